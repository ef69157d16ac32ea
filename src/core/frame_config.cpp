#include <algorithm>
#include <cmath>
#include <combopanel/frame_config.hpp>
#include <combopanel/logger.hpp>

namespace combopanel
{

namespace
{

struct DisplayTypeName
{
    ContentDisplayType type;
    const char*        name;
};

constexpr DisplayTypeName DISPLAY_TYPE_NAMES[] = {
    {ContentDisplayType::Bar, "bar"},
    {ContentDisplayType::Text, "text"},
    {ContentDisplayType::Graph, "graph"},
    {ContentDisplayType::LevelBar, "level_bar"},
    {ContentDisplayType::CoreBars, "core_bars"},
    {ContentDisplayType::Static, "static"},
    {ContentDisplayType::Arc, "arc"},
    {ContentDisplayType::Speedometer, "speedometer"},
};

}   // namespace

const char* display_type_name(ContentDisplayType type)
{
    for (const auto& entry : DISPLAY_TYPE_NAMES)
    {
        if (entry.type == type)
            return entry.name;
    }
    return "bar";
}

std::optional<ContentDisplayType> display_type_from_name(std::string_view name)
{
    for (const auto& entry : DISPLAY_TYPE_NAMES)
    {
        if (name == entry.name)
            return entry.type;
    }
    return std::nullopt;
}

// ─── LayoutSettings ─────────────────────────────────────────────────────────

size_t LayoutSettings::effective_group_count() const
{
    return std::clamp<size_t>(group_count, 1, MAX_GROUPS);
}

std::vector<float> LayoutSettings::effective_weights() const
{
    const size_t n = effective_group_count();

    std::vector<float> weights(n, 1.0f);
    float              sum = 0.0f;
    for (size_t i = 0; i < n; ++i)
    {
        if (i < group_weights.size())
        {
            const float w = group_weights[i];
            weights[i]    = std::isfinite(w) && w > 0.0f ? w : 0.0f;
        }
        sum += weights[i];
    }

    if (!(sum > 0.0f))
    {
        COMBOPANEL_LOG_DEBUG("layout", "Group weights sum to {}, using equal weights", sum);
        std::fill(weights.begin(), weights.end(), 1.0f);
    }
    return weights;
}

std::vector<size_t> LayoutSettings::effective_item_counts() const
{
    const size_t        n = effective_group_count();
    std::vector<size_t> counts(n, 1);
    for (size_t i = 0; i < n && i < group_item_counts.size(); ++i)
        counts[i] = std::clamp<size_t>(group_item_counts[i], 1, MAX_ITEMS_PER_GROUP);
    return counts;
}

Orientation LayoutSettings::item_orientation(size_t group) const
{
    if (group < group_item_orientations.size())
        return group_item_orientations[group];
    return split_orientation;
}

// ─── Transfer ───────────────────────────────────────────────────────────────

TransferableConfig extract_transferable(const FrameConfig& config)
{
    return TransferableConfig{.layout = config.layout(), .animation = config.animation()};
}

void apply_transferable(FrameConfig& config, const TransferableConfig& transfer)
{
    config.layout()    = transfer.layout;
    config.animation() = transfer.animation;
    COMBOPANEL_LOG_DEBUG("config",
                         "Transferred {} groups and {} slots to skin '{}'",
                         transfer.layout.group_count,
                         transfer.layout.content_slots.size(),
                         config.skin_id());
}

}   // namespace combopanel
