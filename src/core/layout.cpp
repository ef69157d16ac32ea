#include "layout.hpp"

#include <algorithm>
#include <cmath>
#include <combopanel/logger.hpp>

namespace combopanel
{

float divider_space(size_t group_count, float divider_width, float divider_padding)
{
    if (group_count < 2)
        return 0.0f;
    float per_divider = std::max(divider_width, 0.0f) + 2.0f * std::max(divider_padding, 0.0f);
    return static_cast<float>(group_count - 1) * per_divider;
}

void compute_group_layouts(const Rect&            content,
                           size_t                 group_count,
                           std::span<const float> weights,
                           Orientation            orientation,
                           float                  divider_width,
                           float                  divider_padding,
                           std::vector<Rect>&     out)
{
    const size_t n = std::clamp<size_t>(group_count, 1, LayoutSettings::MAX_GROUPS);

    out.clear();
    out.reserve(n);

    // Same normalization rules as LayoutSettings::effective_weights
    auto raw_weight = [&](size_t i) -> float
    {
        if (i >= weights.size())
            return 1.0f;
        return std::isfinite(weights[i]) && weights[i] > 0.0f ? weights[i] : 0.0f;
    };

    float total = 0.0f;
    for (size_t i = 0; i < n; ++i)
        total += raw_weight(i);
    const bool equal = !(total > 0.0f);
    if (equal)
        total = static_cast<float>(n);

    const float content_w = std::max(content.w, 0.0f);
    const float content_h = std::max(content.h, 0.0f);
    const float gap       = std::max(divider_width, 0.0f) + 2.0f * std::max(divider_padding, 0.0f);
    const bool  vertical  = orientation == Orientation::Vertical;
    const float main      = vertical ? content_h : content_w;
    const float available = std::max(main - divider_space(n, divider_width, divider_padding), 0.0f);

    float cursor = vertical ? content.y : content.x;
    for (size_t i = 0; i < n; ++i)
    {
        float size = available * (equal ? 1.0f : raw_weight(i)) / total;

        Rect r;
        if (vertical)
        {
            r = Rect{content.x, cursor, content_w, size};
        }
        else
        {
            r = Rect{cursor, content.y, size, content_h};
        }
        out.push_back(r);

        cursor += size;
        if (i + 1 < n)
            cursor += gap;
    }

    COMBOPANEL_LOG_TRACE("layout", "Split {} groups, available {}", n, available);
}

std::vector<Rect> compute_group_layouts(const Rect&            content,
                                        size_t                 group_count,
                                        std::span<const float> weights,
                                        Orientation            orientation,
                                        float                  divider_width,
                                        float                  divider_padding)
{
    std::vector<Rect> out;
    compute_group_layouts(
        content, group_count, weights, orientation, divider_width, divider_padding, out);
    return out;
}

std::vector<Rect> compute_group_layouts(const Rect& content, const LayoutConfig& config)
{
    const auto& layout = config.layout();
    return compute_group_layouts(content,
                                 layout.effective_group_count(),
                                 layout.group_weights,
                                 layout.split_orientation,
                                 config.divider_width(),
                                 config.divider_padding());
}

void compute_item_layouts(const Rect&        group,
                          size_t             item_count,
                          Orientation        orientation,
                          float              spacing,
                          std::vector<Rect>& out)
{
    const size_t k = std::clamp<size_t>(item_count, 1, LayoutSettings::MAX_ITEMS_PER_GROUP);

    out.clear();
    out.reserve(k);

    const bool  vertical = orientation == Orientation::Vertical;
    const float group_w  = std::max(group.w, 0.0f);
    const float group_h  = std::max(group.h, 0.0f);
    const float main     = vertical ? group_h : group_w;

    float gap = 0.0f;
    if (k > 1)
    {
        float total_gap = std::min(std::max(spacing, 0.0f) * static_cast<float>(k - 1), main);
        gap             = total_gap / static_cast<float>(k - 1);
    }
    const float extent = std::max((main - gap * static_cast<float>(k - 1)) / static_cast<float>(k), 0.0f);

    float cursor = vertical ? group.y : group.x;
    for (size_t i = 0; i < k; ++i)
    {
        if (vertical)
            out.push_back(Rect{group.x, cursor, group_w, extent});
        else
            out.push_back(Rect{cursor, group.y, extent, group_h});
        cursor += extent + gap;
    }
}

std::vector<Rect> compute_item_layouts(const Rect& group,
                                       size_t      item_count,
                                       Orientation orientation,
                                       float       spacing)
{
    std::vector<Rect> out;
    compute_item_layouts(group, item_count, orientation, spacing, out);
    return out;
}

Rect inner_content_rect(const Rect& frame, float header_h, float padding)
{
    const float w      = std::max(frame.w, 0.0f);
    const float h      = std::max(frame.h, 0.0f);
    const float header = std::clamp(header_h, 0.0f, h);
    const float pad    = std::max(padding, 0.0f);
    const float pad_x  = std::min(pad, w * 0.5f);
    const float pad_y  = std::min(pad, (h - header) * 0.5f);
    return Rect{frame.x + pad_x,
                frame.y + header + pad_y,
                std::max(w - pad_x * 2.0f, 0.0f),
                std::max(h - header - pad_y * 2.0f, 0.0f)};
}

Rect divider_band(std::span<const Rect> groups,
                  size_t                index,
                  Orientation           orientation,
                  float                 divider_width,
                  float                 divider_padding)
{
    if (index + 1 >= groups.size())
        return {};

    const Rect& g       = groups[index];
    const float width   = std::max(divider_width, 0.0f);
    const float padding = std::max(divider_padding, 0.0f);

    if (orientation == Orientation::Vertical)
        return Rect{g.x, g.bottom() + padding, g.w, width};
    return Rect{g.right() + padding, g.y, width, g.h};
}

}   // namespace combopanel
