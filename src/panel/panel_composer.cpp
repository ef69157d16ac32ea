#include <combopanel/logger.hpp>
#include <combopanel/panel.hpp>

#include "anim/value_animator.hpp"
#include "core/layout.hpp"
#include "core/slots.hpp"

namespace combopanel
{

PanelComposer::PanelComposer(std::shared_ptr<const FrameRenderer> renderer,
                             std::unique_ptr<FrameConfig>         config)
    : renderer_(std::move(renderer)), animator_(std::make_unique<ValueAnimator>())
{
    if (config && renderer_->accepts(*config))
    {
        config_ = std::move(config);
    }
    else
    {
        if (config)
        {
            COMBOPANEL_LOG_WARN("panel",
                                "Config for skin '{}' does not fit '{}', using defaults",
                                config->skin_id(),
                                renderer_->id());
        }
        config_ = renderer_->default_config();
    }
}

PanelComposer::~PanelComposer()                                   = default;
PanelComposer::PanelComposer(PanelComposer&&) noexcept            = default;
PanelComposer& PanelComposer::operator=(PanelComposer&&) noexcept = default;

void PanelComposer::set_item_renderer(std::shared_ptr<ContentItemRenderer> renderer)
{
    item_renderer_ = std::move(renderer);
    needs_redraw_  = true;
}

FrameConfig& PanelComposer::edit_config()
{
    config_changed();
    return *config_;
}

bool PanelComposer::set_config(std::unique_ptr<FrameConfig> config)
{
    if (!config)
        return false;
    if (!renderer_->accepts(*config))
    {
        COMBOPANEL_LOG_WARN("panel",
                            "Rejected config for skin '{}' on '{}'",
                            config->skin_id(),
                            renderer_->id());
        return false;
    }
    config_ = std::move(config);
    config_changed();
    return true;
}

void PanelComposer::apply_theme(const Theme& theme)
{
    config_->set_theme(theme);
    config_changed();
    COMBOPANEL_LOG_DEBUG("theme", "Applied theme '{}'", theme.name);
}

bool PanelComposer::apply_theme_preset(std::string_view name)
{
    auto preset = theme_preset(name);
    if (!preset)
    {
        COMBOPANEL_LOG_WARN("theme", "Unknown theme preset '{}'", name);
        return false;
    }
    apply_theme(*preset);
    return true;
}

bool PanelComposer::switch_skin(std::shared_ptr<const FrameRenderer> renderer)
{
    if (!renderer)
        return false;

    // Layout and animation always carry over, even when left at their defaults
    auto next = renderer->default_config();
    apply_transferable(*next, extract_transferable(*config_));

    COMBOPANEL_LOG_INFO("panel", "Switched skin '{}' -> '{}'", renderer_->id(), renderer->id());

    renderer_ = std::move(renderer);
    config_   = std::move(next);
    config_changed();
    return true;
}

void PanelComposer::update_values(MetricValues values)
{
    values_     = std::move(values);
    data_dirty_ = true;
    refresh_targets();
}

double PanelComposer::display_value(std::string_view slot) const
{
    return animator_->value(slot);
}

void PanelComposer::config_changed()
{
    ++config_version_;
    layout_valid_ = false;
    needs_redraw_ = true;
}

void PanelComposer::refresh_targets()
{
    const auto& layout  = config_->layout();
    const bool  animate = config_->animation().enabled;

    std::vector<std::string> live;
    for (auto& slot : generate_slot_names(layout))
    {
        if (layout.content_slots.find(slot) == layout.content_slots.end())
            continue;
        animator_->set_target(slot, slot_data(values_, slot).percent(), animate);
        live.push_back(std::move(slot));
    }
    animator_->retain(live);
    targets_version_ = config_version_;
}

void PanelComposer::rebuild_layout(const Rect& content)
{
    const auto& settings = config_->layout();
    const auto  counts   = settings.effective_item_counts();

    layout_.content = content;
    renderer_->calculate_group_layouts(*config_, content, layout_.groups);

    layout_.items.clear();
    for (size_t g = 0; g < layout_.groups.size(); ++g)
    {
        const size_t count = g < counts.size() ? counts[g] : 1;
        compute_item_layouts(
            layout_.groups[g], count, settings.item_orientation(g), settings.item_spacing, item_scratch_);

        for (size_t i = 0; i < item_scratch_.size(); ++i)
        {
            PanelItem item{slot_name(g + 1, i + 1), g, item_scratch_[i]};
            if (settings.content_slots.find(item.slot) == settings.content_slots.end())
                COMBOPANEL_LOG_DEBUG("panel", "No content bound to slot {}", item.slot);
            layout_.items.push_back(std::move(item));
        }
    }

    COMBOPANEL_LOG_TRACE("panel",
                         "Layout rebuilt: {} groups, {} items",
                         layout_.groups.size(),
                         layout_.items.size());
}

void PanelComposer::draw_items(DrawSurface& surface)
{
    const auto& slots = config_->layout().content_slots;
    for (const auto& item : layout_.items)
    {
        auto it = slots.find(item.slot);
        if (it == slots.end() || !item_renderer_)
            continue;

        const SlotData     data = slot_data(values_, item.slot);
        ContentItemContext ctx{item.slot,
                               it->second,
                               item.rect,
                               config_->theme(),
                               data,
                               animator_->value(item.slot, data.percent()),
                               values_};
        item_renderer_->render_item(surface, ctx);
    }
}

PanelRenderResult PanelComposer::render(DrawSurface& surface, float width, float height, float elapsed)
{
    PanelRenderResult result;

    if (width < 1.0f || height < 1.0f)
    {
        COMBOPANEL_LOG_TRACE("panel", "Skipping render of {}x{} panel", width, height);
        layout_       = PanelLayout{};
        layout_valid_ = false;
        return result;
    }

    if (!surface.begin_frame(width, height))
    {
        result.ok           = false;
        result.error        = surface.last_error();
        result.needs_redraw = true;
        COMBOPANEL_LOG_ERROR("surface", "begin_frame failed: {}", result.error);
        return result;
    }

    if (targets_version_ != config_version_)
        refresh_targets();

    // 1. frame
    const Rect content = renderer_->render_frame(surface, *config_, width, height);

    // 2-3. groups and items, reused while size, config and content are unchanged
    const bool cached = layout_valid_ && layout_key_.width == width && layout_key_.height == height
                        && layout_key_.version == config_version_ && layout_key_.content == content;
    if (!cached)
    {
        rebuild_layout(content);
        layout_key_   = LayoutKey{width, height, config_version_, content};
        layout_valid_ = true;
    }

    // 4. content
    draw_items(surface);

    // 5. dividers
    renderer_->draw_group_dividers(surface, *config_, layout_.groups);

    // 6. item frames
    if (config_->item_frame_enabled())
    {
        for (const auto& item : layout_.items)
            renderer_->draw_item_frame(surface, *config_, item.rect);
    }

    // 7. animation
    bool animating = false;
    if (config_->animation().enabled)
    {
        animating |= renderer_->animate_custom(*config_, elapsed);
        animating |= animator_->step(elapsed, config_->animation().speed);
    }

    if (!surface.end_frame() || !surface.ok())
    {
        result.ok           = false;
        result.error        = surface.last_error();
        result.needs_redraw = true;
        COMBOPANEL_LOG_ERROR("surface", "Frame failed: {}", result.error);
        return result;
    }

    data_dirty_         = false;
    needs_redraw_       = animating;
    result.needs_redraw = animating;
    return result;
}

}   // namespace combopanel
