#pragma once

#include <combopanel/content_item.hpp>
#include <combopanel/draw_surface.hpp>
#include <combopanel/frame_config.hpp>
#include <combopanel/frame_renderer.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace combopanel
{

class ValueAnimator;

struct PanelItem
{
    std::string slot;        // "group{G}_{I}"
    size_t      group = 0;   // 0-based
    Rect        rect;
};

// Geometry of the last render pass
struct PanelLayout
{
    Rect                   content;
    std::vector<Rect>      groups;
    std::vector<PanelItem> items;
};

struct PanelRenderResult
{
    bool        ok = true;
    std::string error;
    bool        needs_redraw = false;   // animation still in progress

    explicit operator bool() const { return ok; }
};

// One combo panel: a skin, its config, the latest metric snapshot and the
// state needed to draw them frame after frame.
class PanelComposer
{
   public:
    // `renderer` must not be null. A null config means the skin's defaults.
    explicit PanelComposer(std::shared_ptr<const FrameRenderer> renderer,
                           std::unique_ptr<FrameConfig>         config = nullptr);
    ~PanelComposer();

    PanelComposer(PanelComposer&&) noexcept;
    PanelComposer& operator=(PanelComposer&&) noexcept;

    void set_item_renderer(std::shared_ptr<ContentItemRenderer> renderer);

    const FrameRenderer& renderer() const { return *renderer_; }
    const FrameConfig&   config() const { return *config_; }

    // Mutable access for the configuration surface. Invalidates cached layout.
    FrameConfig& edit_config();

    // Rejects configs produced for another skin
    bool set_config(std::unique_ptr<FrameConfig> config);

    // Replaces only the theme; theme references re-resolve on the next render
    void apply_theme(const Theme& theme);
    bool apply_theme_preset(std::string_view name);

    // Moves to another skin keeping layout, slots and animation settings
    bool switch_skin(std::shared_ptr<const FrameRenderer> renderer);

    // New metric snapshot; schedules a redraw
    void                update_values(MetricValues values);
    const MetricValues& values() const { return values_; }

    // One frame: frame, layout, items, dividers, item frames, animation.
    // Fails only when the surface reports an error.
    PanelRenderResult render(DrawSurface& surface, float width, float height, float elapsed);

    const PanelLayout& layout() const { return layout_; }
    bool               needs_redraw() const { return needs_redraw_ || data_dirty_; }
    uint64_t           config_version() const { return config_version_; }

    // Smoothed display value of a slot, in [0, 1]
    double display_value(std::string_view slot) const;

   private:
    struct LayoutKey
    {
        float    width   = -1.0f;
        float    height  = -1.0f;
        uint64_t version = 0;
        Rect     content;
    };

    void config_changed();
    void refresh_targets();
    void rebuild_layout(const Rect& content);
    void draw_items(DrawSurface& surface);

    std::shared_ptr<const FrameRenderer> renderer_;
    std::unique_ptr<FrameConfig>         config_;
    std::shared_ptr<ContentItemRenderer> item_renderer_;
    std::unique_ptr<ValueAnimator>       animator_;

    MetricValues values_;
    PanelLayout  layout_;
    LayoutKey    layout_key_;
    bool         layout_valid_ = false;

    // Scratch reused across frames
    std::vector<Rect> item_scratch_;

    uint64_t config_version_  = 1;
    uint64_t targets_version_ = 0;
    bool     data_dirty_      = true;
    bool     needs_redraw_    = true;
};

}   // namespace combopanel
