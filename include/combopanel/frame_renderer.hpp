#pragma once

#include <cmath>
#include <combopanel/draw_surface.hpp>
#include <combopanel/frame_config.hpp>
#include <combopanel/geometry.hpp>
#include <combopanel/logger.hpp>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace combopanel
{

// A skin: draws the decorative frame around a panel and the dividers between
// its groups. Renderers are stateless; per-panel state lives in the config.
class FrameRenderer
{
   public:
    virtual ~FrameRenderer() = default;

    virtual std::string_view             id() const             = 0;
    virtual std::string_view             name() const           = 0;
    virtual std::unique_ptr<FrameConfig> default_config() const = 0;

    // True if `config` was produced for this skin
    virtual bool accepts(const FrameConfig& config) const = 0;

    // Draws background, border and header. Returns the content rect, or a
    // zero rect without drawing anything when width or height is below 1 or
    // not finite.
    virtual Rect render_frame(DrawSurface&       surface,
                              const FrameConfig& config,
                              float              width,
                              float              height) const = 0;

    // Group rects inside `content`, written into `out`
    virtual void calculate_group_layouts(const FrameConfig& config,
                                         const Rect&        content,
                                         std::vector<Rect>& out) const;

    std::vector<Rect> calculate_group_layouts(const FrameConfig& config, const Rect& content) const;

    // Draws into the gap between consecutive groups. No-op for fewer than two.
    virtual void draw_group_dividers(DrawSurface&          surface,
                                     const FrameConfig&    config,
                                     std::span<const Rect> groups) const = 0;

    // Optional decoration around one content item
    virtual void draw_item_frame(DrawSurface&       surface,
                                 const FrameConfig& config,
                                 const Rect&        item) const
    {
        (void)surface;
        (void)config;
        (void)item;
    }

    // Advances skin-specific animation. Returns true if the next frame differs.
    // Negative or non-finite `elapsed` leaves the state untouched.
    virtual bool animate_custom(FrameConfig& config, float elapsed) const
    {
        (void)config;
        (void)elapsed;
        return false;
    }
};

// Base for skins with a concrete config type. Checks the config type once and
// forwards to typed hooks; a foreign config is logged and treated as empty.
template <typename Config>
class TypedFrameRenderer : public FrameRenderer
{
   public:
    std::unique_ptr<FrameConfig> default_config() const override
    {
        return std::make_unique<Config>();
    }

    bool accepts(const FrameConfig& config) const override
    {
        return dynamic_cast<const Config*>(&config) != nullptr;
    }

    Rect render_frame(DrawSurface&       surface,
                      const FrameConfig& config,
                      float              width,
                      float              height) const final
    {
        const Config* typed = cast(config);
        if (!typed || !(width >= 1.0f && height >= 1.0f) || !std::isfinite(width) || !std::isfinite(height))
            return {};
        return render(surface, *typed, width, height);
    }

    void draw_group_dividers(DrawSurface&          surface,
                             const FrameConfig&    config,
                             std::span<const Rect> groups) const final
    {
        if (groups.size() < 2)
            return;
        if (const Config* typed = cast(config))
            draw_dividers(surface, *typed, groups);
    }

    void draw_item_frame(DrawSurface&       surface,
                         const FrameConfig& config,
                         const Rect&        item) const final
    {
        if (const Config* typed = cast(config))
            draw_item(surface, *typed, item);
    }

    bool animate_custom(FrameConfig& config, float elapsed) const final
    {
        if (!std::isfinite(elapsed) || elapsed < 0.0f)
            return false;
        Config* typed = dynamic_cast<Config*>(&config);
        return typed ? animate(*typed, elapsed) : false;
    }

   protected:
    virtual Rect render(DrawSurface& surface, const Config& config, float width, float height) const = 0;
    virtual void draw_dividers(DrawSurface&          surface,
                               const Config&         config,
                               std::span<const Rect> groups) const = 0;

    virtual void draw_item(DrawSurface& surface, const Config& config, const Rect& item) const
    {
        (void)surface;
        (void)config;
        (void)item;
    }

    virtual bool animate(Config& config, float elapsed) const
    {
        (void)config;
        (void)elapsed;
        return false;
    }

   private:
    const Config* cast(const FrameConfig& config) const
    {
        auto* typed = dynamic_cast<const Config*>(&config);
        if (!typed)
        {
            COMBOPANEL_LOG_WARN("skin",
                                "Skin '{}' received a config for '{}'",
                                id(),
                                config.skin_id());
        }
        return typed;
    }
};

}   // namespace combopanel
