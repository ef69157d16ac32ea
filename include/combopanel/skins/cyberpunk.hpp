#pragma once

#include <combopanel/frame_config.hpp>
#include <combopanel/frame_renderer.hpp>
#include <cstddef>
#include <string>

namespace combopanel
{

enum class CornerStyle
{
    Chamfer,
    Bracket,
    Angular,
};

enum class CyberpunkHeaderStyle
{
    Brackets,
    Underline,
    Box,
    None,
};

enum class CyberpunkDividerStyle
{
    Line,
    Dashed,
    Glow,
    Dots,
    None,
};

// Neon HUD look. Every color defaults to a theme reference so preset swaps
// recolor the whole frame.
struct CyberpunkConfig : ComboFrameConfig<CyberpunkConfig>
{
    static constexpr const char* SKIN_ID          = "cyberpunk";
    static constexpr float       MIN_GRID_SPACING = 2.0f;
    static constexpr size_t      MAX_GRID_LINES   = 512;   // per axis

    CyberpunkConfig();

    // Frame
    float       border_width     = 2.0f;
    ColorSource border_color     = ColorSource::theme(1);
    float       glow_intensity   = 0.6f;
    CornerStyle corner_style     = CornerStyle::Chamfer;
    float       corner_size      = 12.0f;
    ColorSource background_color = ColorSource::custom(Color(0.04f, 0.06f, 0.1f, 0.9f));

    // Background effects
    bool        show_grid        = true;
    ColorSource grid_color       = ColorSource::theme(2);
    float       grid_spacing     = 20.0f;
    bool        show_scanlines   = true;
    float       scanline_opacity = 0.08f;

    // Header
    bool                 show_header  = false;
    std::string          header_text  = "SYSTEM";
    FontSource           header_font  = FontSource::theme(1, 18.0f);
    ColorSource          header_color = ColorSource::theme(1);
    CyberpunkHeaderStyle header_style = CyberpunkHeaderStyle::Brackets;

    // Dividers
    CyberpunkDividerStyle divider_style     = CyberpunkDividerStyle::Line;
    ColorSource           divider_color     = ColorSource::theme(1);
    float                 divider_thickness = 1.0f;
    float                 divider_gap       = 4.0f;

    // Item frames
    bool        item_frames      = false;
    ColorSource item_frame_color = ColorSource::theme(1);
    bool        item_glow        = false;

    std::string_view skin_id() const override { return SKIN_ID; }
    float            divider_width() const override { return divider_thickness; }
    float            divider_padding() const override { return divider_gap; }
    bool             item_frame_enabled() const override { return item_frames; }

    // A positive grid_spacing below MIN_GRID_SPACING is raised to it
    void visit_skin_fields(SkinFieldVisitor& visitor) override;

    // Border plus room for the outer glow
    float frame_margin() const;

    // Grid pitch actually drawn: at least MIN_GRID_SPACING and wide enough
    // that a `width` x `height` frame gets at most MAX_GRID_LINES per axis
    float effective_grid_spacing(float width, float height) const;

    // Height the header occupies, 0 when hidden
    float effective_header_height() const;
};

class CyberpunkRenderer : public TypedFrameRenderer<CyberpunkConfig>
{
   public:
    std::string_view id() const override { return CyberpunkConfig::SKIN_ID; }
    std::string_view name() const override { return "Cyberpunk HUD"; }

   protected:
    Rect render(DrawSurface&           surface,
                const CyberpunkConfig& config,
                float                  width,
                float                  height) const override;

    void draw_dividers(DrawSurface&           surface,
                       const CyberpunkConfig& config,
                       std::span<const Rect>  groups) const override;

    void draw_item(DrawSurface& surface, const CyberpunkConfig& config, const Rect& item) const override;
};

// Octagon with cut corners, chamfer limited to half the smaller side
Path chamfered_rect_path(const Rect& r, float chamfer);

// Diamond-pointed rectangle, points limited to a quarter of each side
Path angular_rect_path(const Rect& r, float point_size);

// L-shaped marks at the four corners
Path bracket_corners_path(const Rect& r, float size);

}   // namespace combopanel
