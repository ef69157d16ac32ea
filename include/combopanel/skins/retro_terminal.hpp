#pragma once

#include <combopanel/frame_config.hpp>
#include <combopanel/frame_renderer.hpp>
#include <cstddef>
#include <string>

namespace combopanel
{

enum class PhosphorColor
{
    Green,
    Amber,
    White,
    Blue,
    Theme,    // theme color 1
    Custom,   // RetroTerminalConfig::custom_phosphor
};

enum class BezelStyle
{
    Classic,
    Slim,
    Industrial,
    None,
};

enum class TerminalHeaderStyle
{
    TitleBar,
    StatusLine,
    Prompt,
    None,
};

enum class TerminalDividerStyle
{
    Dashed,
    Solid,
    BoxDrawing,
    Pipe,
    Ascii,
    None,
};

// CRT monitor look: bezel, phosphor text, scanlines and vignette
struct RetroTerminalConfig : ComboFrameConfig<RetroTerminalConfig>
{
    static constexpr const char* SKIN_ID       = "retro_terminal";
    static constexpr float       DIVIDER_WIDTH = 2.0f;

    RetroTerminalConfig();

    // Appearance
    PhosphorColor phosphor         = PhosphorColor::Green;
    Color         custom_phosphor  = Color(0.2f, 1.0f, 0.2f);
    Color         background_color = Color(0.02f, 0.02f, 0.02f);
    float         text_brightness  = 0.9f;

    // CRT effects
    float scanline_intensity = 0.25f;
    float scanline_spacing   = 2.0f;
    float curvature_amount   = 0.02f;
    float vignette_intensity = 0.4f;
    float screen_glow        = 0.5f;

    // Bezel
    BezelStyle bezel_style     = BezelStyle::Classic;
    Color      bezel_color     = Color(0.12f, 0.12f, 0.10f);
    float      bezel_width     = 16.0f;
    bool       show_power_led  = true;
    Color      power_led_color = Color(0.2f, 0.8f, 0.2f);

    // Header
    bool                show_header   = true;
    TerminalHeaderStyle header_style  = TerminalHeaderStyle::TitleBar;
    std::string         header_text   = "SYSTEM MONITOR";
    float               header_height = 28.0f;
    FontSource          header_font   = FontSource::theme(1, 14.0f);

    // Dividers
    TerminalDividerStyle divider_style = TerminalDividerStyle::Dashed;
    float                divider_gap   = 4.0f;

    // Animation
    bool cursor_blink      = true;
    bool typewriter_effect = false;

    // Runtime animation state, not persisted
    bool   cursor_visible   = true;
    float  blink_timer      = 0.0f;
    float  typewriter_timer = 0.0f;
    size_t typed_chars      = 0;

    std::string_view skin_id() const override { return SKIN_ID; }
    float            divider_width() const override { return DIVIDER_WIDTH; }
    float            divider_padding() const override { return divider_gap; }

    // Persisted fields only; the runtime animation state is skipped
    void visit_skin_fields(SkinFieldVisitor& visitor) override;

    Color phosphor_color() const;
    Color dim_phosphor_color() const;

    // Header line as currently visible (prompt, typewriter and cursor applied)
    std::string visible_header_text() const;

    // Height the header occupies, 0 when hidden
    float effective_header_height() const;
};

class RetroTerminalRenderer : public TypedFrameRenderer<RetroTerminalConfig>
{
   public:
    static constexpr float CURSOR_BLINK_PERIOD     = 0.5f;
    static constexpr float TYPEWRITER_CHARS_PER_SEC = 20.0f;

    std::string_view id() const override { return RetroTerminalConfig::SKIN_ID; }
    std::string_view name() const override { return "Retro Terminal"; }

   protected:
    Rect render(DrawSurface&               surface,
                const RetroTerminalConfig& config,
                float                      width,
                float                      height) const override;

    void draw_dividers(DrawSurface&               surface,
                       const RetroTerminalConfig& config,
                       std::span<const Rect>      groups) const override;

    bool animate(RetroTerminalConfig& config, float elapsed) const override;
};

}   // namespace combopanel
