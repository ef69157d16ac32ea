#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <combopanel/logger.hpp>
#include <combopanel/skins/retro_terminal.hpp>

#include "core/layout.hpp"

namespace combopanel
{

// ─── Config ─────────────────────────────────────────────────────────────────

RetroTerminalConfig::RetroTerminalConfig()
{
    combo.theme                    = theme_preset("retro_terminal").value_or(default_theme());
    combo.layout.group_count       = 1;
    combo.layout.group_item_counts = {4};
    combo.layout.group_weights     = {1.0f};
    combo.layout.split_orientation = Orientation::Vertical;
    combo.layout.content_padding   = 12.0f;
}

Color RetroTerminalConfig::phosphor_color() const
{
    switch (phosphor)
    {
        case PhosphorColor::Green:
            return Color(0.2f, 1.0f, 0.2f);
        case PhosphorColor::Amber:
            return Color(1.0f, 0.69f, 0.0f);
        case PhosphorColor::White:
            return Color(0.9f, 0.9f, 0.85f);
        case PhosphorColor::Blue:
            return Color(0.4f, 0.6f, 1.0f);
        case PhosphorColor::Theme:
            return resolve_color(ColorSource::theme(1), combo.theme);
        case PhosphorColor::Custom:
            return custom_phosphor;
    }
    return custom_phosphor;
}

Color RetroTerminalConfig::dim_phosphor_color() const
{
    Color c = phosphor_color();
    return Color(c.r * 0.5f, c.g * 0.5f, c.b * 0.5f, c.a * 0.7f);
}

std::string RetroTerminalConfig::visible_header_text() const
{
    std::string text = header_text.empty() ? std::string("TERMINAL") : header_text;
    if (typewriter_effect)
        text.resize(std::min(text.size(), typed_chars));

    if (header_style != TerminalHeaderStyle::Prompt)
        return text;

    std::transform(text.begin(),
                   text.end(),
                   text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::string prompt = "$ " + text;
    if (!cursor_blink || cursor_visible)
        prompt += " _";
    return prompt;
}

namespace
{

constexpr std::array<const char*, 6> PHOSPHOR_NAMES{"green", "amber", "white", "blue", "theme", "custom"};
constexpr std::array<const char*, 4> BEZEL_NAMES{"classic", "slim", "industrial", "none"};
constexpr std::array<const char*, 4> HEADER_NAMES{"title_bar", "status_line", "prompt", "none"};
constexpr std::array<const char*, 6> DIVIDER_NAMES{"dashed", "solid", "box_drawing", "pipe", "ascii", "none"};

}   // namespace

void RetroTerminalConfig::visit_skin_fields(SkinFieldVisitor& v)
{
    v.choice("phosphor", phosphor, PHOSPHOR_NAMES);
    v.field("custom_phosphor", custom_phosphor);
    v.field("background_color", background_color);
    v.field("text_brightness", text_brightness);
    v.field("scanline_intensity", scanline_intensity);
    v.field("scanline_spacing", scanline_spacing);
    v.field("curvature_amount", curvature_amount);
    v.field("vignette_intensity", vignette_intensity);
    v.field("screen_glow", screen_glow);
    v.choice("bezel_style", bezel_style, BEZEL_NAMES);
    v.field("bezel_color", bezel_color);
    v.field("bezel_width", bezel_width);
    v.field("show_power_led", show_power_led);
    v.field("power_led_color", power_led_color);
    v.field("show_header", show_header);
    v.choice("header_style", header_style, HEADER_NAMES);
    v.field("header_text", header_text);
    v.field("header_height", header_height);
    v.field("header_font", header_font);
    v.choice("divider_style", divider_style, DIVIDER_NAMES);
    v.field("divider_gap", divider_gap);
    v.field("cursor_blink", cursor_blink);
    v.field("typewriter_effect", typewriter_effect);
}

float RetroTerminalConfig::effective_header_height() const
{
    if (!show_header || header_style == TerminalHeaderStyle::None)
        return 0.0f;
    return std::max(header_height, 0.0f);
}

// ─── Drawing helpers ────────────────────────────────────────────────────────

namespace
{

// Non-finite or negative values read as 0
float non_negative(float v)
{
    return std::isfinite(v) ? std::max(v, 0.0f) : 0.0f;
}

Color lighten(const Color& c, float dr, float dg, float db, float alpha)
{
    return Color(std::min(c.r + dr, 1.0f), std::min(c.g + dg, 1.0f), std::min(c.b + db, 1.0f), alpha);
}

// Never more than half the panel, so the result stays inside it
Rect inset(float width, float height, float by)
{
    const float b = std::min({by, width * 0.5f, height * 0.5f});
    return Rect{b, b, std::max(width - 2.0f * b, 0.0f), std::max(height - 2.0f * b, 0.0f)};
}

// Returns the screen area inside the bezel
Rect draw_bezel(DrawSurface& surface, const RetroTerminalConfig& config, float width, float height)
{
    if (config.bezel_style == BezelStyle::None)
        return Rect{0.0f, 0.0f, width, height};

    const float bw    = std::max(config.bezel_width, 0.0f);
    const Rect  outer = Rect{0.0f, 0.0f, width, height};

    surface.save();

    switch (config.bezel_style)
    {
        case BezelStyle::Classic:
        {
            constexpr float corner = 8.0f;
            surface.fill_rounded_rect(outer, corner, config.bezel_color);

            // Highlight on top/left, shadow on bottom/right
            Stroke highlight{lighten(config.bezel_color, 0.1f, 0.1f, 0.08f, 0.6f), 2.0f, {}};
            surface.draw_line(corner, 0.0f, width - corner, 0.0f, highlight);
            surface.draw_line(0.0f, corner, 0.0f, height - corner, highlight);

            Stroke shadow{Color(0.0f, 0.0f, 0.0f, 0.4f), 2.0f, {}};
            surface.draw_line(corner, height, width - corner, height, shadow);
            surface.draw_line(width, corner, width, height - corner, shadow);

            surface.stroke_rounded_rect(
                inset(width, height, bw - 4.0f), 4.0f, Stroke{Color(0.0f, 0.0f, 0.0f, 0.6f), 3.0f, {}});

            if (config.show_power_led)
            {
                const float led_x = bw * 0.5f;
                const float led_y = height - bw * 0.5f;
                Path        glow;
                glow.circle(led_x, led_y, 6.0f);
                surface.fill_path(glow, config.power_led_color.with_alpha(0.3f));
                Path body;
                body.circle(led_x, led_y, 3.0f);
                surface.fill_path(body, config.power_led_color);
            }
            break;
        }
        case BezelStyle::Slim:
        {
            surface.fill_rounded_rect(outer, 4.0f, config.bezel_color);
            surface.stroke_rounded_rect(
                inset(width, height, bw - 1.0f), 2.0f, Stroke{Color(0.0f, 0.0f, 0.0f, 0.5f), 1.0f, {}});
            break;
        }
        case BezelStyle::Industrial:
        {
            surface.fill_rect(outer, config.bezel_color.scaled(0.8f));

            // Ventilation slots down both sides
            constexpr float  slot_h    = 4.0f;
            constexpr float  slot_gap  = 6.0f;
            constexpr size_t max_slots = 256;
            Path             slots;
            for (size_t i = 0; i < max_slots; ++i)
            {
                const float y = bw + 10.0f + (slot_h + slot_gap) * static_cast<float>(i);
                if (!(y < height - bw - 10.0f))
                    break;
                slots.rect(Rect{4.0f, y, std::max(bw - 8.0f, 0.0f), slot_h});
                slots.rect(Rect{width - bw + 4.0f, y, std::max(bw - 8.0f, 0.0f), slot_h});
            }
            if (!slots.empty())
                surface.fill_path(slots, Color(0.0f, 0.0f, 0.0f, 0.7f));

            surface.stroke_rect(inset(width, height, bw - 2.0f),
                                Stroke{Color(0.0f, 0.0f, 0.0f, 0.6f), 3.0f, {}});

            if (config.show_power_led)
            {
                surface.fill_rect(Rect{width * 0.5f - 8.0f, height - bw * 0.5f - 3.0f, 16.0f, 6.0f},
                                  config.power_led_color);
            }
            break;
        }
        case BezelStyle::None:
            break;
    }

    surface.restore();
    return inset(width, height, bw);
}

void draw_screen_background(DrawSurface& surface, const RetroTerminalConfig& config, const Rect& screen)
{
    surface.fill_rect(screen, config.background_color);

    if (config.screen_glow <= 0.0f || screen.empty())
        return;

    // Faint phosphor persistence glow
    const Color    p          = config.phosphor_color();
    const float    glow_alpha = config.screen_glow * 0.05f;
    RadialGradient glow;
    glow.cx     = screen.center_x();
    glow.cy     = screen.center_y();
    glow.radius = std::max(screen.w, screen.h) * 0.8f;
    glow.stops  = {{0.0f, p.with_alpha(glow_alpha)},
                   {0.5f, p.with_alpha(glow_alpha * 0.5f)},
                   {1.0f, p.with_alpha(0.0f)}};
    surface.fill_radial_gradient(screen, glow);
}

// Header band, cut down to the screen height
float draw_header(DrawSurface& surface, const RetroTerminalConfig& config, const Rect& screen)
{
    const float header_h = std::min(config.effective_header_height(), screen.h);
    if (header_h <= 0.0f)
        return 0.0f;

    const Color phosphor = config.phosphor_color();
    const Color dim      = config.dim_phosphor_color();
    const Color bright   = Color(phosphor.r * config.text_brightness,
                                 phosphor.g * config.text_brightness,
                                 phosphor.b * config.text_brightness,
                                 1.0f);

    const FontSpec font = resolve_font(config.header_font, config.theme());
    TextStyle      style{font.family, font.size, true, false, bright};

    const std::string text    = config.visible_header_text();
    const TextExtents extents = surface.measure_text(text, style);
    const float       text_y  = screen.y + header_h * 0.5f + extents.height / 3.0f;

    surface.save();
    surface.push_clip(Rect{screen.x, screen.y, screen.w, header_h});

    auto draw_glowing = [&](float x)
    {
        if (config.screen_glow > 0.0f)
        {
            TextStyle glow = style;
            glow.color     = phosphor.with_alpha(config.screen_glow * 0.3f);
            surface.draw_text(x, text_y, text, glow);
        }
        surface.draw_text(x, text_y, text, style);
    };

    switch (config.header_style)
    {
        case TerminalHeaderStyle::TitleBar:
            surface.fill_rect(Rect{screen.x, screen.y, screen.w, header_h}, dim.with_alpha(0.15f));
            surface.draw_line(screen.x,
                              screen.y + header_h,
                              screen.right(),
                              screen.y + header_h,
                              Stroke{phosphor.with_alpha(0.5f), 1.0f, {}});
            draw_glowing(screen.x + (screen.w - extents.width) * 0.5f);
            break;

        case TerminalHeaderStyle::StatusLine:
        {
            // Reverse video bar
            surface.fill_rect(Rect{screen.x, screen.y, screen.w, header_h},
                              Color(phosphor.r * 0.8f, phosphor.g * 0.8f, phosphor.b * 0.8f, 0.9f));
            TextStyle inverse = style;
            inverse.color     = colors::black;
            surface.draw_text(screen.x + 8.0f, text_y, text, inverse);

            constexpr const char* status = "STATUS: OK";
            const float           info_w = surface.measure_text(status, inverse).width;
            surface.draw_text(screen.right() - info_w - 8.0f, text_y, status, inverse);
            break;
        }

        case TerminalHeaderStyle::Prompt:
            draw_glowing(screen.x + 8.0f);
            break;

        case TerminalHeaderStyle::None:
            break;
    }

    surface.pop_clip();
    surface.restore();
    return header_h;
}

void draw_scanlines(DrawSurface& surface, const RetroTerminalConfig& config, const Rect& screen)
{
    if (config.scanline_intensity <= 0.0f || screen.empty())
        return;

    constexpr size_t max_lines = 4096;
    const float      spacing   = std::max(non_negative(config.scanline_spacing), 1.0f);
    Path             lines;
    for (size_t i = 0; i < max_lines; ++i)
    {
        const float y = screen.y + spacing * static_cast<float>(i);
        if (!(y < screen.bottom()))
            break;
        lines.rect(Rect{screen.x, y, screen.w, 1.0f});
    }

    surface.push_clip(screen);
    surface.fill_path(lines, Color(0.0f, 0.0f, 0.0f, config.scanline_intensity * 0.5f));
    surface.pop_clip();
}

void draw_vignette(DrawSurface& surface, const RetroTerminalConfig& config, const Rect& screen)
{
    if ((config.curvature_amount <= 0.0f && config.vignette_intensity <= 0.0f) || screen.empty())
        return;

    const float    v = config.vignette_intensity;
    RadialGradient vignette;
    vignette.cx     = screen.center_x();
    vignette.cy     = screen.center_y();
    vignette.radius = std::max(screen.w, screen.h) * 0.75f;
    vignette.stops  = {{0.0f, Color(0.0f, 0.0f, 0.0f, 0.0f)},
                       {0.6f, Color(0.0f, 0.0f, 0.0f, v * 0.2f)},
                       {0.85f, Color(0.0f, 0.0f, 0.0f, v * 0.5f)},
                       {1.0f,
                        Color(0.0f, 0.0f, 0.0f, std::min(v * 0.9f + config.curvature_amount * 2.0f, 1.0f))}};

    surface.push_clip(screen);
    surface.fill_radial_gradient(screen, vignette);
    surface.pop_clip();
}

void draw_divider(DrawSurface&               surface,
                  const RetroTerminalConfig& config,
                  float                      x,
                  float                      y,
                  float                      length,
                  bool                       horizontal)
{
    const Color dim = config.dim_phosphor_color();

    // Line from (x, y) along the divider axis, offset across it by `across`
    auto segment = [&](Path& p, float from, float to, float across)
    {
        if (horizontal)
            p.move_to(x + from, y + across).line_to(x + to, y + across);
        else
            p.move_to(x + across, y + from).line_to(x + across, y + to);
    };

    Path   path;
    Stroke stroke{dim, 1.0f, {}};

    switch (config.divider_style)
    {
        case TerminalDividerStyle::Dashed:
            stroke.dash = {6.0f, 4.0f};
            segment(path, 0.0f, length, 0.0f);
            break;

        case TerminalDividerStyle::Solid:
            stroke.width = 2.0f;
            segment(path, 0.0f, length, 0.0f);
            break;

        case TerminalDividerStyle::BoxDrawing:
        {
            constexpr float cap = 6.0f;
            segment(path, 0.0f, length, 0.0f);
            if (horizontal)
            {
                path.move_to(x, y - cap).line_to(x, y + cap);
                path.move_to(x + length, y - cap).line_to(x + length, y + cap);
            }
            else
            {
                path.move_to(x - cap, y).line_to(x + cap, y);
                path.move_to(x - cap, y + length).line_to(x + cap, y + length);
            }
            break;
        }

        case TerminalDividerStyle::Pipe:
        {
            constexpr size_t max_ticks = 1024;
            for (size_t i = 0; i < max_ticks; ++i)
            {
                const float t = 4.0f * static_cast<float>(i);
                if (!(t < length))
                    break;
                if (horizontal)
                    path.move_to(x + t, y - 4.0f).line_to(x + t, y + 4.0f);
                else
                    path.move_to(x - 4.0f, y + t).line_to(x + 4.0f, y + t);
            }
            break;
        }

        case TerminalDividerStyle::Ascii:
            stroke.width = 2.0f;
            segment(path, 0.0f, length, -1.5f);
            segment(path, 0.0f, length, 1.5f);
            break;

        case TerminalDividerStyle::None:
            break;
    }

    if (!path.empty())
        surface.stroke_path(path, stroke);
}

}   // namespace

// ─── Renderer ───────────────────────────────────────────────────────────────

Rect RetroTerminalRenderer::render(DrawSurface&               surface,
                                   const RetroTerminalConfig& config,
                                   float                      width,
                                   float                      height) const
{
    surface.save();

    const Rect screen = draw_bezel(surface, config, width, height);
    draw_screen_background(surface, config, screen);
    const float header_h = draw_header(surface, config, screen);
    draw_scanlines(surface, config, screen);
    draw_vignette(surface, config, screen);

    surface.restore();

    return inner_content_rect(screen, header_h, config.layout().content_padding);
}

void RetroTerminalRenderer::draw_dividers(DrawSurface&               surface,
                                          const RetroTerminalConfig& config,
                                          std::span<const Rect>      groups) const
{
    if (config.divider_style == TerminalDividerStyle::None)
        return;

    const Orientation split = config.layout().split_orientation;
    for (size_t i = 0; i + 1 < groups.size(); ++i)
    {
        Rect band = divider_band(groups, i, split, config.divider_width(), config.divider_padding());
        if (split == Orientation::Vertical)
            draw_divider(surface, config, band.x, band.center_y(), band.w, true);
        else
            draw_divider(surface, config, band.center_x(), band.y, band.h, false);
    }
}

bool RetroTerminalRenderer::animate(RetroTerminalConfig& config, float elapsed) const
{
    if (!(elapsed > 0.0f) || !std::isfinite(elapsed))
        return false;

    bool changed = false;

    const bool prompt_visible =
        config.show_header && config.header_style == TerminalHeaderStyle::Prompt;
    if (config.cursor_blink && prompt_visible)
    {
        // Each whole period flips the cursor once, so only the parity matters
        const double timer = static_cast<double>(non_negative(config.blink_timer)) + elapsed;
        const double flips = std::floor(timer / CURSOR_BLINK_PERIOD);
        config.blink_timer = static_cast<float>(std::fmod(timer, CURSOR_BLINK_PERIOD));
        if (flips >= 1.0)
        {
            if (std::fmod(flips, 2.0) == 1.0)
                config.cursor_visible = !config.cursor_visible;
            changed = true;
        }
    }

    const size_t length = config.header_text.size();
    if (config.typewriter_effect && config.typed_chars < length)
    {
        // Timer stops once the whole header is out
        const float full        = static_cast<float>(length) / TYPEWRITER_CHARS_PER_SEC;
        config.typewriter_timer = std::min(non_negative(config.typewriter_timer) + elapsed, full);

        size_t target = length;
        if (config.typewriter_timer < full)
        {
            const auto typed = static_cast<size_t>(config.typewriter_timer * TYPEWRITER_CHARS_PER_SEC);
            target           = std::min(typed, length);
        }
        if (target > config.typed_chars)
        {
            config.typed_chars = target;
            changed            = true;
        }
    }

    if (changed)
        COMBOPANEL_LOG_TRACE("skin", "Retro terminal animation step, cursor {}", config.cursor_visible);
    return changed;
}

}   // namespace combopanel
