#include <algorithm>
#include <array>
#include <cmath>
#include <combopanel/skins/cyberpunk.hpp>

#include "core/layout.hpp"

namespace combopanel
{

// ─── Config ─────────────────────────────────────────────────────────────────

CyberpunkConfig::CyberpunkConfig()
{
    combo.theme                    = theme_preset("cyberpunk").value_or(default_theme());
    combo.layout.group_count       = 2;
    combo.layout.group_item_counts = {1, 1};
    combo.layout.group_weights     = {1.0f, 1.0f};
    combo.layout.split_orientation = Orientation::Vertical;
    combo.layout.content_padding   = 10.0f;
}

namespace
{

constexpr std::array<const char*, 3> CORNER_NAMES{"chamfer", "bracket", "angular"};
constexpr std::array<const char*, 4> HEADER_NAMES{"brackets", "underline", "box", "none"};
constexpr std::array<const char*, 5> DIVIDER_NAMES{"line", "dashed", "glow", "dots", "none"};

}   // namespace

void CyberpunkConfig::visit_skin_fields(SkinFieldVisitor& v)
{
    v.field("border_width", border_width);
    v.field("border_color", border_color);
    v.field("glow_intensity", glow_intensity);
    v.choice("corner_style", corner_style, CORNER_NAMES);
    v.field("corner_size", corner_size);
    v.field("background_color", background_color);
    v.field("show_grid", show_grid);
    v.field("grid_color", grid_color);
    v.field("grid_spacing", grid_spacing);
    if (grid_spacing > 0.0f && grid_spacing < MIN_GRID_SPACING)
        grid_spacing = MIN_GRID_SPACING;
    v.field("show_scanlines", show_scanlines);
    v.field("scanline_opacity", scanline_opacity);
    v.field("show_header", show_header);
    v.field("header_text", header_text);
    v.field("header_font", header_font);
    v.field("header_color", header_color);
    v.choice("header_style", header_style, HEADER_NAMES);
    v.choice("divider_style", divider_style, DIVIDER_NAMES);
    v.field("divider_color", divider_color);
    v.field("divider_thickness", divider_thickness);
    v.field("divider_gap", divider_gap);
    v.field("item_frames", item_frames);
    v.field("item_frame_color", item_frame_color);
    v.field("item_glow", item_glow);
}

float CyberpunkConfig::frame_margin() const
{
    return std::max(border_width, 0.0f) + std::max(glow_intensity, 0.0f) * 8.0f;
}

float CyberpunkConfig::effective_grid_spacing(float width, float height) const
{
    const float spacing = std::isfinite(grid_spacing) ? grid_spacing : MIN_GRID_SPACING;
    const float lines   = static_cast<float>(MAX_GRID_LINES);
    return std::max({spacing, MIN_GRID_SPACING, width / lines, height / lines});
}

float CyberpunkConfig::effective_header_height() const
{
    if (!show_header || header_text.empty())
        return 0.0f;
    return resolve_font(header_font, combo.theme).size + 16.0f;
}

// ─── Paths ──────────────────────────────────────────────────────────────────

Path chamfered_rect_path(const Rect& r, float chamfer)
{
    const float c = std::max(std::min({chamfer, r.w * 0.5f, r.h * 0.5f}), 0.0f);
    Path        p;
    p.move_to(r.x + c, r.y)
        .line_to(r.right() - c, r.y)
        .line_to(r.right(), r.y + c)
        .line_to(r.right(), r.bottom() - c)
        .line_to(r.right() - c, r.bottom())
        .line_to(r.x + c, r.bottom())
        .line_to(r.x, r.bottom() - c)
        .line_to(r.x, r.y + c)
        .close();
    return p;
}

Path angular_rect_path(const Rect& r, float point_size)
{
    const float s = std::max(std::min({point_size, r.w * 0.25f, r.h * 0.25f}), 0.0f);
    Path        p;
    p.move_to(r.x - s, r.center_y())
        .line_to(r.x, r.y)
        .line_to(r.center_x(), r.y - s)
        .line_to(r.right(), r.y)
        .line_to(r.right() + s, r.center_y())
        .line_to(r.right(), r.bottom())
        .line_to(r.center_x(), r.bottom() + s)
        .line_to(r.x, r.bottom())
        .close();
    return p;
}

Path bracket_corners_path(const Rect& r, float size)
{
    const float s = size;
    Path        p;
    p.move_to(r.x, r.y + s).line_to(r.x, r.y).line_to(r.x + s, r.y);
    p.move_to(r.right() - s, r.y).line_to(r.right(), r.y).line_to(r.right(), r.y + s);
    p.move_to(r.right(), r.bottom() - s).line_to(r.right(), r.bottom()).line_to(r.right() - s, r.bottom());
    p.move_to(r.x + s, r.bottom()).line_to(r.x, r.bottom()).line_to(r.x, r.bottom() - s);
    return p;
}

namespace
{

Path outline_path(const CyberpunkConfig& config, const Rect& frame)
{
    switch (config.corner_style)
    {
        case CornerStyle::Chamfer:
            return chamfered_rect_path(frame, config.corner_size);
        case CornerStyle::Angular:
            return angular_rect_path(frame, config.corner_size);
        case CornerStyle::Bracket:
            break;
    }
    Path p;
    p.rect(frame);
    return p;
}

void draw_glow(DrawSurface& surface, const CyberpunkConfig& config, const Path& outline)
{
    if (config.glow_intensity <= 0.0f)
        return;

    const Color border = resolve_color(config.border_color, config.theme());

    constexpr int steps = 4;
    for (int i = steps; i >= 1; --i)
    {
        float alpha = config.glow_intensity * (static_cast<float>(i) / steps) * 0.25f;
        surface.stroke_path(outline,
                            Stroke{border.with_alpha(alpha), config.border_width + i * 2.0f, {}});
    }
}

void draw_grid(DrawSurface& surface, const CyberpunkConfig& config, const Rect& frame)
{
    if (!config.show_grid || config.grid_spacing <= 0.0f)
        return;

    const Color grid    = resolve_color(config.grid_color, config.theme());
    const float spacing = config.effective_grid_spacing(frame.w, frame.h);
    Path        lines;
    for (size_t i = 1; i <= CyberpunkConfig::MAX_GRID_LINES; ++i)
    {
        const float x = frame.x + spacing * static_cast<float>(i);
        if (x >= frame.right())
            break;
        lines.move_to(x, frame.y).line_to(x, frame.bottom());
    }
    for (size_t i = 1; i <= CyberpunkConfig::MAX_GRID_LINES; ++i)
    {
        const float y = frame.y + spacing * static_cast<float>(i);
        if (y >= frame.bottom())
            break;
        lines.move_to(frame.x, y).line_to(frame.right(), y);
    }

    if (lines.empty())
        return;

    surface.push_clip(frame);
    surface.stroke_path(lines, Stroke{grid.with_alpha(grid.a * 0.2f), 0.5f, {}});
    surface.pop_clip();
}

void draw_scanlines(DrawSurface& surface, const CyberpunkConfig& config, const Rect& frame)
{
    if (!config.show_scanlines || config.scanline_opacity <= 0.0f)
        return;

    constexpr size_t max_lines = 4096;
    Path             lines;
    for (size_t i = 0; i < max_lines; ++i)
    {
        const float y = frame.y + 2.0f * static_cast<float>(i);
        if (y >= frame.bottom())
            break;
        lines.rect(Rect{frame.x, y, frame.w, 1.0f});
    }

    surface.push_clip(frame);
    surface.fill_path(lines, Color(0.0f, 0.0f, 0.0f, config.scanline_opacity));
    surface.pop_clip();
}

float draw_header(DrawSurface& surface, const CyberpunkConfig& config, const Rect& frame)
{
    const float header_h = std::min(config.effective_header_height(), frame.h);
    if (header_h <= 0.0f)
        return 0.0f;

    const FontSpec font         = resolve_font(config.header_font, config.theme());
    const Color    header_color = resolve_color(config.header_color, config.theme());
    const Color    border       = resolve_color(config.border_color, config.theme());

    TextStyle         style{font.family, font.size, true, false, header_color};
    const TextExtents extents = surface.measure_text(config.header_text, style);

    constexpr float padding = 10.0f;
    const float     text_x  = frame.x + (frame.w - extents.width) * 0.5f;
    const float     text_y  = frame.y + header_h * 0.5f + extents.height * 0.5f;

    surface.save();

    switch (config.header_style)
    {
        case CyberpunkHeaderStyle::Brackets:
        {
            const float mid     = frame.y + header_h * 0.5f;
            const float left_x  = frame.x + padding;
            const float right_x = frame.right() - padding;
            Path        p;
            p.move_to(left_x, mid - 8.0f).line_to(left_x, mid + 8.0f);
            p.move_to(left_x, mid).line_to(text_x - 10.0f, mid);
            p.move_to(right_x, mid - 8.0f).line_to(right_x, mid + 8.0f);
            p.move_to(text_x + extents.width + 10.0f, mid).line_to(right_x, mid);
            surface.stroke_path(p, Stroke{border, 1.5f, {}});
            break;
        }
        case CyberpunkHeaderStyle::Underline:
            surface.draw_line(frame.x + padding,
                              frame.y + header_h - 4.0f,
                              frame.right() - padding,
                              frame.y + header_h - 4.0f,
                              Stroke{border.with_alpha(0.6f), 1.0f, {}});
            break;
        case CyberpunkHeaderStyle::Box:
        {
            Rect box{text_x - 10.0f, frame.y + 4.0f, extents.width + 20.0f, std::max(header_h - 8.0f, 0.0f)};
            Path p = chamfered_rect_path(box, 4.0f);
            surface.fill_path(p, border.with_alpha(0.3f));
            surface.stroke_path(p, Stroke{border, 1.0f, {}});
            break;
        }
        case CyberpunkHeaderStyle::None:
            break;
    }

    surface.draw_text(text_x, text_y, config.header_text, style);
    surface.restore();
    return header_h;
}

void draw_divider(DrawSurface&           surface,
                  const CyberpunkConfig& config,
                  float                  x,
                  float                  y,
                  float                  length,
                  bool                   horizontal)
{
    const Color color = resolve_color(config.divider_color, config.theme());
    const float end_x = horizontal ? x + length : x;
    const float end_y = horizontal ? y : y + length;

    switch (config.divider_style)
    {
        case CyberpunkDividerStyle::Line:
            surface.draw_line(x, y, end_x, end_y, Stroke{color, config.divider_thickness, {}});
            break;

        case CyberpunkDividerStyle::Dashed:
            surface.draw_line(x, y, end_x, end_y, Stroke{color, config.divider_thickness, {8.0f, 4.0f}});
            break;

        case CyberpunkDividerStyle::Glow:
            for (int i = 3; i >= 1; --i)
            {
                float alpha = color.a * (static_cast<float>(i) / 3.0f) * 0.3f;
                surface.draw_line(
                    x, y, end_x, end_y, Stroke{color.with_alpha(alpha), config.divider_thickness + i * 2.0f, {}});
            }
            surface.draw_line(x, y, end_x, end_y, Stroke{color, config.divider_thickness, {}});
            break;

        case CyberpunkDividerStyle::Dots:
        {
            constexpr float  dot_spacing = 6.0f;
            constexpr float  dot_radius  = 1.5f;
            constexpr size_t max_dots    = 1024;
            Path             dots;
            for (size_t i = 0; i < max_dots; ++i)
            {
                const float t = dot_spacing * static_cast<float>(i);
                if (!(t < length))
                    break;
                if (horizontal)
                    dots.circle(x + t, y, dot_radius);
                else
                    dots.circle(x, y + t, dot_radius);
            }
            if (!dots.empty())
                surface.fill_path(dots, color);
            break;
        }

        case CyberpunkDividerStyle::None:
            break;
    }
}

}   // namespace

// ─── Renderer ───────────────────────────────────────────────────────────────

Rect CyberpunkRenderer::render(DrawSurface&           surface,
                               const CyberpunkConfig& config,
                               float                  width,
                               float                  height) const
{
    const Color background = resolve_color(config.background_color, config.theme());
    const Color border     = resolve_color(config.border_color, config.theme());

    // The frame never leaves the panel, even when the glow does not fit
    const float margin = std::min({config.frame_margin(), width * 0.5f, height * 0.5f});
    const Rect  frame{margin,
                     margin,
                     std::max(width - margin * 2.0f, 0.0f),
                     std::max(height - margin * 2.0f, 0.0f)};
    const Path  outline = outline_path(config, frame);

    surface.save();

    draw_glow(surface, config, outline);
    surface.fill_path(outline, background);
    draw_grid(surface, config, frame);

    surface.stroke_path(outline, Stroke{border, config.border_width, {}});
    if (config.corner_style == CornerStyle::Bracket)
        surface.stroke_path(bracket_corners_path(frame, config.corner_size),
                            Stroke{border, config.border_width, {}});

    const float header_h = draw_header(surface, config, frame);
    draw_scanlines(surface, config, frame);

    surface.restore();

    return inner_content_rect(frame, header_h, config.layout().content_padding);
}

void CyberpunkRenderer::draw_dividers(DrawSurface&           surface,
                                      const CyberpunkConfig& config,
                                      std::span<const Rect>  groups) const
{
    if (config.divider_style == CyberpunkDividerStyle::None)
        return;

    const Orientation split = config.layout().split_orientation;
    surface.save();
    for (size_t i = 0; i + 1 < groups.size(); ++i)
    {
        Rect band = divider_band(groups, i, split, config.divider_width(), config.divider_padding());
        if (split == Orientation::Vertical)
            draw_divider(surface, config, band.x, band.center_y(), band.w, true);
        else
            draw_divider(surface, config, band.center_x(), band.y, band.h, false);
    }
    surface.restore();
}

void CyberpunkRenderer::draw_item(DrawSurface&           surface,
                                  const CyberpunkConfig& config,
                                  const Rect&            item) const
{
    if (!config.item_frames || item.empty())
        return;

    const Color color = resolve_color(config.item_frame_color, config.theme());
    const Path  frame = chamfered_rect_path(item, 4.0f);

    if (config.item_glow)
    {
        for (int i = 2; i >= 1; --i)
        {
            float alpha = color.a * (static_cast<float>(i) / 2.0f) * 0.3f;
            surface.stroke_path(frame, Stroke{color.with_alpha(alpha), 1.0f + i, {}});
        }
    }
    surface.stroke_path(frame, Stroke{color, 1.0f, {}});
}

}   // namespace combopanel
