#include <algorithm>
#include <cfloat>
#include <cmath>
#include <combopanel/imgui_surface.hpp>
#include <combopanel/logger.hpp>
#include <imgui.h>

#include "text/font_cache.hpp"

namespace combopanel
{

namespace
{

// Baseline offset from the top of the line box, as a fraction of the size
constexpr float ASCENT_RATIO = 0.8f;

ImU32 to_imgui(const Color& c)
{
    const Color k = c.clamped();
    return IM_COL32(static_cast<int>(k.r * 255.0f + 0.5f),
                    static_cast<int>(k.g * 255.0f + 0.5f),
                    static_cast<int>(k.b * 255.0f + 0.5f),
                    static_cast<int>(k.a * 255.0f + 0.5f));
}

// Calls fn(begin, end) for each subpath; a MoveTo starts a new one
template <typename Fn>
void for_each_subpath(const Path& path, Fn&& fn)
{
    const auto& els   = path.elements();
    size_t      start = 0;
    for (size_t i = 1; i <= els.size(); ++i)
    {
        if (i == els.size() || els[i].verb == Path::Verb::MoveTo)
        {
            fn(start, i);
            start = i;
        }
    }
}

bool is_closed(const Path& path, size_t begin, size_t end)
{
    for (size_t i = begin; i < end; ++i)
    {
        if (path.elements()[i].verb == Path::Verb::Close)
            return true;
    }
    return false;
}

bool is_polyline(const Path& path)
{
    return std::all_of(path.elements().begin(),
                       path.elements().end(),
                       [](const Path::Element& e)
                       {
                           return e.verb == Path::Verb::MoveTo || e.verb == Path::Verb::LineTo
                                  || e.verb == Path::Verb::Close;
                       });
}

}   // namespace

ImGuiSurface::ImGuiSurface(ImDrawList* draw_list, size_t font_cache_capacity) : draw_list_(draw_list)
{
    metrics_ = std::make_unique<FontMetricsCache>(
        font_cache_capacity,
        [this](std::string_view text, const TextStyle& style)
        {
            ImFont* font = font_for(style);
            if (!font)
                return FontMetricsCache::approximate_extents(text, style);
            ImVec2 size =
                font->CalcTextSizeA(style.size, FLT_MAX, 0.0f, text.data(), text.data() + text.size());
            return TextExtents{size.x, size.y};
        });
}

ImGuiSurface::~ImGuiSurface() = default;

void ImGuiSurface::set_origin(float x, float y)
{
    origin_x_ = x;
    origin_y_ = y;
}

void ImGuiSurface::register_font(const std::string& family, ImFont* font)
{
    fonts_[family] = font;
    metrics_->clear();
}

void ImGuiSurface::set_default_font(ImFont* font)
{
    default_font_ = font;
    metrics_->clear();
}

size_t ImGuiSurface::font_cache_size() const
{
    return metrics_->size();
}

ImFont* ImGuiSurface::font_for(const TextStyle& style) const
{
    auto it = fonts_.find(style.family);
    return it != fonts_.end() && it->second ? it->second : default_font_;
}

void ImGuiSurface::fail(std::string message)
{
    COMBOPANEL_LOG_ERROR("surface", "ImGui surface: {}", message);
    if (error_.empty())
        error_ = std::move(message);
}

bool ImGuiSurface::begin_frame(float width, float height)
{
    error_.clear();
    if (!draw_list_)
    {
        fail("no draw list");
        return false;
    }
    if (in_frame_)
    {
        in_frame_ = false;
        fail("begin_frame called twice");
        return false;
    }

    in_frame_   = true;
    open_clips_ = 0;
    saved_clips_.clear();
    draw_list_->PushClipRect(ImVec2(origin_x_, origin_y_),
                             ImVec2(origin_x_ + width, origin_y_ + height),
                             true);
    return true;
}

bool ImGuiSurface::end_frame()
{
    if (!in_frame_)
    {
        fail("end_frame without begin_frame");
        return false;
    }
    in_frame_ = false;

    while (open_clips_ > 0)
        pop_clip();
    saved_clips_.clear();
    draw_list_->PopClipRect();
    return ok();
}

void ImGuiSurface::save()
{
    saved_clips_.push_back(open_clips_);
}

void ImGuiSurface::restore()
{
    if (saved_clips_.empty())
    {
        COMBOPANEL_LOG_WARN("surface", "restore() without matching save()");
        return;
    }
    const int target = saved_clips_.back();
    saved_clips_.pop_back();
    while (open_clips_ > target)
        pop_clip();
}

void ImGuiSurface::push_clip(const Rect& rect)
{
    draw_list_->PushClipRect(ImVec2(origin_x_ + rect.x, origin_y_ + rect.y),
                             ImVec2(origin_x_ + rect.right(), origin_y_ + rect.bottom()),
                             true);
    ++open_clips_;
}

void ImGuiSurface::pop_clip()
{
    if (open_clips_ == 0)
    {
        COMBOPANEL_LOG_WARN("surface", "pop_clip() without matching push_clip()");
        return;
    }
    --open_clips_;
    draw_list_->PopClipRect();
}

void ImGuiSurface::fill_rect(const Rect& rect, const Color& color)
{
    draw_list_->AddRectFilled(ImVec2(origin_x_ + rect.x, origin_y_ + rect.y),
                              ImVec2(origin_x_ + rect.right(), origin_y_ + rect.bottom()),
                              to_imgui(color));
}

void ImGuiSurface::stroke_rect(const Rect& rect, const Stroke& stroke)
{
    if (!stroke.dash.empty())
    {
        stroke_dashed(Path().rect(rect), stroke);
        return;
    }
    draw_list_->AddRect(ImVec2(origin_x_ + rect.x, origin_y_ + rect.y),
                        ImVec2(origin_x_ + rect.right(), origin_y_ + rect.bottom()),
                        to_imgui(stroke.color),
                        0.0f,
                        ImDrawFlags_None,
                        stroke.width);
}

void ImGuiSurface::fill_rounded_rect(const Rect& rect, float radius, const Color& color)
{
    draw_list_->AddRectFilled(ImVec2(origin_x_ + rect.x, origin_y_ + rect.y),
                              ImVec2(origin_x_ + rect.right(), origin_y_ + rect.bottom()),
                              to_imgui(color),
                              std::max(radius, 0.0f));
}

void ImGuiSurface::stroke_rounded_rect(const Rect& rect, float radius, const Stroke& stroke)
{
    draw_list_->AddRect(ImVec2(origin_x_ + rect.x, origin_y_ + rect.y),
                        ImVec2(origin_x_ + rect.right(), origin_y_ + rect.bottom()),
                        to_imgui(stroke.color),
                        std::max(radius, 0.0f),
                        ImDrawFlags_None,
                        stroke.width);
}

void ImGuiSurface::trace_path(const Path& path, size_t begin, size_t end)
{
    bool has_point = false;
    for (size_t i = begin; i < end; ++i)
    {
        const auto& e = path.elements()[i];
        switch (e.verb)
        {
            case Path::Verb::MoveTo:
            case Path::Verb::LineTo:
                draw_list_->PathLineTo(ImVec2(origin_x_ + e.p[0], origin_y_ + e.p[1]));
                has_point = true;
                break;
            case Path::Verb::CurveTo:
                if (!has_point)
                    break;
                draw_list_->PathBezierCubicCurveTo(ImVec2(origin_x_ + e.p[0], origin_y_ + e.p[1]),
                                                   ImVec2(origin_x_ + e.p[2], origin_y_ + e.p[3]),
                                                   ImVec2(origin_x_ + e.p[4], origin_y_ + e.p[5]));
                break;
            case Path::Verb::Arc:
                draw_list_->PathArcTo(ImVec2(origin_x_ + e.p[0], origin_y_ + e.p[1]), e.p[2], e.p[3], e.p[4]);
                has_point = true;
                break;
            case Path::Verb::Close:
                break;
        }
    }
}

void ImGuiSurface::fill_path(const Path& path, const Color& color)
{
    const ImU32 col = to_imgui(color);
    for_each_subpath(path,
                     [&](size_t begin, size_t end)
                     {
                         trace_path(path, begin, end);
                         draw_list_->PathFillConvex(col);
                     });
}

void ImGuiSurface::stroke_path(const Path& path, const Stroke& stroke)
{
    // ImDrawList has no dash support; straight segments are split by hand
    if (!stroke.dash.empty() && is_polyline(path))
    {
        stroke_dashed(path, stroke);
        return;
    }

    const ImU32 col = to_imgui(stroke.color);
    for_each_subpath(path,
                     [&](size_t begin, size_t end)
                     {
                         trace_path(path, begin, end);
                         draw_list_->PathStroke(col,
                                                is_closed(path, begin, end) ? ImDrawFlags_Closed
                                                                            : ImDrawFlags_None,
                                                stroke.width);
                     });
}

void ImGuiSurface::stroke_dashed(const Path& path, const Stroke& stroke)
{
    float pattern = 0.0f;
    for (float d : stroke.dash)
        pattern += std::max(d, 0.0f);
    if (pattern <= 0.0f)
        return;

    const ImU32 col = to_imgui(stroke.color);
    for_each_subpath(
        path,
        [&](size_t begin, size_t end)
        {
            std::vector<ImVec2> pts;
            for (size_t i = begin; i < end; ++i)
            {
                const auto& e = path.elements()[i];
                if (e.verb == Path::Verb::Close && !pts.empty())
                    pts.push_back(pts.front());
                else if (e.verb != Path::Verb::Close)
                    pts.push_back(ImVec2(origin_x_ + e.p[0], origin_y_ + e.p[1]));
            }

            // Phase carries across corners
            size_t dash_index = 0;
            float  remaining  = stroke.dash[0];
            bool   on         = true;
            for (size_t i = 1; i < pts.size(); ++i)
            {
                const float dx  = pts[i].x - pts[i - 1].x;
                const float dy  = pts[i].y - pts[i - 1].y;
                const float len = std::sqrt(dx * dx + dy * dy);
                float       pos = 0.0f;
                while (len > 0.0f && pos < len)
                {
                    const float step = std::min(remaining, len - pos);
                    if (on && step > 0.0f)
                    {
                        const float t0 = pos / len;
                        const float t1 = (pos + step) / len;
                        draw_list_->AddLine(ImVec2(pts[i - 1].x + dx * t0, pts[i - 1].y + dy * t0),
                                            ImVec2(pts[i - 1].x + dx * t1, pts[i - 1].y + dy * t1),
                                            col,
                                            stroke.width);
                    }
                    pos += step;
                    remaining -= step;
                    if (remaining <= 0.0f)
                    {
                        dash_index = (dash_index + 1) % stroke.dash.size();
                        remaining  = std::max(stroke.dash[dash_index], 0.0f);
                        on         = (dash_index % 2) == 0;
                    }
                }
            }
        });
}

void ImGuiSurface::fill_linear_gradient(const Rect& rect, const LinearGradient& gradient)
{
    const float gx  = gradient.x1 - gradient.x0;
    const float gy  = gradient.y1 - gradient.y0;
    const float len = gx * gx + gy * gy;
    if (gradient.stops.empty() || len <= 0.0f)
    {
        fill_rect(rect, sample_gradient(gradient.stops, 0.0f));
        return;
    }

    auto color_at = [&](float x, float y)
    {
        const float t = ((x - gradient.x0) * gx + (y - gradient.y0) * gy) / len;
        return to_imgui(sample_gradient(gradient.stops, t));
    };

    // Strips across the dominant direction, each a four-color quad
    const bool horizontal = std::abs(gx) >= std::abs(gy);
    for (int i = 0; i < GRADIENT_STEPS; ++i)
    {
        const float f0 = static_cast<float>(i) / GRADIENT_STEPS;
        const float f1 = static_cast<float>(i + 1) / GRADIENT_STEPS;

        Rect strip = horizontal ? Rect{rect.x + rect.w * f0, rect.y, rect.w * (f1 - f0), rect.h}
                                : Rect{rect.x, rect.y + rect.h * f0, rect.w, rect.h * (f1 - f0)};

        const ImU32 tl = color_at(strip.x, strip.y);
        const ImU32 tr = color_at(strip.right(), strip.y);
        const ImU32 br = color_at(strip.right(), strip.bottom());
        const ImU32 bl = color_at(strip.x, strip.bottom());
        draw_list_->AddRectFilledMultiColor(ImVec2(origin_x_ + strip.x, origin_y_ + strip.y),
                                            ImVec2(origin_x_ + strip.right(), origin_y_ + strip.bottom()),
                                            tl,
                                            tr,
                                            br,
                                            bl);
    }
}

void ImGuiSurface::fill_radial_gradient(const Rect& rect, const RadialGradient& gradient)
{
    if (gradient.stops.empty() || gradient.radius <= 0.0f)
    {
        fill_rect(rect, sample_gradient(gradient.stops, 0.0f));
        return;
    }

    push_clip(rect);

    // Non-overlapping rings so translucent stops do not stack
    const ImVec2 center(origin_x_ + gradient.cx, origin_y_ + gradient.cy);
    const float  band = gradient.radius / GRADIENT_STEPS;
    draw_list_->AddCircleFilled(center, band, to_imgui(sample_gradient(gradient.stops, 0.0f)));
    for (int i = 1; i < GRADIENT_STEPS; ++i)
    {
        const float t = (static_cast<float>(i) + 0.5f) / GRADIENT_STEPS;
        draw_list_->AddCircle(center,
                              band * (static_cast<float>(i) + 0.5f),
                              to_imgui(sample_gradient(gradient.stops, t)),
                              0,
                              band);
    }

    // Beyond the radius the last stop extends to the corners
    const float far = std::hypot(std::max(std::abs(rect.x - gradient.cx), std::abs(rect.right() - gradient.cx)),
                                 std::max(std::abs(rect.y - gradient.cy), std::abs(rect.bottom() - gradient.cy)));
    if (far > gradient.radius)
    {
        draw_list_->AddCircle(center,
                              (gradient.radius + far) * 0.5f,
                              to_imgui(sample_gradient(gradient.stops, 1.0f)),
                              0,
                              far - gradient.radius);
    }

    pop_clip();
}

TextExtents ImGuiSurface::measure_text(std::string_view text, const TextStyle& style)
{
    return metrics_->measure(text, style);
}

void ImGuiSurface::draw_text(float x, float y, std::string_view text, const TextStyle& style)
{
    if (text.empty())
        return;
    draw_list_->AddText(font_for(style),
                        style.size,
                        ImVec2(origin_x_ + x, origin_y_ + y - style.size * ASCENT_RATIO),
                        to_imgui(style.color),
                        text.data(),
                        text.data() + text.size());
}

}   // namespace combopanel
