#include <algorithm>
#include <cmath>
#include <combopanel/draw_surface.hpp>
#include <numbers>

namespace combopanel
{

LinearGradient linear_gradient_for(const Rect& rect, float angle_deg, std::vector<ResolvedStop> stops)
{
    const float rad = angle_deg * std::numbers::pi_v<float> / 180.0f;
    const float dx  = std::cos(rad);
    const float dy  = std::sin(rad);

    // Half-length of the gradient line so both corners land on the end stops
    const float half = std::abs(rect.w * 0.5f * dx) + std::abs(rect.h * 0.5f * dy);

    LinearGradient g;
    g.x0    = rect.center_x() - dx * half;
    g.y0    = rect.center_y() - dy * half;
    g.x1    = rect.center_x() + dx * half;
    g.y1    = rect.center_y() + dy * half;
    g.stops = std::move(stops);
    return g;
}

// ─── Path ───────────────────────────────────────────────────────────────────

Path& Path::move_to(float x, float y)
{
    elements_.push_back({Verb::MoveTo, {x, y}});
    return *this;
}

Path& Path::line_to(float x, float y)
{
    elements_.push_back({Verb::LineTo, {x, y}});
    return *this;
}

Path& Path::curve_to(float x1, float y1, float x2, float y2, float x3, float y3)
{
    elements_.push_back({Verb::CurveTo, {x1, y1, x2, y2, x3, y3}});
    return *this;
}

Path& Path::arc(float cx, float cy, float radius, float angle0, float angle1)
{
    elements_.push_back({Verb::Arc, {cx, cy, radius, angle0, angle1}});
    return *this;
}

Path& Path::close()
{
    elements_.push_back({Verb::Close, {}});
    return *this;
}

Path& Path::rect(const Rect& r)
{
    move_to(r.x, r.y);
    line_to(r.right(), r.y);
    line_to(r.right(), r.bottom());
    line_to(r.x, r.bottom());
    return close();
}

Path& Path::rounded_rect(const Rect& r, float radius)
{
    const float rr = std::max(std::min({radius, r.w * 0.5f, r.h * 0.5f}), 0.0f);
    if (rr <= 0.0f)
        return rect(r);

    constexpr float pi = std::numbers::pi_v<float>;
    move_to(r.x + rr, r.y);
    line_to(r.right() - rr, r.y);
    arc(r.right() - rr, r.y + rr, rr, -pi * 0.5f, 0.0f);
    line_to(r.right(), r.bottom() - rr);
    arc(r.right() - rr, r.bottom() - rr, rr, 0.0f, pi * 0.5f);
    line_to(r.x + rr, r.bottom());
    arc(r.x + rr, r.bottom() - rr, rr, pi * 0.5f, pi);
    line_to(r.x, r.y + rr);
    arc(r.x + rr, r.y + rr, rr, pi, pi * 1.5f);
    return close();
}

Path& Path::circle(float cx, float cy, float radius)
{
    move_to(cx + radius, cy);
    arc(cx, cy, radius, 0.0f, 2.0f * std::numbers::pi_v<float>);
    return close();
}

void DrawSurface::draw_line(float x0, float y0, float x1, float y1, const Stroke& stroke)
{
    Path p;
    p.move_to(x0, y0).line_to(x1, y1);
    stroke_path(p, stroke);
}

}   // namespace combopanel
