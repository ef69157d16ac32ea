#include <algorithm>
#include <cmath>
#include <combopanel/logger.hpp>
#include <combopanel/svg_surface.hpp>
#include <cstdio>
#include <fstream>
#include <numbers>

#include "text/font_cache.hpp"

namespace combopanel
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

// Convert a Color to an SVG rgb() string
std::string svg_color(const Color& c)
{
    const Color k = c.clamped();
    char        buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "rgb(%d,%d,%d)",
                  static_cast<int>(std::lround(k.r * 255.0f)),
                  static_cast<int>(std::lround(k.g * 255.0f)),
                  static_cast<int>(std::lround(k.b * 255.0f)));
    return buf;
}

// Convert a float to a compact string (no trailing zeros)
std::string fmt(float v)
{
    if (!std::isfinite(v))
        v = 0.0f;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", static_cast<double>(v));
    return buf;
}

// XML-escape a string for safe embedding in SVG attributes/text content
std::string xml_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string fill_attrs(const Color& c)
{
    std::string out = "fill=\"" + svg_color(c) + "\"";
    if (c.a < 1.0f)
        out += " fill-opacity=\"" + fmt(std::clamp(c.a, 0.0f, 1.0f)) + "\"";
    return out;
}

std::string stroke_attrs(const Stroke& s)
{
    std::string out = "fill=\"none\" stroke=\"" + svg_color(s.color) + "\" stroke-width=\""
                      + fmt(s.width) + "\"";
    if (s.color.a < 1.0f)
        out += " stroke-opacity=\"" + fmt(std::clamp(s.color.a, 0.0f, 1.0f)) + "\"";
    if (!s.dash.empty())
    {
        out += " stroke-dasharray=\"";
        for (size_t i = 0; i < s.dash.size(); ++i)
        {
            if (i > 0)
                out += ',';
            out += fmt(s.dash[i]);
        }
        out += '"';
    }
    return out;
}

std::string rect_attrs(const Rect& r)
{
    return "x=\"" + fmt(r.x) + "\" y=\"" + fmt(r.y) + "\" width=\"" + fmt(std::max(r.w, 0.0f))
           + "\" height=\"" + fmt(std::max(r.h, 0.0f)) + "\"";
}

// Arc segments become SVG elliptical arcs; sweeps of a full turn or more are
// split in two since SVG cannot draw a closed arc in one command.
void append_arc(std::string& d, const Path::Element& e, bool has_point)
{
    constexpr float tau = 2.0f * std::numbers::pi_v<float>;

    const float cx = e.p[0], cy = e.p[1], r = e.p[2];
    float       a0 = e.p[3], a1 = e.p[4];
    if (a1 - a0 > tau)
        a1 = a0 + tau;
    else if (a0 - a1 > tau)
        a1 = a0 - tau;

    d += has_point ? "L" : "M";
    d += fmt(cx + r * std::cos(a0)) + " " + fmt(cy + r * std::sin(a0)) + " ";

    const float sweep  = a1 - a0;
    const int   pieces = std::abs(sweep) >= tau * 0.5f ? 2 : 1;
    for (int i = 1; i <= pieces; ++i)
    {
        const float a     = a0 + sweep * static_cast<float>(i) / static_cast<float>(pieces);
        const float piece = std::abs(sweep) / static_cast<float>(pieces);
        d += "A" + fmt(r) + " " + fmt(r) + " 0 " + (piece > std::numbers::pi_v<float> ? "1" : "0")
             + " " + (sweep > 0.0f ? "1" : "0") + " " + fmt(cx + r * std::cos(a)) + " "
             + fmt(cy + r * std::sin(a)) + " ";
    }
}

std::string path_data(const Path& path)
{
    std::string d;
    bool        has_point = false;
    for (const auto& e : path.elements())
    {
        switch (e.verb)
        {
            case Path::Verb::MoveTo:
                d += "M" + fmt(e.p[0]) + " " + fmt(e.p[1]) + " ";
                has_point = true;
                break;
            case Path::Verb::LineTo:
                d += "L" + fmt(e.p[0]) + " " + fmt(e.p[1]) + " ";
                has_point = true;
                break;
            case Path::Verb::CurveTo:
                d += "C" + fmt(e.p[0]) + " " + fmt(e.p[1]) + " " + fmt(e.p[2]) + " " + fmt(e.p[3])
                     + " " + fmt(e.p[4]) + " " + fmt(e.p[5]) + " ";
                has_point = true;
                break;
            case Path::Verb::Arc:
                append_arc(d, e, has_point);
                has_point = true;
                break;
            case Path::Verb::Close:
                d += "Z ";
                break;
        }
    }
    if (!d.empty())
        d.pop_back();
    return d;
}

// SVG needs ascending offsets
std::vector<ResolvedStop> sorted_stops(const std::vector<ResolvedStop>& stops)
{
    std::vector<ResolvedStop> out = stops;
    std::stable_sort(out.begin(),
                     out.end(),
                     [](const ResolvedStop& a, const ResolvedStop& b) { return a.position < b.position; });
    return out;
}

void write_stops(std::ostringstream& defs, const std::vector<ResolvedStop>& stops)
{
    for (const auto& s : sorted_stops(stops))
    {
        defs << "      <stop offset=\"" << fmt(std::clamp(s.position, 0.0f, 1.0f))
             << "\" stop-color=\"" << svg_color(s.color) << "\" stop-opacity=\""
             << fmt(std::clamp(s.color.a, 0.0f, 1.0f)) << "\"/>\n";
    }
}

}   // anonymous namespace

// ─── SvgSurface ─────────────────────────────────────────────────────────────

SvgSurface::SvgSurface(size_t font_cache_capacity)
    : fonts_(std::make_unique<FontMetricsCache>(font_cache_capacity))
{
}

SvgSurface::~SvgSurface() = default;

size_t SvgSurface::font_cache_size() const
{
    return fonts_->size();
}

void SvgSurface::fail(std::string message)
{
    COMBOPANEL_LOG_ERROR("surface", "SVG surface: {}", message);
    if (error_.empty())
        error_ = std::move(message);
}

void SvgSurface::indent()
{
    body_ << std::string(static_cast<size_t>(2 + 2 * open_clips_), ' ');
}

std::string SvgSurface::next_id(const char* prefix)
{
    return std::string(prefix) + std::to_string(++id_counter_);
}

bool SvgSurface::begin_frame(float width, float height)
{
    error_.clear();
    if (in_frame_)
    {
        // Previous frame never finished; drop it
        in_frame_ = false;
        fail("begin_frame called twice");
        return false;
    }
    if (!(width >= 1.0f) || !(height >= 1.0f))
    {
        fail("invalid frame size");
        return false;
    }

    width_      = width;
    height_     = height;
    in_frame_   = true;
    id_counter_ = 0;
    open_clips_ = 0;
    saved_clips_.clear();
    body_.str(std::string());
    defs_.str(std::string());
    return true;
}

bool SvgSurface::end_frame()
{
    if (!in_frame_)
    {
        fail("end_frame without begin_frame");
        return false;
    }
    in_frame_ = false;

    while (open_clips_ > 0)
    {
        --open_clips_;
        indent();
        body_ << "</g>\n";
    }
    saved_clips_.clear();

    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << fmt(width_) << "\" height=\""
        << fmt(height_) << "\" viewBox=\"0 0 " << fmt(width_) << " " << fmt(height_) << "\">\n";

    const std::string defs = defs_.str();
    if (!defs.empty())
        svg << "  <defs>\n" << defs << "  </defs>\n";

    svg << body_.str();
    svg << "</svg>\n";
    document_ = svg.str();

    if (!output_path_.empty())
    {
        std::ofstream file(output_path_);
        if (!file.is_open())
        {
            fail("cannot open " + output_path_);
            return false;
        }
        file << document_;
        if (!file.good())
        {
            fail("write failed for " + output_path_);
            return false;
        }
    }
    return ok();
}

void SvgSurface::save()
{
    saved_clips_.push_back(open_clips_);
}

void SvgSurface::restore()
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

void SvgSurface::push_clip(const Rect& rect)
{
    const std::string id = next_id("clip");
    defs_ << "    <clipPath id=\"" << id << "\"><rect " << rect_attrs(rect) << "/></clipPath>\n";
    indent();
    body_ << "<g clip-path=\"url(#" << id << ")\">\n";
    ++open_clips_;
}

void SvgSurface::pop_clip()
{
    if (open_clips_ == 0)
    {
        COMBOPANEL_LOG_WARN("surface", "pop_clip() without matching push_clip()");
        return;
    }
    --open_clips_;
    indent();
    body_ << "</g>\n";
}

void SvgSurface::fill_rect(const Rect& rect, const Color& color)
{
    indent();
    body_ << "<rect " << rect_attrs(rect) << " " << fill_attrs(color) << "/>\n";
}

void SvgSurface::stroke_rect(const Rect& rect, const Stroke& stroke)
{
    indent();
    body_ << "<rect " << rect_attrs(rect) << " " << stroke_attrs(stroke) << "/>\n";
}

void SvgSurface::fill_rounded_rect(const Rect& rect, float radius, const Color& color)
{
    indent();
    body_ << "<rect " << rect_attrs(rect) << " rx=\"" << fmt(std::max(radius, 0.0f)) << "\" "
          << fill_attrs(color) << "/>\n";
}

void SvgSurface::stroke_rounded_rect(const Rect& rect, float radius, const Stroke& stroke)
{
    indent();
    body_ << "<rect " << rect_attrs(rect) << " rx=\"" << fmt(std::max(radius, 0.0f)) << "\" "
          << stroke_attrs(stroke) << "/>\n";
}

void SvgSurface::fill_path(const Path& path, const Color& color)
{
    if (path.empty())
        return;
    indent();
    body_ << "<path d=\"" << path_data(path) << "\" " << fill_attrs(color) << "/>\n";
}

void SvgSurface::stroke_path(const Path& path, const Stroke& stroke)
{
    if (path.empty())
        return;
    indent();
    body_ << "<path d=\"" << path_data(path) << "\" " << stroke_attrs(stroke) << "/>\n";
}

void SvgSurface::fill_linear_gradient(const Rect& rect, const LinearGradient& gradient)
{
    const std::string id = next_id("grad");
    defs_ << "    <linearGradient id=\"" << id << "\" gradientUnits=\"userSpaceOnUse\" x1=\""
          << fmt(gradient.x0) << "\" y1=\"" << fmt(gradient.y0) << "\" x2=\"" << fmt(gradient.x1)
          << "\" y2=\"" << fmt(gradient.y1) << "\">\n";
    write_stops(defs_, gradient.stops);
    defs_ << "    </linearGradient>\n";

    indent();
    body_ << "<rect " << rect_attrs(rect) << " fill=\"url(#" << id << ")\"/>\n";
}

void SvgSurface::fill_radial_gradient(const Rect& rect, const RadialGradient& gradient)
{
    const std::string id = next_id("grad");
    defs_ << "    <radialGradient id=\"" << id << "\" gradientUnits=\"userSpaceOnUse\" cx=\""
          << fmt(gradient.cx) << "\" cy=\"" << fmt(gradient.cy) << "\" r=\""
          << fmt(std::max(gradient.radius, 0.0f)) << "\">\n";
    write_stops(defs_, gradient.stops);
    defs_ << "    </radialGradient>\n";

    indent();
    body_ << "<rect " << rect_attrs(rect) << " fill=\"url(#" << id << ")\"/>\n";
}

TextExtents SvgSurface::measure_text(std::string_view text, const TextStyle& style)
{
    return fonts_->measure(text, style);
}

void SvgSurface::draw_text(float x, float y, std::string_view text, const TextStyle& style)
{
    if (text.empty())
        return;
    indent();
    body_ << "<text x=\"" << fmt(x) << "\" y=\"" << fmt(y) << "\" font-family=\""
          << xml_escape(style.family) << "\" font-size=\"" << fmt(style.size) << "\"";
    if (style.bold)
        body_ << " font-weight=\"bold\"";
    if (style.italic)
        body_ << " font-style=\"italic\"";
    body_ << " " << fill_attrs(style.color) << ">" << xml_escape(text) << "</text>\n";
}

}   // namespace combopanel
