#pragma once

#include <array>
#include <combopanel/color.hpp>
#include <combopanel/geometry.hpp>
#include <combopanel/theme.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace combopanel
{

struct Stroke
{
    Color              color;
    float              width = 1.0f;
    std::vector<float> dash;   // on/off lengths, empty = solid
};

struct TextStyle
{
    std::string family = FALLBACK_FONT_FAMILY;
    float       size   = FALLBACK_FONT_SIZE;
    bool        bold   = false;
    bool        italic = false;
    Color       color  = colors::white;
};

struct TextExtents
{
    float width  = 0.0f;
    float height = 0.0f;
};

// Gradient along the segment (x0, y0) -> (x1, y1)
struct LinearGradient
{
    float                     x0 = 0.0f, y0 = 0.0f, x1 = 0.0f, y1 = 0.0f;
    std::vector<ResolvedStop> stops;
};

// Gradient from (cx, cy) out to `radius`
struct RadialGradient
{
    float                     cx = 0.0f, cy = 0.0f, radius = 0.0f;
    std::vector<ResolvedStop> stops;
};

// Linear gradient covering `rect` in the direction given by `angle_deg`
LinearGradient linear_gradient_for(const Rect& rect, float angle_deg, std::vector<ResolvedStop> stops);

// Vector path built from move/line/curve/arc/close commands
class Path
{
   public:
    enum class Verb
    {
        MoveTo,
        LineTo,
        CurveTo,   // p[0..5] = c1, c2, end
        Arc,       // p[0..4] = cx, cy, radius, angle0, angle1 (radians, clockwise in y-down)
        Close,
    };

    struct Element
    {
        Verb                 verb;
        std::array<float, 6> p{};
    };

    Path& move_to(float x, float y);
    Path& line_to(float x, float y);
    Path& curve_to(float x1, float y1, float x2, float y2, float x3, float y3);
    Path& arc(float cx, float cy, float radius, float angle0, float angle1);
    Path& close();

    Path& rect(const Rect& r);
    Path& rounded_rect(const Rect& r, float radius);
    Path& circle(float cx, float cy, float radius);

    const std::vector<Element>& elements() const { return elements_; }
    bool                        empty() const { return elements_.empty(); }
    void                        clear() { elements_.clear(); }

   private:
    std::vector<Element> elements_;
};

// Abstract vector-graphics sink a skin draws into.
// begin_frame/end_frame report backend failure; individual draw calls never do.
class DrawSurface
{
   public:
    virtual ~DrawSurface() = default;

    virtual bool begin_frame(float width, float height) = 0;
    virtual bool end_frame()                            = 0;

    // Set when the backend failed since begin_frame
    virtual bool        ok() const         = 0;
    virtual std::string last_error() const = 0;

    virtual void save()    = 0;
    virtual void restore() = 0;

    virtual void push_clip(const Rect& rect) = 0;
    virtual void pop_clip()                  = 0;

    virtual void fill_rect(const Rect& rect, const Color& color)                             = 0;
    virtual void stroke_rect(const Rect& rect, const Stroke& stroke)                         = 0;
    virtual void fill_rounded_rect(const Rect& rect, float radius, const Color& color)       = 0;
    virtual void stroke_rounded_rect(const Rect& rect, float radius, const Stroke& stroke)   = 0;
    virtual void fill_path(const Path& path, const Color& color)                             = 0;
    virtual void stroke_path(const Path& path, const Stroke& stroke)                         = 0;
    virtual void fill_linear_gradient(const Rect& rect, const LinearGradient& gradient)      = 0;
    virtual void fill_radial_gradient(const Rect& rect, const RadialGradient& gradient)      = 0;

    virtual TextExtents measure_text(std::string_view text, const TextStyle& style) = 0;

    // (x, y) is the left end of the baseline
    virtual void draw_text(float x, float y, std::string_view text, const TextStyle& style) = 0;

    // Single straight segment
    void draw_line(float x0, float y0, float x1, float y1, const Stroke& stroke);
};

}   // namespace combopanel
