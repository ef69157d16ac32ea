#pragma once

#include <combopanel/frame_config.hpp>
#include <combopanel/geometry.hpp>
#include <combopanel/theme.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace combopanel
{

class DrawSurface;

using MetricValue  = std::variant<double, std::string, bool>;
using MetricValues = std::unordered_map<std::string, MetricValue>;

// Values published for one slot, read from "{slot}_caption", "{slot}_value", ...
struct SlotData
{
    std::string caption;
    std::string value;
    std::string unit;
    double      numerical_value = 0.0;
    double      min_limit       = 0.0;
    double      max_limit       = 100.0;

    // numerical_value mapped to [0, 1] within the limits
    double percent() const;
};

struct ContentItemContext
{
    std::string_view         slot;
    const ContentItemConfig& config;
    Rect                     rect;
    const Theme&             theme;
    const SlotData&          data;
    double                   display_value;   // smoothed percent(), in [0, 1]
    const MetricValues&      values;
};

// Draws the content bound to a slot (bar, graph, arc, ...)
class ContentItemRenderer
{
   public:
    virtual ~ContentItemRenderer() = default;

    virtual void render_item(DrawSurface& surface, const ContentItemContext& ctx) = 0;
};

}   // namespace combopanel
