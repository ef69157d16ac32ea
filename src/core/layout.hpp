#pragma once

#include <combopanel/frame_config.hpp>
#include <combopanel/geometry.hpp>
#include <cstddef>
#include <span>
#include <vector>

namespace combopanel
{

// Total main-axis space taken by the dividers between `group_count` groups
float divider_space(size_t group_count, float divider_width, float divider_padding);

// Split `content` into `group_count` groups along `orientation`; the count
// is clamped to [1, LayoutSettings::MAX_GROUPS].
// Weights are normalized to group_count entries (pad 1.0, truncate, equal
// weights when the sum is not positive). Every rect has w >= 0 and h >= 0.
// Results are written into `out` so callers can reuse its capacity.
void compute_group_layouts(const Rect&             content,
                           size_t                  group_count,
                           std::span<const float>  weights,
                           Orientation             orientation,
                           float                   divider_width,
                           float                   divider_padding,
                           std::vector<Rect>&      out);

std::vector<Rect> compute_group_layouts(const Rect&            content,
                                        size_t                 group_count,
                                        std::span<const float> weights,
                                        Orientation            orientation,
                                        float                  divider_width,
                                        float                  divider_padding);

// Convenience overload reading everything from a config
std::vector<Rect> compute_group_layouts(const Rect& content, const LayoutConfig& config);

// Stack `item_count` equal items inside `group` with `spacing` between them.
// The count is clamped to [1, LayoutSettings::MAX_ITEMS_PER_GROUP].
// Spacing shrinks when the group is too small to hold it.
void compute_item_layouts(const Rect&        group,
                          size_t             item_count,
                          Orientation        orientation,
                          float              spacing,
                          std::vector<Rect>& out);

std::vector<Rect> compute_item_layouts(const Rect& group,
                                       size_t      item_count,
                                       Orientation orientation,
                                       float       spacing);

// Area inside `frame` below a header of `header_h`, inset by `padding` on
// every side. Header and padding shrink to what the frame can hold, so the
// result never leaves `frame`.
Rect inner_content_rect(const Rect& frame, float header_h, float padding);

// Main-axis rectangle of the divider band following group `index`
// (0-based, valid for index < groups.size() - 1).
Rect divider_band(std::span<const Rect> groups,
                  size_t                index,
                  Orientation           orientation,
                  float                 divider_width,
                  float                 divider_padding);

}   // namespace combopanel
