#pragma once

namespace combopanel
{

// Axis-aligned rectangle in panel-local pixels (y grows downward)
struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float right() const { return x + w; }
    float bottom() const { return y + h; }
    float center_x() const { return x + w * 0.5f; }
    float center_y() const { return y + h * 0.5f; }
    bool  empty() const { return w <= 0.0f || h <= 0.0f; }

    bool operator==(const Rect&) const = default;
};

// Vertical stacks top to bottom (main axis = height).
// Horizontal places side by side (main axis = width).
enum class Orientation
{
    Vertical,
    Horizontal,
};

}   // namespace combopanel
