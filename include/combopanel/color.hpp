#pragma once

#include <algorithm>
#include <cstdint>

namespace combopanel
{

// 32-bit float RGBA color, channels in [0, 1]
struct Color
{
    float r = 0.0f, g = 0.0f, b = 0.0f, a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // From hex (0xRRGGBB or 0xAARRGGBB)
    static constexpr Color from_hex(uint32_t hex)
    {
        if (hex > 0xFFFFFF)
        {
            return Color(((hex >> 16) & 0xFF) / 255.0f,
                         ((hex >> 8) & 0xFF) / 255.0f,
                         (hex & 0xFF) / 255.0f,
                         ((hex >> 24) & 0xFF) / 255.0f);
        }
        return Color(((hex >> 16) & 0xFF) / 255.0f,
                     ((hex >> 8) & 0xFF) / 255.0f,
                     (hex & 0xFF) / 255.0f,
                     1.0f);
    }

    constexpr Color with_alpha(float alpha) const { return Color(r, g, b, alpha); }

    // Scale RGB, leave alpha untouched
    constexpr Color scaled(float k) const { return Color(r * k, g * k, b * k, a); }

    constexpr Color lerp(const Color& other, float t) const
    {
        return Color(r + (other.r - r) * t,
                     g + (other.g - g) * t,
                     b + (other.b - b) * t,
                     a + (other.a - a) * t);
    }

    Color clamped() const
    {
        return Color(std::clamp(r, 0.0f, 1.0f),
                     std::clamp(g, 0.0f, 1.0f),
                     std::clamp(b, 0.0f, 1.0f),
                     std::clamp(a, 0.0f, 1.0f));
    }

    constexpr bool operator==(const Color& o) const
    {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

namespace colors
{
inline constexpr Color transparent{0.0f, 0.0f, 0.0f, 0.0f};
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color green{0.0f, 1.0f, 0.0f};
inline constexpr Color blue{0.0f, 0.0f, 1.0f};
inline constexpr Color cyan{0.0f, 1.0f, 1.0f};
inline constexpr Color magenta{1.0f, 0.0f, 1.0f};
inline constexpr Color gray{0.5f, 0.5f, 0.5f};
}   // namespace colors

}   // namespace combopanel
