#pragma once

#include <array>
#include <combopanel/color.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace combopanel
{

inline constexpr size_t THEME_COLOR_COUNT = 4;
inline constexpr size_t THEME_FONT_COUNT  = 2;

// Returned for theme references that point outside the palette
inline constexpr Color FALLBACK_COLOR{0.5f, 0.5f, 0.5f, 1.0f};
inline constexpr const char* FALLBACK_FONT_FAMILY = "Sans";
inline constexpr float       FALLBACK_FONT_SIZE   = 12.0f;

struct FontSpec
{
    std::string family = FALLBACK_FONT_FAMILY;
    float       size   = FALLBACK_FONT_SIZE;

    bool operator==(const FontSpec&) const = default;
};

// A color either given literally or borrowed from the theme palette.
// Theme indices are 1-based (1..THEME_COLOR_COUNT).
struct ColorSource
{
    enum class Kind
    {
        Custom,
        Theme,
    };

    Kind                 kind  = Kind::Custom;
    Color                color = FALLBACK_COLOR;
    int                  index = 1;
    std::optional<float> alpha_override;

    static ColorSource custom(const Color& c)
    {
        ColorSource s;
        s.kind  = Kind::Custom;
        s.color = c;
        return s;
    }

    static ColorSource theme(int index, std::optional<float> alpha = std::nullopt)
    {
        ColorSource s;
        s.kind           = Kind::Theme;
        s.index          = index;
        s.alpha_override = alpha;
        return s;
    }

    bool is_theme() const { return kind == Kind::Theme; }

    bool operator==(const ColorSource&) const = default;
};

// Font given literally or taken from one of the two theme fonts (1-based slot).
struct FontSource
{
    enum class Kind
    {
        Custom,
        Theme,
    };

    Kind                 kind = Kind::Custom;
    FontSpec             font;
    int                  index = 1;
    std::optional<float> size_override;

    static FontSource custom(std::string family, float size)
    {
        FontSource s;
        s.kind = Kind::Custom;
        s.font = FontSpec{std::move(family), size};
        return s;
    }

    static FontSource theme(int index, std::optional<float> size = std::nullopt)
    {
        FontSource s;
        s.kind          = Kind::Theme;
        s.index         = index;
        s.size_override = size;
        return s;
    }

    bool is_theme() const { return kind == Kind::Theme; }

    bool operator==(const FontSource&) const = default;
};

struct GradientStop
{
    float       position = 0.0f;   // [0, 1]
    ColorSource color;

    bool operator==(const GradientStop&) const = default;
};

struct Gradient
{
    std::vector<GradientStop> stops;
    float                     angle = 90.0f;   // degrees, 0 = left to right, 90 = top to bottom

    bool operator==(const Gradient&) const = default;
};

struct ResolvedStop
{
    float position = 0.0f;
    Color color;

    bool operator==(const ResolvedStop&) const = default;
};

struct ResolvedGradient
{
    std::vector<ResolvedStop> stops;
    float                     angle = 90.0f;
};

// Small palette shared by every element of a panel. Swapped as a whole.
struct Theme
{
    std::string                           name = "default";
    std::array<Color, THEME_COLOR_COUNT>  colors{};
    std::array<FontSpec, THEME_FONT_COUNT> fonts{};
    Gradient                              gradient;

    bool operator==(const Theme&) const = default;
};

// ─── Resolution ─────────────────────────────────────────────────────────────

Color    resolve_color(const ColorSource& source, const Theme& theme);
FontSpec resolve_font(const FontSource& source, const Theme& theme);

// Resolves every stop in declaration order; does not sort.
ResolvedGradient resolve_gradient(const Gradient& gradient, const Theme& theme);

// Position is clamped to [0, 1]. Stops need not be sorted; equal positions keep
// their declaration order. An empty stop list yields FALLBACK_COLOR.
Color sample_gradient(std::span<const ResolvedStop> stops, float position);

// ─── Presets ────────────────────────────────────────────────────────────────

Theme                    default_theme();
std::optional<Theme>     theme_preset(std::string_view name);
std::vector<std::string> theme_preset_names();

}   // namespace combopanel
