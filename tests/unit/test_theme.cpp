#include <algorithm>
#include <combopanel/theme.hpp>
#include <gtest/gtest.h>

using namespace combopanel;

namespace
{

Theme make_theme()
{
    Theme t;
    t.name   = "test";
    t.colors = {colors::red, colors::green, colors::blue, colors::white};
    t.fonts  = {FontSpec{"Header Font", 16.0f}, FontSpec{"Body Font", 10.0f}};
    return t;
}

}   // namespace

// ─── Color resolution ────────────────────────────────────────────────────────

TEST(ResolveColor, CustomIsReturnedUnchanged)
{
    Color c = resolve_color(ColorSource::custom(Color(0.1f, 0.2f, 0.3f, 0.4f)), make_theme());
    EXPECT_EQ(c, Color(0.1f, 0.2f, 0.3f, 0.4f));
}

TEST(ResolveColor, ThemeIndicesAreOneBased)
{
    Theme t = make_theme();
    EXPECT_EQ(resolve_color(ColorSource::theme(1), t), colors::red);
    EXPECT_EQ(resolve_color(ColorSource::theme(2), t), colors::green);
    EXPECT_EQ(resolve_color(ColorSource::theme(3), t), colors::blue);
    EXPECT_EQ(resolve_color(ColorSource::theme(4), t), colors::white);
}

TEST(ResolveColor, AlphaOverrideReplacesAlphaOnly)
{
    Color c = resolve_color(ColorSource::theme(1, 0.3f), make_theme());
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 0.3f);
}

TEST(ResolveColor, OutOfRangeIndexUsesFallback)
{
    Theme t = make_theme();
    EXPECT_EQ(resolve_color(ColorSource::theme(99), t), FALLBACK_COLOR);
    EXPECT_EQ(resolve_color(ColorSource::theme(0), t), FALLBACK_COLOR);
    EXPECT_EQ(resolve_color(ColorSource::theme(-3), t), FALLBACK_COLOR);
}

TEST(ResolveColor, FollowsThemeSwap)
{
    ColorSource src = ColorSource::theme(2);
    Theme       a   = make_theme();
    Theme       b   = make_theme();
    b.colors[1]     = colors::magenta;

    EXPECT_EQ(resolve_color(src, a), colors::green);
    EXPECT_EQ(resolve_color(src, b), colors::magenta);
}

// ─── Font resolution ─────────────────────────────────────────────────────────

TEST(ResolveFont, CustomIsReturnedUnchanged)
{
    FontSpec f = resolve_font(FontSource::custom("Courier", 9.0f), make_theme());
    EXPECT_EQ(f.family, "Courier");
    EXPECT_FLOAT_EQ(f.size, 9.0f);
}

TEST(ResolveFont, ThemeSlotUsesBaseSize)
{
    FontSpec f = resolve_font(FontSource::theme(2), make_theme());
    EXPECT_EQ(f.family, "Body Font");
    EXPECT_FLOAT_EQ(f.size, 10.0f);
}

TEST(ResolveFont, SizeOverrideReplacesBaseSize)
{
    FontSpec f = resolve_font(FontSource::theme(1, 24.0f), make_theme());
    EXPECT_EQ(f.family, "Header Font");
    EXPECT_FLOAT_EQ(f.size, 24.0f);
}

TEST(ResolveFont, OutOfRangeSlotUsesFallback)
{
    FontSpec f = resolve_font(FontSource::theme(3), make_theme());
    EXPECT_EQ(f.family, FALLBACK_FONT_FAMILY);
    EXPECT_FLOAT_EQ(f.size, FALLBACK_FONT_SIZE);
}

// ─── Presets ─────────────────────────────────────────────────────────────────

TEST(ThemePresets, BuiltinNamesAreAvailable)
{
    auto names = theme_preset_names();
    for (const char* expected : {"cyberpunk", "retro_terminal", "synthwave", "industrial"})
    {
        EXPECT_NE(std::find(names.begin(), names.end(), expected), names.end()) << expected;
    }
}

TEST(ThemePresets, LookupByName)
{
    auto t = theme_preset("retro_terminal");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->name, "retro_terminal");
}

TEST(ThemePresets, UnknownNameYieldsNothing)
{
    EXPECT_FALSE(theme_preset("does_not_exist").has_value());
}

TEST(ThemePresets, DefaultThemeIsAPreset)
{
    Theme d = default_theme();
    auto  p = theme_preset(d.name);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, d);
}

TEST(ThemePresets, PresetsHaveFullPalettes)
{
    for (const auto& name : theme_preset_names())
    {
        auto t = theme_preset(name);
        ASSERT_TRUE(t.has_value());
        for (const auto& font : t->fonts)
        {
            EXPECT_FALSE(font.family.empty()) << name;
            EXPECT_GT(font.size, 0.0f) << name;
        }
        EXPECT_FALSE(t->gradient.stops.empty()) << name;
    }
}
