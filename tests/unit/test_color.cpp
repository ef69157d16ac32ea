#include <combopanel/color.hpp>
#include <gtest/gtest.h>

using namespace combopanel;

// ─── Construction ────────────────────────────────────────────────────────────

TEST(Color, DefaultIsOpaqueBlack)
{
    Color c;
    EXPECT_FLOAT_EQ(c.r, 0.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);
}

TEST(Color, FromHexRGB)
{
    Color c = Color::from_hex(0xFF8000);
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_NEAR(c.g, 128.0f / 255.0f, 1e-6f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);
}

TEST(Color, FromHexARGB)
{
    Color c = Color::from_hex(0x8000FF00);
    EXPECT_NEAR(c.a, 128.0f / 255.0f, 1e-6f);
    EXPECT_FLOAT_EQ(c.g, 1.0f);
}

TEST(Color, RgbHelpers)
{
    EXPECT_EQ(rgb(0.1f, 0.2f, 0.3f), Color(0.1f, 0.2f, 0.3f, 1.0f));
    EXPECT_EQ(rgba(0.1f, 0.2f, 0.3f, 0.4f), Color(0.1f, 0.2f, 0.3f, 0.4f));
}

// ─── Operations ──────────────────────────────────────────────────────────────

TEST(Color, WithAlphaKeepsRGB)
{
    Color c = colors::cyan.with_alpha(0.25f);
    EXPECT_FLOAT_EQ(c.r, 0.0f);
    EXPECT_FLOAT_EQ(c.g, 1.0f);
    EXPECT_FLOAT_EQ(c.b, 1.0f);
    EXPECT_FLOAT_EQ(c.a, 0.25f);
}

TEST(Color, ScaledLeavesAlpha)
{
    Color c = Color(0.5f, 0.4f, 0.2f, 0.8f).scaled(0.5f);
    EXPECT_FLOAT_EQ(c.r, 0.25f);
    EXPECT_FLOAT_EQ(c.g, 0.2f);
    EXPECT_FLOAT_EQ(c.b, 0.1f);
    EXPECT_FLOAT_EQ(c.a, 0.8f);
}

TEST(Color, LerpEndpointsAndMidpoint)
{
    EXPECT_EQ(colors::red.lerp(colors::blue, 0.0f), colors::red);
    EXPECT_EQ(colors::red.lerp(colors::blue, 1.0f), colors::blue);

    Color mid = colors::red.lerp(colors::blue, 0.5f);
    EXPECT_FLOAT_EQ(mid.r, 0.5f);
    EXPECT_FLOAT_EQ(mid.g, 0.0f);
    EXPECT_FLOAT_EQ(mid.b, 0.5f);
}

TEST(Color, ClampedLimitsChannels)
{
    Color c = Color(1.5f, -0.5f, 0.5f, 2.0f).clamped();
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.5f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);
}

TEST(Color, Equality)
{
    EXPECT_EQ(colors::white, Color(1.0f, 1.0f, 1.0f));
    EXPECT_NE(colors::white, colors::gray);
}
