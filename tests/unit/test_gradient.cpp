#include <cmath>
#include <combopanel/draw_surface.hpp>
#include <combopanel/theme.hpp>
#include <gtest/gtest.h>
#include <vector>

using namespace combopanel;

namespace
{

std::vector<ResolvedStop> rgb_stops()
{
    return {{0.0f, colors::red}, {0.5f, colors::green}, {1.0f, colors::blue}};
}

}   // namespace

// ─── sample_gradient ─────────────────────────────────────────────────────────

TEST(SampleGradient, QuarterIsMidpointOfFirstSegment)
{
    auto  stops = rgb_stops();
    Color c     = sample_gradient(stops, 0.25f);
    EXPECT_FLOAT_EQ(c.r, 0.5f);
    EXPECT_FLOAT_EQ(c.g, 0.5f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);
}

TEST(SampleGradient, EndpointsMatchFirstAndLastStop)
{
    auto stops = rgb_stops();
    EXPECT_EQ(sample_gradient(stops, 0.0f), colors::red);
    EXPECT_EQ(sample_gradient(stops, 1.0f), colors::blue);
    EXPECT_EQ(sample_gradient(stops, 0.5f), colors::green);
}

TEST(SampleGradient, PositionIsClamped)
{
    auto stops = rgb_stops();
    EXPECT_EQ(sample_gradient(stops, -2.0f), colors::red);
    EXPECT_EQ(sample_gradient(stops, 7.0f), colors::blue);
    EXPECT_EQ(sample_gradient(stops, std::nanf("")), colors::red);
}

TEST(SampleGradient, UnsortedStopsAreSorted)
{
    std::vector<ResolvedStop> stops{{1.0f, colors::blue}, {0.0f, colors::red}, {0.5f, colors::green}};
    Color                     c = sample_gradient(stops, 0.75f);
    EXPECT_FLOAT_EQ(c.r, 0.0f);
    EXPECT_FLOAT_EQ(c.g, 0.5f);
    EXPECT_FLOAT_EQ(c.b, 0.5f);
}

TEST(SampleGradient, EmptyYieldsFallback)
{
    std::vector<ResolvedStop> stops;
    EXPECT_EQ(sample_gradient(stops, 0.3f), FALLBACK_COLOR);
}

TEST(SampleGradient, SingleStopIsConstant)
{
    std::vector<ResolvedStop> stops{{0.4f, colors::cyan}};
    EXPECT_EQ(sample_gradient(stops, 0.0f), colors::cyan);
    EXPECT_EQ(sample_gradient(stops, 1.0f), colors::cyan);
}

TEST(SampleGradient, DuplicatePositionsStepSharply)
{
    std::vector<ResolvedStop> stops{
        {0.0f, colors::red}, {0.5f, colors::red}, {0.5f, colors::blue}, {1.0f, colors::blue}};
    EXPECT_EQ(sample_gradient(stops, 0.49f), colors::red);
    EXPECT_EQ(sample_gradient(stops, 0.51f), colors::blue);
}

TEST(SampleGradient, ContinuousBetweenStops)
{
    auto  stops = rgb_stops();
    Color prev  = sample_gradient(stops, 0.0f);
    for (int i = 1; i <= 100; ++i)
    {
        Color c = sample_gradient(stops, static_cast<float>(i) / 100.0f);
        EXPECT_LT(std::abs(c.r - prev.r), 0.03f);
        EXPECT_LT(std::abs(c.g - prev.g), 0.03f);
        EXPECT_LT(std::abs(c.b - prev.b), 0.03f);
        prev = c;
    }
}

// ─── resolve_gradient ────────────────────────────────────────────────────────

TEST(ResolveGradient, ResolvesThemeStops)
{
    Theme t;
    t.colors = {colors::red, colors::green, colors::blue, colors::white};

    Gradient g;
    g.angle = 45.0f;
    g.stops = {GradientStop{0.0f, ColorSource::theme(3)},
               GradientStop{1.0f, ColorSource::custom(colors::black)}};

    ResolvedGradient r = resolve_gradient(g, t);
    ASSERT_EQ(r.stops.size(), 2u);
    EXPECT_FLOAT_EQ(r.angle, 45.0f);
    EXPECT_EQ(r.stops[0].color, colors::blue);
    EXPECT_EQ(r.stops[1].color, colors::black);
}

// ─── linear_gradient_for ─────────────────────────────────────────────────────

TEST(LinearGradientFor, ZeroDegreesRunsLeftToRight)
{
    LinearGradient g = linear_gradient_for(Rect{10.0f, 20.0f, 100.0f, 50.0f}, 0.0f, {});
    EXPECT_NEAR(g.x0, 10.0f, 1e-4f);
    EXPECT_NEAR(g.x1, 110.0f, 1e-4f);
    EXPECT_NEAR(g.y0, 45.0f, 1e-4f);
    EXPECT_NEAR(g.y1, 45.0f, 1e-4f);
}

TEST(LinearGradientFor, NinetyDegreesRunsTopToBottom)
{
    LinearGradient g = linear_gradient_for(Rect{0.0f, 0.0f, 100.0f, 50.0f}, 90.0f, {});
    EXPECT_NEAR(g.x0, 50.0f, 1e-3f);
    EXPECT_NEAR(g.x1, 50.0f, 1e-3f);
    EXPECT_NEAR(g.y0, 0.0f, 1e-3f);
    EXPECT_NEAR(g.y1, 50.0f, 1e-3f);
}
