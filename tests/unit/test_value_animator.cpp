#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "anim/value_animator.hpp"

using namespace combopanel;

TEST(ValueAnimator, FirstTargetSnaps)
{
    ValueAnimator anim;
    EXPECT_TRUE(anim.set_target("group1_1", 0.8, true));
    EXPECT_DOUBLE_EQ(anim.value("group1_1"), 0.8);
    EXPECT_FALSE(anim.is_animating());
}

TEST(ValueAnimator, MovesTowardTarget)
{
    ValueAnimator anim;
    anim.set_target("a", 0.0, true);
    EXPECT_TRUE(anim.set_target("a", 1.0, true));
    EXPECT_TRUE(anim.is_animating());

    EXPECT_TRUE(anim.step(0.05f, 8.0f));
    double v = anim.value("a");
    EXPECT_GT(v, 0.0);
    EXPECT_LT(v, 1.0);
    EXPECT_NEAR(v, 0.4, 1e-6);
}

TEST(ValueAnimator, ReachesTargetAndStops)
{
    ValueAnimator anim;
    anim.set_target("a", 0.0, true);
    anim.set_target("a", 1.0, true);

    int frames = 0;
    while (anim.step(1.0f / 60.0f, 8.0f) && frames < 1000)
        ++frames;

    EXPECT_LT(frames, 1000);
    EXPECT_DOUBLE_EQ(anim.value("a"), 1.0);
    EXPECT_FALSE(anim.is_animating());
}

TEST(ValueAnimator, LargeStepDoesNotOvershoot)
{
    ValueAnimator anim;
    anim.set_target("a", 0.0, true);
    anim.set_target("a", 1.0, true);
    anim.step(10.0f, 8.0f);
    EXPECT_DOUBLE_EQ(anim.value("a"), 1.0);
}

TEST(ValueAnimator, TinyTargetChangeIgnored)
{
    ValueAnimator anim;
    anim.set_target("a", 0.5, true);
    EXPECT_FALSE(anim.set_target("a", 0.502, true));
    EXPECT_FALSE(anim.is_animating());
}

TEST(ValueAnimator, DisabledAnimationSnaps)
{
    ValueAnimator anim;
    anim.set_target("a", 0.1, false);
    EXPECT_TRUE(anim.set_target("a", 0.9, false));
    EXPECT_DOUBLE_EQ(anim.value("a"), 0.9);
    EXPECT_FALSE(anim.set_target("a", 0.9, false));
}

TEST(ValueAnimator, ZeroElapsedHoldsValue)
{
    ValueAnimator anim;
    anim.set_target("a", 0.0, true);
    anim.set_target("a", 1.0, true);
    EXPECT_TRUE(anim.step(0.0f, 8.0f));
    EXPECT_DOUBLE_EQ(anim.value("a"), 0.0);
}

TEST(ValueAnimator, UnknownKeyUsesFallback)
{
    ValueAnimator anim;
    EXPECT_DOUBLE_EQ(anim.value("missing", 0.25), 0.25);
    EXPECT_FALSE(anim.contains("missing"));
}

TEST(ValueAnimator, RetainDropsStaleKeys)
{
    ValueAnimator anim;
    anim.set_target("group1_1", 0.1, true);
    anim.set_target("group1_2", 0.2, true);
    anim.set_target("group2_1", 0.3, true);

    std::vector<std::string> keep{"group1_1", "group2_1"};
    anim.retain(keep);

    EXPECT_EQ(anim.size(), 2u);
    EXPECT_FALSE(anim.contains("group1_2"));
    EXPECT_TRUE(anim.contains("group2_1"));
}

TEST(SmoothToward, SnapsWithinThreshold)
{
    EXPECT_DOUBLE_EQ(ValueAnimator::smooth_toward(0.9995, 1.0, 8.0, 0.016), 1.0);
    EXPECT_DOUBLE_EQ(ValueAnimator::smooth_toward(0.0, 1.0, 8.0, -1.0), 0.0);
}
