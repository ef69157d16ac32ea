#include <combopanel/frame_scheduler.hpp>
#include <gtest/gtest.h>

using namespace combopanel;

TEST(FrameScheduler, DefaultState)
{
    FrameScheduler scheduler;
    EXPECT_FLOAT_EQ(scheduler.target_fps(), 30.0f);
    EXPECT_EQ(scheduler.mode(), FrameScheduler::Mode::TargetFPS);
    EXPECT_EQ(scheduler.frame_number(), 0u);
    EXPECT_FLOAT_EQ(scheduler.elapsed_seconds(), 0.0f);
    EXPECT_FALSE(scheduler.has_fixed_timestep());
}

TEST(FrameScheduler, AdvanceAccumulatesElapsed)
{
    FrameScheduler scheduler;
    scheduler.advance(0.02f);
    scheduler.advance(0.03f);

    EXPECT_EQ(scheduler.frame_number(), 2u);
    EXPECT_FLOAT_EQ(scheduler.dt(), 0.03f);
    EXPECT_FLOAT_EQ(scheduler.elapsed_seconds(), 0.05f);
}

TEST(FrameScheduler, FixedTimestepOverridesMeasured)
{
    FrameScheduler scheduler;
    scheduler.set_fixed_timestep(1.0f / 60.0f);
    EXPECT_TRUE(scheduler.has_fixed_timestep());

    for (int i = 0; i < 60; ++i)
        scheduler.advance(0.1f);
    EXPECT_FLOAT_EQ(scheduler.dt(), 1.0f / 60.0f);
    EXPECT_NEAR(scheduler.elapsed_seconds(), 1.0f, 1e-4f);

    scheduler.clear_fixed_timestep();
    scheduler.advance(0.1f);
    EXPECT_FLOAT_EQ(scheduler.dt(), 0.1f);
}

TEST(FrameScheduler, NonPositiveSettingsIgnored)
{
    FrameScheduler scheduler(60.0f);
    scheduler.set_target_fps(0.0f);
    scheduler.set_target_fps(-5.0f);
    EXPECT_FLOAT_EQ(scheduler.target_fps(), 60.0f);

    scheduler.set_fixed_timestep(0.0f);
    scheduler.set_fixed_timestep(-0.1f);
    EXPECT_FALSE(scheduler.has_fixed_timestep());
}

TEST(FrameScheduler, StallsClamped)
{
    FrameScheduler scheduler;
    scheduler.advance(3.0f);
    EXPECT_FLOAT_EQ(scheduler.dt(), FrameScheduler::MAX_DT);
    EXPECT_FLOAT_EQ(scheduler.last_dt_ms(), 250.0f);

    scheduler.advance(-1.0f);
    EXPECT_FLOAT_EQ(scheduler.dt(), 0.0f);
    EXPECT_FLOAT_EQ(scheduler.elapsed_seconds(), FrameScheduler::MAX_DT);
}

TEST(FrameScheduler, HitchesCounted)
{
    FrameScheduler scheduler(30.0f);
    scheduler.advance(0.033f);
    scheduler.advance(0.060f);   // under twice the 33.3ms target
    EXPECT_EQ(scheduler.hitch_count(), 0u);

    scheduler.advance(0.070f);
    scheduler.advance(0.200f);
    EXPECT_EQ(scheduler.hitch_count(), 2u);
}

TEST(FrameScheduler, ResetClearsTiming)
{
    FrameScheduler scheduler;
    scheduler.advance(0.2f);
    scheduler.advance(0.2f);
    ASSERT_GT(scheduler.hitch_count(), 0u);

    scheduler.reset();
    EXPECT_EQ(scheduler.frame_number(), 0u);
    EXPECT_FLOAT_EQ(scheduler.elapsed_seconds(), 0.0f);
    EXPECT_EQ(scheduler.hitch_count(), 0u);
    EXPECT_FLOAT_EQ(scheduler.last_dt_ms(), 0.0f);
}

TEST(FrameScheduler, FirstMeasuredFrameIsZero)
{
    FrameScheduler scheduler(1000.0f, FrameScheduler::Mode::Uncapped);
    scheduler.begin_frame();
    EXPECT_EQ(scheduler.frame_number(), 0u);
    EXPECT_FLOAT_EQ(scheduler.dt(), 0.0f);
    scheduler.end_frame();

    scheduler.begin_frame();
    EXPECT_EQ(scheduler.frame_number(), 1u);
    EXPECT_GE(scheduler.dt(), 0.0f);
    EXPECT_LE(scheduler.dt(), FrameScheduler::MAX_DT);
}
