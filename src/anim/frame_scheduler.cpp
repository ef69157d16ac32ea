#include <combopanel/frame_scheduler.hpp>
#include <combopanel/logger.hpp>
#include <thread>

namespace combopanel
{

FrameScheduler::FrameScheduler(float target_fps, Mode mode) : mode_(mode)
{
    set_target_fps(target_fps);
    reset();
}

void FrameScheduler::set_target_fps(float fps)
{
    if (fps > 0.0f)
    {
        target_fps_ = fps;
    }
}

void FrameScheduler::set_fixed_timestep(float dt)
{
    if (dt <= 0.0f)
    {
        COMBOPANEL_LOG_WARN("scheduler", "Ignoring non-positive fixed timestep {}", dt);
        return;
    }
    use_fixed_timestep_ = true;
    fixed_dt_           = dt;
}

void FrameScheduler::clear_fixed_timestep()
{
    use_fixed_timestep_ = false;
}

void FrameScheduler::begin_frame()
{
    frame_start_ = Clock::now();

    if (first_frame_)
    {
        first_frame_      = false;
        last_frame_start_ = frame_start_;
        frame_            = Frame{};
        return;
    }

    Duration dt_duration = frame_start_ - last_frame_start_;
    last_frame_start_    = frame_start_;
    advance(static_cast<float>(dt_duration.count()));
}

void FrameScheduler::advance(float raw_dt)
{
    if (raw_dt < 0.0f)
        raw_dt = 0.0f;

    // Clamp dt so a stalled host does not make animations jump
    if (raw_dt > MAX_DT)
    {
        raw_dt = MAX_DT;
    }

    frame_.dt = use_fixed_timestep_ ? fixed_dt_ : raw_dt;
    frame_.elapsed_sec += frame_.dt;
    frame_.number++;

    last_dt_ms_           = raw_dt * 1000.0f;
    const float target_ms = 1000.0f / target_fps_;
    if (last_dt_ms_ > target_ms * 2.0f)
    {
        hitch_count_++;
        COMBOPANEL_LOG_DEBUG("scheduler",
                             "Frame {} hitch: {}ms (target: {}ms)",
                             frame_.number,
                             last_dt_ms_,
                             target_ms);
    }
}

void FrameScheduler::end_frame()
{
    if (mode_ != Mode::TargetFPS || first_frame_)
        return;

    Duration target_frame_time{1.0 / static_cast<double>(target_fps_)};
    Duration frame_duration = Clock::now() - frame_start_;
    if (frame_duration >= target_frame_time)
        return;

    // Sleep for most of the remaining time (leave 1ms for spin-wait)
    Duration remaining  = target_frame_time - frame_duration;
    auto     sleep_time = remaining - Duration{0.001};
    if (sleep_time.count() > 0.0)
    {
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(sleep_time));
    }

    const auto deadline = frame_start_ + std::chrono::duration_cast<Clock::duration>(target_frame_time);
    while (Clock::now() < deadline)
    {
        std::this_thread::yield();
    }
}

void FrameScheduler::reset()
{
    first_frame_ = true;
    frame_       = Frame{};
    hitch_count_ = 0;
    last_dt_ms_  = 0.0f;
}

}   // namespace combopanel
