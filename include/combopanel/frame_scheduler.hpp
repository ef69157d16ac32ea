#pragma once

#include <chrono>
#include <cstdint>

namespace combopanel
{

struct Frame
{
    float    elapsed_sec = 0.0f;
    float    dt          = 0.0f;
    uint64_t number      = 0;
};

// Paces the host's redraw loop and produces the elapsed time fed to
// PanelComposer::render().
class FrameScheduler
{
   public:
    enum class Mode
    {
        TargetFPS,   // Sleep + spin-wait to hit target FPS
        Uncapped,    // Run as fast as possible (host or vsync paces)
    };

    // Longest dt reported for one frame; longer stalls are clamped
    static constexpr float MAX_DT = 0.25f;

    explicit FrameScheduler(float target_fps = 30.0f, Mode mode = Mode::TargetFPS);

    // Set target FPS (only used in TargetFPS mode); non-positive values are ignored
    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // Fixed timestep for deterministic animation
    void set_fixed_timestep(float dt);
    void clear_fixed_timestep();
    bool has_fixed_timestep() const { return use_fixed_timestep_; }

    // Call at the start and end of each frame
    void begin_frame();
    void end_frame();

    // Accounts one frame that took `raw_dt` seconds. begin_frame() calls this
    // with the measured time.
    void advance(float raw_dt);

    // Reset timing (e.g., after the panel was hidden)
    void reset();

    const Frame& current_frame() const { return frame_; }
    float        elapsed_seconds() const { return frame_.elapsed_sec; }
    float        dt() const { return frame_.dt; }
    uint64_t     frame_number() const { return frame_.number; }

    // Frames that took more than twice the target frame time
    uint64_t hitch_count() const { return hitch_count_; }
    float    last_dt_ms() const { return last_dt_ms_; }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    float target_fps_ = 30.0f;
    Mode  mode_       = Mode::TargetFPS;

    bool  use_fixed_timestep_ = false;
    float fixed_dt_           = 1.0f / 30.0f;

    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_ = true;

    Frame    frame_;
    uint64_t hitch_count_ = 0;
    float    last_dt_ms_  = 0.0f;
};

}   // namespace combopanel
