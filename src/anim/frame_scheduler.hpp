#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <vellum/frame.hpp>

namespace vellum
{

// Paces a loop to a target frame rate and keeps rolling hitch statistics.
// Used by TimerTickSource when the host has no display-refresh signal.
class FrameScheduler
{
   public:
    enum class Mode
    {
        TargetFPS,   // Sleep + spin-wait to hit target FPS
        Uncapped,    // Run as fast as possible
    };

    explicit FrameScheduler(float target_fps = 60.0f, Mode mode = Mode::TargetFPS);

    // Non-positive values are ignored
    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // Call at the start and end of each frame
    void begin_frame();
    void end_frame();

    // Reset timing (e.g., after the loop was idle)
    void reset();

    const Frame& current_frame() const { return frame_; }
    float        dt() const { return frame_.dt; }
    uint64_t     frame_number() const { return frame_.number; }

    // Hitch detection stats (rolling window)
    struct FrameStats
    {
        float    max_frame_time_ms  = 0.0f;
        float    avg_frame_time_ms  = 0.0f;
        float    p95_frame_time_ms  = 0.0f;
        uint32_t hitch_count        = 0;   // frames > 2x target in window
        uint64_t window_frame_count = 0;
    };
    FrameStats frame_stats() const { return stats_; }
    float      last_dt_ms() const { return last_dt_ms_; }

    static constexpr size_t STATS_WINDOW_FRAMES = 600;   // ~10s at 60fps

    // Feeds one frame time into the statistics window. begin_frame() does
    // this with the measured time.
    void record_frame_time(float dt_ms);

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    float target_fps_ = 60.0f;
    Mode  mode_       = Mode::TargetFPS;

    TimePoint start_time_;
    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_ = true;

    Frame frame_;

    FrameStats stats_;
    float      last_dt_ms_        = 0.0f;
    float      max_dt_in_window_  = 0.0f;
    double     dt_sum_in_window_  = 0.0;
    uint32_t   hitches_in_window_ = 0;
    uint64_t   window_counter_    = 0;

    std::array<float, STATS_WINDOW_FRAMES> dt_samples_{};
    std::array<float, STATS_WINDOW_FRAMES> dt_sorted_{};
};

}   // namespace vellum
