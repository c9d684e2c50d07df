#include "frame_scheduler.hpp"

#include <algorithm>
#include <thread>
#include <vellum/logger.hpp>

namespace vellum
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

void FrameScheduler::begin_frame()
{
    frame_start_ = Clock::now();

    if (first_frame_)
    {
        first_frame_      = false;
        start_time_       = frame_start_;
        last_frame_start_ = frame_start_;
        frame_.dt          = 0.0f;
        frame_.elapsed_sec = 0.0f;
        return;
    }

    Duration elapsed_since_start = frame_start_ - start_time_;
    Duration dt_duration         = frame_start_ - last_frame_start_;
    last_frame_start_            = frame_start_;

    float raw_dt = static_cast<float>(dt_duration.count());

    // Clamp dt so a stalled host does not report one giant frame
    if (raw_dt > 0.25f)
    {
        raw_dt = 0.25f;
    }

    frame_.dt          = raw_dt;
    frame_.elapsed_sec = static_cast<float>(elapsed_since_start.count());
    frame_.number++;

    record_frame_time(raw_dt * 1000.0f);
}

void FrameScheduler::end_frame()
{
    if (mode_ != Mode::TargetFPS)
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

    // Spin-wait for the rest (precision), bounded at 10ms
    auto spin_start = Clock::now();
    auto deadline   = frame_start_ + std::chrono::duration_cast<Clock::duration>(target_frame_time);
    while (Clock::now() < deadline)
    {
        if (Clock::now() - spin_start > std::chrono::milliseconds(10))
            break;
    }
}

void FrameScheduler::reset()
{
    first_frame_       = true;
    frame_             = Frame{};
    stats_             = FrameStats{};
    last_dt_ms_        = 0.0f;
    max_dt_in_window_  = 0.0f;
    dt_sum_in_window_  = 0.0;
    hitches_in_window_ = 0;
    window_counter_    = 0;
}

void FrameScheduler::record_frame_time(float dt_ms)
{
    last_dt_ms_ = dt_ms;
    max_dt_in_window_ = std::max(max_dt_in_window_, dt_ms);
    dt_sum_in_window_ += dt_ms;
    dt_samples_[window_counter_] = dt_ms;
    window_counter_++;

    float target_ms = 1000.0f / target_fps_;
    if (dt_ms > target_ms * 2.0f)
    {
        hitches_in_window_++;
        VELLUM_LOG_DEBUG("hitch",
                         "Frame {} hitch: {}ms (target: {}ms)",
                         frame_.number,
                         dt_ms,
                         target_ms);
    }

    if (window_counter_ < STATS_WINDOW_FRAMES)
        return;

    dt_sorted_ = dt_samples_;
    auto p95_index = static_cast<size_t>(0.95 * static_cast<double>(STATS_WINDOW_FRAMES - 1));
    std::nth_element(dt_sorted_.begin(), dt_sorted_.begin() + p95_index, dt_sorted_.end());

    stats_.max_frame_time_ms  = max_dt_in_window_;
    stats_.avg_frame_time_ms  = static_cast<float>(dt_sum_in_window_ / window_counter_);
    stats_.p95_frame_time_ms  = dt_sorted_[p95_index];
    stats_.hitch_count        = hitches_in_window_;
    stats_.window_frame_count = window_counter_;

    if (hitches_in_window_ > 0)
    {
        VELLUM_LOG_INFO("perf",
                        "Stats ({} frames): avg={}ms p95={}ms max={}ms hitches={}",
                        STATS_WINDOW_FRAMES,
                        stats_.avg_frame_time_ms,
                        stats_.p95_frame_time_ms,
                        stats_.max_frame_time_ms,
                        hitches_in_window_);
    }

    max_dt_in_window_  = 0.0f;
    dt_sum_in_window_  = 0.0;
    hitches_in_window_ = 0;
    window_counter_    = 0;
}

}   // namespace vellum
