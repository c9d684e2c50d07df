#include "frame_scheduler.hpp"

#include <cstddef>
#include <iterator>
#include <vellum/logger.hpp>
#include <vellum/tick_source.hpp>

namespace vellum
{

namespace
{

// Runs `due` in order. If a callback throws, the callbacks after it go back
// to the front of `pending` so that no other tick chain is lost.
size_t run_due(std::vector<TickSource::Callback>& due, std::vector<TickSource::Callback>& pending)
{
    size_t next = 0;
    try
    {
        while (next < due.size())
            due[next++]();
    }
    catch (...)
    {
        pending.insert(pending.begin(),
                       std::make_move_iterator(due.begin() + static_cast<std::ptrdiff_t>(next)),
                       std::make_move_iterator(due.end()));
        throw;
    }
    return next;
}

}   // anonymous namespace

// ─── ManualTickSource ───────────────────────────────────────────────────────

void ManualTickSource::request_tick(Callback callback)
{
    if (callback)
        pending_.push_back(std::move(callback));
}

size_t ManualTickSource::pump()
{
    std::vector<Callback> due;
    due.swap(pending_);
    return run_due(due, pending_);
}

// ─── TimerTickSource ────────────────────────────────────────────────────────

TimerTickSource::TimerTickSource(float target_fps)
    : scheduler_(std::make_unique<FrameScheduler>(target_fps))
{
}

TimerTickSource::~TimerTickSource() = default;

void TimerTickSource::request_tick(Callback callback)
{
    if (callback)
        pending_.push_back(std::move(callback));
}

uint64_t TimerTickSource::run(uint64_t max_ticks)
{
    VELLUM_LOG_DEBUG("timer", "tick loop started at {} fps", scheduler_->target_fps());

    uint64_t ticks = 0;
    scheduler_->reset();
    while (!pending_.empty() && ticks < max_ticks)
    {
        scheduler_->begin_frame();

        std::vector<Callback> due;
        due.swap(pending_);
        run_due(due, pending_);
        ++ticks;

        scheduler_->end_frame();
    }

    VELLUM_LOG_DEBUG("timer", "tick loop stopped after {} ticks", ticks);
    return ticks;
}

void TimerTickSource::set_uncapped(bool uncapped)
{
    scheduler_->set_mode(uncapped ? FrameScheduler::Mode::Uncapped
                                  : FrameScheduler::Mode::TargetFPS);
}

float TimerTickSource::target_fps() const
{
    return scheduler_->target_fps();
}

const Frame& TimerTickSource::last_frame() const
{
    return scheduler_->current_frame();
}

}   // namespace vellum
