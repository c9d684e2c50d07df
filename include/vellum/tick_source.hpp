#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <vector>
#include <vellum/frame.hpp>

namespace vellum
{

class FrameScheduler;

// The host's display-refresh signal. A frame engine asks for exactly one
// callback per tick; the source runs it on the thread that owns the engine.
class TickSource
{
   public:
    using Callback = std::function<void()>;

    virtual ~TickSource() = default;

    // Schedules `callback` to run once, at the next refresh.
    virtual void request_tick(Callback callback) = 0;
};

// Tick source driven explicitly by the host (or a test): nothing runs until
// pump() is called.
class ManualTickSource : public TickSource
{
   public:
    void request_tick(Callback callback) override;

    // Runs the callbacks pending at the time of the call; callbacks they
    // request wait for the next pump(). Returns how many ran. An exception
    // from a callback propagates; the callbacks after it stay pending.
    size_t pump();

    size_t pending() const { return pending_.size(); }

   private:
    std::vector<Callback> pending_;
};

// Fallback when the host has no refresh signal: a fixed-rate timer loop on
// the calling thread, 60 Hz by default.
class TimerTickSource : public TickSource
{
   public:
    explicit TimerTickSource(float target_fps = 60.0f);
    ~TimerTickSource() override;

    TimerTickSource(const TimerTickSource&)            = delete;
    TimerTickSource& operator=(const TimerTickSource&) = delete;

    void request_tick(Callback callback) override;

    // Runs pending ticks paced at the target rate until none is pending or
    // `max_ticks` have run. Returns the number of ticks run. Blocks.
    uint64_t run(uint64_t max_ticks = std::numeric_limits<uint64_t>::max());

    // Disables pacing (useful for offline rendering).
    void set_uncapped(bool uncapped);

    float        target_fps() const;
    const Frame& last_frame() const;

   private:
    std::unique_ptr<FrameScheduler> scheduler_;
    std::vector<Callback>           pending_;
};

}   // namespace vellum
