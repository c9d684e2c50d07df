#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include <vellum/frame.hpp>
#include <vellum/tick_source.hpp>

namespace vellum
{

class Registry;
class PointerDispatcher;

struct FrameEngineConfig
{
    float target_fps = 60.0f;   // used by the fallback timer source only
};

// Drives the per-frame pipeline: pointer hover diffing, animation advance,
// before-render hooks, paint, frame listeners.
//
// Ticks are requested one at a time from a TickSource, so no two ticks ever
// overlap. stop() only suppresses the next reschedule; a tick already
// requested runs as a no-op.
class FrameEngine
{
   public:
    enum class State
    {
        Idle,
        Running,
    };

    using Hook          = std::function<void()>;
    using FrameListener = std::function<void(const Frame&)>;

    // Without a tick source the engine owns a TimerTickSource.
    FrameEngine(Registry&          registry,
                PointerDispatcher& dispatcher,
                TickSource*        source = nullptr,
                FrameEngineConfig  config = {});
    ~FrameEngine();

    FrameEngine(const FrameEngine&)            = delete;
    FrameEngine& operator=(const FrameEngine&) = delete;

    void  start();
    void  stop();
    bool  is_running() const { return state_ == State::Running; }
    State state() const { return state_; }

    // Runs one frame of work regardless of the state. Hosts owning their own
    // refresh loop call this directly instead of start().
    void tick();

    // Runs after Registry::update() and before Registry::render().
    void on_before_render(Hook hook) { before_render_.push_back(std::move(hook)); }

    // Runs after Registry::render(), e.g. to present the surface.
    void on_frame(FrameListener listener) { listeners_.push_back(std::move(listener)); }

    uint64_t     frame_number() const { return frame_.number; }
    const Frame& current_frame() const { return frame_; }

    TickSource&      tick_source() { return *source_; }
    TimerTickSource* timer() { return owned_timer_.get(); }

    const FrameEngineConfig& config() const { return config_; }

   private:
    void schedule();
    void on_tick();

    Registry&          registry_;
    PointerDispatcher& dispatcher_;
    FrameEngineConfig  config_;

    std::unique_ptr<TimerTickSource> owned_timer_;
    TickSource*                      source_ = nullptr;

    State state_     = State::Idle;
    bool  scheduled_ = false;
    Frame frame_;

    std::vector<Hook>          before_render_;
    std::vector<FrameListener> listeners_;

    // Tick callbacks hold a weak reference; a source outliving the engine
    // then runs them as no-ops.
    std::shared_ptr<FrameEngine*> alive_;

    using Clock = std::chrono::steady_clock;
    Clock::time_point started_at_;
    Clock::time_point last_tick_at_;
    bool              first_tick_ = true;
};

}   // namespace vellum
