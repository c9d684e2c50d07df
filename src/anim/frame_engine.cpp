#include <exception>
#include <vellum/frame_engine.hpp>
#include <vellum/logger.hpp>
#include <vellum/pointer.hpp>
#include <vellum/registry.hpp>

namespace vellum
{

FrameEngine::FrameEngine(Registry&          registry,
                         PointerDispatcher& dispatcher,
                         TickSource*        source,
                         FrameEngineConfig  config)
    : registry_(registry),
      dispatcher_(dispatcher),
      config_(config),
      source_(source),
      alive_(std::make_shared<FrameEngine*>(this))
{
    if (!source_)
    {
        owned_timer_ = std::make_unique<TimerTickSource>(config_.target_fps);
        source_      = owned_timer_.get();
    }
}

FrameEngine::~FrameEngine()
{
    state_ = State::Idle;
    alive_.reset();
}

void FrameEngine::start()
{
    if (state_ == State::Running)
        return;

    state_      = State::Running;
    first_tick_ = true;
    VELLUM_LOG_INFO("engine", "started at frame {}", frame_.number);
    schedule();
}

void FrameEngine::stop()
{
    if (state_ == State::Idle)
        return;

    state_ = State::Idle;
    VELLUM_LOG_INFO("engine", "stopped at frame {}", frame_.number);
}

void FrameEngine::schedule()
{
    // A tick still pending from before a stop/start cycle carries on the chain.
    if (scheduled_)
        return;

    scheduled_ = true;
    std::weak_ptr<FrameEngine*> token = alive_;
    source_->request_tick(
        [token]()
        {
            if (auto alive = token.lock())
                (*alive)->on_tick();
        });
}

void FrameEngine::on_tick()
{
    scheduled_ = false;
    if (state_ != State::Running)
        return;

    // Faults never break the tick chain
    try
    {
        tick();
    }
    catch (const std::exception& e)
    {
        registry_.report_fault("tick", nullptr, e.what());
    }
    catch (...)
    {
        registry_.report_fault("tick", nullptr, "unknown exception");
    }

    if (state_ == State::Running)
        schedule();
}

void FrameEngine::tick()
{
    auto now = Clock::now();
    if (first_tick_)
    {
        first_tick_   = false;
        started_at_   = now;
        last_tick_at_ = now;
    }
    frame_.dt          = std::chrono::duration<float>(now - last_tick_at_).count();
    frame_.elapsed_sec = std::chrono::duration<float>(now - started_at_).count();
    last_tick_at_      = now;

    VELLUM_LOG_TRACE("engine", "tick {}", frame_.number);

    dispatcher_.update();
    registry_.update();

    for (auto& hook : before_render_)
    {
        try
        {
            hook();
        }
        catch (const std::exception& e)
        {
            registry_.report_fault("before-render", nullptr, e.what());
        }
        catch (...)
        {
            registry_.report_fault("before-render", nullptr, "unknown exception");
        }
    }

    registry_.render();
    ++frame_.number;

    for (auto& listener : listeners_)
    {
        try
        {
            listener(frame_);
        }
        catch (const std::exception& e)
        {
            registry_.report_fault("frame-listener", nullptr, e.what());
        }
        catch (...)
        {
            registry_.report_fault("frame-listener", nullptr, "unknown exception");
        }
    }
}

}   // namespace vellum
