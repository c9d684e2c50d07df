#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <vellum/frame_engine.hpp>
#include <vellum/pointer.hpp>
#include <vellum/recording_surface.hpp>
#include <vellum/registry.hpp>

using namespace vellum;

namespace
{

class FrameEngineTest : public ::testing::Test
{
   protected:
    FrameEngineTest() : dispatcher_(registry_), engine_(registry_, dispatcher_, &ticks_) {}

    Registry          registry_;
    PointerDispatcher dispatcher_;
    ManualTickSource  ticks_;
    FrameEngine       engine_;
};

}   // anonymous namespace

TEST_F(FrameEngineTest, StartsIdle)
{
    EXPECT_EQ(engine_.state(), FrameEngine::State::Idle);
    EXPECT_FALSE(engine_.is_running());
    EXPECT_EQ(ticks_.pending(), 0u);
    EXPECT_EQ(engine_.timer(), nullptr);
}

TEST_F(FrameEngineTest, StartSchedulesOneTick)
{
    engine_.start();
    EXPECT_TRUE(engine_.is_running());
    EXPECT_EQ(ticks_.pending(), 1u);

    // A second start does not add a parallel tick chain
    engine_.start();
    EXPECT_EQ(ticks_.pending(), 1u);
}

TEST_F(FrameEngineTest, EachTickReschedulesWhileRunning)
{
    engine_.start();
    for (int i = 0; i < 5; ++i)
    {
        EXPECT_EQ(ticks_.pump(), 1u);
        EXPECT_EQ(ticks_.pending(), 1u);
    }
    EXPECT_EQ(engine_.frame_number(), 5u);
}

TEST_F(FrameEngineTest, StopSuppressesNextTick)
{
    engine_.start();
    ticks_.pump();
    engine_.stop();
    EXPECT_EQ(engine_.state(), FrameEngine::State::Idle);

    // The already-requested tick runs as a no-op and reschedules nothing
    EXPECT_EQ(ticks_.pump(), 1u);
    EXPECT_EQ(ticks_.pending(), 0u);
    EXPECT_EQ(engine_.frame_number(), 1u);
}

TEST_F(FrameEngineTest, StopStartDoesNotDoubleTicks)
{
    engine_.start();
    engine_.stop();
    engine_.start();
    EXPECT_EQ(ticks_.pending(), 1u);

    ticks_.pump();
    EXPECT_EQ(engine_.frame_number(), 1u);
    EXPECT_EQ(ticks_.pending(), 1u);
}

TEST_F(FrameEngineTest, TickOrderIsPointerUpdateRenderListeners)
{
    std::vector<std::string> trace;

    PrimitiveCapabilities caps;
    caps.name        = "traced";
    caps.is_inside   = [](const Primitive&, double, double) { return true; };
    caps.events.over = [&trace](Primitive&) { trace.push_back("pointer"); };
    auto kind        = define_primitive([&trace](Primitive&, Surface&) { trace.push_back("render"); },
                                 caps);

    auto p = kind->create({}, {}, std::make_shared<RecordingSurface>());
    p->animate({{"x", 1.0}}, 1, [&trace](Primitive&) { trace.push_back("update"); });
    registry_.add(p);

    engine_.on_before_render([&trace]() { trace.push_back("before-render"); });
    engine_.on_frame([&trace](const Frame&) { trace.push_back("frame"); });

    dispatcher_.move(0.0, 0.0);
    engine_.start();
    ticks_.pump();

    std::vector<std::string> expected{"pointer", "update", "before-render", "render", "frame"};
    EXPECT_EQ(trace, expected);
}

TEST_F(FrameEngineTest, AnimationsFrozenWhileStopped)
{
    auto p = define_primitive([](Primitive&, Surface&) {})->create();
    p->animate({{"x", 100.0}}, 10, {}, "linear");
    registry_.add(p);

    engine_.start();
    ticks_.pump();
    ticks_.pump();
    engine_.stop();
    ticks_.pump();
    EXPECT_DOUBLE_EQ(p->x(), 20.0);

    // No replay of the missed tick after a restart
    engine_.start();
    ticks_.pump();
    EXPECT_DOUBLE_EQ(p->x(), 30.0);
}

TEST_F(FrameEngineTest, ScenarioAnimateTenFrames)
{
    auto p     = define_primitive([](Primitive&, Surface&) {})->create();
    int  fired = 0;
    p->animate({{"x", 100.0}}, 10, [&fired](Primitive&) { ++fired; });
    registry_.add(p);

    engine_.start();
    for (int i = 0; i < 5; ++i)
        ticks_.pump();
    EXPECT_NEAR(p->x(), 25.0, 1e-9);

    for (int i = 0; i < 5; ++i)
        ticks_.pump();
    EXPECT_DOUBLE_EQ(p->x(), 100.0);
    EXPECT_EQ(fired, 1);
}

TEST_F(FrameEngineTest, FaultsDoNotStopScheduling)
{
    auto bad = define_primitive([](Primitive&, Surface&) { throw std::runtime_error("render"); });
    registry_.add(bad->create({}, {}, std::make_shared<RecordingSurface>()));

    std::vector<Fault> faults;
    registry_.set_fault_handler([&faults](const Fault& f) { faults.push_back(f); });
    engine_.on_frame([](const Frame&) { throw std::runtime_error("listener"); });

    engine_.start();
    ticks_.pump();
    ticks_.pump();

    EXPECT_TRUE(engine_.is_running());
    EXPECT_EQ(ticks_.pending(), 1u);
    EXPECT_EQ(engine_.frame_number(), 2u);
    ASSERT_EQ(faults.size(), 4u);
    EXPECT_EQ(faults[0].stage, "render");
    EXPECT_EQ(faults[1].stage, "frame-listener");
    EXPECT_EQ(faults[1].primitive, nullptr);
}

TEST_F(FrameEngineTest, NonStandardThrowFromListenerKeepsScheduling)
{
    std::vector<Fault> faults;
    registry_.set_fault_handler([&faults](const Fault& f) { faults.push_back(f); });

    int calls = 0;
    engine_.on_frame(
        [&calls](const Frame&)
        {
            if (++calls == 1)
                throw 42;
        });

    engine_.start();
    ticks_.pump();

    EXPECT_TRUE(engine_.is_running());
    EXPECT_EQ(ticks_.pending(), 1u);
    ASSERT_EQ(faults.size(), 1u);
    EXPECT_EQ(faults[0].stage, "frame-listener");
    EXPECT_EQ(faults[0].message, "unknown exception");

    ticks_.pump();
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(engine_.frame_number(), 2u);
}

TEST_F(FrameEngineTest, NonStandardThrowFromHookIsIsolated)
{
    int  renders = 0;
    auto kind    = define_primitive([&renders](Primitive&, Surface&) { ++renders; });
    registry_.add(kind->create({}, {}, std::make_shared<RecordingSurface>()));

    engine_.on_before_render([]() { throw std::string("not an exception"); });

    engine_.start();
    ticks_.pump();

    EXPECT_EQ(renders, 1);
    EXPECT_EQ(ticks_.pending(), 1u);
}

TEST_F(FrameEngineTest, ThrowingFaultHandlerKeepsScheduling)
{
    auto bad = define_primitive([](Primitive&, Surface&) { throw std::runtime_error("render"); });
    registry_.add(bad->create({}, {}, std::make_shared<RecordingSurface>()));

    int reports = 0;
    registry_.set_fault_handler(
        [&reports](const Fault&)
        {
            ++reports;
            throw std::runtime_error("handler failed");
        });

    engine_.start();
    ticks_.pump();

    EXPECT_TRUE(engine_.is_running());
    EXPECT_EQ(ticks_.pending(), 1u);

    ticks_.pump();
    EXPECT_EQ(reports, 2);
    EXPECT_EQ(engine_.frame_number(), 2u);
}

TEST_F(FrameEngineTest, RestartAfterFaultingTick)
{
    engine_.on_frame([](const Frame&) { throw 7; });
    engine_.start();
    ticks_.pump();

    engine_.stop();
    ticks_.pump();
    EXPECT_EQ(ticks_.pending(), 0u);

    engine_.start();
    EXPECT_EQ(ticks_.pending(), 1u);
}

TEST_F(FrameEngineTest, ManualTickWorksWhileIdle)
{
    uint64_t seen = 0;
    engine_.on_frame([&seen](const Frame& f) { seen = f.number; });

    engine_.tick();
    engine_.tick();

    EXPECT_EQ(seen, 2u);
    EXPECT_FALSE(engine_.is_running());
    EXPECT_EQ(ticks_.pending(), 0u);
}

TEST_F(FrameEngineTest, FrameTimingAdvances)
{
    engine_.tick();
    EXPECT_FLOAT_EQ(engine_.current_frame().dt, 0.0f);
    engine_.tick();
    EXPECT_GE(engine_.current_frame().elapsed_seconds(), 0.0f);
    EXPECT_GE(engine_.current_frame().delta_time(), 0.0f);
}

TEST(FrameEngine, StaleTickAfterDestructionIsHarmless)
{
    Registry          registry;
    PointerDispatcher dispatcher(registry);
    ManualTickSource  ticks;
    {
        FrameEngine engine(registry, dispatcher, &ticks);
        engine.start();
    }
    EXPECT_EQ(ticks.pending(), 1u);
    EXPECT_EQ(ticks.pump(), 1u);
    EXPECT_EQ(ticks.pending(), 0u);
}

TEST(FrameEngine, FallsBackToTimerSource)
{
    Registry          registry;
    PointerDispatcher dispatcher(registry);
    FrameEngine       engine(registry, dispatcher, nullptr, FrameEngineConfig{120.0f});

    ASSERT_NE(engine.timer(), nullptr);
    EXPECT_FLOAT_EQ(engine.timer()->target_fps(), 120.0f);

    int frames = 0;
    engine.on_frame(
        [&](const Frame&)
        {
            if (++frames == 3)
                engine.stop();
        });

    engine.timer()->set_uncapped(true);
    engine.start();
    uint64_t ran = engine.timer()->run(100);

    EXPECT_EQ(frames, 3);
    EXPECT_EQ(ran, 3u);
    EXPECT_FALSE(engine.is_running());
}
