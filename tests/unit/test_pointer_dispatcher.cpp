#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <vellum/pointer.hpp>
#include <vellum/registry.hpp>

using namespace vellum;

namespace
{

// Records "<event> <id>" for every pointer event any instance receives
class PointerFixture : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        PrimitiveCapabilities caps;
        caps.name      = "target";
        caps.is_inside = [](const Primitive& p, double x, double y)
        {
            double half = p.number_or("half", 5.0);
            return std::abs(x) <= half && std::abs(y) <= half;
        };
        caps.events.click = [this](Primitive& p) { log("click", p); };
        caps.events.over  = [this](Primitive& p) { log("over", p); };
        caps.events.move  = [this](Primitive& p) { log("move", p); };
        caps.events.out   = [this](Primitive& p) { log("out", p); };
        kind_             = define_primitive([](Primitive&, Surface&) {}, caps);
    }

    PrimitivePtr add(const std::string& id, double x, double y, double half = 5.0)
    {
        auto p = kind_->create({{"id", id}, {"x", x}, {"y", y}, {"half", half}});
        registry_.add(p);
        return p;
    }

    void log(const char* event, const Primitive& p)
    {
        events_.push_back(std::string(event) + " " + p.string_or("id", "?"));
    }

    std::vector<std::string> take()
    {
        auto out = std::move(events_);
        events_.clear();
        return out;
    }

    std::shared_ptr<const PrimitiveKind> kind_;
    Registry                             registry_;
    PointerDispatcher                    dispatcher_{registry_};
    std::vector<std::string>             events_;
};

using Events = std::vector<std::string>;

}   // anonymous namespace

TEST_F(PointerFixture, NothingHappensBeforeFirstMove)
{
    add("a", 0.0, 0.0, 10.0);
    dispatcher_.update();
    EXPECT_TRUE(take().empty());
    EXPECT_EQ(dispatcher_.hit_test_count(), 0u);
    EXPECT_DOUBLE_EQ(dispatcher_.pointer_x(), PointerDispatcher::NO_POSITION);
}

TEST_F(PointerFixture, OverThenMoveThenOut)
{
    auto a = add("a", 50.0, 50.0);

    dispatcher_.move(50.0, 50.0);
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"over a"}));
    EXPECT_TRUE(dispatcher_.is_hovered(a.get()));

    dispatcher_.move(51.0, 50.0);
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"move a"}));

    dispatcher_.move(200.0, 200.0);
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"out a"}));
    EXPECT_FALSE(dispatcher_.is_hovered(a.get()));
    EXPECT_TRUE(dispatcher_.hovered().empty());
}

TEST_F(PointerFixture, UnchangedPositionDoesNoWork)
{
    add("a", 0.0, 0.0);
    dispatcher_.move(1.0, 1.0);
    dispatcher_.update();
    take();
    EXPECT_EQ(dispatcher_.hit_test_count(), 1u);

    dispatcher_.update();
    dispatcher_.update();
    EXPECT_EQ(dispatcher_.hit_test_count(), 1u);
    EXPECT_TRUE(take().empty());

    // Moving away and back within one frame is coalesced
    dispatcher_.move(100.0, 100.0);
    dispatcher_.move(1.0, 1.0);
    dispatcher_.update();
    EXPECT_EQ(dispatcher_.hit_test_count(), 1u);
    EXPECT_TRUE(take().empty());
}

TEST_F(PointerFixture, HoverDiffLaw)
{
    // a and b overlap at x in [5, 10]; c is far away
    add("a", 0.0, 0.0, 10.0);
    add("b", 15.0, 0.0, 10.0);
    add("c", 100.0, 0.0, 10.0);

    dispatcher_.move(0.0, 0.0);   // H = {a}
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"over a"}));

    dispatcher_.move(7.0, 0.0);   // H = {a, b}
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"move a", "over b"}));

    dispatcher_.move(20.0, 0.0);   // H = {b}
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"move b", "out a"}));

    dispatcher_.move(100.0, 0.0);   // H = {c}
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"over c", "out b"}));
}

TEST_F(PointerFixture, ClickFiresOnAllMatchesInRegistryOrder)
{
    add("p1", 10.0, 10.0);
    add("p2", 12.0, 12.0);
    add("far", 90.0, 90.0);

    dispatcher_.click(11.0, 11.0);
    EXPECT_EQ(take(), (Events{"click p1", "click p2"}));
}

TEST_F(PointerFixture, ClickIgnoresThrottleAndTicks)
{
    add("a", 0.0, 0.0);
    dispatcher_.click(0.0, 0.0);
    dispatcher_.click(0.0, 0.0);
    EXPECT_EQ(take(), (Events{"click a", "click a"}));
    EXPECT_EQ(dispatcher_.hit_test_count(), 0u);
}

TEST_F(PointerFixture, PrimitiveWithoutEventsNeverReported)
{
    PrimitiveCapabilities caps;
    caps.name      = "plain";
    caps.is_inside = [](const Primitive&, double, double) { return true; };
    auto plain     = define_primitive([](Primitive&, Surface&) {}, caps)->create();
    EXPECT_FALSE(plain->mouse_enabled());
    registry_.add(plain);

    dispatcher_.move(0.0, 0.0);
    dispatcher_.update();
    dispatcher_.click(0.0, 0.0);

    EXPECT_TRUE(take().empty());
    EXPECT_FALSE(dispatcher_.is_hovered(plain.get()));
}

TEST_F(PointerFixture, MouseDisabledPrimitiveGetsNoEvents)
{
    auto a = add("a", 0.0, 0.0);
    a->set_mouse_enabled(false);

    dispatcher_.move(0.0, 0.0);
    dispatcher_.update();
    dispatcher_.click(0.0, 0.0);
    EXPECT_TRUE(take().empty());
}

TEST_F(PointerFixture, RemovedPrimitiveGetsOut)
{
    auto a = add("a", 0.0, 0.0);
    dispatcher_.move(0.0, 0.0);
    dispatcher_.update();
    take();

    registry_.remove(a);
    dispatcher_.move(1.0, 0.0);
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"out a"}));
}

TEST_F(PointerFixture, DuplicateRegistrationHoveredOnce)
{
    auto a = add("a", 0.0, 0.0);
    registry_.add(a);

    dispatcher_.move(0.0, 0.0);
    dispatcher_.update();
    EXPECT_EQ(take(), (Events{"over a"}));
    EXPECT_EQ(dispatcher_.hovered().size(), 1u);
}

TEST_F(PointerFixture, ResetFiresOutAndForgetsPosition)
{
    add("a", 0.0, 0.0);
    dispatcher_.move(0.0, 0.0);
    dispatcher_.update();
    take();

    dispatcher_.reset();
    EXPECT_EQ(take(), (Events{"out a"}));
    EXPECT_TRUE(dispatcher_.hovered().empty());
    EXPECT_DOUBLE_EQ(dispatcher_.pointer_x(), PointerDispatcher::NO_POSITION);

    dispatcher_.update();
    EXPECT_TRUE(take().empty());
}

TEST_F(PointerFixture, HandlerFaultIsIsolated)
{
    PrimitiveCapabilities caps;
    caps.name        = "throwing";
    caps.is_inside   = [](const Primitive&, double, double) { return true; };
    caps.events.over = [](Primitive&) { throw std::runtime_error("over failed"); };
    registry_.add(define_primitive([](Primitive&, Surface&) {}, caps)->create());
    add("b", 0.0, 0.0);

    std::vector<Fault> faults;
    registry_.set_fault_handler([&faults](const Fault& f) { faults.push_back(f); });

    dispatcher_.move(0.0, 0.0);
    dispatcher_.update();

    EXPECT_EQ(take(), (Events{"over b"}));
    ASSERT_EQ(faults.size(), 1u);
    EXPECT_EQ(faults[0].stage, "over");
    EXPECT_EQ(dispatcher_.hovered().size(), 2u);
}
