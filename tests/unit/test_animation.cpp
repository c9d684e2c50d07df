#include <gtest/gtest.h>
#include <stdexcept>
#include <vellum/animation.hpp>
#include <vellum/primitive.hpp>

using namespace vellum;

namespace
{

std::shared_ptr<Primitive> make_plain()
{
    static auto kind = define_primitive([](Primitive&, Surface&) {});
    return kind->create();
}

AnimationTask make_task(const std::string& property, double from, double to, int frames)
{
    AnimationTask task;
    task.property      = property;
    task.initial_value = from;
    task.range         = to - from;
    task.total_frames  = frames;
    return task;
}

}   // anonymous namespace

// ─── AnimationTask ──────────────────────────────────────────────────────────

TEST(AnimationTask, ValueAtUsesEasingRatio)
{
    auto task = make_task("x", 0.0, 100.0, 10);
    EXPECT_DOUBLE_EQ(task.value_at(0), 0.0);
    EXPECT_DOUBLE_EQ(task.value_at(5), 25.0);   // in_quad(0.5)
    EXPECT_DOUBLE_EQ(task.value_at(10), 100.0);
}

TEST(AnimationTask, ValueAtPastEndIsTarget)
{
    auto task = make_task("x", 10.0, -10.0, 4);
    EXPECT_DOUBLE_EQ(task.value_at(7), -10.0);
    EXPECT_DOUBLE_EQ(task.target_value(), -10.0);
}

TEST(AnimationTask, LinearEasing)
{
    auto task   = make_task("x", 0.0, 10.0, 4);
    task.easing = ease::linear;
    EXPECT_DOUBLE_EQ(task.value_at(1), 2.5);
    EXPECT_DOUBLE_EQ(task.value_at(3), 7.5);
}

// ─── AnimationQueue ─────────────────────────────────────────────────────────

TEST(AnimationQueue, PushResetsRemainingFrames)
{
    AnimationQueue queue;
    auto           task   = make_task("x", 0.0, 1.0, 6);
    task.remaining_frames = 99;
    queue.push(task);

    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.tasks()[0].remaining_frames, 6);
    EXPECT_EQ(queue.tasks()[0].elapsed_frames(), 0);
}

TEST(AnimationQueue, NegativeFramesClampToZero)
{
    AnimationQueue queue;
    queue.push(make_task("x", 0.0, 1.0, -3));
    EXPECT_EQ(queue.tasks()[0].total_frames, 0);
}

TEST(AnimationQueue, RemainingStrictlyDecreases)
{
    auto p = make_plain();

    AnimationQueue queue;
    queue.push(make_task("x", 0.0, 50.0, 5));

    int previous = queue.tasks()[0].remaining_frames;
    for (int i = 0; i < 4; ++i)
    {
        queue.advance(*p);
        ASSERT_EQ(queue.size(), 1u);
        EXPECT_EQ(queue.tasks()[0].remaining_frames, previous - 1);
        previous = queue.tasks()[0].remaining_frames;
    }
    queue.advance(*p);
    EXPECT_TRUE(queue.empty());
    EXPECT_DOUBLE_EQ(p->x(), 50.0);
}

TEST(AnimationQueue, CallbackFiresOnceOnFinalAdvance)
{
    auto p = make_plain();

    AnimationQueue queue;
    int            fired = 0;
    auto           task  = make_task("y", 0.0, 8.0, 3);
    task.on_complete     = [&fired](Primitive&) { ++fired; };
    queue.push(task);

    queue.advance(*p);
    queue.advance(*p);
    EXPECT_EQ(fired, 0);
    queue.advance(*p);
    EXPECT_EQ(fired, 1);
    queue.advance(*p);
    queue.advance(*p);
    EXPECT_EQ(fired, 1);
}

TEST(AnimationQueue, ZeroLengthTaskSnapsOnNextAdvance)
{
    auto p = make_plain();

    AnimationQueue queue;
    int            fired = 0;
    auto           task  = make_task("x", 0.0, 42.0, 0);
    task.on_complete     = [&fired](Primitive&) { ++fired; };
    queue.push(task);

    EXPECT_DOUBLE_EQ(p->x(), 0.0);
    queue.advance(*p);
    EXPECT_DOUBLE_EQ(p->x(), 42.0);
    EXPECT_EQ(fired, 1);
    EXPECT_TRUE(queue.empty());
}

TEST(AnimationQueue, SamePropertyLastWriteWins)
{
    auto p = make_plain();

    AnimationQueue queue;
    queue.push(make_task("x", 0.0, 10.0, 2));
    queue.push(make_task("x", 0.0, 90.0, 2));

    queue.advance(*p);
    queue.advance(*p);
    EXPECT_DOUBLE_EQ(p->x(), 90.0);
}

TEST(AnimationQueue, CallbackMayScheduleFollowUp)
{
    auto p = make_plain();

    AnimationQueue queue;

    auto first        = make_task("x", 0.0, 10.0, 1);
    first.on_complete = [&queue](Primitive&) { queue.push(make_task("x", 10.0, 20.0, 1)); };
    queue.push(first);

    queue.advance(*p);
    EXPECT_DOUBLE_EQ(p->x(), 10.0);
    ASSERT_EQ(queue.size(), 1u);

    queue.advance(*p);
    EXPECT_DOUBLE_EQ(p->x(), 20.0);
    EXPECT_TRUE(queue.empty());
}

TEST(AnimationQueue, ThrowingCallbackDoesNotStarveOthers)
{
    auto p = make_plain();

    AnimationQueue queue;
    int            fired = 0;

    auto a        = make_task("x", 0.0, 1.0, 1);
    a.on_complete = [](Primitive&) { throw std::runtime_error("boom"); };
    auto b        = make_task("y", 0.0, 1.0, 1);
    b.on_complete = [&fired](Primitive&) { ++fired; };
    queue.push(a);
    queue.push(b);

    EXPECT_THROW(queue.advance(*p), std::runtime_error);
    EXPECT_EQ(fired, 1);
    EXPECT_TRUE(queue.empty());
}

TEST(AnimationQueue, ClearDropsWithoutCallbacks)
{
    auto p = make_plain();

    AnimationQueue queue;
    int            fired = 0;
    auto           task  = make_task("x", 0.0, 1.0, 2);
    task.on_complete     = [&fired](Primitive&) { ++fired; };
    queue.push(task);

    queue.clear();
    queue.advance(*p);
    EXPECT_EQ(fired, 0);
    EXPECT_DOUBLE_EQ(p->x(), 0.0);
}
