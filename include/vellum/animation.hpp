#pragma once

#include <functional>
#include <string>
#include <vector>
#include <vellum/easing.hpp>

namespace vellum
{

class Primitive;

using CompletionFn = std::function<void(Primitive&)>;

// One scheduled interpolation of a numeric primitive property.
struct AnimationTask
{
    std::string  property;
    double       initial_value    = 0.0;
    double       range            = 0.0;   // target - initial, signed
    int          total_frames     = 0;
    int          remaining_frames = 0;
    EasingFn     easing           = ease::in_quad;
    CompletionFn on_complete;
    bool         completed = false;   // set once, by the advance that finishes the task

    int    elapsed_frames() const { return total_frames - remaining_frames; }
    double target_value() const { return initial_value + range; }

    // Property value once `elapsed` of total_frames frames have run.
    double value_at(int elapsed) const;
};

// Per-primitive list of animation tasks, advanced once per frame.
class AnimationQueue
{
   public:
    void push(AnimationTask task);

    // Advances every task by one frame and writes the new values into
    // `owner`. A task whose remaining count reaches zero is marked completed,
    // dropped, and its callback fired exactly once after the queue has been
    // updated; callbacks may therefore push new tasks or clear the queue.
    // If callbacks throw, the remaining callbacks still run and the first
    // exception is rethrown afterwards.
    void advance(Primitive& owner);

    // Drops all pending tasks without firing their callbacks.
    void clear() { tasks_.clear(); }

    bool   empty() const { return tasks_.empty(); }
    size_t size() const { return tasks_.size(); }

    const std::vector<AnimationTask>& tasks() const { return tasks_; }

   private:
    std::vector<AnimationTask> tasks_;
};

}   // namespace vellum
