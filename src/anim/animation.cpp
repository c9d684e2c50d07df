#include <exception>
#include <iterator>
#include <vellum/animation.hpp>
#include <vellum/logger.hpp>
#include <vellum/primitive.hpp>

namespace vellum
{

double AnimationTask::value_at(int elapsed) const
{
    if (total_frames <= 0 || elapsed >= total_frames)
        return target_value();
    if (elapsed <= 0)
        return initial_value;

    double ratio = static_cast<double>(elapsed) / static_cast<double>(total_frames);
    return initial_value + range * easing(ratio);
}

void AnimationQueue::push(AnimationTask task)
{
    if (!task.easing)
        task.easing = default_easing();
    if (task.total_frames < 0)
        task.total_frames = 0;
    task.remaining_frames = task.total_frames;
    task.completed        = false;
    tasks_.push_back(std::move(task));
}

void AnimationQueue::advance(Primitive& owner)
{
    if (tasks_.empty())
        return;

    std::vector<AnimationTask> active;
    active.swap(tasks_);

    std::vector<AnimationTask> finished;
    tasks_.reserve(active.size());

    for (auto& task : active)
    {
        if (task.remaining_frames > 0)
        {
            owner.set_number(task.property, task.value_at(task.elapsed_frames() + 1));
            --task.remaining_frames;
        }
        else
        {
            // Zero-length task: jump straight to the target
            owner.set_number(task.property, task.target_value());
        }

        if (task.remaining_frames == 0)
        {
            task.completed = true;
            finished.push_back(std::move(task));
        }
        else
        {
            tasks_.push_back(std::move(task));
        }
    }

    std::exception_ptr first_error;
    for (auto& task : finished)
    {
        VELLUM_LOG_TRACE("animation", "'{}' finished after {} frames", task.property, task.total_frames);
        if (!task.on_complete)
            continue;
        try
        {
            task.on_complete(owner);
        }
        catch (...)
        {
            // Rethrown below once every completed task has had its callback
            if (!first_error)
                first_error = std::current_exception();
        }
    }

    if (first_error)
        std::rethrow_exception(first_error);
}

}   // namespace vellum
