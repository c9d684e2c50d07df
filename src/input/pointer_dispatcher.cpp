#include <algorithm>
#include <exception>
#include <vellum/logger.hpp>
#include <vellum/pointer.hpp>

namespace vellum
{

namespace
{

bool holds(const std::vector<PrimitivePtr>& list, const Primitive* primitive)
{
    return std::any_of(list.begin(),
                       list.end(),
                       [primitive](const PrimitivePtr& p) { return p.get() == primitive; });
}

}   // anonymous namespace

void PointerDispatcher::move(double x, double y)
{
    latest_x_ = x;
    latest_y_ = y;
}

void PointerDispatcher::click(double x, double y)
{
    auto hits = registry_.interactive_under(x, y);
    VELLUM_LOG_DEBUG("pointer", "click at ({}, {}) hit {} primitive(s)", x, y, hits.size());
    for (const auto& p : hits)
        fire(p, PointerEvent::Click);
}

void PointerDispatcher::update()
{
    if (latest_x_ == checked_x_ && latest_y_ == checked_y_)
        return;

    const double px = latest_x_;
    const double py = latest_y_;

    ++hit_tests_;
    auto current = registry_.interactive_under(px, py);

    std::vector<PrimitivePtr> next;
    next.reserve(current.size());
    for (const auto& p : current)
    {
        // A primitive registered twice is still hovered only once
        if (holds(next, p.get()))
            continue;

        fire(p, holds(hover_buffer_, p.get()) ? PointerEvent::Move : PointerEvent::Over);
        next.push_back(p);
    }

    for (const auto& p : hover_buffer_)
    {
        if (!holds(next, p.get()))
            fire(p, PointerEvent::Out);
    }

    hover_buffer_.swap(next);
    checked_x_ = px;
    checked_y_ = py;
}

void PointerDispatcher::reset()
{
    auto previous = std::move(hover_buffer_);
    hover_buffer_.clear();
    for (const auto& p : previous)
        fire(p, PointerEvent::Out);

    latest_x_  = NO_POSITION;
    latest_y_  = NO_POSITION;
    checked_x_ = NO_POSITION;
    checked_y_ = NO_POSITION;
}

bool PointerDispatcher::is_hovered(const Primitive* primitive) const
{
    return holds(hover_buffer_, primitive);
}

void PointerDispatcher::fire(const PrimitivePtr& primitive, PointerEvent event)
{
    VELLUM_LOG_TRACE("pointer", "{} -> '{}'", to_string(event), primitive->kind().name());
    try
    {
        primitive->dispatch(event);
    }
    catch (const std::exception& e)
    {
        registry_.report_fault(to_string(event), primitive.get(), e.what());
    }
    catch (...)
    {
        registry_.report_fault(to_string(event), primitive.get(), "unknown exception");
    }
}

}   // namespace vellum
