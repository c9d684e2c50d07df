#include <algorithm>
#include <exception>
#include <vellum/logger.hpp>
#include <vellum/primitive.hpp>
#include <vellum/registry.hpp>

namespace vellum
{

void Registry::add(PrimitivePtr primitive)
{
    if (!primitive)
    {
        VELLUM_LOG_WARN("registry", "ignoring null primitive");
        return;
    }
    primitives_.push_back(std::move(primitive));
}

void Registry::add(const std::vector<PrimitivePtr>& primitives)
{
    primitives_.reserve(primitives_.size() + primitives.size());
    for (const auto& p : primitives)
        add(p);
}

void Registry::remove(const PrimitivePtr& primitive)
{
    remove(primitive.get());
}

void Registry::remove(const Primitive* primitive)
{
    auto it = std::find_if(primitives_.begin(),
                           primitives_.end(),
                           [primitive](const PrimitivePtr& p) { return p.get() == primitive; });
    if (it != primitives_.end())
        primitives_.erase(it);
}

void Registry::clear()
{
    primitives_.clear();
}

bool Registry::contains(const Primitive* primitive) const
{
    return std::any_of(primitives_.begin(),
                       primitives_.end(),
                       [primitive](const PrimitivePtr& p) { return p.get() == primitive; });
}

std::vector<PrimitivePtr> Registry::objects_under(double x, double y) const
{
    std::vector<PrimitivePtr> hits;
    for (const auto& p : primitives_)
    {
        if (!p->kind().hit_testable())
            continue;

        bool inside = false;
        try
        {
            inside = p->is_inside(x - p->x(), y - p->y());
        }
        catch (const std::exception& e)
        {
            report_fault("hit-test", p.get(), e.what());
        }
        catch (...)
        {
            report_fault("hit-test", p.get(), "unknown exception");
        }
        if (inside)
            hits.push_back(p);
    }
    return hits;
}

std::vector<PrimitivePtr> Registry::interactive_under(double x, double y) const
{
    auto hits = objects_under(x, y);
    hits.erase(std::remove_if(hits.begin(),
                              hits.end(),
                              [](const PrimitivePtr& p) { return !p->mouse_enabled(); }),
               hits.end());
    return hits;
}

template <typename Fn>
void Registry::for_each_isolated(const char* stage, Fn&& fn)
{
    // Iterate over a snapshot: callbacks may add or remove primitives
    auto snapshot = primitives_;
    for (const auto& p : snapshot)
    {
        try
        {
            fn(*p);
        }
        catch (const std::exception& e)
        {
            report_fault(stage, p.get(), e.what());
        }
        catch (...)
        {
            report_fault(stage, p.get(), "unknown exception");
        }
    }
}

void Registry::update()
{
    for_each_isolated("update", [](Primitive& p) { p.update(); });
}

void Registry::render()
{
    for_each_isolated("render",
                      [](Primitive& p)
                      {
                          if (p.visible())
                              p.render();
                      });
}

void Registry::report_fault(const char* stage, const Primitive* primitive, const char* message) const
{
    const char* kind = primitive ? primitive->kind().name().c_str() : "-";
    VELLUM_LOG_ERROR("registry", "{} failed for '{}': {}", stage, kind, message);
    if (!fault_handler_)
        return;
    try
    {
        fault_handler_(Fault{stage, primitive, message});
    }
    catch (const std::exception& e)
    {
        VELLUM_LOG_ERROR("registry", "fault handler failed while reporting {}: {}", stage, e.what());
    }
    catch (...)
    {
        VELLUM_LOG_ERROR("registry", "fault handler failed while reporting {}", stage);
    }
}

}   // namespace vellum
