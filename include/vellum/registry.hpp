#pragma once

#include <memory>
#include <vector>
#include <vellum/error.hpp>

namespace vellum
{

class Primitive;

using PrimitivePtr = std::shared_ptr<Primitive>;

// Ordered collection of live primitives.
//
// Ordering contract: insertion order is paint order, update order and
// hit-test order. The first primitive added is advanced first, painted first
// (so it ends up underneath later ones) and reported first by
// objects_under(). The same reference may be added more than once; remove()
// deletes the first occurrence only.
class Registry
{
   public:
    Registry() = default;

    Registry(const Registry&)            = delete;
    Registry& operator=(const Registry&) = delete;

    void add(PrimitivePtr primitive);
    void add(const std::vector<PrimitivePtr>& primitives);

    // No-op if `primitive` is not registered.
    void remove(const PrimitivePtr& primitive);
    void remove(const Primitive* primitive);

    void clear();

    // Primitives, in registry order, whose is_inside(x - p.x, y - p.y) holds.
    // Primitives without a hit-test predicate are never matched.
    std::vector<PrimitivePtr> objects_under(double x, double y) const;

    // objects_under() restricted to primitives with mouse_enabled set.
    std::vector<PrimitivePtr> interactive_under(double x, double y) const;

    // Advances every primitive's animations, in registry order.
    void update();

    // Paints every visible primitive, in registry order.
    void render();

    bool   contains(const Primitive* primitive) const;
    size_t size() const { return primitives_.size(); }
    bool   empty() const { return primitives_.empty(); }

    const std::vector<PrimitivePtr>& primitives() const { return primitives_; }

    // Receives exceptions isolated while updating, rendering or hit-testing
    // a single primitive. They are also logged at error level.
    void set_fault_handler(FaultHandler handler) { fault_handler_ = std::move(handler); }

    // Shared by the pointer dispatcher and the frame engine.
    void report_fault(const char* stage, const Primitive* primitive, const char* message) const;

   private:
    template <typename Fn>
    void for_each_isolated(const char* stage, Fn&& fn);

    std::vector<PrimitivePtr> primitives_;
    FaultHandler              fault_handler_;
};

}   // namespace vellum
