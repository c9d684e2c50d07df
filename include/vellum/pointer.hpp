#pragma once

#include <cstdint>
#include <vector>
#include <vellum/primitive.hpp>
#include <vellum/registry.hpp>

namespace vellum
{

// Turns raw pointer input into per-primitive over/move/out/click events.
//
// move() only records the latest position; it is consulted by the next
// update() (fast successive moves inside one frame coalesce). update() does
// nothing while the position is unchanged since the previous check. click()
// is dispatched immediately and ignores the throttle.
class PointerDispatcher
{
   public:
    // Impossible coordinate used before any pointer input arrived.
    static constexpr double NO_POSITION = -1.0;

    explicit PointerDispatcher(Registry& registry) : registry_(registry) {}

    PointerDispatcher(const PointerDispatcher&)            = delete;
    PointerDispatcher& operator=(const PointerDispatcher&) = delete;

    // Pointer boundary, surface-local pixels.
    void move(double x, double y);
    void click(double x, double y);

    // Per-frame hover diffing. Fires "over" for newly hovered primitives,
    // "move" for still-hovered ones and "out" for ones no longer hovered.
    void update();

    // Fires "out" for every hovered primitive and forgets the last position.
    void reset();

    const std::vector<PrimitivePtr>& hovered() const { return hover_buffer_; }
    bool                             is_hovered(const Primitive* primitive) const;

    double pointer_x() const { return latest_x_; }
    double pointer_y() const { return latest_y_; }

    // Registry queries issued by update(); unchanged positions issue none.
    uint64_t hit_test_count() const { return hit_tests_; }

   private:
    void fire(const PrimitivePtr& primitive, PointerEvent event);

    Registry&                 registry_;
    std::vector<PrimitivePtr> hover_buffer_;

    double latest_x_  = NO_POSITION;
    double latest_y_  = NO_POSITION;
    double checked_x_ = NO_POSITION;
    double checked_y_ = NO_POSITION;

    uint64_t hit_tests_ = 0;
};

}   // namespace vellum
