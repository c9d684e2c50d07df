#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <vellum/animation.hpp>
#include <vellum/error.hpp>
#include <vellum/property.hpp>

namespace vellum
{

class Surface;
class Primitive;
class PrimitiveKind;

enum class PointerEvent
{
    Click,
    Over,
    Move,
    Out,
};

const char* to_string(PointerEvent event);

using EventHandler = std::function<void(Primitive&)>;

struct PrimitiveEvents
{
    EventHandler click;
    EventHandler over;
    EventHandler move;
    EventHandler out;

    bool                empty() const { return !click && !over && !move && !out; }
    const EventHandler& handler(PointerEvent event) const;
};

// Axis-aligned box in the primitive's local space.
struct BoundingBox
{
    double x  = 0.0;
    double y  = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    double width() const { return x1 - x; }
    double height() const { return y1 - y; }
};

using RenderFn      = std::function<void(Primitive&, Surface&)>;
using HitTestFn     = std::function<bool(const Primitive&, double local_x, double local_y)>;
using BoundingBoxFn = std::function<BoundingBox(const Primitive&)>;
using InitFn        = std::function<void(Primitive&)>;

// Optional parts of a primitive kind. Leaving a member empty disables the
// corresponding capability for every instance of the kind.
struct PrimitiveCapabilities
{
    std::string     name = "primitive";   // used in log messages
    HitTestFn       is_inside;
    BoundingBoxFn   bounding_box;
    InitFn          init;
    PrimitiveEvents events;

    // Numeric properties that may be animated in addition to the built-in
    // x, y, rotation, scale, alpha and index.
    std::vector<std::string> animatable;
};

// Ordered property targets of an animate() call.
using AnimationTargets = std::vector<std::pair<std::string, double>>;

struct AnimateResult
{
    size_t                              accepted = 0;
    std::vector<AnimationPropertyError> rejected;

    bool ok() const { return rejected.empty(); }
};

// Throws PrimitiveDefinitionError if `render` is empty, if event handlers are
// supplied without an is_inside predicate, or if an animatable descriptor is
// empty, duplicated or names a non-numeric built-in.
std::shared_ptr<const PrimitiveKind> define_primitive(RenderFn              render,
                                                      PrimitiveCapabilities caps = {});

// Instance constructor produced by define_primitive(). Immutable once defined
// and shared by every instance of the kind.
class PrimitiveKind : public std::enable_shared_from_this<PrimitiveKind>
{
   public:
    // Builds an instance. Layering, lowest precedence first:
    //   built-in defaults < event wiring < data < init hook < style
    std::shared_ptr<Primitive> create(const PropertyMap&       data    = {},
                                      const PropertyMap&       style   = {},
                                      std::shared_ptr<Surface> surface = nullptr) const;

    const std::string& name() const { return caps_.name; }

    bool hit_testable() const { return static_cast<bool>(caps_.is_inside); }
    bool has_bounding_box() const { return static_cast<bool>(caps_.bounding_box); }
    bool has_events() const { return !caps_.events.empty(); }

    bool is_animatable(std::string_view property) const;

    const PrimitiveEvents&          events() const { return caps_.events; }
    const std::vector<std::string>& animatable() const { return animatable_; }

   private:
    PrimitiveKind(RenderFn render, PrimitiveCapabilities caps);

    friend class Primitive;
    friend std::shared_ptr<const PrimitiveKind> define_primitive(RenderFn, PrimitiveCapabilities);

    RenderFn                 render_;
    PrimitiveCapabilities    caps_;
    std::vector<std::string> animatable_;   // built-ins followed by declared names
};

// A drawable, animatable, optionally hit-testable instance. Identity is the
// object itself; instances are shared through std::shared_ptr.
class Primitive
{
   public:
    static constexpr int    TRANSITION_FPS            = 60;
    static constexpr double TRANSITION_SLIDE_DISTANCE = 40.0;

    explicit Primitive(std::shared_ptr<const PrimitiveKind> kind);

    Primitive(const Primitive&)            = delete;
    Primitive& operator=(const Primitive&) = delete;

    const PrimitiveKind& kind() const { return *kind_; }

    // ─── Built-in properties ────────────────────────────────────────────
    double x() const { return number_or(props::x, 0.0); }
    double y() const { return number_or(props::y, 0.0); }
    double rotation() const { return number_or(props::rotation, 0.0); }
    double scale() const { return number_or(props::scale, 1.0); }
    double alpha() const { return number_or(props::alpha, 1.0); }
    // Truncated and clamped to the int range; non-finite values read as 0.
    int    index() const;
    bool   visible() const { return flag_or(props::visible, true); }
    bool   is_static() const { return flag_or(props::is_static, false); }
    bool   mouse_enabled() const { return flag_or(props::mouse_enabled, true); }

    void set_x(double v) { set_number(props::x, v); }
    void set_y(double v) { set_number(props::y, v); }
    void set_position(double px, double py);
    void set_rotation(double v) { set_number(props::rotation, v); }
    void set_scale(double v) { set_number(props::scale, v); }
    void set_alpha(double v) { set_number(props::alpha, v); }
    void set_index(int v) { set_number(props::index, static_cast<double>(v)); }
    void set_visible(bool v) { set(props::visible, v); }
    void set_static(bool v) { set(props::is_static, v); }
    void set_mouse_enabled(bool v) { set(props::mouse_enabled, v); }

    // ─── Property bag ───────────────────────────────────────────────────
    bool                  has(std::string_view name) const;
    const PropertyValue*  get(std::string_view name) const;
    std::optional<double> number(std::string_view name) const;
    double                number_or(std::string_view name, double fallback) const;
    bool                  flag_or(std::string_view name, bool fallback) const;
    Color                 color_or(std::string_view name, const Color& fallback) const;
    std::string           string_or(std::string_view name, std::string_view fallback) const;

    void set(std::string_view name, PropertyValue value);
    void set_number(std::string_view name, double value);

    // Copies every entry of `values` over the current properties.
    void assign(const PropertyMap& values);

    const PropertyMap& properties() const { return props_; }

    // ─── Animation ──────────────────────────────────────────────────────
    // Schedules one task per target. Targets that do not exist, are not
    // numeric or are not animatable for this kind are rejected individually
    // and logged; the rest are still scheduled. `on_complete` belongs to the
    // last scheduled task and therefore fires once per call. Unknown easing
    // names fall back to the default easing.
    AnimateResult animate(const AnimationTargets& targets,
                          int                     frames,
                          CompletionFn            on_complete = {},
                          std::string_view        easing      = {});

    // Named presets: fadeout, fadein, fadeinright, fadeinleft. Duration is
    // converted at 60 frames per second; non-positive durations mean 1 s.
    AnimateResult transition(std::string_view name,
                             double           duration_seconds = 1.0,
                             CompletionFn     on_complete      = {},
                             std::string_view easing           = {});

    // Advances the animation queue by one frame.
    void update();

    const AnimationQueue& animations() const { return animations_; }
    bool                  is_animating() const { return !animations_.empty(); }
    void                  clear_animations() { animations_.clear(); }

    // ─── Drawing ────────────────────────────────────────────────────────
    // Paints onto the bound surface; a primitive without one paints nothing.
    void render();
    void render(Surface& surface);

    // Debug outline of the bounding box. Throws PrimitiveDefinitionError if
    // the kind has no bounding-box capability.
    void draw_bounding_box(Surface& surface) const;

    const std::shared_ptr<Surface>& surface() const { return surface_; }
    void bind_surface(std::shared_ptr<Surface> surface) { surface_ = std::move(surface); }

    // ─── Hit testing & events ───────────────────────────────────────────
    // Coordinates are relative to (x, y).
    bool                       is_inside(double local_x, double local_y) const;
    std::optional<BoundingBox> bounding_box() const;

    bool handles(PointerEvent event) const;

    // Runs the handler for `event`, if any. Returns whether one ran.
    bool dispatch(PointerEvent event);

   private:
    std::shared_ptr<const PrimitiveKind> kind_;
    PropertyMap                          props_;
    AnimationQueue                       animations_;
    std::shared_ptr<Surface>             surface_;
};

}   // namespace vellum
