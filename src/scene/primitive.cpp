#include <algorithm>
#include <cmath>
#include <limits>
#include <vellum/logger.hpp>
#include <vellum/primitive.hpp>
#include <vellum/surface.hpp>

namespace vellum
{

namespace
{

constexpr std::string_view BUILTIN_ANIMATABLE[] = {
    props::x, props::y, props::rotation, props::scale, props::alpha, props::index};

constexpr std::string_view BUILTIN_FLAGS[] = {
    props::visible, props::is_static, props::mouse_enabled};

bool contains(const std::vector<std::string>& names, std::string_view name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Unwinds everything pushed since construction, including saves the render
// callback left unbalanced.
class ScopedPaint
{
   public:
    explicit ScopedPaint(Surface& surface) : surface_(surface), depth_(surface.save_depth())
    {
        surface_.save();
    }

    ~ScopedPaint()
    {
        while (surface_.save_depth() > depth_)
            surface_.restore();
    }

    ScopedPaint(const ScopedPaint&)            = delete;
    ScopedPaint& operator=(const ScopedPaint&) = delete;

   private:
    Surface& surface_;
    size_t   depth_;
};

}   // anonymous namespace

const char* to_string(PointerEvent event)
{
    switch (event)
    {
        case PointerEvent::Click:
            return "click";
        case PointerEvent::Over:
            return "over";
        case PointerEvent::Move:
            return "move";
        case PointerEvent::Out:
            return "out";
    }
    return "unknown";
}

const EventHandler& PrimitiveEvents::handler(PointerEvent event) const
{
    switch (event)
    {
        case PointerEvent::Click:
            return click;
        case PointerEvent::Over:
            return over;
        case PointerEvent::Move:
            return move;
        case PointerEvent::Out:
            return out;
    }
    return click;
}

// ─── PrimitiveKind ──────────────────────────────────────────────────────────

PrimitiveKind::PrimitiveKind(RenderFn render, PrimitiveCapabilities caps)
    : render_(std::move(render)), caps_(std::move(caps))
{
    animatable_.assign(std::begin(BUILTIN_ANIMATABLE), std::end(BUILTIN_ANIMATABLE));
    for (const auto& name : caps_.animatable)
        animatable_.push_back(name);
}

std::shared_ptr<const PrimitiveKind> define_primitive(RenderFn render, PrimitiveCapabilities caps)
{
    if (!render)
    {
        throw PrimitiveDefinitionError("kind '" + caps.name + "' has no render function");
    }
    if (!caps.events.empty() && !caps.is_inside)
    {
        throw PrimitiveDefinitionError("kind '" + caps.name
                                       + "' has event handlers but no is_inside predicate");
    }

    std::vector<std::string> seen;
    for (const auto& name : caps.animatable)
    {
        if (name.empty())
        {
            throw PrimitiveDefinitionError("kind '" + caps.name
                                           + "' declares an unnamed animatable property");
        }
        if (contains(seen, name))
        {
            throw PrimitiveDefinitionError("kind '" + caps.name + "' declares animatable property '"
                                           + name + "' twice");
        }
        if (std::find(std::begin(BUILTIN_ANIMATABLE), std::end(BUILTIN_ANIMATABLE), name)
            != std::end(BUILTIN_ANIMATABLE))
        {
            throw PrimitiveDefinitionError("kind '" + caps.name + "': '" + name
                                           + "' is built in and already animatable");
        }
        if (std::find(std::begin(BUILTIN_FLAGS), std::end(BUILTIN_FLAGS), name)
            != std::end(BUILTIN_FLAGS))
        {
            throw PrimitiveDefinitionError("kind '" + caps.name + "': '" + name
                                           + "' is a flag and cannot be animated");
        }
        seen.push_back(name);
    }

    VELLUM_LOG_DEBUG("primitive",
                     "defined kind '{}' (hit-test: {}, events: {}, animatable: {})",
                     caps.name,
                     static_cast<bool>(caps.is_inside),
                     !caps.events.empty(),
                     caps.animatable.size());

    return std::shared_ptr<const PrimitiveKind>(
        new PrimitiveKind(std::move(render), std::move(caps)));
}

bool PrimitiveKind::is_animatable(std::string_view property) const
{
    return contains(animatable_, property);
}

std::shared_ptr<Primitive> PrimitiveKind::create(const PropertyMap&       data,
                                                 const PropertyMap&       style,
                                                 std::shared_ptr<Surface> surface) const
{
    auto primitive = std::make_shared<Primitive>(shared_from_this());

    // Without handlers there is nothing to dispatch, so skip hit-testing
    if (!has_events())
        primitive->set_mouse_enabled(false);

    primitive->assign(data);

    if (caps_.init)
        caps_.init(*primitive);

    primitive->assign(style);
    primitive->bind_surface(std::move(surface));
    return primitive;
}

// ─── Primitive ──────────────────────────────────────────────────────────────

Primitive::Primitive(std::shared_ptr<const PrimitiveKind> kind) : kind_(std::move(kind))
{
    props_.insert_or_assign(std::string(props::index), 0.0);
    props_.insert_or_assign(std::string(props::visible), true);
    props_.insert_or_assign(std::string(props::is_static), false);
    props_.insert_or_assign(std::string(props::mouse_enabled), true);
    props_.insert_or_assign(std::string(props::alpha), 1.0);
    props_.insert_or_assign(std::string(props::rotation), 0.0);
    props_.insert_or_assign(std::string(props::scale), 1.0);
    props_.insert_or_assign(std::string(props::x), 0.0);
    props_.insert_or_assign(std::string(props::y), 0.0);
}

int Primitive::index() const
{
    double v = number_or(props::index, 0.0);
    if (!std::isfinite(v))
        return 0;
    v = std::clamp(v,
                   static_cast<double>(std::numeric_limits<int>::min()),
                   static_cast<double>(std::numeric_limits<int>::max()));
    return static_cast<int>(v);
}

void Primitive::set_position(double px, double py)
{
    set_x(px);
    set_y(py);
}

bool Primitive::has(std::string_view name) const
{
    return props_.find(name) != props_.end();
}

const PropertyValue* Primitive::get(std::string_view name) const
{
    auto it = props_.find(name);
    return it != props_.end() ? &it->second : nullptr;
}

std::optional<double> Primitive::number(std::string_view name) const
{
    const PropertyValue* v = get(name);
    return v ? as_number(*v) : std::nullopt;
}

double Primitive::number_or(std::string_view name, double fallback) const
{
    return number(name).value_or(fallback);
}

bool Primitive::flag_or(std::string_view name, bool fallback) const
{
    const PropertyValue* v = get(name);
    if (!v)
        return fallback;
    return as_flag(*v).value_or(fallback);
}

Color Primitive::color_or(std::string_view name, const Color& fallback) const
{
    const PropertyValue* v = get(name);
    if (!v)
        return fallback;
    return as_color(*v).value_or(fallback);
}

std::string Primitive::string_or(std::string_view name, std::string_view fallback) const
{
    const PropertyValue* v = get(name);
    if (const auto* s = v ? std::get_if<std::string>(v) : nullptr)
        return *s;
    return std::string(fallback);
}

void Primitive::set(std::string_view name, PropertyValue value)
{
    auto it = props_.find(name);
    if (it != props_.end())
        it->second = std::move(value);
    else
        props_.emplace(std::string(name), std::move(value));
}

void Primitive::set_number(std::string_view name, double value)
{
    set(name, PropertyValue{value});
}

void Primitive::assign(const PropertyMap& values)
{
    merge_into(props_, values);
}

// ─── Animation ──────────────────────────────────────────────────────────────

AnimateResult Primitive::animate(const AnimationTargets& targets,
                                 int                     frames,
                                 CompletionFn            on_complete,
                                 std::string_view        easing)
{
    AnimateResult result;
    EasingFn      easing_fn = resolve_easing(easing);

    std::vector<AnimationTask> accepted;
    accepted.reserve(targets.size());

    for (const auto& [property, target] : targets)
    {
        const PropertyValue* current = get(property);
        if (!current)
        {
            result.rejected.emplace_back(property, "does not exist");
            continue;
        }

        auto value = as_number(*current);
        if (!value)
        {
            result.rejected.emplace_back(property,
                                         std::string("is a ") + type_name(*current)
                                             + ", not a number, and cannot be animated");
            continue;
        }

        if (!kind_->is_animatable(property))
        {
            result.rejected.emplace_back(property,
                                         "is not declared animatable for kind '" + kind_->name()
                                             + "'");
            continue;
        }

        AnimationTask task;
        task.property      = property;
        task.initial_value = *value;
        task.range         = target - *value;
        task.total_frames  = std::max(frames, 0);
        task.easing        = easing_fn;
        accepted.push_back(std::move(task));
    }

    for (const auto& error : result.rejected)
    {
        VELLUM_LOG_WARN("animation", "{} (kind '{}')", error.what(), kind_->name());
    }

    if (accepted.empty())
    {
        if (on_complete)
            VELLUM_LOG_WARN("animation", "nothing scheduled; completion callback dropped");
        return result;
    }

    accepted.back().on_complete = std::move(on_complete);
    result.accepted             = accepted.size();
    for (auto& task : accepted)
        animations_.push(std::move(task));

    return result;
}

AnimateResult Primitive::transition(std::string_view name,
                                    double           duration_seconds,
                                    CompletionFn     on_complete,
                                    std::string_view easing)
{
    double seconds = duration_seconds > 0.0 ? duration_seconds : 1.0;
    int    frames  = static_cast<int>(std::lround(seconds * TRANSITION_FPS));

    AnimationTargets targets;
    if (name == "fadeout")
    {
        targets = {{std::string(props::alpha), 0.0}};
    }
    else if (name == "fadein")
    {
        targets = {{std::string(props::alpha), 1.0}};
    }
    else if (name == "fadeinright" || name == "fadeinleft")
    {
        double home = x();
        set_x(name == "fadeinright" ? home - TRANSITION_SLIDE_DISTANCE
                                    : home + TRANSITION_SLIDE_DISTANCE);
        targets = {{std::string(props::alpha), 1.0}, {std::string(props::x), home}};
    }
    else
    {
        AnimateResult result;
        result.rejected.emplace_back(std::string(name), "is not a known transition");
        VELLUM_LOG_WARN("animation", "{}", result.rejected.back().what());
        return result;
    }

    return animate(targets, frames, std::move(on_complete), easing);
}

void Primitive::update()
{
    animations_.advance(*this);
}

// ─── Drawing ────────────────────────────────────────────────────────────────

void Primitive::render()
{
    if (!surface_)
    {
        VELLUM_LOG_TRACE("primitive", "'{}' has no surface bound; skipped", kind_->name());
        return;
    }
    render(*surface_);
}

void Primitive::render(Surface& surface)
{
    ScopedPaint paint(surface);
    surface.translate(x(), y());
    surface.rotate(rotation());
    surface.scale(scale(), scale());
    surface.set_global_alpha(alpha());
    kind_->render_(*this, surface);
}

void Primitive::draw_bounding_box(Surface& surface) const
{
    auto box = bounding_box();
    if (!box)
    {
        throw PrimitiveDefinitionError("kind '" + kind_->name()
                                       + "' has no bounding box; cannot draw it");
    }

    ScopedPaint paint(surface);
    surface.translate(x(), y());
    surface.rotate(rotation());
    surface.scale(scale(), scale());
    surface.begin_path();
    surface.set_stroke_color(colors::red);
    surface.set_line_width(3.0);
    surface.move_to(box->x, box->y);
    surface.line_to(box->x1, box->y);
    surface.line_to(box->x1, box->y1);
    surface.line_to(box->x, box->y1);
    surface.close_path();
    surface.stroke();
}

// ─── Hit testing & events ───────────────────────────────────────────────────

bool Primitive::is_inside(double local_x, double local_y) const
{
    return kind_->caps_.is_inside && kind_->caps_.is_inside(*this, local_x, local_y);
}

std::optional<BoundingBox> Primitive::bounding_box() const
{
    if (!kind_->caps_.bounding_box)
        return std::nullopt;
    return kind_->caps_.bounding_box(*this);
}

bool Primitive::handles(PointerEvent event) const
{
    return static_cast<bool>(kind_->caps_.events.handler(event));
}

bool Primitive::dispatch(PointerEvent event)
{
    const EventHandler& handler = kind_->caps_.events.handler(event);
    if (!handler)
        return false;
    handler(*this);
    return true;
}

}   // namespace vellum
