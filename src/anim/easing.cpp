#include <array>
#include <cmath>
#include <utility>
#include <vellum/easing.hpp>
#include <vellum/error.hpp>
#include <vellum/logger.hpp>

namespace vellum
{

namespace ease
{

namespace
{
constexpr double PI         = 3.14159265358979323846;
constexpr double BACK_S     = 1.70158;
constexpr double ELASTIC_P  = 0.3;
constexpr double ELASTIC_IO = 0.3 * 1.5;

double elastic_wave(double t, double period)
{
    double shift = period / 4.0;
    return std::sin((t - shift) * (2.0 * PI) / period);
}
}   // anonymous namespace

double linear(double t)
{
    return t;
}

double in_quad(double t)
{
    return t * t;
}

double out_quad(double t)
{
    return -t * (t - 2.0);
}

double in_out_quad(double t)
{
    t *= 2.0;
    if (t < 1.0)
        return 0.5 * t * t;
    t -= 1.0;
    return -0.5 * (t * (t - 2.0) - 1.0);
}

double in_cubic(double t)
{
    return t * t * t;
}

double out_cubic(double t)
{
    t -= 1.0;
    return t * t * t + 1.0;
}

double in_out_cubic(double t)
{
    t *= 2.0;
    if (t < 1.0)
        return 0.5 * t * t * t;
    t -= 2.0;
    return 0.5 * (t * t * t + 2.0);
}

double in_quart(double t)
{
    return t * t * t * t;
}

double out_quart(double t)
{
    t -= 1.0;
    return -(t * t * t * t - 1.0);
}

double in_out_quart(double t)
{
    t *= 2.0;
    if (t < 1.0)
        return 0.5 * t * t * t * t;
    t -= 2.0;
    return -0.5 * (t * t * t * t - 2.0);
}

double in_quint(double t)
{
    return t * t * t * t * t;
}

double out_quint(double t)
{
    t -= 1.0;
    return t * t * t * t * t + 1.0;
}

double in_out_quint(double t)
{
    t *= 2.0;
    if (t < 1.0)
        return 0.5 * t * t * t * t * t;
    t -= 2.0;
    return 0.5 * (t * t * t * t * t + 2.0);
}

double in_sine(double t)
{
    return 1.0 - std::cos(t * (PI / 2.0));
}

double out_sine(double t)
{
    return std::sin(t * (PI / 2.0));
}

double in_out_sine(double t)
{
    return -0.5 * (std::cos(PI * t) - 1.0);
}

double in_expo(double t)
{
    return (t == 0.0) ? 0.0 : std::pow(2.0, 10.0 * (t - 1.0));
}

double out_expo(double t)
{
    return (t == 1.0) ? 1.0 : 1.0 - std::pow(2.0, -10.0 * t);
}

double in_out_expo(double t)
{
    if (t == 0.0)
        return 0.0;
    if (t == 1.0)
        return 1.0;
    t *= 2.0;
    if (t < 1.0)
        return 0.5 * std::pow(2.0, 10.0 * (t - 1.0));
    t -= 1.0;
    return 0.5 * (2.0 - std::pow(2.0, -10.0 * t));
}

double in_circ(double t)
{
    return 1.0 - std::sqrt(1.0 - t * t);
}

double out_circ(double t)
{
    t -= 1.0;
    return std::sqrt(1.0 - t * t);
}

double in_out_circ(double t)
{
    t *= 2.0;
    if (t < 1.0)
        return -0.5 * (std::sqrt(1.0 - t * t) - 1.0);
    t -= 2.0;
    return 0.5 * (std::sqrt(1.0 - t * t) + 1.0);
}

double in_elastic(double t)
{
    if (t <= 0.0)
        return 0.0;
    if (t >= 1.0)
        return 1.0;
    t -= 1.0;
    return -(std::pow(2.0, 10.0 * t) * elastic_wave(t, ELASTIC_P));
}

double out_elastic(double t)
{
    if (t <= 0.0)
        return 0.0;
    if (t >= 1.0)
        return 1.0;
    return std::pow(2.0, -10.0 * t) * elastic_wave(t, ELASTIC_P) + 1.0;
}

double in_out_elastic(double t)
{
    if (t <= 0.0)
        return 0.0;
    if (t >= 1.0)
        return 1.0;
    t = t * 2.0 - 1.0;
    if (t < 0.0)
        return -0.5 * (std::pow(2.0, 10.0 * t) * elastic_wave(t, ELASTIC_IO));
    return std::pow(2.0, -10.0 * t) * elastic_wave(t, ELASTIC_IO) * 0.5 + 1.0;
}

double in_back(double t)
{
    return t * t * ((BACK_S + 1.0) * t - BACK_S);
}

double out_back(double t)
{
    t -= 1.0;
    return t * t * ((BACK_S + 1.0) * t + BACK_S) + 1.0;
}

double in_out_back(double t)
{
    constexpr double s = BACK_S * 1.525;
    t *= 2.0;
    if (t < 1.0)
        return 0.5 * (t * t * ((s + 1.0) * t - s));
    t -= 2.0;
    return 0.5 * (t * t * ((s + 1.0) * t + s) + 2.0);
}

double out_bounce(double t)
{
    constexpr double n1 = 7.5625;
    constexpr double d1 = 2.75;

    if (t < 1.0 / d1)
    {
        return n1 * t * t;
    }
    else if (t < 2.0 / d1)
    {
        t -= 1.5 / d1;
        return n1 * t * t + 0.75;
    }
    else if (t < 2.5 / d1)
    {
        t -= 2.25 / d1;
        return n1 * t * t + 0.9375;
    }
    else
    {
        t -= 2.625 / d1;
        return n1 * t * t + 0.984375;
    }
}

double in_bounce(double t)
{
    return 1.0 - out_bounce(1.0 - t);
}

double in_out_bounce(double t)
{
    if (t < 0.5)
        return in_bounce(t * 2.0) * 0.5;
    return out_bounce(t * 2.0 - 1.0) * 0.5 + 0.5;
}

}   // namespace ease

namespace
{

using NamedEasing = std::pair<std::string_view, EasingFn>;

constexpr std::array<NamedEasing, 31> EASINGS = {{
    {"linear", ease::linear},
    {"easeInQuad", ease::in_quad},
    {"easeOutQuad", ease::out_quad},
    {"easeInOutQuad", ease::in_out_quad},
    {"easeInCubic", ease::in_cubic},
    {"easeOutCubic", ease::out_cubic},
    {"easeInOutCubic", ease::in_out_cubic},
    {"easeInQuart", ease::in_quart},
    {"easeOutQuart", ease::out_quart},
    {"easeInOutQuart", ease::in_out_quart},
    {"easeInQuint", ease::in_quint},
    {"easeOutQuint", ease::out_quint},
    {"easeInOutQuint", ease::in_out_quint},
    {"easeInSine", ease::in_sine},
    {"easeOutSine", ease::out_sine},
    {"easeInOutSine", ease::in_out_sine},
    {"easeInExpo", ease::in_expo},
    {"easeOutExpo", ease::out_expo},
    {"easeInOutExpo", ease::in_out_expo},
    {"easeInCirc", ease::in_circ},
    {"easeOutCirc", ease::out_circ},
    {"easeInOutCirc", ease::in_out_circ},
    {"easeInElastic", ease::in_elastic},
    {"easeOutElastic", ease::out_elastic},
    {"easeInOutElastic", ease::in_out_elastic},
    {"easeInBack", ease::in_back},
    {"easeOutBack", ease::out_back},
    {"easeInOutBack", ease::in_out_back},
    {"easeInBounce", ease::in_bounce},
    {"easeOutBounce", ease::out_bounce},
    {"easeInOutBounce", ease::in_out_bounce},
}};

}   // anonymous namespace

EasingFn find_easing(std::string_view name)
{
    for (const auto& [easing_name, fn] : EASINGS)
    {
        if (easing_name == name)
            return fn;
    }
    return nullptr;
}

EasingFn resolve_easing(std::string_view name)
{
    if (name.empty())
        return default_easing();

    if (EasingFn fn = find_easing(name))
        return fn;

    VELLUM_LOG_DEBUG("easing",
                     "{}; using {}",
                     EasingNotFoundError(std::string(name)).what(),
                     DEFAULT_EASING_NAME);
    return default_easing();
}

EasingFn default_easing()
{
    return ease::in_quad;
}

std::vector<std::string_view> easing_names()
{
    std::vector<std::string_view> names;
    names.reserve(EASINGS.size());
    for (const auto& entry : EASINGS)
        names.push_back(entry.first);
    return names;
}

}   // namespace vellum
