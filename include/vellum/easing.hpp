#pragma once

#include <string_view>
#include <vector>

namespace vellum
{

// Easing functions map the elapsed ratio t in [0, 1] to the interpolation
// curve value. All of them satisfy f(0) == 0 and f(1) == 1; some overshoot
// in between (back, elastic).
namespace ease
{
double linear(double t);

double in_quad(double t);
double out_quad(double t);
double in_out_quad(double t);

double in_cubic(double t);
double out_cubic(double t);
double in_out_cubic(double t);

double in_quart(double t);
double out_quart(double t);
double in_out_quart(double t);

double in_quint(double t);
double out_quint(double t);
double in_out_quint(double t);

double in_sine(double t);
double out_sine(double t);
double in_out_sine(double t);

double in_expo(double t);
double out_expo(double t);
double in_out_expo(double t);

double in_circ(double t);
double out_circ(double t);
double in_out_circ(double t);

double in_elastic(double t);
double out_elastic(double t);
double in_out_elastic(double t);

double in_back(double t);
double out_back(double t);
double in_out_back(double t);

double in_bounce(double t);
double out_bounce(double t);
double in_out_bounce(double t);
}   // namespace ease

using EasingFn = double (*)(double);

inline constexpr std::string_view DEFAULT_EASING_NAME = "easeInQuad";

// Looks an easing up by its conventional name ("easeInQuad", "easeOutBounce",
// "linear", ...). Returns nullptr for unknown names.
EasingFn find_easing(std::string_view name);

// Like find_easing(), but an empty or unknown name yields the default easing
// (ease::in_quad). Unknown names are logged at debug level.
EasingFn resolve_easing(std::string_view name);

EasingFn default_easing();

std::vector<std::string_view> easing_names();

}   // namespace vellum
