#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vellum/color.hpp>

namespace vellum
{

// A primitive property or style entry. Only numbers are animatable.
using PropertyValue = std::variant<double, bool, Color, std::string>;

// Ordered by name so that merges and dumps are deterministic.
using PropertyMap = std::map<std::string, PropertyValue, std::less<>>;

// Names of the properties every primitive carries.
namespace props
{
inline constexpr std::string_view x             = "x";
inline constexpr std::string_view y             = "y";
inline constexpr std::string_view rotation      = "rotation";
inline constexpr std::string_view scale         = "scale";
inline constexpr std::string_view alpha         = "alpha";
inline constexpr std::string_view index         = "index";
inline constexpr std::string_view visible       = "visible";
inline constexpr std::string_view is_static     = "static";
inline constexpr std::string_view mouse_enabled = "mouse_enabled";
}   // namespace props

// Copies every entry of `source` into `target`, overwriting entries with the
// same name (source wins).
void merge_into(PropertyMap& target, const PropertyMap& source);

std::optional<double> as_number(const PropertyValue& v);
std::optional<bool>   as_flag(const PropertyValue& v);

// Strings of the form "#rrggbb" are accepted as colors.
std::optional<Color> as_color(const PropertyValue& v);

const char* type_name(const PropertyValue& v);

std::string to_string(const PropertyValue& v);

}   // namespace vellum
