#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vellum
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    constexpr Color with_alpha(float alpha) const { return Color(r, g, b, alpha); }

    constexpr bool operator==(const Color&) const = default;
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color yellow{1.0f, 1.0f, 0.0f};
inline constexpr Color transparent{0.0f, 0.0f, 0.0f, 0.0f};
}   // namespace colors

// Parses CSS-style hex colors: "#rgb", "#rrggbb" and "#rrggbbaa".
std::optional<Color> parse_color(std::string_view text);

// "#rrggbb" (or "#rrggbbaa" when alpha is not 1).
std::string to_hex(const Color& c);

}   // namespace vellum
