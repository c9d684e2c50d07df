#include <cmath>
#include <cstdio>
#include <vellum/color.hpp>

namespace vellum
{

namespace
{

int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

int to_byte(float channel)
{
    float clamped = channel < 0.0f ? 0.0f : (channel > 1.0f ? 1.0f : channel);
    return static_cast<int>(std::lround(clamped * 255.0f));
}

}   // anonymous namespace

std::optional<Color> parse_color(std::string_view text)
{
    if (text.empty() || text.front() != '#')
        return std::nullopt;
    text.remove_prefix(1);

    int digits[8] = {};
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (i >= 8)
            return std::nullopt;
        digits[i] = hex_digit(text[i]);
        if (digits[i] < 0)
            return std::nullopt;
    }

    switch (text.size())
    {
        case 3:
            return Color{(digits[0] * 17) / 255.0f,
                         (digits[1] * 17) / 255.0f,
                         (digits[2] * 17) / 255.0f};
        case 6:
            return Color{(digits[0] * 16 + digits[1]) / 255.0f,
                         (digits[2] * 16 + digits[3]) / 255.0f,
                         (digits[4] * 16 + digits[5]) / 255.0f};
        case 8:
            return Color{(digits[0] * 16 + digits[1]) / 255.0f,
                         (digits[2] * 16 + digits[3]) / 255.0f,
                         (digits[4] * 16 + digits[5]) / 255.0f,
                         (digits[6] * 16 + digits[7]) / 255.0f};
        default:
            return std::nullopt;
    }
}

std::string to_hex(const Color& c)
{
    char buf[16];
    if (to_byte(c.a) == 255)
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", to_byte(c.r), to_byte(c.g), to_byte(c.b));
    else
        std::snprintf(buf,
                      sizeof(buf),
                      "#%02x%02x%02x%02x",
                      to_byte(c.r),
                      to_byte(c.g),
                      to_byte(c.b),
                      to_byte(c.a));
    return buf;
}

}   // namespace vellum
