#include <cstdio>
#include <vellum/property.hpp>

namespace vellum
{

void merge_into(PropertyMap& target, const PropertyMap& source)
{
    for (const auto& [name, value] : source)
    {
        target.insert_or_assign(name, value);
    }
}

std::optional<double> as_number(const PropertyValue& v)
{
    if (const auto* d = std::get_if<double>(&v))
        return *d;
    return std::nullopt;
}

std::optional<bool> as_flag(const PropertyValue& v)
{
    if (const auto* b = std::get_if<bool>(&v))
        return *b;
    return std::nullopt;
}

std::optional<Color> as_color(const PropertyValue& v)
{
    if (const auto* c = std::get_if<Color>(&v))
        return *c;
    if (const auto* s = std::get_if<std::string>(&v))
        return parse_color(*s);
    return std::nullopt;
}

const char* type_name(const PropertyValue& v)
{
    switch (v.index())
    {
        case 0:
            return "number";
        case 1:
            return "boolean";
        case 2:
            return "color";
        case 3:
            return "string";
        default:
            return "unknown";
    }
}

std::string to_string(const PropertyValue& v)
{
    if (const auto* d = std::get_if<double>(&v))
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", *d);
        return buf;
    }
    if (const auto* b = std::get_if<bool>(&v))
        return *b ? "true" : "false";
    if (const auto* c = std::get_if<Color>(&v))
        return to_hex(*c);
    return std::get<std::string>(v);
}

}   // namespace vellum
