#include <cmath>
#include <set>
#include <vellum/config.hpp>

namespace vellum
{

bool Insets::valid() const
{
    for (double side : {top, right, bottom, left})
    {
        if (!std::isfinite(side) || side < 0.0)
            return false;
    }
    return true;
}

ContentBox compute_content_box(int width, int height, const Insets& padding, const Insets& margin)
{
    ContentBox box;
    box.x  = padding.left + margin.left;
    box.x1 = static_cast<double>(width) - (padding.right + margin.right);
    box.y  = padding.top + margin.top;
    box.y1 = static_cast<double>(height) - (padding.bottom + margin.bottom);
    return box;
}

const ChartStyle* Theme::find(std::string_view chart_type) const
{
    auto it = styles.find(chart_type);
    return it != styles.end() ? &it->second : nullptr;
}

const Theme& default_theme()
{
    static const Theme theme = []
    {
        Theme t;
        t.name = "default";

        ChartStyle line;

        KindStyle point;
        point.properties = {
            {"side", 10.0},
            {"stroke", std::string("#ff0")},
            {"stroke_width", 4.0},
            {"fill", std::string("#000")},
        };
        line["point"] = point;

        KindStyle axis;
        axis.properties = {
            {"stroke", std::string("#000")},
            {"stroke_width", 1.0},
        };
        line["axis"] = axis;

        // Per-series styling
        KindStyle segment;
        segment.item_default = {
            {"visible", true},
            {"stroke", std::string("#f00")},
            {"stroke_width", 2.0},
        };
        line["line"] = segment;

        t.styles["line"] = line;
        return t;
    }();
    return theme;
}

// ─── StyleResolver ──────────────────────────────────────────────────────────

StyleResolver::StyleResolver(std::string  chart_type,
                             const Theme& defaults,
                             const Theme& theme,
                             ChartStyle   user)
    : chart_type_(std::move(chart_type))
{
    for (const Theme* layer : {&defaults, &theme})
    {
        if (const ChartStyle* style = layer->find(chart_type_))
            layers_.push_back(*style);
        else
            layers_.emplace_back();
    }
    layers_.push_back(std::move(user));
}

StyleSheet StyleResolver::resolve(std::string_view kind, std::string_view item) const
{
    StyleSheet sheet;

    for (const auto& layer : layers_)
    {
        auto it = layer.find(kind);
        if (it == layer.end())
            continue;
        merge_into(sheet, it->second.properties);
        if (!item.empty())
            merge_into(sheet, it->second.item_default);
    }

    if (item.empty())
        return sheet;

    for (const auto& layer : layers_)
    {
        auto it = layer.find(kind);
        if (it == layer.end())
            continue;
        auto entry = it->second.items.find(std::string(item));
        if (entry != it->second.items.end())
            merge_into(sheet, entry->second);
    }
    return sheet;
}

std::vector<std::string> StyleResolver::kinds() const
{
    std::set<std::string> names;
    for (const auto& layer : layers_)
    {
        for (const auto& [name, style] : layer)
            names.insert(name);
    }
    return {names.begin(), names.end()};
}

}   // namespace vellum
