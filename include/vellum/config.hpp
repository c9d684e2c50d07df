#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <vellum/property.hpp>

namespace vellum
{

// Flattened style dictionary handed to PrimitiveKind::create().
using StyleSheet = PropertyMap;

// Pixel insets around the chart content. A single number applies to all
// four sides.
struct Insets
{
    double top    = 0.0;
    double right  = 0.0;
    double bottom = 0.0;
    double left   = 0.0;

    Insets() = default;
    Insets(double all) : top(all), right(all), bottom(all), left(all) {}
    Insets(double t, double r, double b, double l) : top(t), right(r), bottom(b), left(l) {}

    // Every side finite and non-negative.
    bool valid() const;

    bool operator==(const Insets&) const = default;
};

// Area left for plotting once padding and margin are taken away.
struct ContentBox
{
    double x  = 0.0;
    double y  = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    double width() const { return x1 - x; }
    double height() const { return y1 - y; }
};

ContentBox compute_content_box(int width, int height, const Insets& padding, const Insets& margin);

// Style of one primitive kind.
//   properties    apply to every instance of the kind
//   item_default  template applied to every named item (e.g. each series)
//   items         per-item entries, override the template
struct KindStyle
{
    PropertyMap                        properties;
    PropertyMap                        item_default;
    std::map<std::string, PropertyMap> items;
};

// Kind name -> style, for one chart type.
using ChartStyle = std::map<std::string, KindStyle, std::less<>>;

struct Theme
{
    std::string name = "default";

    // Chart type -> kind styles.
    std::map<std::string, ChartStyle, std::less<>> styles;

    const ChartStyle* find(std::string_view chart_type) const;
};

// Built-in defaults every chart starts from.
const Theme& default_theme();

struct ChartConfig
{
    std::string type;
    int         width      = 400;
    int         height     = 230;
    Insets      padding    = 10.0;
    Insets      margin     = 10.0;
    std::string background = "#eee";
    bool        is_static  = false;

    // User overrides, kind name -> style, for `type`.
    ChartStyle style;
};

// Resolves per-kind style sheets for one chart type from three layers,
// lowest precedence first: built-in defaults, theme, user options.
//
// For a named item, the templates of all layers (properties, then
// item_default) are merged first and the item entries of all layers are
// merged on top, so a default-layer item entry beats a user-layer template.
class StyleResolver
{
   public:
    StyleResolver() = default;
    StyleResolver(std::string chart_type, const Theme& defaults, const Theme& theme, ChartStyle user);

    StyleSheet resolve(std::string_view kind, std::string_view item = {}) const;

    // Kinds mentioned by any layer.
    std::vector<std::string> kinds() const;

    const std::string& chart_type() const { return chart_type_; }

   private:
    std::string             chart_type_;
    std::vector<ChartStyle> layers_;
};

}   // namespace vellum
