#include <algorithm>
#include <vellum/chart.hpp>
#include <vellum/error.hpp>
#include <vellum/logger.hpp>

namespace vellum
{

// ─── ChartTypeRegistry ──────────────────────────────────────────────────────

void ChartTypeRegistry::add(std::shared_ptr<ChartTypeHandler> handler)
{
    if (!handler)
        return;
    std::string name = handler->name();
    handlers_.insert_or_assign(std::move(name), std::move(handler));
}

std::shared_ptr<ChartTypeHandler> ChartTypeRegistry::find(std::string_view name) const
{
    auto it = handlers_.find(name);
    return it != handlers_.end() ? it->second : nullptr;
}

bool ChartTypeRegistry::contains(std::string_view name) const
{
    return handlers_.find(name) != handlers_.end();
}

std::vector<std::string> ChartTypeRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_)
        out.push_back(name);
    return out;
}

ChartTypeRegistry ChartTypeRegistry::with_builtins()
{
    ChartTypeRegistry registry;
    registry.add(make_line_chart_handler());
    return registry;
}

// ─── ChartContext ───────────────────────────────────────────────────────────

PrimitivePtr ChartContext::make(std::string_view kind, const PropertyMap& data, std::string_view item) const
{
    const KindTable& kinds = chart_.handler().kinds();
    auto             it    = kinds.find(kind);
    if (it == kinds.end())
    {
        throw ConfigurationError("chart type '" + chart_.handler().name()
                                 + "' has no primitive kind '" + std::string(kind) + "'");
    }

    PropertyMap merged = data;
    merged.insert_or_assign(std::string(props::is_static), is_static_);

    return it->second->create(merged, chart_.style().resolve(kind, item), chart_.surface_ptr());
}

Registry& ChartContext::registry() const
{
    return chart_.registry();
}

const ContentBox& ChartContext::box() const
{
    return chart_.box();
}

const SeriesData& ChartContext::data() const
{
    return chart_.data();
}

// ─── Chart ──────────────────────────────────────────────────────────────────

Chart::Chart(std::shared_ptr<Surface> surface,
             SeriesData               data,
             ChartConfig              config,
             const ChartTypeRegistry& handlers,
             const Theme&             theme,
             TickSource*              source)
    : surface_(std::move(surface)),
      data_(std::move(data)),
      config_(std::move(config)),
      theme_(theme),
      dispatcher_(registry_),
      engine_(registry_, dispatcher_, source)
{
    if (!surface_)
        throw ConfigurationError("please provide a container surface for the chart");
    if (data_.empty() && !data_.has_x())
        throw ConfigurationError("please provide some data to plot");
    if (config_.type.empty())
        throw ConfigurationError("please specify the type of chart to render");

    handler_ = handlers.find(config_.type);
    if (!handler_)
        throw ConfigurationError("chart type '" + config_.type + "' is not supported");

    refresh();

    engine_.on_before_render(
        [this]()
        {
            surface_->clear();
            surface_->background(background_);
        });

    VELLUM_LOG_INFO("chart",
                    "'{}' chart {}x{}, {} series",
                    config_.type,
                    config_.width,
                    config_.height,
                    data_.series_count());

    handler_->init(*this);

    if (!config_.is_static)
        engine_.start();
}

Chart::~Chart()
{
    engine_.stop();
}

void Chart::click(double x, double y)
{
    if (config_.is_static)
    {
        VELLUM_LOG_TRACE("chart", "click at ({}, {}) ignored by static chart", x, y);
        return;
    }
    dispatcher_.click(x, y);
}

void Chart::move(double x, double y)
{
    if (config_.is_static)
        return;
    dispatcher_.move(x, y);
}

void Chart::layer(const std::function<void(ChartContext&)>& init, bool is_static)
{
    ChartContext context(*this, is_static);
    init(context);
}

void Chart::refresh()
{
    if (!config_.padding.valid())
        throw ConfigurationError("padding must be finite and non-negative");
    if (!config_.margin.valid())
        throw ConfigurationError("margin must be finite and non-negative");
    if (config_.width <= 0 || config_.height <= 0)
        throw ConfigurationError("chart size must be positive");

    auto background = parse_color(config_.background);
    if (!background)
        throw ConfigurationError("background '" + config_.background + "' is not a color");

    auto box = compute_content_box(config_.width, config_.height, config_.padding, config_.margin);
    if (box.width() <= 0.0 || box.height() <= 0.0)
        throw ConfigurationError("padding and margin leave no room for the chart content");

    VELLUM_LOG_DEBUG("chart", "resolving '{}' style from theme '{}'", config_.type, theme_.name);
    StyleResolver style(config_.type, default_theme(), theme_, config_.style);

    data_.refresh();

    style_      = std::move(style);
    box_        = box;
    background_ = *background;

    surface_->set_width(config_.width);
    surface_->set_height(config_.height);
}

}   // namespace vellum
