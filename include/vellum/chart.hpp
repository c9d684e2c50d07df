#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <vellum/config.hpp>
#include <vellum/frame_engine.hpp>
#include <vellum/pointer.hpp>
#include <vellum/primitive.hpp>
#include <vellum/registry.hpp>
#include <vellum/series_data.hpp>
#include <vellum/surface.hpp>

namespace vellum
{

class Chart;

// Primitive kinds of one chart type, keyed by kind name.
using KindTable = std::map<std::string, std::shared_ptr<const PrimitiveKind>, std::less<>>;

// Chart-type specific setup: the primitive kinds the type draws with and the
// init step that lays them out.
class ChartTypeHandler
{
   public:
    virtual ~ChartTypeHandler() = default;

    virtual const std::string& name() const  = 0;
    virtual const KindTable&   kinds() const = 0;

    // Creates the chart's primitives, normally through Chart::layer().
    virtual void init(Chart& chart) = 0;
};

// Chart types available to Chart construction. Owned by the caller.
class ChartTypeRegistry
{
   public:
    // Replaces any handler registered under the same name.
    void add(std::shared_ptr<ChartTypeHandler> handler);

    std::shared_ptr<ChartTypeHandler> find(std::string_view name) const;
    bool                              contains(std::string_view name) const;
    std::vector<std::string>          names() const;

    // A registry holding the built-in "line" handler.
    static ChartTypeRegistry with_builtins();

   private:
    std::map<std::string, std::shared_ptr<ChartTypeHandler>, std::less<>> handlers_;
};

std::shared_ptr<ChartTypeHandler> make_line_chart_handler();

// Handed to a layer's init callback. make() builds a primitive of one of the
// chart type's kinds, bound to the chart surface and styled by the resolver.
class ChartContext
{
   public:
    ChartContext(Chart& chart, bool is_static) : chart_(chart), is_static_(is_static) {}

    // Throws ConfigurationError if the chart type has no kind `kind`.
    // `item` selects per-item style entries (e.g. a series name).
    PrimitivePtr make(std::string_view   kind,
                      const PropertyMap& data = {},
                      std::string_view   item = {}) const;

    Registry&         registry() const;
    const ContentBox& box() const;
    const SeriesData& data() const;
    bool              is_static() const { return is_static_; }

   private:
    Chart& chart_;
    bool   is_static_;
};

// Ties a surface, data, configuration and a chart-type handler to the
// runtime engine. Construction validates everything before any primitive
// exists and starts the frame engine unless the chart is static.
class Chart
{
   public:
    // Throws ConfigurationError for a missing surface, missing data, missing
    // or unsupported chart type, invalid insets or background; throws
    // ValidationError for malformed data.
    Chart(std::shared_ptr<Surface>  surface,
          SeriesData                data,
          ChartConfig               config,
          const ChartTypeRegistry&  handlers,
          const Theme&              theme  = default_theme(),
          TickSource*               source = nullptr);
    ~Chart();

    Chart(const Chart&)            = delete;
    Chart& operator=(const Chart&) = delete;

    // Runs `init` with a fresh context. Primitives made through a static
    // layer carry static = true.
    void layer(const std::function<void(ChartContext&)>& init, bool is_static = false);

    // Re-resolves style, revalidates data, recomputes the content box and
    // resizes the surface. Call after changing data() or config().
    void refresh();

    // Pointer boundary, surface-local pixels. Static charts ignore pointer
    // input.
    void click(double x, double y);
    void move(double x, double y);

    void start() { engine_.start(); }
    void stop() { engine_.stop(); }
    void tick() { engine_.tick(); }
    bool is_running() const { return engine_.is_running(); }

    void set_fault_handler(FaultHandler handler) { registry_.set_fault_handler(std::move(handler)); }

    Registry&          registry() { return registry_; }
    PointerDispatcher& dispatcher() { return dispatcher_; }
    FrameEngine&       engine() { return engine_; }
    Surface&           surface() { return *surface_; }

    const std::shared_ptr<Surface>& surface_ptr() const { return surface_; }

    SeriesData&          data() { return data_; }
    const SeriesData&    data() const { return data_; }
    ChartConfig&         config() { return config_; }
    const ChartConfig&   config() const { return config_; }
    const ContentBox&    box() const { return box_; }
    const StyleResolver& style() const { return style_; }
    const Color&         background() const { return background_; }
    ChartTypeHandler&    handler() { return *handler_; }

   private:
    std::shared_ptr<Surface>          surface_;
    SeriesData                        data_;
    ChartConfig                       config_;
    Theme                             theme_;
    std::shared_ptr<ChartTypeHandler> handler_;

    StyleResolver style_;
    ContentBox    box_;
    Color         background_;

    Registry          registry_;
    PointerDispatcher dispatcher_;
    FrameEngine       engine_;
};

}   // namespace vellum
