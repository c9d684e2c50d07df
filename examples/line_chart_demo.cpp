#include <cmath>
#include <memory>
#include <vellum/vellum.hpp>

using namespace vellum;

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    SeriesData data;
    data.set_x(24.0);

    std::vector<double> sales, costs;
    for (int i = 0; i < 13; ++i)
    {
        sales.push_back(50.0 + 30.0 * std::sin(i * 0.5));
        costs.push_back(40.0 + 2.0 * i);
    }
    data.add_series("sales", sales);
    data.add_series("costs", costs);

    ChartConfig config;
    config.type                         = "line";
    config.width                        = 640;
    config.height                       = 360;
    config.style["line"].items["costs"] = {{"stroke", std::string("#36c")}};

    auto svg = std::make_shared<SvgSurface>(config.width, config.height);

    // No host refresh signal: the engine falls back to its own timer
    Chart chart(svg, std::move(data), config, ChartTypeRegistry::with_builtins());

    chart.set_fault_handler(
        [](const Fault& f) { VELLUM_LOG_WARN("demo", "{} fault: {}", f.stage, f.message); });

    // Grow every point in, then fade the first one out
    bool first = true;
    for (const auto& p : chart.registry().primitives())
    {
        if (p->kind().name() != "point")
            continue;
        p->set_number("side", 0.0);
        p->animate({{"side", 10.0}}, 30, {}, "easeOutBack");
        if (first)
        {
            p->transition("fadeout", 1.0, [](Primitive& faded) {
                VELLUM_LOG_INFO("demo", "point {} faded out", faded.index());
            });
            first = false;
        }
    }

    // Sweep a simulated pointer across the plot, then stop
    chart.engine().on_frame(
        [&chart](const Frame& frame)
        {
            double x = 20.0 + static_cast<double>(frame.number) * 5.0;
            chart.move(x, 180.0);
            if (frame.number == 60)
                chart.click(x, 180.0);
            if (frame.number >= 90)
                chart.stop();
        });

    uint64_t ticks = chart.engine().timer()->run(1000);
    VELLUM_LOG_INFO("demo", "ran {} frames", ticks);

    if (!svg->write("line_chart.svg"))
        return 1;
    VELLUM_LOG_INFO("demo", "saved line_chart.svg ({} elements)", svg->element_count());
    return 0;
}
