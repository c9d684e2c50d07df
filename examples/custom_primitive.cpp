#include <cmath>
#include <numbers>
#include <memory>
#include <vellum/vellum.hpp>

using namespace vellum;

// A diamond that reacts to the pointer and can be spun and resized
static std::shared_ptr<const PrimitiveKind> define_diamond()
{
    PrimitiveCapabilities caps;
    caps.name       = "diamond";
    caps.animatable = {"radius"};
    caps.is_inside  = [](const Primitive& p, double x, double y)
    { return std::abs(x) + std::abs(y) <= p.number_or("radius", 10.0); };
    caps.events.over  = [](Primitive& p) { p.animate({{"radius", 30.0}}, 10, {}, "easeOutQuad"); };
    caps.events.out   = [](Primitive& p) { p.animate({{"radius", 20.0}}, 10, {}, "easeInQuad"); };
    caps.events.click = [](Primitive& p)
    { p.animate({{"rotation", p.rotation() + std::numbers::pi / 2.0}}, 20, {}, "easeInOutCubic"); };

    return define_primitive(
        [](Primitive& p, Surface& s)
        {
            double r = p.number_or("radius", 10.0);
            s.begin_path();
            s.move_to(0.0, -r);
            s.line_to(r, 0.0);
            s.line_to(0.0, r);
            s.line_to(-r, 0.0);
            s.close_path();
            s.set_fill_color(p.color_or("fill", colors::red));
            s.fill();
        },
        caps);
}

int main()
{
    Logger::instance().add_sink(sinks::console_sink());

    auto svg     = std::make_shared<SvgSurface>(300, 200);
    auto diamond = define_diamond();

    Registry          registry;
    PointerDispatcher dispatcher(registry);
    ManualTickSource  ticks;
    FrameEngine       engine(registry, dispatcher, &ticks);

    engine.on_before_render(
        [&svg]()
        {
            svg->clear();
            svg->background(colors::white);
        });

    for (int i = 0; i < 3; ++i)
    {
        registry.add(diamond->create({{"x", 75.0 + 75.0 * i}, {"y", 100.0}, {"radius", 20.0}},
                                     {{"fill", std::string("#3a6")}},
                                     svg));
    }
    registry.primitives().back()->transition("fadein", 0.5);

    engine.start();
    dispatcher.move(150.0, 100.0);
    for (int i = 0; i < 15; ++i)
        ticks.pump();

    dispatcher.click(150.0, 100.0);
    dispatcher.move(0.0, 0.0);
    for (int i = 0; i < 30; ++i)
        ticks.pump();
    engine.stop();

    VELLUM_LOG_INFO("example", "{} frames, middle radius {}", engine.frame_number(),
                    registry.primitives()[1]->number_or("radius", 0.0));
    return svg->write("custom_primitive.svg") ? 0 : 1;
}
