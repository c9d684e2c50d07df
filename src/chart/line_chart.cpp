#include <cmath>
#include <vellum/chart.hpp>
#include <vellum/logger.hpp>

namespace vellum
{

namespace
{

constexpr double HALF_PI = 1.57079632679489661923;

// Straight stroke from the origin along the local x axis.
void render_axis(Primitive& p, Surface& s)
{
    s.begin_path();
    s.move_to(0.0, 0.0);
    s.line_to(p.number_or("length", 0.0), 0.0);
    s.close_path();
    s.set_stroke_color(p.color_or("stroke", colors::black));
    s.set_line_width(p.number_or("stroke_width", 1.0));
    s.stroke();
}

// Segment from the origin to (dx, dy), one per pair of consecutive samples.
void render_segment(Primitive& p, Surface& s)
{
    s.begin_path();
    s.move_to(0.0, 0.0);
    s.line_to(p.number_or("dx", 0.0), p.number_or("dy", 0.0));
    s.set_stroke_color(p.color_or("stroke", colors::red));
    s.set_line_width(p.number_or("stroke_width", 1.0));
    s.stroke();
}

void render_point(Primitive& p, Surface& s)
{
    double side = p.number_or("side", 10.0);
    double half = side / 2.0;
    s.begin_path();
    s.rect(-half, -half, side, side);
    s.close_path();
    s.set_stroke_color(p.color_or("stroke", colors::yellow));
    s.set_line_width(p.number_or("stroke_width", 1.0));
    s.stroke();
    s.set_fill_color(p.color_or("fill", colors::black));
    s.fill();
}

class LineChartHandler : public ChartTypeHandler
{
   public:
    LineChartHandler()
    {
        PrimitiveCapabilities axis;
        axis.name       = "axis";
        axis.animatable = {"length"};
        kinds_["axis"]  = define_primitive(render_axis, axis);

        PrimitiveCapabilities segment;
        segment.name       = "line";
        segment.animatable = {"dx", "dy"};
        kinds_["line"]     = define_primitive(render_segment, segment);

        PrimitiveCapabilities point;
        point.name      = "point";
        point.is_inside = [](const Primitive& p, double x, double y)
        {
            double half = p.number_or("side", 10.0) / 2.0;
            return x > -half && x < half && y > -half && y < half;
        };
        point.bounding_box = [](const Primitive& p)
        {
            double half = p.number_or("side", 10.0) / 2.0;
            return BoundingBox{-half, -half, half, half};
        };
        point.events.over  = [](Primitive& p) { p.set("highlighted", true); };
        point.events.out   = [](Primitive& p) { p.set("highlighted", false); };
        point.events.click = [](Primitive& p) { p.set("selected", !p.flag_or("selected", false)); };
        point.animatable   = {"side"};
        kinds_["point"]    = define_primitive(render_point, point);
    }

    const std::string& name() const override { return name_; }
    const KindTable&   kinds() const override { return kinds_; }

    void init(Chart& chart) override
    {
        const ContentBox& box      = chart.box();
        const Bounds      xs       = chart.data().x_bounds();
        const Bounds      ys       = chart.data().bounds();
        const double      origin_x = box.x;
        const double      origin_y = box.y1;

        chart.layer(
            [&](ChartContext& ctx)
            {
                auto x_axis = ctx.make("axis", {{"x", origin_x}, {"y", origin_y}, {"length", box.width()}});
                auto y_axis = ctx.make("axis",
                                       {{"x", origin_x},
                                        {"y", origin_y},
                                        {"length", box.height()},
                                        {"rotation", -HALF_PI}});
                ctx.registry().add(std::vector<PrimitivePtr>{y_axis, x_axis});
            },
            true);

        auto to_screen = [&](const DataPoint& pt, double& sx, double& sy)
        {
            sx = box.x + (xs.range != 0.0 ? pt.x / xs.range * box.width() : 0.0);
            sy = ys.range != 0.0 ? box.y1 - (pt.y - ys.min) / ys.range * box.height()
                                 : box.y + box.height() / 2.0;
        };

        auto points = chart.data().points();
        chart.layer(
            [&](ChartContext& ctx)
            {
                for (const auto& [series, samples] : points)
                {
                    for (size_t i = 0; i + 1 < samples.size(); ++i)
                    {
                        double x0, y0, x1, y1;
                        to_screen(samples[i], x0, y0);
                        to_screen(samples[i + 1], x1, y1);
                        ctx.registry().add(ctx.make(
                            "line", {{"x", x0}, {"y", y0}, {"dx", x1 - x0}, {"dy", y1 - y0}}, series));
                    }
                }

                for (const auto& [series, samples] : points)
                {
                    for (size_t i = 0; i < samples.size(); ++i)
                    {
                        double sx, sy;
                        to_screen(samples[i], sx, sy);
                        ctx.registry().add(ctx.make(
                            "point", {{"x", sx}, {"y", sy}, {"index", static_cast<double>(i)}}, series));
                    }
                }
            });

        VELLUM_LOG_DEBUG("chart", "line chart laid out {} primitives", chart.registry().size());
    }

   private:
    std::string name_ = "line";
    KindTable   kinds_;
};

}   // anonymous namespace

std::shared_ptr<ChartTypeHandler> make_line_chart_handler()
{
    return std::make_shared<LineChartHandler>();
}

}   // namespace vellum
