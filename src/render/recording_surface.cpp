#include <algorithm>
#include <vellum/recording_surface.hpp>

namespace vellum
{

namespace
{

std::vector<RecordingSurface::Point> copy_points(const auto& path)
{
    std::vector<RecordingSurface::Point> points;
    points.reserve(path.size());
    for (const auto& p : path)
        points.push_back({p.x, p.y});
    return points;
}

}   // anonymous namespace

size_t RecordingSurface::count(Op op) const
{
    return static_cast<size_t>(std::count_if(
        commands_.begin(), commands_.end(), [op](const Command& c) { return c.op == op; }));
}

void RecordingSurface::on_stroke(const std::vector<PathPoint>& path, const PaintState& state)
{
    commands_.push_back({Op::Stroke, copy_points(path), state, state.stroke_color});
}

void RecordingSurface::on_fill(const std::vector<PathPoint>& path, const PaintState& state)
{
    commands_.push_back({Op::Fill, copy_points(path), state, state.fill_color});
}

void RecordingSurface::on_clear()
{
    commands_.push_back({Op::Clear, {}, state(), colors::transparent});
}

void RecordingSurface::on_background(const Color& fill)
{
    commands_.push_back({Op::Background,
                         {{0.0, 0.0}, {static_cast<double>(width()), static_cast<double>(height())}},
                         state(),
                         fill});
}

}   // namespace vellum
