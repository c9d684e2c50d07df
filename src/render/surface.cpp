#include <cmath>
#include <vellum/logger.hpp>
#include <vellum/surface.hpp>

namespace vellum
{

// ─── Transform2D ────────────────────────────────────────────────────────────

Transform2D Transform2D::translation(double dx, double dy)
{
    return Transform2D{1.0, 0.0, 0.0, 1.0, dx, dy};
}

Transform2D Transform2D::rotation(double radians)
{
    double cs = std::cos(radians);
    double sn = std::sin(radians);
    return Transform2D{cs, sn, -sn, cs, 0.0, 0.0};
}

Transform2D Transform2D::scaling(double sx, double sy)
{
    return Transform2D{sx, 0.0, 0.0, sy, 0.0, 0.0};
}

Transform2D Transform2D::operator*(const Transform2D& r) const
{
    return Transform2D{a * r.a + c * r.b,
                       b * r.a + d * r.b,
                       a * r.c + c * r.d,
                       b * r.c + d * r.d,
                       a * r.e + c * r.f + e,
                       b * r.e + d * r.f + f};
}

void Transform2D::apply(double x, double y, double& out_x, double& out_y) const
{
    out_x = a * x + c * y + e;
    out_y = b * x + d * y + f;
}

// ─── Surface ────────────────────────────────────────────────────────────────

Surface::Surface(int width, int height) : width_(width), height_(height) {}

void Surface::save()
{
    stack_.push_back(state_);
}

void Surface::restore()
{
    if (stack_.empty())
    {
        VELLUM_LOG_WARN("surface", "restore() without matching save() ignored");
        return;
    }
    state_ = stack_.back();
    stack_.pop_back();
}

void Surface::translate(double dx, double dy)
{
    state_.transform = state_.transform * Transform2D::translation(dx, dy);
}

void Surface::rotate(double radians)
{
    state_.transform = state_.transform * Transform2D::rotation(radians);
}

void Surface::scale(double sx, double sy)
{
    state_.transform = state_.transform * Transform2D::scaling(sx, sy);
}

void Surface::set_global_alpha(double alpha)
{
    // Out-of-range values are ignored, like a canvas context does
    if (alpha < 0.0 || alpha > 1.0 || std::isnan(alpha))
        return;
    state_.alpha = alpha;
}

void Surface::begin_path()
{
    path_.clear();
    on_begin_path();
}

void Surface::move_to(double x, double y)
{
    PathPoint p{0.0, 0.0, true, false};
    state_.transform.apply(x, y, p.x, p.y);
    path_.push_back(p);
}

void Surface::line_to(double x, double y)
{
    if (path_.empty())
    {
        move_to(x, y);
        return;
    }
    PathPoint p{0.0, 0.0, false, false};
    state_.transform.apply(x, y, p.x, p.y);
    path_.push_back(p);
}

void Surface::rect(double x, double y, double w, double h)
{
    move_to(x, y);
    line_to(x + w, y);
    line_to(x + w, y + h);
    line_to(x, y + h);
    close_path();
}

void Surface::close_path()
{
    if (!path_.empty())
        path_.back().close = true;
}

void Surface::stroke()
{
    if (!path_.empty())
        on_stroke(path_, state_);
}

void Surface::fill()
{
    if (!path_.empty())
        on_fill(path_, state_);
}

void Surface::set_width(int px)
{
    if (px < 0)
        return;
    width_ = px;
    on_resize(width_, height_);
}

void Surface::set_height(int px)
{
    if (px < 0)
        return;
    height_ = px;
    on_resize(width_, height_);
}

void Surface::clear()
{
    path_.clear();
    on_clear();
}

void Surface::background(const Color& fill)
{
    on_background(fill);
}

}   // namespace vellum
