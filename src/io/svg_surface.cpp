#include <cstdio>
#include <fstream>
#include <sstream>
#include <vellum/logger.hpp>
#include <vellum/svg_surface.hpp>

namespace vellum
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

// Convert a Color to an SVG rgb() string
std::string svg_color(const Color& c)
{
    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "rgb(%d,%d,%d)",
                  static_cast<int>(c.r * 255.0f),
                  static_cast<int>(c.g * 255.0f),
                  static_cast<int>(c.b * 255.0f));
    return buf;
}

// Convert a number to a compact string (no trailing zeros)
std::string fmt(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", v);
    return buf;
}

template <typename Path>
std::string path_data(const Path& path)
{
    std::ostringstream d;
    for (const auto& p : path)
    {
        d << (p.move ? "M" : "L") << fmt(p.x) << ' ' << fmt(p.y) << ' ';
        if (p.close)
            d << "Z ";
    }
    std::string out = d.str();
    if (!out.empty())
        out.pop_back();
    return out;
}

// Combined opacity of the paint state and the color's own alpha
double opacity(const PaintState& state, const Color& c)
{
    return state.alpha * static_cast<double>(c.a);
}

}   // anonymous namespace

void SvgSurface::on_stroke(const std::vector<PathPoint>& path, const PaintState& state)
{
    std::ostringstream el;
    el << "  <path d=\"" << path_data(path) << "\" fill=\"none\" stroke=\""
       << svg_color(state.stroke_color) << "\" stroke-width=\"" << fmt(state.line_width) << "\"";
    double op = opacity(state, state.stroke_color);
    if (op < 1.0)
        el << " stroke-opacity=\"" << fmt(op) << "\"";
    el << "/>";
    elements_.push_back(el.str());
}

void SvgSurface::on_fill(const std::vector<PathPoint>& path, const PaintState& state)
{
    std::ostringstream el;
    el << "  <path d=\"" << path_data(path) << "\" fill=\"" << svg_color(state.fill_color)
       << "\" stroke=\"none\"";
    double op = opacity(state, state.fill_color);
    if (op < 1.0)
        el << " fill-opacity=\"" << fmt(op) << "\"";
    el << "/>";
    elements_.push_back(el.str());
}

void SvgSurface::on_clear()
{
    elements_.clear();
}

void SvgSurface::on_background(const Color& fill)
{
    std::ostringstream el;
    el << "  <rect x=\"0\" y=\"0\" width=\"" << width() << "\" height=\"" << height()
       << "\" fill=\"" << svg_color(fill) << "\"";
    if (fill.a < 1.0f)
        el << " fill-opacity=\"" << fmt(fill.a) << "\"";
    el << "/>";
    elements_.push_back(el.str());
}

std::string SvgSurface::to_string() const
{
    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width() << "\" height=\""
        << height() << "\" viewBox=\"0 0 " << width() << " " << height() << "\">\n";
    for (const auto& el : elements_)
        svg << el << "\n";
    svg << "</svg>\n";
    return svg.str();
}

bool SvgSurface::write(const std::string& path) const
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        VELLUM_LOG_ERROR("svg", "cannot open '{}' for writing", path);
        return false;
    }
    file << to_string();
    return static_cast<bool>(file);
}

}   // namespace vellum
