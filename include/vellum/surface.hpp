#pragma once

#include <cstddef>
#include <vector>
#include <vellum/color.hpp>

namespace vellum
{

// 2D affine transform in canvas convention:
//   | a c e |
//   | b d f |
//   | 0 0 1 |
struct Transform2D
{
    double a = 1.0, b = 0.0, c = 0.0, d = 1.0, e = 0.0, f = 0.0;

    static Transform2D identity() { return {}; }
    static Transform2D translation(double dx, double dy);
    static Transform2D rotation(double radians);
    static Transform2D scaling(double sx, double sy);

    // this * rhs: rhs is applied first, then this.
    Transform2D operator*(const Transform2D& rhs) const;

    void apply(double x, double y, double& out_x, double& out_y) const;

    bool operator==(const Transform2D&) const = default;
};

// Paint state saved and restored by Surface::save()/restore().
struct PaintState
{
    Transform2D transform;
    double      alpha        = 1.0;
    Color       stroke_color = colors::black;
    Color       fill_color   = colors::black;
    double      line_width   = 1.0;
};

// Drawing context handed to primitive render callbacks. The base class owns
// the transform/paint-state stack; implementations only turn paths into
// output. All path coordinates are in the current user space.
class Surface
{
   public:
    Surface(int width, int height);
    virtual ~Surface() = default;

    Surface(const Surface&)            = delete;
    Surface& operator=(const Surface&) = delete;

    // ─── State stack ────────────────────────────────────────────────────
    void   save();
    // Unbalanced restore() calls are ignored (and logged).
    void   restore();
    size_t save_depth() const { return stack_.size(); }

    void translate(double dx, double dy);
    void rotate(double radians);
    void scale(double sx, double sy);
    void set_transform(const Transform2D& t) { state_.transform = t; }

    void   set_global_alpha(double alpha);
    double global_alpha() const { return state_.alpha; }

    void set_stroke_color(const Color& c) { state_.stroke_color = c; }
    void set_fill_color(const Color& c) { state_.fill_color = c; }
    void set_line_width(double w) { state_.line_width = w; }

    const PaintState& state() const { return state_; }

    // ─── Paths ──────────────────────────────────────────────────────────
    void begin_path();
    void move_to(double x, double y);
    void line_to(double x, double y);
    void rect(double x, double y, double w, double h);
    void close_path();

    void stroke();
    void fill();

    // ─── Surface ────────────────────────────────────────────────────────
    void set_width(int px);
    void set_height(int px);
    int  width() const { return width_; }
    int  height() const { return height_; }

    void clear();
    void background(const Color& fill);

   protected:
    struct PathPoint
    {
        double x, y;     // device space (transform already applied)
        bool   move;     // starts a new subpath
        bool   close;    // closes the current subpath
    };

    const std::vector<PathPoint>& path() const { return path_; }

    virtual void on_begin_path() {}
    virtual void on_stroke(const std::vector<PathPoint>& path, const PaintState& state) = 0;
    virtual void on_fill(const std::vector<PathPoint>& path, const PaintState& state)   = 0;
    virtual void on_clear()                                                             = 0;
    virtual void on_background(const Color& fill)                                       = 0;
    virtual void on_resize(int /*width*/, int /*height*/) {}

   private:
    int                     width_;
    int                     height_;
    PaintState              state_;
    std::vector<PaintState> stack_;
    std::vector<PathPoint>  path_;
};

// Saves the surface state on construction and restores it on destruction,
// including during stack unwinding.
class SurfaceStateGuard
{
   public:
    explicit SurfaceStateGuard(Surface& surface) : surface_(surface) { surface_.save(); }
    ~SurfaceStateGuard() { surface_.restore(); }

    SurfaceStateGuard(const SurfaceStateGuard&)            = delete;
    SurfaceStateGuard& operator=(const SurfaceStateGuard&) = delete;

   private:
    Surface& surface_;
};

}   // namespace vellum
