#pragma once

#include <vector>
#include <vellum/surface.hpp>

namespace vellum
{

// Headless surface that keeps every paint operation with the paint state in
// effect when it was issued. Used by tests and by hosts that replay frames.
class RecordingSurface : public Surface
{
   public:
    enum class Op
    {
        Stroke,
        Fill,
        Clear,
        Background,
    };

    struct Point
    {
        double x, y;
    };

    struct Command
    {
        Op                 op;
        std::vector<Point> points;   // device space
        PaintState         state;
        Color              color;    // stroke/fill/background color used
    };

    explicit RecordingSurface(int width = 400, int height = 230) : Surface(width, height) {}

    const std::vector<Command>& commands() const { return commands_; }
    size_t                      count(Op op) const;
    void                        reset() { commands_.clear(); }

   protected:
    void on_stroke(const std::vector<PathPoint>& path, const PaintState& state) override;
    void on_fill(const std::vector<PathPoint>& path, const PaintState& state) override;
    void on_clear() override;
    void on_background(const Color& fill) override;

   private:
    std::vector<Command> commands_;
};

}   // namespace vellum
