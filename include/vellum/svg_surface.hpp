#pragma once

#include <string>
#include <vector>
#include <vellum/surface.hpp>

namespace vellum
{

// Surface that accumulates the current frame as SVG elements. clear()
// discards the frame, so after a tick the document holds exactly what the
// last render painted.
class SvgSurface : public Surface
{
   public:
    SvgSurface(int width, int height) : Surface(width, height) {}

    std::string to_string() const;
    bool        write(const std::string& path) const;

    size_t element_count() const { return elements_.size(); }

   protected:
    void on_stroke(const std::vector<PathPoint>& path, const PaintState& state) override;
    void on_fill(const std::vector<PathPoint>& path, const PaintState& state) override;
    void on_clear() override;
    void on_background(const Color& fill) override;

   private:
    std::vector<std::string> elements_;
};

}   // namespace vellum
