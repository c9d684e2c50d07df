#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vellum
{

struct DataPoint
{
    double x = 0.0;
    double y = 0.0;
};

struct Bounds
{
    double min   = 0.0;
    double max   = 0.0;
    double range = 0.0;
};

// Line-chart source data: an x extent and one or more named y series.
//
// The x extent accepts three shapes:
//   set_x(10.0)              -> min 0, max 10
//   set_x({10.0})            -> min 0, max 10
//   set_x({2.0, 4.0, 8.0})   -> min 2 (first), max 8 (last)
// Every series needs at least two values. Nothing is checked until refresh().
class SeriesData
{
   public:
    SeriesData() = default;

    void set_x(double max);
    void set_x(std::vector<double> values);

    // Adds or replaces the series `name`. Insertion order is kept.
    void add_series(const std::string& name, std::vector<double> values);
    void remove_series(const std::string& name);

    // Validates the raw data and recomputes the extents.
    // Throws ValidationError on malformed data; the previous extents are
    // left untouched in that case.
    void refresh();

    bool is_refreshed() const { return refreshed_; }
    bool empty() const { return series_.empty(); }
    bool has_x() const { return x_.has_value(); }

    size_t series_count() const { return series_.size(); }
    const std::vector<std::pair<std::string, std::vector<double>>>& series() const
    {
        return series_;
    }

    // Points of every series, spread evenly over the x range:
    // x_i = range / (n - 1) * i. Throws ValidationError before refresh().
    std::map<std::string, std::vector<DataPoint>> points() const;

    // y bounds over all series. Throws ValidationError before refresh().
    Bounds bounds() const;
    Bounds x_bounds() const;

   private:
    void require_refreshed(const char* what) const;

    std::optional<std::vector<double>>                       x_;
    std::vector<std::pair<std::string, std::vector<double>>> series_;

    bool   refreshed_ = false;
    Bounds x_bounds_;
    Bounds y_bounds_;
};

}   // namespace vellum
