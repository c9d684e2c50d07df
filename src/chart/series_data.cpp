#include <algorithm>
#include <cmath>
#include <limits>
#include <vellum/error.hpp>
#include <vellum/logger.hpp>
#include <vellum/series_data.hpp>

namespace vellum
{

namespace
{

bool all_finite(const std::vector<double>& values)
{
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

}   // anonymous namespace

void SeriesData::set_x(double max)
{
    x_         = std::vector<double>{max};
    refreshed_ = false;
}

void SeriesData::set_x(std::vector<double> values)
{
    x_         = std::move(values);
    refreshed_ = false;
}

void SeriesData::add_series(const std::string& name, std::vector<double> values)
{
    auto it = std::find_if(series_.begin(),
                           series_.end(),
                           [&name](const auto& s) { return s.first == name; });
    if (it != series_.end())
        it->second = std::move(values);
    else
        series_.emplace_back(name, std::move(values));
    refreshed_ = false;
}

void SeriesData::remove_series(const std::string& name)
{
    auto it = std::find_if(series_.begin(),
                           series_.end(),
                           [&name](const auto& s) { return s.first == name; });
    if (it != series_.end())
    {
        series_.erase(it);
        refreshed_ = false;
    }
}

void SeriesData::refresh()
{
    if (!x_ || series_.empty())
        throw ValidationError("line data needs an x property and at least one y series");

    const auto& xs = *x_;
    if (xs.empty())
        throw ValidationError("bad data supplied to the x property: no values");
    if (!all_finite(xs))
        throw ValidationError("bad data supplied to the x property: non-finite value");

    Bounds x;
    if (xs.size() == 1)
    {
        x.min = 0.0;
        x.max = xs.front();
    }
    else
    {
        x.min = xs.front();
        x.max = xs.back();
    }
    x.range = x.max - x.min;

    Bounds y;
    y.min = std::numeric_limits<double>::infinity();
    y.max = -std::numeric_limits<double>::infinity();
    for (const auto& [name, values] : series_)
    {
        if (name.empty())
            throw ValidationError("series names must not be empty");
        if (values.size() < 2)
            throw ValidationError("line '" + name + "' needs more than one data point");
        if (!all_finite(values))
            throw ValidationError("line '" + name + "' contains a non-finite value");

        auto [lo, hi] = std::minmax_element(values.begin(), values.end());
        y.min         = std::min(y.min, *lo);
        y.max         = std::max(y.max, *hi);
    }
    y.range = y.max - y.min;

    x_bounds_  = x;
    y_bounds_  = y;
    refreshed_ = true;

    VELLUM_LOG_DEBUG("data",
                     "refreshed {} series, x [{}, {}], y [{}, {}]",
                     series_.size(),
                     x.min,
                     x.max,
                     y.min,
                     y.max);
}

void SeriesData::require_refreshed(const char* what) const
{
    if (!refreshed_)
        throw ValidationError(std::string(what) + " requested before the data was refreshed");
}

std::map<std::string, std::vector<DataPoint>> SeriesData::points() const
{
    require_refreshed("points");

    std::map<std::string, std::vector<DataPoint>> out;
    for (const auto& [name, values] : series_)
    {
        auto& line = out[name];
        line.reserve(values.size());
        double step = x_bounds_.range / static_cast<double>(values.size() - 1);
        for (size_t i = 0; i < values.size(); ++i)
            line.push_back(DataPoint{step * static_cast<double>(i), values[i]});
    }
    return out;
}

Bounds SeriesData::bounds() const
{
    require_refreshed("bounds");
    return y_bounds_;
}

Bounds SeriesData::x_bounds() const
{
    require_refreshed("x bounds");
    return x_bounds_;
}

}   // namespace vellum
