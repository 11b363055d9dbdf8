#include <algorithm>
#include <cmath>
#include <decima/spatial_grid.hpp>
#include <stdexcept>

namespace decima
{

GridGeometry::GridGeometry(const Rect& bounds, std::size_t grid_size)
    : bounds_(bounds), grid_size_(grid_size)
{
    if (grid_size_ == 0)
        throw std::invalid_argument("spatial grid size must be positive");
    if (!std::isfinite(bounds.x) || !std::isfinite(bounds.y) || !std::isfinite(bounds.w)
        || !std::isfinite(bounds.h))
        throw std::invalid_argument("spatial grid bounds must be finite");
}

std::size_t GridGeometry::axis_cell(double value, double min, double extent) const
{
    if (extent <= 0.0)
        return 0;

    const double cell = std::floor((value - min) / extent * static_cast<double>(grid_size_));
    if (std::isnan(cell))
        return 0;

    // Clamp in floating point first so huge or infinite values never hit the cast.
    const double clamped = std::clamp(cell, 0.0, static_cast<double>(grid_size_ - 1));
    return static_cast<std::size_t>(clamped);
}

std::size_t GridGeometry::cell_x(double x) const
{
    return axis_cell(x, bounds_.min_x(), bounds_.w);
}

std::size_t GridGeometry::cell_y(double y) const
{
    return axis_cell(y, bounds_.min_y(), bounds_.h);
}

GridGeometry::CellRange GridGeometry::cell_range(const Point& center, double radius) const
{
    CellRange range;
    range.min_x = cell_x(center.x - radius);
    range.max_x = cell_x(center.x + radius);
    range.min_y = cell_y(center.y - radius);
    range.max_y = cell_y(center.y + radius);
    return range;
}

}   // namespace decima
