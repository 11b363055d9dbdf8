#pragma once

#include <cmath>
#include <cstddef>
#include <decima/config.hpp>
#include <decima/geometry.hpp>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace decima
{

// Cell arithmetic for a fixed `grid_size x grid_size` grid laid over `bounds`.
// Coordinates outside the bounds clamp into the nearest edge cell.
class GridGeometry
{
   public:
    struct CellRange
    {
        std::size_t min_x = 0;
        std::size_t max_x = 0;
        std::size_t min_y = 0;
        std::size_t max_y = 0;
    };

    // Throws std::invalid_argument for grid_size == 0 or non-finite bounds.
    GridGeometry(const Rect& bounds, std::size_t grid_size);

    const Rect& bounds() const { return bounds_; }
    std::size_t grid_size() const { return grid_size_; }
    std::size_t cell_count() const { return grid_size_ * grid_size_; }

    std::size_t cell_x(double x) const;
    std::size_t cell_y(double y) const;
    std::size_t cell_of(const Point& p) const { return cell_y(p.y) * grid_size_ + cell_x(p.x); }

    // Cells touched by the square [center - radius, center + radius].
    CellRange cell_range(const Point& center, double radius) const;

   private:
    std::size_t axis_cell(double value, double min, double extent) const;

    Rect        bounds_;
    std::size_t grid_size_;
};

// Uniform-grid spatial index over (element, point) records.
// Fill with insert(), then query.  There is no removal; rebuilding means
// constructing a new grid and inserting everything again.
template <typename T>
class SpatialGrid
{
   public:
    explicit SpatialGrid(const Rect& bounds,
                         std::size_t grid_size = SpatialIndexConfig::DEFAULT_GRID_SIZE)
        : geometry_(bounds, grid_size), cells_(geometry_.cell_count())
    {
    }

    void insert(T element, const Point& point)
    {
        const std::size_t index = records_.size();
        records_.push_back(Record{std::move(element), point});
        cells_[geometry_.cell_of(point)].push_back(index);
    }

    void reserve(std::size_t count) { records_.reserve(count); }

    // Elements whose Euclidean distance to `center` is <= radius, in cell
    // scan order.  Throws std::invalid_argument for a negative or NaN radius.
    std::vector<T> query(const Point& center, double radius) const
    {
        std::vector<T> result;
        for_each_within(center,
                        radius,
                        [&](const Record& r, double) { result.push_back(r.element); });
        return result;
    }

    // Closest element within `radius`, if any.  Ties keep the first in scan order.
    std::optional<T> nearest(const Point& center, double radius) const
    {
        const Record* best    = nullptr;
        double        best_d2 = std::numeric_limits<double>::infinity();
        for_each_within(center,
                        radius,
                        [&](const Record& r, double d2)
                        {
                            if (d2 < best_d2)
                            {
                                best_d2 = d2;
                                best    = &r;
                            }
                        });
        if (!best)
            return std::nullopt;
        return best->element;
    }

    std::size_t size() const { return records_.size(); }
    bool        empty() const { return records_.empty(); }
    const Rect& bounds() const { return geometry_.bounds(); }
    std::size_t grid_size() const { return geometry_.grid_size(); }

    std::size_t cell_population(std::size_t cell) const { return cells_.at(cell).size(); }

   private:
    struct Record
    {
        T     element;
        Point point;
    };

    template <typename Fn>
    void for_each_within(const Point& center, double radius, Fn&& fn) const
    {
        if (std::isnan(radius) || radius < 0.0)
            throw std::invalid_argument("spatial query radius must be non-negative");
        if (records_.empty())
            return;

        const auto   range      = geometry_.cell_range(center, radius);
        const double radius_sq  = radius * radius;
        const auto   grid_size  = geometry_.grid_size();

        for (std::size_t cy = range.min_y; cy <= range.max_y; ++cy)
        {
            for (std::size_t cx = range.min_x; cx <= range.max_x; ++cx)
            {
                for (std::size_t index : cells_[cy * grid_size + cx])
                {
                    const Record& r  = records_[index];
                    const double  d2 = distance_squared(r.point, center);
                    if (d2 <= radius_sq)
                        fn(r, d2);
                }
            }
        }
    }

    GridGeometry                          geometry_;
    std::vector<Record>                   records_;
    std::vector<std::vector<std::size_t>> cells_;
};

}   // namespace decima
