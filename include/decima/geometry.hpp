#pragma once

#include <cstddef>

namespace decima
{

struct Point
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point&) const = default;
};

// Axis-aligned rectangle anchored at its minimum corner.
struct Rect
{
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;

    double min_x() const { return x; }
    double min_y() const { return y; }
    double max_x() const { return x + w; }
    double max_y() const { return y + h; }

    bool contains(const Point& p) const
    {
        return p.x >= min_x() && p.x <= max_x() && p.y >= min_y() && p.y <= max_y();
    }

    bool operator==(const Rect&) const = default;
};

inline double distance_squared(const Point& a, const Point& b)
{
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return dx * dx + dy * dy;
}

// Half-open index range [first, last) into a series.
struct IndexRange
{
    std::size_t first = 0;
    std::size_t last  = 0;

    std::size_t size() const { return last > first ? last - first : 0; }
    bool        empty() const { return last <= first; }

    bool operator==(const IndexRange&) const = default;
};

}   // namespace decima
