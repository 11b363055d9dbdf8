#pragma once

// ─── Decima ↔ Eigen Integration ─────────────────────────────────────────────
//
// Build series and point sets straight from Eigen vectors.
//
// Requirements:
//   - Eigen 3.x  (header-only)
//   - Build with -DDECIMA_USE_EIGEN=ON
//
// Usage:
//
//   #include <decima/eigen.hpp>
//
//   Eigen::VectorXd t = Eigen::VectorXd::LinSpaced(1'000'000, 0.0, 60.0);
//   Eigen::VectorXd v = t.array().sin();
//
//   decima::ReductionEngine<decima::Point> engine(decima::make_points(t, v));
//
// ─────────────────────────────────────────────────────────────────────────────

#include <decima/geometry.hpp>
#include <decima/series.hpp>
#include <eigen3/Eigen/Core>
#include <stdexcept>
#include <vector>

namespace decima
{

// Series holding the coefficients of an Eigen vector expression, in order.
template <typename Derived>
Series<typename Derived::Scalar> make_series(const Eigen::DenseBase<Derived>& v)
{
    static_assert(Derived::ColsAtCompileTime == 1 || Derived::RowsAtCompileTime == 1,
                  "make_series expects a vector expression");
    std::vector<typename Derived::Scalar> values(static_cast<std::size_t>(v.size()));
    for (Eigen::Index i = 0; i < v.size(); ++i)
        values[static_cast<std::size_t>(i)] = v(i);
    return Series<typename Derived::Scalar>(std::move(values));
}

// Zips two equally sized vector expressions into a Series<Point>.
// Throws std::invalid_argument on a size mismatch.
template <typename DerivedX, typename DerivedY>
Series<Point> make_points(const Eigen::DenseBase<DerivedX>& x, const Eigen::DenseBase<DerivedY>& y)
{
    if (x.size() != y.size())
        throw std::invalid_argument("make_points: x and y sizes differ");

    std::vector<Point> points(static_cast<std::size_t>(x.size()));
    for (Eigen::Index i = 0; i < x.size(); ++i)
        points[static_cast<std::size_t>(i)] = Point{static_cast<double>(x(i)), static_cast<double>(y(i))};
    return Series<Point>(std::move(points));
}

}   // namespace decima
