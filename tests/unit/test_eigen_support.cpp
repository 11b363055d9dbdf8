#include <decima/eigen.hpp>
#include <decima/reduction_engine.hpp>
#include <eigen3/Eigen/Core>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace decima;

// ─── Series from Eigen ───────────────────────────────────────────────────────

TEST(EigenSeries, CopiesVectorInOrder)
{
    Eigen::VectorXd v(4);
    v << 1.0, 2.0, 3.0, 4.0;

    auto s = make_series(v);
    ASSERT_EQ(s.size(), 4u);
    EXPECT_DOUBLE_EQ(s.front(), 1.0);
    EXPECT_DOUBLE_EQ(s.back(), 4.0);
}

TEST(EigenSeries, AcceptsExpressions)
{
    Eigen::VectorXf v = Eigen::VectorXf::LinSpaced(5, 0.0f, 4.0f);
    auto            s = make_series(v * 2.0f);
    ASSERT_EQ(s.size(), 5u);
    EXPECT_FLOAT_EQ(s[4], 8.0f);
}

TEST(EigenSeries, RowVector)
{
    Eigen::RowVector3d r(7.0, 8.0, 9.0);
    auto               s = make_series(r);
    EXPECT_EQ(s, (Series<double>{7.0, 8.0, 9.0}));
}

// ─── Points from Eigen ───────────────────────────────────────────────────────

TEST(EigenPoints, ZipsXAndY)
{
    Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(3, 0.0, 2.0);
    Eigen::VectorXd y(3);
    y << 10.0, 20.0, 30.0;

    auto pts = make_points(x, y);
    ASSERT_EQ(pts.size(), 3u);
    EXPECT_DOUBLE_EQ(pts[1].x, 1.0);
    EXPECT_DOUBLE_EQ(pts[1].y, 20.0);
}

TEST(EigenPoints, SizeMismatchThrows)
{
    Eigen::VectorXd x(3);
    Eigen::VectorXd y(4);
    x.setZero();
    y.setZero();
    EXPECT_THROW(make_points(x, y), std::invalid_argument);
}

TEST(EigenPoints, FeedsEngine)
{
    Eigen::VectorXd t = Eigen::VectorXd::LinSpaced(50'000, 0.0, 60.0);
    Eigen::VectorXd v = t.array().sin();

    EngineConfig config;
    config.eager_precompute = false;
    ReductionEngine<Point> engine(make_points(t, v), sampling::MinMax{}, config);
    auto                   out = engine.optimized_data(std::nullopt, 1000);
    EXPECT_LE(out.size(), 1000u);
    EXPECT_DOUBLE_EQ(out.front().x, 0.0);
    EXPECT_NEAR(out.back().x, 60.0, 1e-9);
}
