#include <gtest/gtest.h>
#include "noteplot/plot/plotSpline.h"
#include "noteplot/plot/plotAdaptive.h"
#include "test_helpers.h"

using namespace NotePlot;
using namespace NotePlot::Testing;

TEST(CubicSplineTest, PassesThroughKnots) {
    CubicSpline s({0.0, 1.0, 2.5, 4.0}, {1.0, -2.0, 0.5, 3.0});
    EXPECT_NEAR(s(0.0), 1.0, 1e-12);
    EXPECT_NEAR(s(1.0), -2.0, 1e-12);
    EXPECT_NEAR(s(2.5), 0.5, 1e-12);
    EXPECT_NEAR(s(4.0), 3.0, 1e-12);
}

TEST(CubicSplineTest, NaturalSplineKnownValue) {
    // 三点 (0,0) (1,1) (2,0)：M1 = -3，S(0.5) = 0.6875
    CubicSpline s({0.0, 1.0, 2.0}, {0.0, 1.0, 0.0});
    EXPECT_NEAR(s(0.5), 0.6875, 1e-12);
    EXPECT_NEAR(s(1.5), 0.6875, 1e-12);
}

TEST(CubicSplineTest, ReproducesLinearData) {
    CubicSpline s({0.0, 1.0, 3.0, 7.0}, {1.0, 3.0, 7.0, 15.0});
    for (double x = 0.0; x <= 7.0; x += 0.25) {
        EXPECT_NEAR(s(x), 2.0 * x + 1.0, 1e-10) << "x=" << x;
    }
}

TEST(CubicSplineTest, TwoKnotsIsLinear) {
    CubicSpline s({0.0, 2.0}, {0.0, 4.0});
    EXPECT_NEAR(s(0.5), 1.0, 1e-12);
}

TEST(CubicSplineTest, OutsideKnotsIsNaN) {
    CubicSpline s({0.0, 1.0}, {0.0, 1.0});
    EXPECT_TRUE(std::isnan(s(-0.01)));
    EXPECT_TRUE(std::isnan(s(1.01)));
}

TEST(CubicSplineTest, InvalidKnotsThrow) {
    EXPECT_THROW(CubicSpline({0.0}, {0.0}), std::runtime_error);
    EXPECT_THROW(CubicSpline({0.0, 1.0}, {0.0}), std::runtime_error);
    EXPECT_THROW(CubicSpline({0.0, 1.0, 1.0}, {0.0, 1.0, 2.0}), std::runtime_error);
    EXPECT_THROW(CubicSpline({0.0, 2.0, 1.0}, {0.0, 1.0, 2.0}), std::runtime_error);
}

TEST(SplineCurveTest, ExplicitSplineDomainAndSampling) {
    std::vector<Vec2> pts = {{-1.0, 0.0}, {0.0, 1.0}, {1.0, 0.0}, {2.0, 2.0}};
    SplineCurve sc = make_spline_curve(pts);

    EXPECT_DOUBLE_EQ(sc.domain.min, -1.0);
    EXPECT_DOUBLE_EQ(sc.domain.max, 2.0);
    EXPECT_EQ(sc.curve.mode, CurveMode::Explicit);

    RawSequence raw = sample_adaptive(sc.curve, sc.domain, SamplingConfig{});
    EXPECT_TRUE(WellFormed(raw));
    EXPECT_TRUE(PointsValid(raw, sc.domain));
    EXPECT_EQ(assemble(raw).size(), 1u);
    EXPECT_NEAR(as_point(raw.back()).y, 2.0, 1e-12);
}

TEST(SplineCurveTest, ExplicitSplineRejectsBadPoints) {
    EXPECT_THROW(make_spline_curve({{0.0, 0.0}}), std::runtime_error);
    EXPECT_THROW(make_spline_curve({{0.0, 0.0}, {0.0, 1.0}}), std::runtime_error);
    EXPECT_THROW(make_spline_curve({{0.0, 0.0}, {1.0, std::numeric_limits<double>::infinity()}}),
                 std::runtime_error);
}

TEST(SplineCurveTest, ParametricSplineUsesChordLength) {
    std::vector<Vec2> pts = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}};
    SplineCurve sc = make_parametric_spline(pts);

    EXPECT_EQ(sc.curve.mode, CurveMode::Parametric);
    EXPECT_DOUBLE_EQ(sc.domain.min, 0.0);
    EXPECT_DOUBLE_EQ(sc.domain.max, 2.0);   // 重复点被跳过
    EXPECT_NEAR(sc.curve.fx(1.0), 1.0, 1e-12);
    EXPECT_NEAR(sc.curve.fy(1.0), 0.0, 1e-12);
    EXPECT_NEAR(sc.curve.fx(2.0), 1.0, 1e-12);
    EXPECT_NEAR(sc.curve.fy(2.0), 1.0, 1e-12);
}

TEST(SplineCurveTest, ParametricSplineHandlesBacktrackingPoints) {
    // x 不单调的点列 (回头)：显函数样条做不到，参数样条可以
    std::vector<Vec2> pts = {{0.0, 0.0}, {2.0, 1.0}, {1.0, 2.0}, {-1.0, 1.0}};
    EXPECT_THROW(make_spline_curve(pts), std::runtime_error);

    SplineCurve sc = make_parametric_spline(pts);
    RawSequence raw = sample_adaptive(sc.curve, sc.domain, SamplingConfig{});
    EXPECT_TRUE(WellFormed(raw));
    EXPECT_TRUE(PointsValid(raw, sc.domain));
    ASSERT_FALSE(raw.empty());
    EXPECT_NEAR(as_point(raw.front()).x, 0.0, 1e-12);
    EXPECT_NEAR(as_point(raw.back()).x, -1.0, 1e-12);
}

TEST(SplineCurveTest, ParametricSplineNeedsDistinctPoints) {
    EXPECT_THROW(make_parametric_spline({{1.0, 1.0}, {1.0, 1.0}}), std::runtime_error);
    EXPECT_THROW(make_parametric_spline({}), std::runtime_error);
}
