#include <gtest/gtest.h>
#include "noteplot/functions/guard.h"
#include <stdexcept>

using namespace NotePlot;

TEST(GuardTest, FiniteValueIsAccepted) {
    GuardLimits limits;
    auto v = guarded_call([](double x) { return x * x; }, 0.0, limits);
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 0.0);
}

TEST(GuardTest, NaNAndInfinityAreRejected) {
    GuardLimits limits;
    EXPECT_FALSE(guarded_call([](double x) { return std::sqrt(x); }, -1.0, limits).has_value());
    EXPECT_FALSE(guarded_call([](double x) { return 1.0 / x; }, 0.0, limits).has_value());
}

TEST(GuardTest, ValueAboveCeilingIsRejected) {
    GuardLimits limits;
    limits.value_ceiling = 100.0;
    EXPECT_TRUE(guarded_call([](double) { return 100.0; }, 1.0, limits).has_value());
    EXPECT_FALSE(guarded_call([](double) { return 100.5; }, 1.0, limits).has_value());
    EXPECT_FALSE(guarded_call([](double) { return -1e9; }, 1.0, limits).has_value());
}

TEST(GuardTest, ThrowingFunctionIsRejected) {
    GuardLimits limits;
    auto f = [](double x) -> double {
        if (x < 0) throw std::domain_error("negative input");
        return x;
    };
    EXPECT_FALSE(guarded_call(f, -2.0, limits).has_value());
    EXPECT_TRUE(guarded_call(f, 2.0, limits).has_value());
}

TEST(GuardTest, ZeroEpsilonSkipsTheCall) {
    GuardLimits limits;
    limits.zero_epsilon = 1e-10;
    int calls = 0;
    auto f = [&calls](double x) { ++calls; return 1.0 / x; };

    EXPECT_FALSE(guarded_call(f, 0.0, limits).has_value());
    EXPECT_FALSE(guarded_call(f, 5e-11, limits).has_value());
    EXPECT_EQ(calls, 0) << "function must not be invoked near zero";

    EXPECT_TRUE(guarded_call(f, 0.5, limits).has_value());
    EXPECT_EQ(calls, 1);
}

TEST(GuardTest, NonFiniteInputIsRejected) {
    GuardLimits limits;
    int calls = 0;
    auto f = [&calls](double x) { ++calls; return x; };
    EXPECT_FALSE(guarded_call(f, std::numeric_limits<double>::quiet_NaN(), limits).has_value());
    EXPECT_FALSE(guarded_call(f, std::numeric_limits<double>::infinity(), limits).has_value());
    EXPECT_EQ(calls, 0);
}

TEST(GuardTest, ExplicitPointUsesInputAsX) {
    Curve c = make_explicit_curve([](double x) { return 2.0 * x; });
    auto p = evaluate_guarded(c, 3.0, GuardLimits{});
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->t, 3.0);
    EXPECT_DOUBLE_EQ(p->x, 3.0);
    EXPECT_DOUBLE_EQ(p->y, 6.0);
}

TEST(GuardTest, ParametricRequiresBothComponents) {
    Curve c = make_parametric_curve([](double t) { return t; },
                                    [](double t) { return std::log(t); });
    EXPECT_TRUE(evaluate_guarded(c, 1.0, GuardLimits{}).has_value());
    EXPECT_FALSE(evaluate_guarded(c, -1.0, GuardLimits{}).has_value());
}

TEST(GuardTest, PolarConvertsToCartesian) {
    Curve c = make_polar_curve([](double) { return 2.0; });
    auto p = evaluate_guarded(c, M_PI / 2.0, GuardLimits{});
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, 0.0, 1e-12);
    EXPECT_NEAR(p->y, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(p->t, M_PI / 2.0);
}

TEST(GuardTest, EvaluationsAreCounted) {
    Curve c = make_explicit_curve([](double x) { return x; });
    SampleStats stats;
    for (int i = 0; i < 5; ++i) (void)evaluate_guarded(c, i, GuardLimits{}, &stats);
    EXPECT_EQ(stats.evaluations, 5u);
}

TEST(GuardTest, CurveFactoriesRejectMissingFunctions) {
    EXPECT_THROW(make_explicit_curve(nullptr), std::runtime_error);
    EXPECT_THROW(make_parametric_curve([](double t) { return t; }, nullptr), std::runtime_error);
    EXPECT_THROW(make_polar_curve(nullptr), std::runtime_error);
}
