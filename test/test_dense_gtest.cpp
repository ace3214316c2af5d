#include <gtest/gtest.h>
#include "noteplot/plot/plotDense.h"
#include "noteplot/plot/plotAssemble.h"
#include "noteplot/CAS/RPN/ShuntingYard.h"
#include "test_helpers.h"

using namespace NotePlot;
using namespace NotePlot::Testing;

class DenseSamplerTest : public ::testing::Test {
protected:
    SamplingConfig config;

    void SetUp() override {
        config.strategy = SamplingStrategy::Dense;
        config.sample_count = 200;
    }
};

TEST_F(DenseSamplerTest, SmoothParabolaIsOneUnbrokenRun) {
    Domain d{-2.0, 2.0};
    Curve c = make_explicit_curve([](double x) { return x * x; });
    SampleStats stats;

    RawSequence raw = sample_dense(c, d, config, &stats);

    EXPECT_EQ(raw.size(), 201u);
    EXPECT_EQ(stats.breaks, 0u);
    EXPECT_TRUE(WellFormed(raw));
    EXPECT_TRUE(PointsValid(raw, d));
    EXPECT_TRUE(MonotonicT(raw));

    auto lines = assemble(raw);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_DOUBLE_EQ(lines.front().front().x, -2.0);
    EXPECT_DOUBLE_EQ(lines.front().front().y, 4.0);
    EXPECT_DOUBLE_EQ(lines.front().back().x, 2.0);
    EXPECT_DOUBLE_EQ(lines.front().back().y, 4.0);
}

TEST_F(DenseSamplerTest, ReciprocalSplitsAtZero) {
    Domain d{-1.0, 1.0};
    Curve c = make_explicit_curve([](double x) { return 1.0 / x; });

    RawSequence raw = sample_dense(c, d, config);
    EXPECT_TRUE(WellFormed(raw));
    EXPECT_TRUE(PointsValid(raw, d));

    auto lines = assemble(raw);
    ASSERT_EQ(lines.size(), 2u);
    for (const auto& p : lines[0]) EXPECT_LT(p.x, 0.0);
    for (const auto& p : lines[1]) EXPECT_GT(p.x, 0.0);
}

TEST_F(DenseSamplerTest, ZeroEpsilonKeepsFunctionAwayFromZero) {
    Domain d{-1.0, 1.0};
    config.zero_epsilon = 1e-10;
    std::vector<double> args;
    Curve c = make_explicit_curve([&args](double x) { args.push_back(x); return 1.0 / x; });

    RawSequence raw = sample_dense(c, d, config);
    for (double a : args) EXPECT_GE(std::abs(a), 1e-10);
    EXPECT_EQ(assemble(raw).size(), 2u);
}

TEST_F(DenseSamplerTest, RpnCurveUsesBatchPathWithSameResult) {
    Domain d{-3.0, 3.0};
    Curve batch = make_rpn_explicit_curve(Parser::compile_infix_to_rpn("sin(3*x) * x").bytecode);
    Curve scalar = make_explicit_curve([](double x) { return std::sin(3 * x) * x; });
    ASSERT_TRUE(static_cast<bool>(batch.batch_fx));

    RawSequence a = sample_dense(batch, d, config);
    RawSequence b = sample_dense(scalar, d, config);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        ASSERT_FALSE(is_break(a[i]));
        EXPECT_NEAR(as_point(a[i]).x, as_point(b[i]).x, 1e-12);
        EXPECT_NEAR(as_point(a[i]).y, as_point(b[i]).y, 1e-9);
    }
    EXPECT_DOUBLE_EQ(as_point(a.back()).x, 3.0);
}

TEST_F(DenseSamplerTest, RpnReciprocalBreaksOnBatchPath) {
    Domain d{-1.0, 1.0};
    Curve c = make_rpn_explicit_curve(Parser::compile_infix_to_rpn("1/x").bytecode);

    RawSequence raw = sample_dense(c, d, config);
    EXPECT_TRUE(WellFormed(raw));
    EXPECT_TRUE(PointsValid(raw, d));
    EXPECT_EQ(assemble(raw).size(), 2u);
}

TEST_F(DenseSamplerTest, StepFunctionJumpIsBroken) {
    Domain d{-1.0, 1.0};
    config.sample_count = 201;   // 网格不落在 0 上
    Curve c = make_explicit_curve([](double x) { return x < 0 ? -5.0 : 5.0; });

    RawSequence raw = sample_dense(c, d, config);
    auto lines = assemble(raw);
    ASSERT_EQ(lines.size(), 2u);
    for (const auto& p : lines[0]) EXPECT_DOUBLE_EQ(p.y, -5.0);
    for (const auto& p : lines[1]) EXPECT_DOUBLE_EQ(p.y, 5.0);
}

TEST_F(DenseSamplerTest, SteepContinuousSegmentStaysConnected) {
    // 相邻样本差值超过绝对阈值，但二分后差值回落：不是间断
    Domain d{0.0, 1.0};
    config.sample_count = 10;
    config.jump_relative = 0.0;
    Curve c = make_explicit_curve([](double x) { return 100.0 * x; });

    auto lines = assemble(sample_dense(c, d, config));
    EXPECT_EQ(lines.size(), 1u);
}

TEST_F(DenseSamplerTest, PointCeilingTruncates) {
    Domain d{0.0, 10.0};
    config.sample_count = 1000;
    config.point_ceiling = 100;
    Curve c = make_explicit_curve([](double x) { return std::sin(x); });
    SampleStats stats;

    RawSequence raw = sample_dense(c, d, config, &stats);
    EXPECT_EQ(count_points(raw), 100u);
    EXPECT_TRUE(stats.point_ceiling_hit);
    EXPECT_TRUE(stats.degraded());
}

TEST_F(DenseSamplerTest, ThrowingFunctionProducesBreaks) {
    Domain d{0.0, 1.0};
    config.sample_count = 100;
    Curve c = make_explicit_curve([](double x) -> double {
        if (x > 0.3 && x < 0.6) throw std::domain_error("undefined");
        return x;
    });

    RawSequence raw = sample_dense(c, d, config);
    EXPECT_TRUE(WellFormed(raw));
    EXPECT_EQ(assemble(raw).size(), 2u);
}

TEST_F(DenseSamplerTest, AlwaysInvalidGivesEmptySequence) {
    Domain d{0.0, 1.0};
    Curve c = make_explicit_curve([](double) { return std::numeric_limits<double>::quiet_NaN(); });
    EXPECT_TRUE(sample_dense(c, d, config).empty());
}

TEST_F(DenseSamplerTest, InvalidDomainOrConfigThrows) {
    Curve c = make_explicit_curve([](double x) { return x; });
    EXPECT_THROW(sample_dense(c, Domain{1.0, 1.0}, config), std::runtime_error);
    EXPECT_THROW(sample_dense(c, Domain{2.0, 1.0}, config), std::runtime_error);
    EXPECT_THROW(sample_dense(c, Domain{0.0, std::numeric_limits<double>::infinity()}, config), std::runtime_error);

    config.sample_count = 0;
    EXPECT_THROW(sample_dense(c, Domain{0.0, 1.0}, config), std::runtime_error);
}

TEST_F(DenseSamplerTest, ParametricCircle) {
    Domain d{0.0, 2.0 * M_PI};
    Curve c = make_parametric_curve([](double t) { return std::cos(t); },
                                    [](double t) { return std::sin(t); });
    RawSequence raw = sample_dense(c, d, config);
    ASSERT_EQ(raw.size(), 201u);
    for (const auto& e : raw) {
        const auto& p = as_point(e);
        EXPECT_NEAR(std::hypot(p.x, p.y), 1.0, 1e-12);
    }
}
