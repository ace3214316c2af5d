#include <gtest/gtest.h>
#include "noteplot/plot/plotWarped.h"
#include "noteplot/plot/plotAssemble.h"
#include "test_helpers.h"

using namespace NotePlot;
using namespace NotePlot::Testing;

class WarpedSamplerTest : public ::testing::Test {
protected:
    SamplingConfig config;
    Domain domain{-1.0, 1.0};
    Curve identity = make_explicit_curve([](double x) { return x; });

    void SetUp() override {
        config.strategy = SamplingStrategy::Warped;
        config.sample_count = 200;
        config.center = 0.0;
    }

    static size_t count_in(const RawSequence& raw, double lo, double hi) {
        size_t n = 0;
        for (const auto& e : raw) {
            if (is_break(e)) continue;
            double t = as_point(e).t;
            if (t >= lo && t <= hi) ++n;
        }
        return n;
    }
};

TEST_F(WarpedSamplerTest, WarpFunctionsFixEndpointsAndCenter) {
    for (WarpKind k : {WarpKind::Cubic, WarpKind::Tanh}) {
        EXPECT_DOUBLE_EQ(warp_parameter(-1.0, k), -1.0);
        EXPECT_DOUBLE_EQ(warp_parameter(0.0, k), 0.0);
        EXPECT_DOUBLE_EQ(warp_parameter(1.0, k), 1.0);
        // 单调
        double prev = -1.0;
        for (int i = 1; i <= 100; ++i) {
            double w = warp_parameter(-1.0 + 0.02 * i, k);
            EXPECT_GT(w, prev);
            prev = w;
        }
    }
}

TEST_F(WarpedSamplerTest, CubicWarpConcentratesNearCenter) {
    config.warp = WarpKind::Cubic;
    RawSequence raw = sample_warped(identity, domain, config);

    size_t near = count_in(raw, -0.1, 0.1);
    size_t edge = count_in(raw, 0.8, 1.0);
    EXPECT_GT(near, 5 * edge) << "near=" << near << " edge=" << edge;
    EXPECT_TRUE(MonotonicT(raw));
    EXPECT_TRUE(PointsValid(raw, domain));
}

TEST_F(WarpedSamplerTest, TanhWarpConcentratesNearCenter) {
    config.warp = WarpKind::Tanh;
    RawSequence raw = sample_warped(identity, domain, config);

    size_t near = count_in(raw, -0.1, 0.1);
    size_t edge = count_in(raw, 0.8, 1.0);
    EXPECT_GT(near, 2 * edge) << "near=" << near << " edge=" << edge;
    EXPECT_TRUE(MonotonicT(raw));
}

TEST_F(WarpedSamplerTest, InfiniteOscillationNearCenterGetsDensestSampling) {
    // sin(pi/x) 在 0 附近无限振荡：等宽窗口内，中心的点数至少是两端的 5 倍
    Domain d{-0.5, 0.5};
    config.warp = WarpKind::Cubic;
    Curve c = make_explicit_curve([](double x) { return std::sin(M_PI / x); });

    RawSequence raw = sample_warped(c, d, config);
    EXPECT_TRUE(WellFormed(raw));
    EXPECT_TRUE(PointsValid(raw, d));
    EXPECT_TRUE(MonotonicT(raw));

    size_t near = count_in(raw, -0.05, 0.05);
    size_t edge = count_in(raw, -0.5, -0.45) + count_in(raw, 0.45, 0.5);
    ASSERT_GT(edge, 0u);
    EXPECT_GE(near, 5 * edge) << "near=" << near << " edge=" << edge;
}

TEST_F(WarpedSamplerTest, CoversWholeDomain) {
    RawSequence raw = sample_warped(identity, domain, config);
    ASSERT_FALSE(raw.empty());
    EXPECT_DOUBLE_EQ(as_point(raw.front()).t, -1.0);
    EXPECT_DOUBLE_EQ(as_point(raw.back()).t, 1.0);
}

TEST_F(WarpedSamplerTest, CenterOutsideDomainIsClamped) {
    config.center = 5.0;
    RawSequence raw = sample_warped(identity, domain, config);
    EXPECT_TRUE(WellFormed(raw));
    EXPECT_TRUE(PointsValid(raw, domain));
    EXPECT_TRUE(MonotonicT(raw));
    EXPECT_GT(count_in(raw, 0.9, 1.0), count_in(raw, -1.0, -0.9));
}

TEST_F(WarpedSamplerTest, SingularityAtCenterIsBroken) {
    Curve recip = make_explicit_curve([](double x) { return 1.0 / x; });
    RawSequence raw = sample_warped(recip, domain, config);

    EXPECT_TRUE(WellFormed(raw));
    EXPECT_TRUE(PointsValid(raw, domain));
    auto lines = assemble(raw);
    ASSERT_GE(lines.size(), 2u);
    for (const auto& line : lines) {
        bool neg = line.front().x < 0;
        for (const auto& p : line) EXPECT_EQ(p.x < 0, neg) << "polyline crosses the pole";
    }
}

TEST_F(WarpedSamplerTest, NonFiniteCenterThrows) {
    config.center = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(sample_warped(identity, domain, config), std::runtime_error);
}

TEST_F(WarpedSamplerTest, PointCeilingRespected) {
    config.point_ceiling = 50;
    SampleStats stats;
    RawSequence raw = sample_warped(identity, domain, config, &stats);
    EXPECT_EQ(count_points(raw), 50u);
    EXPECT_TRUE(stats.point_ceiling_hit);
}
