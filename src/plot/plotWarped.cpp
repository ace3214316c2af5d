// --- 文件路径: src/plot/plotWarped.cpp ---
#include "pch.h"
#include "noteplot/plot/plotWarped.h"
#include "noteplot/plot/plotSequence.h"
#include "noteplot/functions/guard.h"

namespace NotePlot {

namespace {
    constexpr double TANH_FLATNESS = 0.95;
    constexpr double TANH_SHARPNESS = 6.0;

    struct WarpedSample {
        double t;
        std::optional<SamplePoint> point;
    };
}

double warp_parameter(double u, WarpKind kind) {
    u = std::clamp(u, -1.0, 1.0);
    switch (kind) {
        case WarpKind::Cubic:
            return u * u * u;
        case WarpKind::Tanh: {
            const double norm = 1.0 - TANH_FLATNESS * std::tanh(TANH_SHARPNESS) / TANH_SHARPNESS;
            return (u - TANH_FLATNESS * std::tanh(TANH_SHARPNESS * u) / TANH_SHARPNESS) / norm;
        }
    }
    return u;
}

RawSequence sample_warped(const Curve& curve, const Domain& domain, const SamplingConfig& config,
                          SampleStats* stats) {
    resolve_config(config, domain);
    if (!std::isfinite(config.center)) throw std::runtime_error("Invalid config: center must be finite");

    const GuardLimits limits = guard_limits(config);
    const int n = config.sample_count;
    const double center = std::clamp(config.center, domain.min, domain.max);
    const double left = center - domain.min;
    const double right = domain.max - center;

    // 1. 扭曲 + 求值 (无效点也保留，排序后仍需在其位置断开)
    std::vector<WarpedSample> samples;
    samples.reserve(static_cast<size_t>(n) + 1);
    for (int i = 0; i <= n; ++i) {
        double u = -1.0 + 2.0 * static_cast<double>(i) / n;
        double w = warp_parameter(u, config.warp);
        double t = w < 0.0 ? center + w * left : center + w * right;
        t = std::clamp(t, domain.min, domain.max);
        samples.push_back({t, evaluate_guarded(curve, t, limits, stats)});
    }

    // 2. 按自变量排序并去掉重复位置
    std::stable_sort(samples.begin(), samples.end(),
                     [](const WarpedSample& a, const WarpedSample& b) { return a.t < b.t; });
    samples.erase(std::unique(samples.begin(), samples.end(),
                              [](const WarpedSample& a, const WarpedSample& b) { return a.t == b.t; }),
                  samples.end());

    // 3. 按排序后的相邻关系重新插入断点
    SequenceBuilder out(static_cast<size_t>(config.point_ceiling), stats);
    std::optional<SamplePoint> prev;
    for (const auto& s : samples) {
        if (!s.point) {
            out.push_break();
            prev.reset();
            continue;
        }
        if (prev && is_discontinuity(curve, *prev, *s.point, config, limits, stats)) {
            out.push_break();
        }
        if (!out.push_point(*s.point) || out.full()) break;
        prev = s.point;
    }
    return out.finish();
}

} // namespace NotePlot
