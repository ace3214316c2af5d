// --- 文件路径: src/functions/guard.cpp ---
#include "pch.h"
#include "noteplot/functions/guard.h"
#include "noteplot/functions/functions.h"

namespace NotePlot {

GuardLimits guard_limits(const SamplingConfig& config) {
    return {config.zero_epsilon, config.value_ceiling};
}

std::optional<double> guarded_call(const ScalarFn& f, double input, const GuardLimits& limits) {
    if (!std::isfinite(input) || std::abs(input) < limits.zero_epsilon) return std::nullopt;

    double v = 0.0;
    try {
        v = f(input);
    } catch (const std::exception&) {
        // 用户函数在此处未定义 (例如对负数开方时主动抛出)
        return std::nullopt;
    }
    if (!is_plottable(v, limits.value_ceiling)) return std::nullopt;
    return v;
}

std::optional<SamplePoint> evaluate_guarded(const Curve& curve, double t, const GuardLimits& limits,
                                            SampleStats* stats) {
    if (stats) stats->evaluations++;

    switch (curve.mode) {
        case CurveMode::Explicit: {
            auto y = guarded_call(curve.fx, t, limits);
            if (!y) return std::nullopt;
            return SamplePoint{t, t, *y};
        }
        case CurveMode::Parametric: {
            auto x = guarded_call(curve.fx, t, limits);
            if (!x) return std::nullopt;
            auto y = guarded_call(curve.fy, t, limits);
            if (!y) return std::nullopt;
            return SamplePoint{t, *x, *y};
        }
        case CurveMode::Polar: {
            auto r = guarded_call(curve.fx, t, limits);
            if (!r) return std::nullopt;
            double x = *r * std::cos(t);
            double y = *r * std::sin(t);
            if (!is_plottable(x, limits.value_ceiling) || !is_plottable(y, limits.value_ceiling)) return std::nullopt;
            return SamplePoint{t, x, y};
        }
    }
    return std::nullopt;
}

} // namespace NotePlot
