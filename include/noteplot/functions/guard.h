// --- 文件路径: include/noteplot/functions/guard.h ---

#ifndef NOTEPLOT_GUARD_H
#define NOTEPLOT_GUARD_H

#include "pch.h"
#include "noteplot/plot/plotTypes.h"
#include "noteplot/plot/plotCurve.h"

namespace NotePlot {

/**
 * @brief 求值守卫的两个阈值。
 *
 * zero_epsilon:  |输入| 小于它时不调用函数，直接视为无效 (0 表示关闭)
 * value_ceiling: |结果| 大于它视为无效 (屏幕外的发散值)
 */
struct GuardLimits {
    double zero_epsilon = 0.0;
    double value_ceiling = 1e6;
};

GuardLimits guard_limits(const SamplingConfig& config);

/**
 * @brief 安全调用一次用户函数。
 *
 * 无效 (std::nullopt) 的情况：
 * - 输入过于接近 0
 * - 结果为 NaN / ±Inf / 超出 value_ceiling
 * - 函数抛出 std::exception
 *
 * 无效是正常结果，从不向外抛异常。
 */
std::optional<double> guarded_call(const ScalarFn& f, double input, const GuardLimits& limits);

/**
 * @brief 在参数 t 处对曲线求值，返回绘图坐标。
 *
 * 参数方程与极坐标的每个分量都会经过守卫；极坐标在此处合成 (r·cos θ, r·sin θ)。
 * stats 非空时累加 evaluations。
 */
std::optional<SamplePoint> evaluate_guarded(const Curve& curve, double t, const GuardLimits& limits,
                                            SampleStats* stats = nullptr);

} // namespace NotePlot

#endif //NOTEPLOT_GUARD_H
