// --- 文件路径: include/noteplot/plot/plotAdaptive.h ---

#ifndef NOTEPLOT_PLOT_ADAPTIVE_H
#define NOTEPLOT_PLOT_ADAPTIVE_H

#include "pch.h"
#include "noteplot/plot/plotTypes.h"
#include "noteplot/plot/plotCurve.h"

namespace NotePlot {

/**
 * @brief 三点弦误差：中点到两端点连线中点的距离。
 *
 * 显函数下等于 |y_mid - (y_curr + y_next)/2|，
 * 即 (h/4)·|slope(mid→next) - slope(curr→mid)|，二阶差分意义下的曲率估计。
 * relative_error 打开时与相对误差取大：abs / max(局部幅值, tolerance)。
 * 相对项的分母以 tolerance 为下限，零点附近不会无限放大。
 */
double chordal_error(const SamplePoint& curr, const SamplePoint& mid, const SamplePoint& next,
                     CurveMode mode, const SamplingConfig& config);

/**
 * @brief 曲率自适应采样
 *
 * 从左到右单遍推进，步长 h 按局部弦误差调整：
 * - 端点无效: 插入断点，跨过该点继续 (不原地重试)
 * - 从无效恢复: 直接接受
 * - 中点无效: 插入断点，接受端点
 * - 误差 > tolerance 且 h > min_step 且细分次数未满: h 减半重试
 * - 否则接受，输出中点与端点；误差 < tolerance/10 时 h *= growth_factor
 * - 细分耗尽仍超差且端点构成跳变: 以断点代替连线
 *
 * 终止条件: 到达 domain.max / 点数达到 point_ceiling (此时恰好输出 point_ceiling 个点)
 *          / 迭代次数达到 max_iterations / 超出 time_budget_ms。
 */
RawSequence sample_adaptive(const Curve& curve, const Domain& domain, const SamplingConfig& config,
                            SampleStats* stats = nullptr);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_ADAPTIVE_H
