// --- 文件路径: include/noteplot/plot/plotWarped.h ---

#ifndef NOTEPLOT_PLOT_WARPED_H
#define NOTEPLOT_PLOT_WARPED_H

#include "pch.h"
#include "noteplot/plot/plotTypes.h"
#include "noteplot/plot/plotCurve.h"

namespace NotePlot {

/**
 * @brief 把 u ∈ [-1, 1] 映射到 w ∈ [-1, 1]，奇函数、单调、在 0 附近平坦。
 *
 * Cubic: w = u³
 * Tanh:  w = (u - s·tanh(k·u)/k) / (1 - s·tanh(k)/k)，s = 0.95, k = 6
 */
double warp_parameter(double u, WarpKind kind);

/**
 * @brief 密度扭曲采样：把采样点集中到 config.center 附近
 *
 * 适用于在某一点附近无限振荡的函数 (典型: sin(π/x) 在 0 附近)。
 *
 * 流程: 均匀 u -> 扭曲 -> 映射到中心两侧 -> 钳制到定义域 -> 求值
 *       -> 按 t 排序去重 -> 按排序后的相邻关系重新检测断点。
 * 排序后才检测断点：扭曲顺序下的相邻点不代表排序后的相邻点。
 *
 * center 落在定义域外时被钳制到最近的端点。
 */
RawSequence sample_warped(const Curve& curve, const Domain& domain, const SamplingConfig& config,
                          SampleStats* stats = nullptr);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_WARPED_H
