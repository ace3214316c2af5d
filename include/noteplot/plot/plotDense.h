// --- 文件路径: include/noteplot/plot/plotDense.h ---

#ifndef NOTEPLOT_PLOT_DENSE_H
#define NOTEPLOT_PLOT_DENSE_H

#include "pch.h"
#include "noteplot/plot/plotTypes.h"
#include "noteplot/plot/plotCurve.h"

namespace NotePlot {

/**
 * @brief 均匀网格采样 (基准策略)
 *
 * 核心逻辑:
 * 1. 在定义域上均匀取 sample_count + 1 个点，终点精确落在 domain.max。
 * 2. 无效点插入断点后继续扫描，连续无效只产生一个断点。
 * 3. 相邻有效点跳变超过阈值且中点探测确认时插入断点。
 * 4. 显函数且带 batch_fx 时走 XSIMD 批量求值，每个通道单独分类。
 *
 * @param curve 被采样曲线
 * @param domain 自变量区间
 * @param config 采样参数 (使用 sample_count / point_ceiling / 跳变与守卫阈值)
 * @param stats [可选输出] 诊断信息
 * @return 原始采样序列
 */
RawSequence sample_dense(const Curve& curve, const Domain& domain, const SamplingConfig& config,
                         SampleStats* stats = nullptr);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_DENSE_H
