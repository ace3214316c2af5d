// --- 文件路径: include/noteplot/plot/plotCall.h ---
#ifndef NOTEPLOT_PLOT_CALL_H
#define NOTEPLOT_PLOT_CALL_H

#include "pch.h"
#include "noteplot/plot/plotTypes.h"
#include "noteplot/plot/plotCurve.h"
#include <vector>
#include <string>

namespace NotePlot {

/**
 * @brief 单次采样入口：按 config.strategy 分派到 dense / warped / adaptive。
 *
 * 单线程、同步、无 I/O。数值问题 (奇点/间断/振荡) 以断点表示，从不抛出；
 * 只有定义域或配置违反约束时抛出 std::runtime_error。
 */
RawSequence sample(const Curve& curve, const Domain& domain, const SamplingConfig& config,
                   SampleStats* stats = nullptr);

// 一个待绘制对象
struct PlotRequest {
    std::string name;
    Curve curve;
    Domain domain;
    SamplingConfig config;
};

struct PlotResult {
    std::string name;
    RawSequence raw;
    std::vector<Polyline> polylines;
    SampleStats stats;
    std::string error;   // 非空表示该请求被拒绝 (配置非法)，其余请求不受影响

    bool ok() const { return error.empty(); }
};

/**
 * @brief 批量渲染调度入口
 *
 * 各请求之间互不共享状态，使用 TBB parallel_for_each 并行执行，
 * 结果经由 concurrent_bounded_queue 回收并按请求顺序返回。
 * 单个请求内部仍然是单线程采样。
 *
 * @param requests 待绘制对象
 * @param verbose 为 true 时逐个输出 [Batch] 摘要
 */
std::vector<PlotResult> sample_batch(const std::vector<PlotRequest>& requests, bool verbose = false);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_CALL_H
