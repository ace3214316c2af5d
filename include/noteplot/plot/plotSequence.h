// --- 文件路径: include/noteplot/plot/plotSequence.h ---

#ifndef NOTEPLOT_PLOT_SEQUENCE_H
#define NOTEPLOT_PLOT_SEQUENCE_H

#include "pch.h"
#include "noteplot/plot/plotTypes.h"
#include "noteplot/plot/plotCurve.h"
#include "noteplot/functions/guard.h"

namespace NotePlot {

/**
 * @brief 所有采样器共用的输出缓冲。
 *
 * 维护 RawSequence 的不变量：
 * - 不以断点开头 (没有点时 push_break 被忽略)
 * - 不出现连续断点
 * - finish() 去掉结尾断点
 * - 有效点数不超过 point_ceiling
 */
class SequenceBuilder {
public:
    SequenceBuilder(size_t point_ceiling, SampleStats* stats);

    // 达到上限时返回 false 且不写入
    bool push_point(const SamplePoint& p);
    void push_break();

    bool full() const { return m_points >= m_ceiling; }
    size_t point_count() const { return m_points; }
    bool empty() const { return m_out.empty(); }
    bool last_is_break() const { return !m_out.empty() && is_break(m_out.back()); }

    RawSequence finish();

private:
    RawSequence m_out;
    size_t m_ceiling;
    size_t m_points = 0;
    SampleStats* m_stats;
};

// 仅比较阈值: |Δ| > max(jump_threshold, jump_relative * max(|a|, |b|))
constexpr int JUMP_PROBE_DEPTH = 8;

bool exceeds_jump(const SamplePoint& a, const SamplePoint& b, CurveMode mode, const SamplingConfig& config);

/**
 * @brief 判断相邻两个有效点之间是否为间断。
 *
 * 先做阈值判断；超过阈值后二分探测 (最多 JUMP_PROBE_DEPTH 层)，每层取差值较大的一半：
 * - 中点无效，或落在两端点的包围范围之外 (极点两侧的典型形态)：间断
 * - 某一层的差值回落到阈值以内：陡峭但连续，不断开
 * - 探测层数耗尽仍超过阈值 (阶跃)：间断
 */
bool is_discontinuity(const Curve& curve, const SamplePoint& a, const SamplePoint& b,
                      const SamplingConfig& config, const GuardLimits& limits, SampleStats* stats);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_SEQUENCE_H
