// --- 文件路径: include/noteplot/plot/plotAssemble.h ---

#ifndef NOTEPLOT_PLOT_ASSEMBLE_H
#define NOTEPLOT_PLOT_ASSEMBLE_H

#include "pch.h"
#include "noteplot/plot/plotTypes.h"

namespace NotePlot {

/**
 * @brief 把原始采样序列切分成最少数量的连续折线。
 *
 * 单遍扫描：连续断点合并为一个，开头/结尾的断点被忽略，
 * 每段最长的连续有效点组成一条折线。
 * 长度为 1 的折线原样保留，由渲染器决定画成孤立点还是丢弃。
 */
std::vector<Polyline> assemble(const RawSequence& raw);

// 规范化原始序列：去掉首尾断点并合并连续断点
RawSequence normalize_breaks(const RawSequence& raw);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_ASSEMBLE_H
