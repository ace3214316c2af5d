// --- 文件路径: include/noteplot/plot/plotTypes.h ---

#ifndef NOTEPLOT_PLOT_TYPES_H
#define NOTEPLOT_PLOT_TYPES_H

#include "pch.h"

namespace NotePlot {

// =========================================================
// 1. 采样点与断点标记
// =========================================================

// 一个有效采样点。t 为自变量 (显函数模式下 t == x)，(x, y) 为绘图坐标。
struct SamplePoint {
    double t;
    double x;
    double y;
};

// 断点标记：渲染器不得跨越它连线
struct BreakMarker {};

using RawEntry = std::variant<SamplePoint, BreakMarker>;
using RawSequence = std::vector<RawEntry>;
using Polyline = std::vector<SamplePoint>;

inline bool is_break(const RawEntry& e) { return std::holds_alternative<BreakMarker>(e); }
inline const SamplePoint& as_point(const RawEntry& e) { return std::get<SamplePoint>(e); }

// 统计 RawSequence 中的有效点数量 (不含断点)
size_t count_points(const RawSequence& seq);

// =========================================================
// 2. 定义域
// =========================================================
struct Domain {
    double min = 0.0;
    double max = 1.0;

    double width() const { return max - min; }
    bool contains(double v) const { return v >= min && v <= max; }

    /**
     * @brief 检查 min < max 且两端均有限。
     * @throws std::runtime_error 定义域非法时抛出。
     */
    void validate() const;
};

// =========================================================
// 3. 采样配置
// =========================================================
enum class SamplingStrategy { Dense, Warped, Adaptive };
enum class WarpKind { Cubic, Tanh };

/**
 * @brief 采样参数包。所有字段都有默认值。
 *
 * min_step / max_step 为 0 表示根据定义域宽度自动推导
 * (min_step = width * 1e-5, max_step = width / 20)。
 */
struct SamplingConfig {
    SamplingStrategy strategy = SamplingStrategy::Adaptive;

    int sample_count = 200;
    double min_step = 0.0;
    double max_step = 0.0;
    double tolerance = 0.01;
    bool relative_error = true;
    int max_refinement = 8;
    int point_ceiling = 5000;
    int max_iterations = 100000;
    double growth_factor = 1.5;

    // 仅 Warped 模式使用
    double center = 0.0;
    WarpKind warp = WarpKind::Cubic;

    // 跳变判定: |Δ| > max(jump_threshold, jump_relative * max(|a|, |b|))
    double jump_threshold = 2.0;
    double jump_relative = 1.0;

    // 求值守卫
    double zero_epsilon = 0.0;
    double value_ceiling = 1e6;

    // 可选的墙钟预算 (毫秒)，0 表示不限制
    double time_budget_ms = 0.0;
};

// 推导后的步长范围
struct StepBounds {
    double min_step;
    double max_step;
};

/**
 * @brief 校验配置并推导自动步长。
 * @throws std::runtime_error 配置违反约束时抛出。
 */
StepBounds resolve_config(const SamplingConfig& config, const Domain& domain);

// =========================================================
// 4. 诊断信息 (可选输出)
// =========================================================
struct SampleStats {
    size_t evaluations = 0;
    size_t iterations = 0;
    size_t forced_accepts = 0;   // 细分次数耗尽后强制接受的步
    size_t breaks = 0;
    bool point_ceiling_hit = false;
    bool iteration_limit_hit = false;
    bool time_budget_hit = false;

    bool degraded() const {
        return forced_accepts > 0 || point_ceiling_hit || iteration_limit_hit || time_budget_hit;
    }
};

const char* strategy_name(SamplingStrategy s);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_TYPES_H
