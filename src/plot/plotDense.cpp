// --- 文件路径: src/plot/plotDense.cpp ---
#include "pch.h"
#include "noteplot/plot/plotDense.h"
#include "noteplot/plot/plotSequence.h"
#include "noteplot/functions/functions.h"
#include "noteplot/functions/guard.h"

namespace NotePlot {

namespace {
    // 顺序扫描状态：上一个有效点 + 输出缓冲
    struct DenseScan {
        const Curve& curve;
        const SamplingConfig& config;
        const GuardLimits& limits;
        SampleStats* stats;
        SequenceBuilder& out;
        std::optional<SamplePoint> prev;

        // 返回 false 表示达到点数上限，应停止
        bool feed(const std::optional<SamplePoint>& p) {
            if (!p) {
                out.push_break();
                prev.reset();
                return true;
            }
            if (prev && is_discontinuity(curve, *prev, *p, config, limits, stats)) {
                out.push_break();
            }
            if (!out.push_point(*p)) return false;
            prev = p;
            return !out.full();
        }
    };

    // 第 i 个网格点。最后一个点直接取 max，避免累积误差越界
    NOTEPLOT_FORCE_INLINE double grid_at(const Domain& d, double step, int i, int n) {
        return i == n ? d.max : d.min + i * step;
    }
}

RawSequence sample_dense(const Curve& curve, const Domain& domain, const SamplingConfig& config,
                         SampleStats* stats) {
    resolve_config(config, domain);
    const GuardLimits limits = guard_limits(config);
    const int n = config.sample_count;
    const double step = domain.width() / n;

    SequenceBuilder out(static_cast<size_t>(config.point_ceiling), stats);
    DenseScan scan{curve, config, limits, stats, out, std::nullopt};

    const int total = n + 1;
    int i = 0;

    // --- SIMD 路径：仅显函数 + 批量求值器 ---
    if (curve.mode == CurveMode::Explicit && curve.batch_fx) {
        constexpr int batch_size = static_cast<int>(batch_type::size);
        const batch_type v_step(step);
        const batch_type v_min(domain.min);
        const batch_type v_index = get_index_vec();

        alignas(batch_type::arch_type::alignment()) std::array<double, batch_type::size> buf_x{};
        alignas(batch_type::arch_type::alignment()) std::array<double, batch_type::size> buf_y{};
        alignas(batch_type::arch_type::alignment()) std::array<double, batch_type::size> buf_ok{};

        // 终点留给标量尾部，保证精确落在 domain.max
        bool stopped = false;
        for (; i + batch_size <= n && !stopped; i += batch_size) {
            batch_type x_batch = v_min + (batch_type(static_cast<double>(i)) + v_index) * v_step;
            batch_type y_batch;
            try {
                y_batch = curve.batch_fx(x_batch);
            } catch (const std::exception&) {
                break; // 批量求值器失败时整段退回标量守卫路径
            }
            auto ok = is_plottable_batch(y_batch, limits.value_ceiling) &
                      ~near_zero_batch(x_batch, limits.zero_epsilon);

            x_batch.store_aligned(buf_x.data());
            y_batch.store_aligned(buf_y.data());
            xs::select(ok, batch_type(1.0), batch_type(0.0)).store_aligned(buf_ok.data());
            if (stats) stats->evaluations += batch_size;

            for (int k = 0; k < batch_size; ++k) {
                std::optional<SamplePoint> p;
                if (buf_ok[k] != 0.0) p = SamplePoint{buf_x[k], buf_x[k], buf_y[k]};
                if (!scan.feed(p)) { stopped = true; break; }
            }
        }
        if (stopped) return out.finish();
    }

    // --- 标量路径 (含 SIMD 尾部) ---
    for (; i < total; ++i) {
        double t = grid_at(domain, step, i, n);
        if (!scan.feed(evaluate_guarded(curve, t, limits, stats))) break;
    }
    return out.finish();
}

} // namespace NotePlot
