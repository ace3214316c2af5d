// --- 文件路径: src/plot/plotAdaptive.cpp ---
#include "pch.h"
#include "noteplot/plot/plotAdaptive.h"
#include "noteplot/plot/plotSequence.h"
#include "noteplot/functions/guard.h"

namespace NotePlot {

namespace {
    constexpr double GROW_BELOW = 0.1;        // 误差低于 tolerance 的这个比例才放大步长
    constexpr size_t WATCHDOG_INTERVAL = 64;  // 每多少次迭代检查一次墙钟

    double magnitude(const SamplePoint& p, CurveMode mode) {
        return mode == CurveMode::Explicit ? std::abs(p.y) : std::hypot(p.x, p.y);
    }
}

double chordal_error(const SamplePoint& curr, const SamplePoint& mid, const SamplePoint& next,
                     CurveMode mode, const SamplingConfig& config) {
    double abs_err;
    if (mode == CurveMode::Explicit) {
        abs_err = std::abs(mid.y - 0.5 * (curr.y + next.y));
    } else {
        abs_err = std::hypot(mid.x - 0.5 * (curr.x + next.x), mid.y - 0.5 * (curr.y + next.y));
    }
    if (!config.relative_error) return abs_err;

    double scale = std::max({magnitude(curr, mode), magnitude(mid, mode), magnitude(next, mode)});
    double rel_err = abs_err / std::max(scale, config.tolerance);
    return std::max(abs_err, rel_err);
}

RawSequence sample_adaptive(const Curve& curve, const Domain& domain, const SamplingConfig& config,
                            SampleStats* stats) {
    const StepBounds bounds = resolve_config(config, domain);
    const GuardLimits limits = guard_limits(config);

    SampleStats local_stats;
    SampleStats& st = stats ? *stats : local_stats;

    SequenceBuilder out(static_cast<size_t>(config.point_ceiling), &st);

    const auto start_time = std::chrono::steady_clock::now();
    const bool has_budget = config.time_budget_ms > 0.0;

    double h = std::clamp(domain.width() / config.sample_count, bounds.min_step, bounds.max_step);
    double x = domain.min;
    std::optional<SamplePoint> curr = evaluate_guarded(curve, x, limits, &st);
    if (curr) out.push_point(*curr);

    int refinements = 0;

    while (x < domain.max) {
        if (out.full()) break;
        if (st.iterations >= static_cast<size_t>(config.max_iterations)) {
            st.iteration_limit_hit = true;
            break;
        }
        st.iterations++;

        // 看门狗：定期检查墙钟预算
        if (has_budget && st.iterations % WATCHDOG_INTERVAL == 0) {
            std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_time;
            if (elapsed.count() > config.time_budget_ms) {
                st.time_budget_hit = true;
                break;
            }
        }

        // 1. 步长钳制 + 末端截断 (剩余不足半个最小步时直接并入本步)
        h = std::clamp(h, bounds.min_step, bounds.max_step);
        double x_next = x + h;
        if (x_next >= domain.max || domain.max - x_next < 0.5 * bounds.min_step) x_next = domain.max;
        if (x_next <= x) x_next = std::nextafter(x, domain.max);
        const double step = x_next - x;

        std::optional<SamplePoint> next = evaluate_guarded(curve, x_next, limits, &st);

        // 2. 端点无效：先缩小步长逼近奇点，预算用完再断开并跨过
        if (!next) {
            if (curr && h > bounds.min_step && refinements < config.max_refinement) {
                h *= 0.5;
                refinements++;
                continue;
            }
            out.push_break();
            x = x_next;
            curr.reset();
            refinements = 0;
            continue;
        }

        // 3. 从奇点恢复：直接接受
        if (!curr) {
            out.push_point(*next);
            x = x_next;
            curr = next;
            refinements = 0;
            continue;
        }

        // 4. 中点探测
        std::optional<SamplePoint> mid = evaluate_guarded(curve, x + 0.5 * step, limits, &st);
        if (!mid) {
            // 可去奇点恰好落在中点时，换个步长就能绕开
            if (h > bounds.min_step && refinements < config.max_refinement) {
                h *= 0.5;
                refinements++;
                continue;
            }
            out.push_break();
            out.push_point(*next);
            x = x_next;
            curr = next;
            refinements = 0;
            continue;
        }

        const double err = chordal_error(*curr, *mid, *next, curve.mode, config);

        // 5. 超差则缩小步长，从同一个 x 重试
        if (err > config.tolerance && h > bounds.min_step && refinements < config.max_refinement) {
            h *= 0.5;
            refinements++;
            continue;
        }

        // 6. 接受 (误差恰好等于 tolerance 也接受)
        if (err > config.tolerance) {
            st.forced_accepts++;
            if (is_discontinuity(curve, *curr, *next, config, limits, &st)) {
                out.push_break();
                out.push_point(*next);
                x = x_next;
                curr = next;
                refinements = 0;
                continue;
            }
        }

        if (out.push_point(*mid)) out.push_point(*next);
        if (err < config.tolerance * GROW_BELOW) h *= config.growth_factor;

        x = x_next;
        curr = next;
        refinements = 0;
    }

    return out.finish();
}

} // namespace NotePlot
