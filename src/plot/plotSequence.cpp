// --- 文件路径: src/plot/plotSequence.cpp ---
#include "pch.h"
#include "noteplot/plot/plotSequence.h"

namespace NotePlot {

SequenceBuilder::SequenceBuilder(size_t point_ceiling, SampleStats* stats)
    : m_ceiling(point_ceiling), m_stats(stats)
{
    m_out.reserve(std::min<size_t>(point_ceiling, 4096) + 16);
}

bool SequenceBuilder::push_point(const SamplePoint& p) {
    if (full()) {
        if (m_stats) m_stats->point_ceiling_hit = true;
        return false;
    }
    m_out.emplace_back(p);
    m_points++;
    if (full() && m_stats) m_stats->point_ceiling_hit = true;
    return true;
}

void SequenceBuilder::push_break() {
    if (m_out.empty() || is_break(m_out.back())) return;
    m_out.emplace_back(BreakMarker{});
}

RawSequence SequenceBuilder::finish() {
    if (last_is_break()) m_out.pop_back();
    if (m_stats) {
        m_stats->breaks = static_cast<size_t>(std::count_if(m_out.begin(), m_out.end(),
                                                            [](const RawEntry& e) { return is_break(e); }));
    }
    return std::move(m_out);
}

bool exceeds_jump(const SamplePoint& a, const SamplePoint& b, CurveMode mode, const SamplingConfig& config) {
    double delta, magnitude;
    if (mode == CurveMode::Explicit) {
        delta = std::abs(b.y - a.y);
        magnitude = std::max(std::abs(a.y), std::abs(b.y));
    } else {
        delta = std::hypot(b.x - a.x, b.y - a.y);
        magnitude = std::max(std::hypot(a.x, a.y), std::hypot(b.x, b.y));
    }
    double threshold = std::max(config.jump_threshold, config.jump_relative * magnitude);
    return delta > threshold;
}

bool is_discontinuity(const Curve& curve, const SamplePoint& a, const SamplePoint& b,
                      const SamplingConfig& config, const GuardLimits& limits, SampleStats* stats) {
    auto outside = [](double v, double p, double q) {
        return v < std::min(p, q) || v > std::max(p, q);
    };
    auto gap = [&curve](const SamplePoint& p, const SamplePoint& q) {
        return curve.mode == CurveMode::Explicit ? std::abs(q.y - p.y) : std::hypot(q.x - p.x, q.y - p.y);
    };

    SamplePoint lo = a, hi = b;
    for (int depth = 0; depth < JUMP_PROBE_DEPTH; ++depth) {
        if (!exceeds_jump(lo, hi, curve.mode, config)) return false;

        auto mid = evaluate_guarded(curve, 0.5 * (lo.t + hi.t), limits, stats);
        if (!mid) return true;
        if (outside(mid->y, lo.y, hi.y)) return true;
        if (curve.mode != CurveMode::Explicit && outside(mid->x, lo.x, hi.x)) return true;

        // 跳变集中在差值较大的一半
        if (gap(lo, *mid) >= gap(*mid, hi)) hi = *mid;
        else lo = *mid;
    }
    return exceeds_jump(lo, hi, curve.mode, config);
}

} // namespace NotePlot
