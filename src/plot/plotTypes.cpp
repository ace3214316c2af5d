// --- 文件路径: src/plot/plotTypes.cpp ---
#include "pch.h"
#include "noteplot/plot/plotTypes.h"

namespace NotePlot {

size_t count_points(const RawSequence& seq) {
    size_t n = 0;
    for (const auto& e : seq) {
        if (!is_break(e)) ++n;
    }
    return n;
}

void Domain::validate() const {
    if (!std::isfinite(min) || !std::isfinite(max)) {
        throw std::runtime_error("Invalid domain: bounds must be finite");
    }
    if (!(min < max)) {
        std::ostringstream oss;
        oss << "Invalid domain: min (" << min << ") must be less than max (" << max << ")";
        throw std::runtime_error(oss.str());
    }
}

StepBounds resolve_config(const SamplingConfig& config, const Domain& domain) {
    domain.validate();

    if (config.sample_count <= 0) throw std::runtime_error("Invalid config: sample_count must be positive");
    if (config.point_ceiling <= 0) throw std::runtime_error("Invalid config: point_ceiling must be positive");
    if (config.max_iterations <= 0) throw std::runtime_error("Invalid config: max_iterations must be positive");
    if (config.max_refinement <= 0) throw std::runtime_error("Invalid config: max_refinement must be positive");
    if (!(config.tolerance > 0.0) || !std::isfinite(config.tolerance)) {
        throw std::runtime_error("Invalid config: tolerance must be a positive number");
    }
    if (!(config.growth_factor > 1.0)) throw std::runtime_error("Invalid config: growth_factor must be greater than 1");
    if (config.min_step < 0.0 || config.max_step < 0.0) {
        throw std::runtime_error("Invalid config: step sizes must not be negative");
    }
    if (config.jump_threshold < 0.0 || config.jump_relative < 0.0) {
        throw std::runtime_error("Invalid config: jump thresholds must not be negative");
    }
    if (config.zero_epsilon < 0.0 || !(config.value_ceiling > 0.0)) {
        throw std::runtime_error("Invalid config: guard limits out of range");
    }
    if (config.time_budget_ms < 0.0) throw std::runtime_error("Invalid config: time_budget_ms must not be negative");

    const double w = domain.width();
    StepBounds b{};
    b.min_step = config.min_step > 0.0 ? config.min_step : w * 1e-5;
    b.max_step = config.max_step > 0.0 ? config.max_step : w / 20.0;

    // 只给出一端时，自动推导的另一端向它让步
    if (config.min_step <= 0.0 && b.min_step > b.max_step) b.min_step = b.max_step;
    if (config.max_step <= 0.0 && b.max_step < b.min_step) b.max_step = b.min_step;

    if (b.min_step > b.max_step) {
        std::ostringstream oss;
        oss << "Invalid config: min_step (" << b.min_step << ") exceeds max_step (" << b.max_step << ")";
        throw std::runtime_error(oss.str());
    }

    // 远离原点的定义域上，步长不能小于 x 处的几个 ulp，否则 x + h == x
    const double ulp_floor = 4.0 * std::numeric_limits<double>::epsilon()
                           * std::max(std::abs(domain.min), std::abs(domain.max));
    b.min_step = std::max(b.min_step, ulp_floor);
    b.max_step = std::max(b.max_step, ulp_floor);
    return b;
}

const char* strategy_name(SamplingStrategy s) {
    switch (s) {
        case SamplingStrategy::Dense:    return "dense";
        case SamplingStrategy::Warped:   return "warped";
        case SamplingStrategy::Adaptive: return "adaptive";
    }
    return "unknown";
}

} // namespace NotePlot
