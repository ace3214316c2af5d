#ifndef NOTEPLOT_FUNCTIONS_H
#define NOTEPLOT_FUNCTIONS_H

#include "pch.h"

namespace NotePlot {

// 有限且不超过绘图上限
NOTEPLOT_FORCE_INLINE bool is_plottable(double v, double ceiling) {
    return std::isfinite(v) && std::abs(v) <= ceiling;
}

// SIMD 版：返回每个通道是否可绘制
NOTEPLOT_FORCE_INLINE batch_type::batch_bool_type is_plottable_batch(const batch_type& v, double ceiling) {
    auto finite_mask = ~(xs::isnan(v) | xs::isinf(v));
    return finite_mask & (xs::abs(v) <= batch_type(ceiling));
}

// 自变量过于接近 0 (1/x 一类奇点)
NOTEPLOT_FORCE_INLINE batch_type::batch_bool_type near_zero_batch(const batch_type& x, double epsilon) {
    return xs::abs(x) < batch_type(epsilon);
}

// 与 std::pow 一致的 SIMD 乘方：负底数配整数指数时按奇偶决定符号，配非整数指数为 NaN
NOTEPLOT_FORCE_INLINE batch_type pow_batch(const batch_type& base, const batch_type& exponent) {
    batch_type r = xs::pow(xs::abs(base), exponent);
    auto is_int = xs::floor(exponent) == exponent;
    auto is_odd = is_int & (xs::fmod(exponent, batch_type(2.0)) != batch_type(0.0));
    auto is_neg = base < batch_type(0.0);
    r = xs::select(is_neg & is_odd, -r, r);
    return xs::select(is_neg & ~is_int, batch_type(std::numeric_limits<double>::quiet_NaN()), r);
}

NOTEPLOT_FORCE_INLINE const batch_type& get_index_vec() {
    static const auto index_vec = [] {
        constexpr std::size_t batch_size = batch_type::size;
        alignas(batch_type::arch_type::alignment()) std::array<double, batch_size> indices{};
        for (std::size_t i = 0; i < batch_size; ++i) {
            indices[i] = static_cast<double>(i);
        }
        return xs::load_aligned(indices.data());
    }();
    return index_vec;
}

} // namespace NotePlot

#endif //NOTEPLOT_FUNCTIONS_H
