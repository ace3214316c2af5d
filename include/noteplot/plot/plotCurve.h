// --- 文件路径: include/noteplot/plot/plotCurve.h ---

#ifndef NOTEPLOT_PLOT_CURVE_H
#define NOTEPLOT_PLOT_CURVE_H

#include "pch.h"
#include "noteplot/CAS/RPN/RPN.h"

namespace NotePlot {

enum class CurveMode {
    Explicit,   // y = f(x)
    Parametric, // (x(t), y(t))
    Polar       // r(θ) -> (r·cos θ, r·sin θ)
};

using ScalarFn = std::function<double(double)>;
using BatchFn = std::function<batch_type(const batch_type&)>;

/**
 * @brief 被采样的曲线。只借用调用方的函数对象，采样器从不修改它。
 *
 * - Explicit:   fx 为 f(x)
 * - Parametric: fx 为 x(t)，fy 为 y(t)
 * - Polar:      fx 为 r(θ)
 *
 * batch_fx 可选，仅显函数模式使用：密集采样器会用它走 SIMD 批量路径。
 */
struct Curve {
    CurveMode mode = CurveMode::Explicit;
    ScalarFn fx;
    ScalarFn fy;
    BatchFn batch_fx;
};

Curve make_explicit_curve(ScalarFn f);
Curve make_parametric_curve(ScalarFn x_of_t, ScalarFn y_of_t);
Curve make_polar_curve(ScalarFn r_of_theta);

// =========================================================
// RPN 程序 -> 曲线
// 程序以 shared_ptr 持有，曲线拷贝后仍然有效
// =========================================================
Curve make_rpn_explicit_curve(AlignedVector<RPNToken> program);
Curve make_rpn_parametric_curve(AlignedVector<RPNToken> program_x, AlignedVector<RPNToken> program_y);
Curve make_rpn_polar_curve(AlignedVector<RPNToken> program_r);

const char* curve_mode_name(CurveMode mode);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_CURVE_H
