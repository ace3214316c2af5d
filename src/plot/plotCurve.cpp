// --- 文件路径: src/plot/plotCurve.cpp ---
#include "pch.h"
#include "noteplot/plot/plotCurve.h"
#include <memory>

namespace NotePlot {

Curve make_explicit_curve(ScalarFn f) {
    if (!f) throw std::runtime_error("Explicit curve requires a function");
    Curve c;
    c.mode = CurveMode::Explicit;
    c.fx = std::move(f);
    return c;
}

Curve make_parametric_curve(ScalarFn x_of_t, ScalarFn y_of_t) {
    if (!x_of_t || !y_of_t) throw std::runtime_error("Parametric curve requires both x(t) and y(t)");
    Curve c;
    c.mode = CurveMode::Parametric;
    c.fx = std::move(x_of_t);
    c.fy = std::move(y_of_t);
    return c;
}

Curve make_polar_curve(ScalarFn r_of_theta) {
    if (!r_of_theta) throw std::runtime_error("Polar curve requires r(theta)");
    Curve c;
    c.mode = CurveMode::Polar;
    c.fx = std::move(r_of_theta);
    return c;
}

// =========================================================
// RPN 曲线：程序共享给标量与 SIMD 两条求值路径
// =========================================================
namespace {
    using ProgramPtr = std::shared_ptr<const AlignedVector<RPNToken>>;

    ProgramPtr share_program(AlignedVector<RPNToken> program) {
        validate_rpn(program);
        return std::make_shared<const AlignedVector<RPNToken>>(std::move(program));
    }

    ScalarFn scalar_of(const ProgramPtr& prog) {
        return [prog](double v) { return evaluate_rpn<double>(*prog, v); };
    }
}

Curve make_rpn_explicit_curve(AlignedVector<RPNToken> program) {
    ProgramPtr prog = share_program(std::move(program));
    Curve c = make_explicit_curve(scalar_of(prog));
    c.batch_fx = [prog](const batch_type& v) { return evaluate_rpn<batch_type>(*prog, v); };
    return c;
}

Curve make_rpn_parametric_curve(AlignedVector<RPNToken> program_x, AlignedVector<RPNToken> program_y) {
    return make_parametric_curve(scalar_of(share_program(std::move(program_x))),
                                 scalar_of(share_program(std::move(program_y))));
}

Curve make_rpn_polar_curve(AlignedVector<RPNToken> program_r) {
    return make_polar_curve(scalar_of(share_program(std::move(program_r))));
}

const char* curve_mode_name(CurveMode mode) {
    switch (mode) {
        case CurveMode::Explicit:   return "explicit";
        case CurveMode::Parametric: return "parametric";
        case CurveMode::Polar:      return "polar";
    }
    return "unknown";
}

} // namespace NotePlot
