// --- 文件路径: src/plot/plotSpline.cpp ---
#include "pch.h"
#include "noteplot/plot/plotSpline.h"
#include <Eigen/Sparse>
#include <Eigen/SparseCholesky>
#include <memory>

namespace NotePlot {

namespace {
    void check_finite(const std::vector<Vec2>& points) {
        for (const auto& p : points) {
            if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
                throw std::runtime_error("Interpolation points must be finite");
            }
        }
    }
}

CubicSpline::CubicSpline(std::vector<double> knots, std::vector<double> values)
    : m_knots(std::move(knots)), m_values(std::move(values))
{
    const size_t n = m_knots.size();
    if (n < 2 || m_values.size() != n) {
        throw std::runtime_error("Cubic spline needs at least 2 knots with matching values");
    }
    for (size_t i = 1; i < n; ++i) {
        if (!(m_knots[i] > m_knots[i - 1])) throw std::runtime_error("Spline knots must be strictly increasing");
    }

    m_second = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));
    if (n == 2) return; // 两点退化为直线

    // 内部节点 1..n-2 的三对角系统:
    // h[i-1]·M[i-1] + 2(h[i-1]+h[i])·M[i] + h[i]·M[i+1] = 6·(Δ[i] - Δ[i-1])
    const Eigen::Index m = static_cast<Eigen::Index>(n - 2);
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(static_cast<size_t>(3 * m));
    Eigen::VectorXd rhs(m);

    for (Eigen::Index r = 0; r < m; ++r) {
        const size_t i = static_cast<size_t>(r) + 1;
        const double h0 = m_knots[i] - m_knots[i - 1];
        const double h1 = m_knots[i + 1] - m_knots[i];
        triplets.emplace_back(r, r, 2.0 * (h0 + h1));
        if (r > 0) triplets.emplace_back(r, r - 1, h0);
        if (r + 1 < m) triplets.emplace_back(r, r + 1, h1);
        rhs(r) = 6.0 * ((m_values[i + 1] - m_values[i]) / h1 - (m_values[i] - m_values[i - 1]) / h0);
    }

    Eigen::SparseMatrix<double> A(m, m);
    A.setFromTriplets(triplets.begin(), triplets.end());

    Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> solver;
    solver.compute(A);
    if (solver.info() != Eigen::Success) throw std::runtime_error("Spline system factorization failed");
    Eigen::VectorXd inner = solver.solve(rhs);
    if (solver.info() != Eigen::Success) throw std::runtime_error("Spline system solve failed");

    m_second.segment(1, m) = inner;
}

double CubicSpline::operator()(double x) const {
    if (x < m_knots.front() || x > m_knots.back()) return std::numeric_limits<double>::quiet_NaN();

    auto it = std::upper_bound(m_knots.begin(), m_knots.end(), x);
    size_t i = it == m_knots.begin() ? 0 : static_cast<size_t>(it - m_knots.begin()) - 1;
    if (i >= m_knots.size() - 1) i = m_knots.size() - 2;

    const double x0 = m_knots[i], x1 = m_knots[i + 1];
    const double h = x1 - x0;
    const double a = x1 - x, b = x - x0;
    const double M0 = m_second(static_cast<Eigen::Index>(i));
    const double M1 = m_second(static_cast<Eigen::Index>(i + 1));

    return M0 * a * a * a / (6.0 * h) + M1 * b * b * b / (6.0 * h)
         + (m_values[i] / h - M0 * h / 6.0) * a
         + (m_values[i + 1] / h - M1 * h / 6.0) * b;
}

SplineCurve make_spline_curve(const std::vector<Vec2>& points) {
    if (points.size() < 2) throw std::runtime_error("Interpolation needs at least 2 points");
    check_finite(points);

    std::vector<double> xs, ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }
    auto spline = std::make_shared<const CubicSpline>(std::move(xs), std::move(ys));

    SplineCurve out;
    out.domain = {spline->front(), spline->back()};
    out.curve = make_explicit_curve([spline](double x) { return (*spline)(x); });
    return out;
}

SplineCurve make_parametric_spline(const std::vector<Vec2>& points) {
    check_finite(points);

    std::vector<double> s, xs, ys;
    for (const auto& p : points) {
        if (!xs.empty()) {
            double d = std::hypot(p.x - xs.back(), p.y - ys.back());
            if (d == 0.0) continue;
            s.push_back(s.back() + d);
        } else {
            s.push_back(0.0);
        }
        xs.push_back(p.x);
        ys.push_back(p.y);
    }
    if (s.size() < 2) throw std::runtime_error("Parametric interpolation needs at least 2 distinct points");

    auto sx = std::make_shared<const CubicSpline>(s, std::move(xs));
    auto sy = std::make_shared<const CubicSpline>(s, std::move(ys));

    SplineCurve out;
    out.domain = {0.0, s.back()};
    out.curve = make_parametric_curve([sx](double t) { return (*sx)(t); },
                                      [sy](double t) { return (*sy)(t); });
    return out;
}

} // namespace NotePlot
