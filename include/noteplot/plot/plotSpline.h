// --- 文件路径: include/noteplot/plot/plotSpline.h ---

#ifndef NOTEPLOT_PLOT_SPLINE_H
#define NOTEPLOT_PLOT_SPLINE_H

#include "pch.h"
#include "noteplot/plot/plotTypes.h"
#include "noteplot/plot/plotCurve.h"
#include <Eigen/Core>

namespace NotePlot {

/**
 * @brief 自然三次样条 (端点二阶导为 0)
 *
 * 节点必须严格递增且全部有限。二阶导数由三对角方程组求得 (Eigen 稀疏 LDLT)。
 * 节点区间之外返回 NaN，交给求值守卫判为无效。
 */
class CubicSpline {
public:
    CubicSpline(std::vector<double> knots, std::vector<double> values);

    double operator()(double x) const;

    double front() const { return m_knots.front(); }
    double back() const { return m_knots.back(); }
    size_t size() const { return m_knots.size(); }

private:
    std::vector<double> m_knots;
    std::vector<double> m_values;
    Eigen::VectorXd m_second;   // 各节点二阶导
};

// 插值曲线及其自然定义域
struct SplineCurve {
    Curve curve;
    Domain domain;
};

/**
 * @brief 过点集 (x 严格递增) 的显函数样条。定义域为 [x_0, x_n]。
 * @throws std::runtime_error 点数少于 2、x 非严格递增或含非有限值。
 */
SplineCurve make_spline_curve(const std::vector<Vec2>& points);

/**
 * @brief 过任意点列的参数样条，以累计弦长为参数。定义域为 [0, 总弦长]。
 * 相邻重复点会被跳过。
 * @throws std::runtime_error 去重后少于 2 个点或含非有限值。
 */
SplineCurve make_parametric_spline(const std::vector<Vec2>& points);

} // namespace NotePlot

#endif //NOTEPLOT_PLOT_SPLINE_H
