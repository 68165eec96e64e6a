#ifndef XFCURVES_CURVE_HELPER_HXX
#define XFCURVES_CURVE_HELPER_HXX

#include "PointOps.hxx"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

// Generic numeric helpers for anything that looks like a curve:
//   P point(double u) const;
//   P tangent(double u) const;
//   double length(double start, double end, int maxIterations, double tolerance) const;
// where u runs over [0, 1].
namespace CurveHelper {

template <class Curve>
using PointOf = std::decay_t<decltype(std::declval<const Curve&>().point(0.0))>;

inline void checkTolerance(double tolerance) {
    if (!(tolerance > 0.0)) throw std::invalid_argument("tolerance must be greater than zero");
}

inline void checkIterations(int maxIterations) {
    if (maxIterations < 1) throw std::invalid_argument("maxIterations must be at least 1");
}

// Romberg integration of |tangent(u)| over [start, end]. At least minIterations
// refinements are made; afterwards the loop stops as soon as two diagonal
// estimates agree within tolerance.
template <class Curve>
double getLength(const Curve& curve, double start, double end,
                 int minIterations, int maxIterations, double tolerance) {
    checkTolerance(tolerance);
    checkIterations(maxIterations);
    if (start == end) return 0.0;
    if (start > end) std::swap(start, end);

    using P = PointOf<Curve>;
    // 2^20 samples is far beyond anything a cubic needs.
    const int rows = std::min(maxIterations, 20);
    minIterations = std::min(minIterations, rows);

    std::vector<double> prev(static_cast<std::size_t>(rows + 1), 0.0);
    std::vector<double> cur(static_cast<std::size_t>(rows + 1), 0.0);

    double h = end - start;
    prev[0] = 0.5 * h * (PointOps<P>::length(curve.tangent(start)) + PointOps<P>::length(curve.tangent(end)));

    for (int i = 1; i <= rows; ++i) {
        const long long n = 1LL << (i - 1);
        h *= 0.5;
        double sum = 0.0;
        for (long long k = 0; k < n; ++k) {
            const double u = start + static_cast<double>(2 * k + 1) * h;
            sum += PointOps<P>::length(curve.tangent(u));
        }
        cur[0] = 0.5 * prev[0] + h * sum;
        double factor = 1.0;
        for (int j = 1; j <= i; ++j) {
            factor *= 4.0;
            cur[static_cast<std::size_t>(j)] = cur[static_cast<std::size_t>(j - 1)]
                + (cur[static_cast<std::size_t>(j - 1)] - prev[static_cast<std::size_t>(j - 1)]) / (factor - 1.0);
        }
        const double estimate = cur[static_cast<std::size_t>(i)];
        if (i >= minIterations && std::fabs(estimate - prev[static_cast<std::size_t>(i - 1)]) < tolerance) {
            return estimate;
        }
        std::swap(prev, cur);
    }
    return prev[static_cast<std::size_t>(rows)];
}

namespace detail {
template <class Curve, class P>
void flattenRecursive(const Curve& curve, std::vector<P>& points,
                      double param0, double param1,
                      const P& point0, const P& point1,
                      double length0, double length1,
                      int iteration, int maxIterations, double tolerance) {
    const double chord = PointOps<P>::length(PointOps<P>::sub(point1, point0));
    if (iteration >= maxIterations || std::fabs((length1 - length0) - chord) < tolerance) {
        points.push_back(point0);
        points.push_back(point1);
        return;
    }

    const double paramM = 0.5 * (param0 + param1);
    const P pointM = curve.point(paramM);
    const double lengthM = curve.length(0.0, paramM, maxIterations, tolerance);
    flattenRecursive(curve, points, param0, paramM, point0, pointM, length0, lengthM,
                     iteration + 1, maxIterations, tolerance);
    flattenRecursive(curve, points, paramM, param1, pointM, point1, lengthM, length1,
                     iteration + 1, maxIterations, tolerance);
}
} // namespace detail

// Approximates the curve on [0, 1] by line segments. Segments are appended as
// point pairs (start, end); consecutive pairs repeat their shared point.
template <class Curve, class P>
void flatten(const Curve& curve, std::vector<P>& points, int maxIterations, double tolerance) {
    checkTolerance(tolerance);
    checkIterations(maxIterations);

    const double totalLength = curve.length(0.0, 1.0, maxIterations, tolerance);
    if (totalLength == 0.0) return; // degenerate curve

    const P point0 = curve.point(0.0);
    const P point1 = curve.point(1.0);
    if (totalLength < tolerance) {
        points.push_back(point0);
        points.push_back(point1);
        return;
    }
    detail::flattenRecursive(curve, points, 0.0, 1.0, point0, point1, 0.0, totalLength,
                             0, maxIterations, tolerance);
}

// Solves curve.point(u) == value for u in [0, 1] on a 1D curve using
// Newton-Raphson safeguarded by bisection. Returns NaN if value is not
// bracketed by the end points or no solution is found within maxIterations.
template <class Curve>
double getParameter(const Curve& curve, double value, int maxIterations) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double f0 = curve.point(0.0) - value;
    const double f1 = curve.point(1.0) - value;
    if (f0 == 0.0) return 0.0;
    if (f1 == 0.0) return 1.0;
    if ((f0 < 0.0) == (f1 < 0.0)) return nan;

    const double epsilonX = Numeric::Epsilon * std::max(1.0, std::fabs(value));
    const double epsilonU = 1e-12;

    // Orient the bracket so that f(lo) < 0.
    double lo = 0.0;
    double hi = 1.0;
    if (f0 > 0.0) std::swap(lo, hi);

    double u = std::fabs(f1 - f0) > 0.0 ? -f0 / (f1 - f0) : 0.5;
    double dxOld = 1.0;
    double dx = dxOld;
    for (int i = 0; i < maxIterations; ++i) {
        const double f = curve.point(u) - value;
        if (std::fabs(f) <= epsilonX) return u;
        const double df = curve.tangent(u);

        if (((u - hi) * df - f) * ((u - lo) * df - f) > 0.0 || std::fabs(2.0 * f) > std::fabs(dxOld * df)) {
            dxOld = dx;
            dx = 0.5 * (hi - lo);
            u = lo + dx;
        } else {
            dxOld = dx;
            dx = f / df;
            u -= dx;
        }
        if (std::fabs(dx) < epsilonU) {
            return std::fabs(curve.point(u) - value) <= epsilonX * 1e3 ? u : nan;
        }
        if (curve.point(u) - value < 0.0) lo = u; else hi = u;
    }
    return nan;
}

// Finds u in [0, 1] such that the arc length from 0 to u equals length.
// totalLength is the length of the whole curve. If the iteration budget runs
// out the current estimate is returned.
template <class Curve>
double getParameterFromLength(const Curve& curve, double length, double totalLength,
                              int maxIterations, double tolerance) {
    checkTolerance(tolerance);
    checkIterations(maxIterations);
    if (length <= 0.0 || totalLength <= 0.0) return 0.0;
    if (length >= totalLength) return 1.0;

    using P = PointOf<Curve>;
    double lo = 0.0;
    double hi = 1.0;
    double u = length / totalLength;
    for (int i = 0; i < maxIterations; ++i) {
        const double f = curve.length(0.0, u, maxIterations, tolerance / 10.0) - length;
        if (std::fabs(f) < tolerance) return u;
        if (f < 0.0) lo = u; else hi = u;

        const double speed = PointOps<P>::length(curve.tangent(u));
        double next = speed > 0.0 ? u - f / speed : 0.5 * (lo + hi);
        if (!(next > lo && next < hi)) next = 0.5 * (lo + hi);
        u = next;
    }
    return u;
}

} // namespace CurveHelper

#endif // XFCURVES_CURVE_HELPER_HXX
