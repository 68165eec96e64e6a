#ifndef XFCURVES_POINT_OPS_HXX
#define XFCURVES_POINT_OPS_HXX

#include <array>
#include <cmath>
#include <cstddef>
#include <limits>

// Point types used throughout the curve library. Points are plain fixed-size
// arrays (1D curves use a bare double).
using Point2 = std::array<double, 2>;
using Point3 = std::array<double, 3>;

// Minimal arithmetic needed by the segment and curve templates.
// Specialized for double and std::array<double, N>.
template <class P>
struct PointOps;

template <>
struct PointOps<double> {
    static double zero() { return 0.0; }
    static double nan() { return std::numeric_limits<double>::quiet_NaN(); }
    static double add(double a, double b) { return a + b; }
    static double sub(double a, double b) { return a - b; }
    static double scale(double a, double s) { return a * s; }
    static double combine(double w0, double p0, double w1, double p1) { return w0 * p0 + w1 * p1; }
    static double combine(double w0, double p0, double w1, double p1,
                          double w2, double p2, double w3, double p3) {
        return w0 * p0 + w1 * p1 + w2 * p2 + w3 * p3;
    }
    static double length(double a) { return std::fabs(a); }
    static bool isNaN(double a) { return std::isnan(a); }
};

template <std::size_t N>
struct PointOps<std::array<double, N>> {
    using P = std::array<double, N>;

    static P zero() { return P{}; }
    static P nan() {
        P r;
        r.fill(std::numeric_limits<double>::quiet_NaN());
        return r;
    }
    static P add(const P& a, const P& b) {
        P r;
        for (std::size_t i = 0; i < N; ++i) r[i] = a[i] + b[i];
        return r;
    }
    static P sub(const P& a, const P& b) {
        P r;
        for (std::size_t i = 0; i < N; ++i) r[i] = a[i] - b[i];
        return r;
    }
    static P scale(const P& a, double s) {
        P r;
        for (std::size_t i = 0; i < N; ++i) r[i] = a[i] * s;
        return r;
    }
    static P combine(double w0, const P& p0, double w1, const P& p1) {
        P r;
        for (std::size_t i = 0; i < N; ++i) r[i] = w0 * p0[i] + w1 * p1[i];
        return r;
    }
    static P combine(double w0, const P& p0, double w1, const P& p1,
                     double w2, const P& p2, double w3, const P& p3) {
        P r;
        for (std::size_t i = 0; i < N; ++i) r[i] = w0 * p0[i] + w1 * p1[i] + w2 * p2[i] + w3 * p3[i];
        return r;
    }
    static double length(const P& a) {
        double s = 0.0;
        for (std::size_t i = 0; i < N; ++i) s += a[i] * a[i];
        return std::sqrt(s);
    }
    static bool isNaN(const P& a) {
        for (std::size_t i = 0; i < N; ++i) if (std::isnan(a[i])) return true;
        return false;
    }
};

// Tolerances shared by the evaluators.
namespace Numeric {
constexpr double Epsilon = 1e-9;

inline bool isZero(double x, double eps = Epsilon) { return std::fabs(x) <= eps; }

inline bool areEqual(double a, double b, double eps = Epsilon) { return std::fabs(a - b) <= eps; }
} // namespace Numeric

#endif // XFCURVES_POINT_OPS_HXX
