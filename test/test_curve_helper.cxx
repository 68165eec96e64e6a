#include <gtest/gtest.h>
#include "CurveHelper.hxx"
#include "Segments.hxx"
#include <cmath>

namespace {
// Unit circle arc over [0, pi/2]; exact length known.
struct QuarterCircle {
    Point2 point(double u) const {
        const double a = 0.5 * 3.14159265358979323846 * u;
        return Point2{std::cos(a), std::sin(a)};
    }
    Point2 tangent(double u) const {
        const double k = 0.5 * 3.14159265358979323846;
        const double a = k * u;
        return Point2{-k * std::sin(a), k * std::cos(a)};
    }
    double length(double start, double end, int maxIterations, double tolerance) const {
        return CurveHelper::getLength(*this, start, end, 2, maxIterations, tolerance);
    }
};
}

TEST(CurveHelper, RombergQuarterCircle) {
    QuarterCircle c;
    const double pi = 3.14159265358979323846;
    EXPECT_NEAR(CurveHelper::getLength(c, 0.0, 1.0, 2, 12, 1e-10), 0.5 * pi, 1e-8);
    EXPECT_NEAR(CurveHelper::getLength(c, 0.0, 0.5, 2, 12, 1e-10), 0.25 * pi, 1e-8);
    EXPECT_DOUBLE_EQ(CurveHelper::getLength(c, 0.3, 0.3, 2, 12, 1e-10), 0.0);
}

TEST(CurveHelper, RejectsBadArguments) {
    QuarterCircle c;
    std::vector<Point2> pts;
    EXPECT_THROW(CurveHelper::getLength(c, 0.0, 1.0, 2, 10, 0.0), std::invalid_argument);
    EXPECT_THROW(CurveHelper::getLength(c, 0.0, 1.0, 2, 0, 1e-6), std::invalid_argument);
    EXPECT_THROW(CurveHelper::flatten(c, pts, 10, -1e-3), std::invalid_argument);
    EXPECT_THROW(CurveHelper::getParameterFromLength(c, 0.5, 1.0, 10, 0.0), std::invalid_argument);
}

TEST(CurveHelper, FlattenCircleWithinTolerance) {
    QuarterCircle c;
    std::vector<Point2> pts;
    CurveHelper::flatten(c, pts, 10, 1e-4);
    ASSERT_GE(pts.size(), 4u);
    for (const auto& p : pts) {
        EXPECT_NEAR(std::sqrt(p[0] * p[0] + p[1] * p[1]), 1.0, 1e-12);
    }
    // Every chord midpoint is close to the circle.
    for (std::size_t i = 0; i + 1 < pts.size(); i += 2) {
        const double mx = 0.5 * (pts[i][0] + pts[i + 1][0]);
        const double my = 0.5 * (pts[i][1] + pts[i + 1][1]);
        EXPECT_LT(1.0 - std::sqrt(mx * mx + my * my), 1e-2);
    }
}

TEST(CurveHelper, GetParameterSolvesMonotonicCubic) {
    BezierSegment<double> x{0.0, 1.0, 3.0, 4.0};
    for (double target : {0.0, 0.5, 1.7, 3.2, 4.0}) {
        const double u = CurveHelper::getParameter(x, target, 20);
        ASSERT_FALSE(std::isnan(u)) << target;
        EXPECT_NEAR(x.point(u), target, 1e-8);
    }
}

TEST(CurveHelper, GetParameterOutsideRangeIsNaN) {
    BezierSegment<double> x{0.0, 1.0, 3.0, 4.0};
    EXPECT_TRUE(std::isnan(CurveHelper::getParameter(x, -0.5, 20)));
    EXPECT_TRUE(std::isnan(CurveHelper::getParameter(x, 4.5, 20)));
}

TEST(CurveHelper, GetParameterDecreasingCurve) {
    HermiteSegment<double> x{5.0, -2.0, -4.0, 1.0};
    const double u = CurveHelper::getParameter(x, 3.0, 30);
    ASSERT_FALSE(std::isnan(u));
    EXPECT_NEAR(x.point(u), 3.0, 1e-8);
}

TEST(CurveHelper, ParameterFromLength) {
    QuarterCircle c;
    const double total = c.length(0.0, 1.0, 12, 1e-10);
    // Constant speed: length fraction equals parameter.
    EXPECT_NEAR(CurveHelper::getParameterFromLength(c, 0.25 * total, total, 20, 1e-9), 0.25, 1e-6);
    EXPECT_DOUBLE_EQ(CurveHelper::getParameterFromLength(c, -1.0, total, 20, 1e-9), 0.0);
    EXPECT_DOUBLE_EQ(CurveHelper::getParameterFromLength(c, 2.0 * total, total, 20, 1e-9), 1.0);

    BezierSegment<Point2> b{{0, 0}, {0, 3}, {1, 3}, {4, 0}};
    const double bTotal = b.length(0.0, 1.0, 12, 1e-10);
    const double u = CurveHelper::getParameterFromLength(b, 0.4 * bTotal, bTotal, 30, 1e-9);
    EXPECT_NEAR(b.length(0.0, u, 12, 1e-10), 0.4 * bTotal, 1e-6);
}
