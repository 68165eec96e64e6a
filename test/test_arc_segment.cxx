#include <gtest/gtest.h>
#include "ArcSegment.hxx"
#include <cmath>

namespace {
const double PI = 3.14159265358979323846;

void expectPoint(const Point2& p, double x, double y, double tol = 1e-9) {
    EXPECT_NEAR(p[0], x, tol);
    EXPECT_NEAR(p[1], y, tol);
}
}

TEST(ArcSegment, HalfCircleCounterClockwise) {
    ArcSegment2 arc({1, 0}, {-1, 0}, {1, 1});
    expectPoint(arc.point(0.0), 1, 0);
    expectPoint(arc.point(0.5), 0, 1);
    expectPoint(arc.point(1.0), -1, 0);
    EXPECT_NEAR(arc.length(0.0, 1.0, 10, 1e-9), PI, 1e-9);

    ResolvedArc r = resolveArc(arc);
    EXPECT_FALSE(r.empty);
    expectPoint(r.center, 0, 0);
    EXPECT_NEAR(r.sweepAngle, PI, 1e-12);
}

TEST(ArcSegment, HalfCircleClockwise) {
    ArcSegment2 arc({1, 0}, {-1, 0}, {1, 1}, 0.0, false, true);
    expectPoint(arc.point(0.5), 0, -1);
    EXPECT_LT(resolveArc(arc).sweepAngle, 0.0);
}

TEST(ArcSegment, LargeAndSmallArcsShareEndPoints) {
    // Quarter circle of radius 1 from (1,0) to (0,1).
    ArcSegment2 small({1, 0}, {0, 1}, {1, 1});
    ArcSegment2 large({1, 0}, {0, 1}, {1, 1}, 0.0, true, false);

    EXPECT_NEAR(small.length(0.0, 1.0, 10, 1e-9), 0.5 * PI, 1e-9);
    EXPECT_NEAR(large.length(0.0, 1.0, 10, 1e-9), 1.5 * PI, 1e-9);
    expectPoint(small.point(1.0), 0, 1);
    expectPoint(large.point(1.0), 0, 1);
    expectPoint(resolveArc(small).center, 0, 0);
    expectPoint(resolveArc(large).center, 1, 1);
}

TEST(ArcSegment, RadiusTooSmallIsScaledUp) {
    ArcSegment2 arc({0, 0}, {4, 0}, {1, 1});
    ResolvedArc r = resolveArc(arc);
    EXPECT_NEAR(r.radiusX, 2.0, 1e-12);
    EXPECT_NEAR(r.radiusY, 2.0, 1e-12);
    expectPoint(r.center, 2, 0);
    expectPoint(arc.point(1.0), 4, 0);
    EXPECT_NEAR(arc.length(0.0, 1.0, 10, 1e-9), 2.0 * PI, 1e-9);
}

TEST(ArcSegment, RotatedEllipse) {
    // Ellipse with radii (2,1) rotated by 90 degrees: the long axis is vertical.
    ArcSegment2 arc({0, -2}, {0, 2}, {2, 1}, 0.5 * PI, false, false);
    expectPoint(arc.point(0.0), 0, -2);
    expectPoint(arc.point(1.0), 0, 2);
    // Counter-clockwise from bottom to top passes through x = +1.
    expectPoint(arc.point(0.5), 1, 0);

    // Tangent matches finite differences of point().
    const double h = 1e-6;
    for (double u : {0.2, 0.5, 0.8}) {
        Point2 a = arc.point(u - h);
        Point2 b = arc.point(u + h);
        Point2 t = arc.tangent(u);
        EXPECT_NEAR(t[0], (b[0] - a[0]) / (2 * h), 1e-5);
        EXPECT_NEAR(t[1], (b[1] - a[1]) / (2 * h), 1e-5);
    }
}

TEST(ArcSegment, CoincidentEndPoints) {
    ArcSegment2 empty({1, 1}, {1, 1}, {1, 1});
    EXPECT_TRUE(resolveArc(empty).empty);
    expectPoint(empty.point(0.5), 1, 1);
    EXPECT_DOUBLE_EQ(empty.length(0.0, 1.0, 10, 1e-6), 0.0);
    std::vector<Point2> pts;
    empty.flatten(pts, 10, 1e-6);
    EXPECT_TRUE(pts.empty());

    // Large arc flag turns a degenerate arc into the full ellipse through point1.
    ArcSegment2 full({1, 1}, {1, 1}, {1, 1}, 0.0, true, false);
    EXPECT_FALSE(resolveArc(full).empty);
    expectPoint(full.point(0.0), 1, 1);
    expectPoint(full.point(0.5), -1, 1);
    expectPoint(full.point(1.0), 1, 1);
    EXPECT_NEAR(full.length(0.0, 1.0, 10, 1e-9), 2.0 * PI, 1e-9);
}

TEST(ArcSegment, InvalidRadius) {
    EXPECT_THROW(ArcSegment2({0, 0}, {1, 0}, {0, 1}), std::invalid_argument);
    ArcSegment2 arc;
    EXPECT_THROW(arc.setRadius({1, -1}), std::invalid_argument);
    EXPECT_NO_THROW(arc.setRadius({2, 3}));
    EXPECT_DOUBLE_EQ(arc.radius()[1], 3.0);
}

TEST(ArcSegment, EllipticLengthAndFlatten) {
    // Upper half of an ellipse with radii (2,1).
    ArcSegment2 arc({2, 0}, {-2, 0}, {2, 1});
    const double len = arc.length(0.0, 1.0, 16, 1e-10);
    // Half the perimeter of a (2,1) ellipse.
    EXPECT_NEAR(len, 4.84422411027383809921 , 1e-6);

    std::vector<Point2> pts;
    arc.flatten(pts, 12, 1e-5);
    ASSERT_GE(pts.size(), 4u);
    expectPoint(pts.front(), 2, 0);
    expectPoint(pts.back(), -2, 0);
    for (const auto& p : pts) {
        EXPECT_NEAR(p[0] * p[0] / 4.0 + p[1] * p[1], 1.0, 1e-9);
        EXPECT_GE(p[1], -1e-12);
    }
}
