#include <gtest/gtest.h>
#include "Path.hxx"
#include <algorithm>
#include <cmath>

namespace {
Path2 makeSquare(SplineInterpolation interp) {
    Path2 path;
    const Point2 corners[5] = { {0, 0}, {1, 0}, {1, 1}, {0, 1}, {0, 0} };
    for (int i = 0; i < 5; ++i) path.add(PathKey<Point2>(static_cast<double>(i), corners[i], interp));
    return path;
}

void expectPoint(const Point2& p, double x, double y, double tol = 1e-9) {
    EXPECT_NEAR(p[0], x, tol);
    EXPECT_NEAR(p[1], y, tol);
}
}

TEST(Path, EmptyAndSingleKey) {
    Path2 path;
    EXPECT_TRUE(std::isnan(path.getPoint(0.0)[0]));
    expectPoint(path.getTangent(0.0), 0, 0);
    EXPECT_DOUBLE_EQ(path.getLength(0.0, 1.0, 10, 1e-6), 0.0);
    EXPECT_TRUE(std::isnan(path.getParameterFromLength(1.0, 10, 1e-6)));

    path.add(PathKey<Point2>(2.0, {3, 4}, SplineInterpolation::Linear));
    expectPoint(path.getPoint(-5.0), 3, 4);
    expectPoint(path.getPoint(7.0), 3, 4);
    EXPECT_DOUBLE_EQ(path.getLength(0.0, 5.0, 10, 1e-6), 0.0);
    EXPECT_THROW(path.getSpline(0), std::logic_error);
}

TEST(Path, LinearSquare) {
    Path2 path = makeSquare(SplineInterpolation::Linear);
    expectPoint(path.getPoint(0.5), 0.5, 0);
    expectPoint(path.getPoint(2.25), 0.75, 1);
    expectPoint(path.getPoint(4.0), 0, 0);
    expectPoint(path.getTangent(1.5), 0, 1);
    expectPoint(path.getTangent(3.5), 0, -1);

    // Constant loops hold the end points and stand still.
    expectPoint(path.getPoint(-1.0), 0, 0);
    expectPoint(path.getTangent(-1.0), 0, 0);
    expectPoint(path.getTangent(6.0), 0, 0);

    EXPECT_NEAR(path.getLength(0.0, 4.0, 12, 1e-6), 4.0, 1e-4);
    EXPECT_NEAR(path.getLength(0.5, 1.5, 12, 1e-6), 1.0, 1e-4);
    EXPECT_THROW(path.getSpline(5), std::out_of_range);
}

TEST(Path, LoopsOnSquare) {
    Path2 path = makeSquare(SplineInterpolation::Linear);
    path.setPreLoop(CurveLoopType::Cycle);
    path.setPostLoop(CurveLoopType::Cycle);
    expectPoint(path.getPoint(4.5), 0.5, 0);
    expectPoint(path.getPoint(5.5), 1, 0.5);
    expectPoint(path.getPoint(-0.5), 0, 0.5);

    path.setPostLoop(CurveLoopType::Oscillate);
    // Mirrored pass runs backwards around the square.
    expectPoint(path.getPoint(4.5), 0, 0.5);
    expectPoint(path.getTangent(4.5), 0, 1);

    path.setPreLoop(CurveLoopType::Linear);
    expectPoint(path.getPoint(-2.0), -2, 0);
    expectPoint(path.getTangent(-2.0), 1, 0);
}

TEST(Path, CycleOffsetShiftsByEndDifference) {
    Path1 path;
    path.add(PathKey<double>(0.0, 0.0, SplineInterpolation::Linear));
    path.add(PathKey<double>(1.0, 2.0, SplineInterpolation::Linear));
    path.setPreLoop(CurveLoopType::CycleOffset);
    path.setPostLoop(CurveLoopType::CycleOffset);
    EXPECT_NEAR(path.getPoint(1.5), 3.0, 1e-12);
    EXPECT_NEAR(path.getPoint(2.5), 5.0, 1e-12);
    EXPECT_NEAR(path.getPoint(-0.5), -1.0, 1e-12);
    EXPECT_NEAR(path.getTangent(2.5), 2.0, 1e-12);
    // Period counts beyond the int range.
    EXPECT_NEAR(path.getPoint(3e9 + 0.5), 6e9 + 1.0, 1e-3);
    EXPECT_NEAR(path.getPoint(-3e9 - 0.5), -6e9 - 1.0, 1e-3);
}

TEST(Path, BezierAndHermiteKeys) {
    Path2 bezier;
    bezier.add(PathKey<Point2>(0.0, {0, 0}, {0, 0}, {0, 1}, SplineInterpolation::Bezier));
    bezier.add(PathKey<Point2>(2.0, {2, 0}, {2, 1}, {0, 0}, SplineInterpolation::Bezier));
    expectPoint(bezier.getPoint(1.0), 1, 0.75);
    // d/dt = d/du / interval length.
    expectPoint(bezier.getTangent(0.0), 0, 1.5);

    Path2 hermite;
    hermite.add(PathKey<Point2>(0.0, {0, 0}, {0, 0}, {1, 0}, SplineInterpolation::Hermite));
    hermite.add(PathKey<Point2>(1.0, {1, 1}, {0, 1}, {0, 1}, SplineInterpolation::Hermite));
    hermite.setPostLoop(CurveLoopType::Linear);
    expectPoint(hermite.getPoint(1.0), 1, 1);
    expectPoint(hermite.getTangent(1.0), 0, 1);
    expectPoint(hermite.getPoint(3.0), 1, 3);
}

TEST(Path, CatmullRomPassesThroughKeys) {
    Path2 path = makeSquare(SplineInterpolation::CatmullRom);
    for (int i = 0; i < 5; ++i) {
        const Point2 p = path.getPoint(static_cast<double>(i));
        expectPoint(p, path[static_cast<std::size_t>(i)].point[0], path[static_cast<std::size_t>(i)].point[1]);
    }
}

TEST(Path, SmoothEndsClosedLoop) {
    Path2 path = makeSquare(SplineInterpolation::CatmullRom);
    path.setPreLoop(CurveLoopType::Cycle);
    path.setPostLoop(CurveLoopType::Cycle);
    path.setSmoothEnds(true);
    const Point2 a = path.getTangent(4.0 - 1e-9);
    const Point2 b = path.getTangent(1e-9);
    expectPoint(a, b[0], b[1], 1e-6);
}

TEST(Path, TangentMatchesFiniteDifference) {
    Path3 path;
    path.add(PathKey<Point3>(0.0, {0, 0, 0}, SplineInterpolation::CatmullRom));
    path.add(PathKey<Point3>(0.5, {1, 0, 1}, SplineInterpolation::CatmullRom));
    path.add(PathKey<Point3>(2.0, {1, 2, 0}, SplineInterpolation::Hermite));
    path.add(PathKey<Point3>(3.0, {0, 2, 2}, {1, 0, 0}, {0, 0, 0}, SplineInterpolation::BSpline));
    path.add(PathKey<Point3>(4.0, {-1, 1, 2}, SplineInterpolation::Linear));
    const double h = 1e-6;
    for (double t : {0.2, 1.1, 2.5, 3.4}) {
        const Point3 a = path.getPoint(t - h);
        const Point3 b = path.getPoint(t + h);
        const Point3 d = path.getTangent(t);
        for (int k = 0; k < 3; ++k) EXPECT_NEAR(d[k], (b[k] - a[k]) / (2 * h), 1e-5) << t;
    }
}

TEST(Path, FlattenStaysOnPath) {
    Path2 path = makeSquare(SplineInterpolation::CatmullRom);
    std::vector<Point2> pts;
    path.flatten(pts, 10, 1e-4);
    ASSERT_GE(pts.size(), 8u);
    ASSERT_EQ(pts.size() % 2, 0u);
    expectPoint(pts.front(), 0, 0);
    expectPoint(pts.back(), 0, 0);

    double poly = 0.0;
    for (std::size_t i = 0; i < pts.size(); i += 2) {
        poly += PointOps<Point2>::length(PointOps<Point2>::sub(pts[i + 1], pts[i]));
    }
    const double len = path.getLength(0.0, 4.0, 16, 1e-8);
    EXPECT_LE(poly, len + 1e-6);
    EXPECT_NEAR(poly, len, 1e-2);

    std::vector<Point2> none;
    EXPECT_THROW(path.flatten(none, 10, 0.0), std::invalid_argument);
}

TEST(Path, StepKeysFlattenToNothing) {
    Path2 path = makeSquare(SplineInterpolation::StepLeft);
    std::vector<Point2> pts;
    path.flatten(pts, 10, 1e-4);
    EXPECT_TRUE(pts.empty());
    expectPoint(path.getPoint(0.0), 0, 0);
    expectPoint(path.getPoint(0.1), 1, 0);
}

TEST(Path, ParameterizeByLength) {
    Path2 path;
    path.add(PathKey<Point2>(0.0, {0, 0}, SplineInterpolation::Linear));
    path.add(PathKey<Point2>(1.0, {3, 4}, SplineInterpolation::Linear));
    path.add(PathKey<Point2>(2.0, {3, 6}, SplineInterpolation::Linear));
    path.parameterizeByLength(10, 1e-8);
    EXPECT_DOUBLE_EQ(path[0].parameter, 0.0);
    EXPECT_NEAR(path[1].parameter, 5.0, 1e-9);
    EXPECT_NEAR(path[2].parameter, 7.0, 1e-9);
    // Unit speed afterwards.
    EXPECT_NEAR(PointOps<Point2>::length(path.getTangent(2.5)), 1.0, 1e-12);
    EXPECT_THROW(path.parameterizeByLength(10, 0.0), std::invalid_argument);
}

TEST(Path, ParameterFromLength) {
    Path2 path;
    path.add(PathKey<Point2>(0.0, {0, 0}, SplineInterpolation::CatmullRom));
    path.add(PathKey<Point2>(1.0, {1, 1}, SplineInterpolation::CatmullRom));
    path.add(PathKey<Point2>(2.0, {3, 1}, SplineInterpolation::CatmullRom));
    path.add(PathKey<Point2>(3.0, {4, 0}, SplineInterpolation::CatmullRom));
    path.parameterizeByLength(20, 1e-10);
    const double total = path[3].parameter;

    for (double s : {0.0, 0.3 * total, 0.5 * total, total}) {
        const double t = path.getParameterFromLength(s, 30, 1e-8);
        // Arc length up to t, measured segment by segment.
        const int i = std::min(path.getKeyIndex(t), 2);
        const double start = path[static_cast<std::size_t>(i)].parameter;
        const double u = (t - start) / (path[static_cast<std::size_t>(i + 1)].parameter - start);
        const double measured = start + segmentLength(path.getSpline(i), 0.0, u, 20, 1e-10);
        EXPECT_NEAR(measured, s, 1e-6) << s;
    }
    EXPECT_THROW(path.getParameterFromLength(1.0, 10, -1.0), std::invalid_argument);
}

TEST(Path, ParameterFromLengthOutsideRange) {
    Path1 path;
    path.add(PathKey<double>(0.0, 0.0, SplineInterpolation::Linear));
    path.add(PathKey<double>(2.0, 2.0, SplineInterpolation::Linear));

    path.setPostLoop(CurveLoopType::Constant);
    EXPECT_NEAR(path.getParameterFromLength(3.0, 20, 1e-9), 2.0, 1e-9);

    path.setPostLoop(CurveLoopType::Linear);
    EXPECT_NEAR(path.getParameterFromLength(3.0, 20, 1e-9), 3.0, 1e-9);

    path.setPostLoop(CurveLoopType::Cycle);
    EXPECT_NEAR(path.getParameterFromLength(5.0, 20, 1e-9), 5.0, 1e-6);

    path.setPreLoop(CurveLoopType::Linear);
    EXPECT_NEAR(path.getParameterFromLength(-1.5, 20, 1e-9), -1.5, 1e-9);
}
