#include <gtest/gtest.h>
#include "PathMesher.hxx"
#include <cstdio>
#include <cmath>

namespace {
Path2 makeLoop(const std::vector<Point2>& corners, SplineInterpolation interp) {
    Path2 path;
    for (std::size_t i = 0; i <= corners.size(); ++i) {
        path.add(PathKey<Point2>(static_cast<double>(i), corners[i % corners.size()], interp));
    }
    return path;
}
}

TEST(PathMesher, BoundaryPolygonOfSquare) {
    Path2 square = makeLoop({ {0, 0}, {1, 0}, {1, 1}, {0, 1} }, SplineInterpolation::Linear);
    auto poly = PathMesher::boundaryPolygon(square, 1e-3, 10);
    ASSERT_EQ(poly.size(), 4u);
    EXPECT_EQ(poly[2], (Point2{1, 1}));
}

TEST(PathMesher, OpenPathIsRejected) {
    Path2 open;
    open.add(PathKey<Point2>(0.0, {0, 0}, SplineInterpolation::Linear));
    open.add(PathKey<Point2>(1.0, {1, 0}, SplineInterpolation::Linear));
    open.add(PathKey<Point2>(2.0, {1, 1}, SplineInterpolation::Linear));
    EXPECT_THROW(PathMesher::boundaryPolygon(open, 1e-3, 10), std::invalid_argument);

    std::string err;
    EXPECT_FALSE(PathMesher::generate({open}, 0.1, "open.msh", &err));
    EXPECT_NE(err.find("not closed"), std::string::npos);
    EXPECT_THROW(PathMesher::generate({}, 0.1, "none.msh"), std::invalid_argument);
}

TEST(PathMesher, GeneratesMshWithHole) {
    std::vector<Path2> boundaries;
    boundaries.push_back(makeLoop({ {0, 0}, {1, 0}, {1, 1}, {0, 1} }, SplineInterpolation::Linear));
    // Rounded inner loop.
    Path2 hole = makeLoop({ {0.7, 0.5}, {0.5, 0.7}, {0.3, 0.5}, {0.5, 0.3} }, SplineInterpolation::CatmullRom);
    hole.setPreLoop(CurveLoopType::Cycle);
    hole.setPostLoop(CurveLoopType::Cycle);
    hole.setSmoothEnds(true);
    boundaries.push_back(hole);

    const char* path = "test_path_mesher.msh";
    bool ok = PathMesher::generate(boundaries, 0.1, path, 1e-3, 8);
    ASSERT_TRUE(ok);
    FILE* f = std::fopen(path, "rb");
    ASSERT_NE(f, nullptr);
    std::fclose(f);
}

TEST(PathMesher, NegativeCoordinates) {
    std::vector<Path2> boundaries;
    boundaries.push_back(makeLoop({ {-2, -1}, {-1, -1}, {-1, -0.5}, {-2, -0.5} }, SplineInterpolation::Linear));
    std::string err;
    const char* path = "test_path_mesher_negative.msh";
    ASSERT_TRUE(PathMesher::generate(boundaries, 0.1, path, &err)) << err;
    FILE* f = std::fopen(path, "rb");
    ASSERT_NE(f, nullptr);
    std::fclose(f);
    std::remove(path);
}
