#include "ArcSegment.hxx"
#include "Curve2.hxx"
#include "CurveIO.hxx"
#include "Path.hxx"
#include "Polyline.hxx"

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

// Keyframe style function curve that uses every interpolation type.
static Curve2 makeMixedCurve() {
    Curve2 curve;
    curve.add(CurveKey2({10, 1}, SplineInterpolation::Linear));
    curve.add(CurveKey2({15, 3}, SplineInterpolation::StepLeft));
    curve.add(CurveKey2({22, 5}, SplineInterpolation::StepCentered));
    curve.add(CurveKey2({25, 4}, SplineInterpolation::StepRight));
    curve.add(CurveKey2({30, 7}, {32, 5}, {33, 10}, SplineInterpolation::Bezier));
    curve.add(CurveKey2({34, 10}, SplineInterpolation::BSpline));
    curve.add(CurveKey2({40, 3}, {1, 0}, {1, 1}, SplineInterpolation::Hermite));
    curve.add(CurveKey2({45, 10}, SplineInterpolation::CatmullRom));
    curve.add(CurveKey2({48, 5}, SplineInterpolation::CatmullRom));
    curve.sort();
    curve.setPreLoop(CurveLoopType::Constant);
    curve.setPostLoop(CurveLoopType::Oscillate);
    return curve;
}

// Closed CatmullRom loop through the corners of a rounded square.
static Path2 makeRoundedSquare(double r) {
    Path2 path;
    const Point2 corners[4] = { { r, 0 }, { 0, r }, { -r, 0 }, { 0, -r } };
    for (int i = 0; i <= 4; ++i) {
        path.add(PathKey<Point2>(static_cast<double>(i), corners[i % 4], SplineInterpolation::CatmullRom));
    }
    path.setPreLoop(CurveLoopType::Cycle);
    path.setPostLoop(CurveLoopType::Cycle);
    path.setSmoothEnds(true);
    path.parameterizeByLength(10, 1e-4);
    return path;
}

// Upper half disk: an elliptical arc from (1,0) to (-1,0) closed by the
// diameter. The arc is flattened into Linear keys.
static Path2 makeHalfDisk(double r) {
    ArcSegment2 arc({ r, 0.0 }, { -r, 0.0 }, { r, r });
    std::vector<Point2> pairs;
    arc.flatten(pairs, 10, 1e-4);
    std::vector<Point2> points = Polyline::fromSegments(pairs, 1e-12);
    points.push_back(Point2{ r, 0.0 });

    Path2 path;
    for (std::size_t i = 0; i < points.size(); ++i) {
        path.add(PathKey<Point2>(static_cast<double>(i), points[i], SplineInterpolation::Linear));
    }
    path.parameterizeByLength(10, 1e-6);
    return path;
}

// Helix with Hermite keys, one key per quarter turn.
static Path3 makeHelix(double radius, double pitch, int turns) {
    Path3 path;
    const double pi = 3.14159265358979323846;
    const double dAngle = 0.5 * pi;
    const int keys = 4 * turns + 1;
    for (int k = 0; k < keys; ++k) {
        const double a = k * dAngle;
        const double z = pitch * a / (2.0 * pi);
        Point3 p{ radius * std::cos(a), radius * std::sin(a), z };
        // Derivative per key interval (dAngle per interval).
        Point3 t{ -radius * std::sin(a) * dAngle, radius * std::cos(a) * dAngle, pitch * dAngle / (2.0 * pi) };
        path.add(PathKey<Point3>(static_cast<double>(k), p, t, t, SplineInterpolation::Hermite));
    }
    path.setPostLoop(CurveLoopType::CycleOffset);
    return path;
}

int main() {
    std::string err;
    {
        CurveSet set;
        set.curves.push_back(makeMixedCurve());
        set.paths3.push_back(makeHelix(1.0, 0.5, 2));
        const std::string crv = "mixed_curves.crv";
        if (!CurveIO::writeFile(crv, set, &err)) { std::fprintf(stderr, "CRV write failed: %s\n", err.c_str()); return 1; }
    }
    {
        // Outer boundary first, holes after it.
        CurveSet set;
        set.paths2.push_back(makeHalfDisk(2.0));
        Path2 hole = makeRoundedSquare(0.5);
        for (auto& key : hole) key.point[1] += 0.9;
        set.paths2.push_back(hole);
        const std::string crv = "half_disk_with_hole.crv";
        if (!CurveIO::writeFile(crv, set, &err)) { std::fprintf(stderr, "CRV write failed: %s\n", err.c_str()); return 1; }
    }

    std::printf("Wrote example curves: mixed_curves.crv, half_disk_with_hole.crv\n");
    return 0;
}
