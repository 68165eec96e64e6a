#ifndef XFCURVES_SEGMENTS_HXX
#define XFCURVES_SEGMENTS_HXX

#include "CurveHelper.hxx"
#include "PointOps.hxx"

#include <variant>
#include <vector>

// Curve segments parameterized over u in [0, 1]. Each segment is a small value
// type that is built on the stack for a single evaluation; P is double, Point2
// or Point3.
//
// Common interface:
//   P point(double u) const;
//   P tangent(double u) const;        // dC/du, not normalized
//   double length(double start, double end, int maxIterations, double tolerance) const;
//   void flatten(std::vector<P>& points, int maxIterations, double tolerance) const;

enum class StepInterpolation { Left, Centered, Right };

template <class P>
struct LineSegment {
    P point1{};
    P point2{};

    P point(double u) const { return PointOps<P>::combine(1.0 - u, point1, u, point2); }

    P tangent(double) const { return PointOps<P>::sub(point2, point1); }

    double length(double start, double end, int maxIterations, double tolerance) const {
        CurveHelper::checkTolerance(tolerance);
        CurveHelper::checkIterations(maxIterations);
        return PointOps<P>::length(tangent(0.0)) * std::fabs(end - start);
    }

    void flatten(std::vector<P>& points, int maxIterations, double tolerance) const {
        CurveHelper::checkTolerance(tolerance);
        CurveHelper::checkIterations(maxIterations);
        if (point1 == point2) return;
        points.push_back(point1);
        points.push_back(point2);
    }
};

// Discontinuous segment: jumps from point1 to point2. It has no geometric
// length, so flatten() adds nothing.
template <class P>
struct StepSegment {
    P point1{};
    P point2{};
    StepInterpolation stepType = StepInterpolation::Left;

    P point(double u) const {
        switch (stepType) {
        case StepInterpolation::Left:
            return u == 0.0 ? point1 : point2;
        case StepInterpolation::Centered:
            return u < 0.5 ? point1 : point2;
        case StepInterpolation::Right:
            return u < 1.0 ? point1 : point2;
        }
        return point1;
    }

    P tangent(double) const { return PointOps<P>::zero(); }

    double length(double, double, int maxIterations, double tolerance) const {
        CurveHelper::checkTolerance(tolerance);
        CurveHelper::checkIterations(maxIterations);
        return 0.0;
    }

    void flatten(std::vector<P>&, int maxIterations, double tolerance) const {
        CurveHelper::checkTolerance(tolerance);
        CurveHelper::checkIterations(maxIterations);
    }
};

// Cubic Bezier from point1 to point2 with two control points.
template <class P>
struct BezierSegment {
    P point1{};
    P controlPoint1{};
    P controlPoint2{};
    P point2{};

    P point(double u) const {
        const double v = 1.0 - u;
        return PointOps<P>::combine(v * v * v, point1,
                                    3.0 * u * v * v, controlPoint1,
                                    3.0 * u * u * v, controlPoint2,
                                    u * u * u, point2);
    }

    P tangent(double u) const {
        const double v = 1.0 - u;
        return PointOps<P>::combine(-3.0 * v * v, point1,
                                    3.0 * v * v - 6.0 * u * v, controlPoint1,
                                    6.0 * u * v - 3.0 * u * u, controlPoint2,
                                    3.0 * u * u, point2);
    }

    double length(double start, double end, int maxIterations, double tolerance) const {
        return CurveHelper::getLength(*this, start, end, 2, maxIterations, tolerance);
    }

    void flatten(std::vector<P>& points, int maxIterations, double tolerance) const {
        CurveHelper::flatten(*this, points, maxIterations, tolerance);
    }
};

// Cubic Hermite spline through point1 and point2 with the given end tangents.
template <class P>
struct HermiteSegment {
    P point1{};
    P tangent1{};
    P tangent2{};
    P point2{};

    P point(double u) const {
        const double u2 = u * u;
        const double u3 = u2 * u;
        return PointOps<P>::combine(2.0 * u3 - 3.0 * u2 + 1.0, point1,
                                    u3 - 2.0 * u2 + u, tangent1,
                                    u3 - u2, tangent2,
                                    -2.0 * u3 + 3.0 * u2, point2);
    }

    P tangent(double u) const {
        const double u2 = u * u;
        return PointOps<P>::combine(6.0 * u2 - 6.0 * u, point1,
                                    3.0 * u2 - 4.0 * u + 1.0, tangent1,
                                    3.0 * u2 - 2.0 * u, tangent2,
                                    -6.0 * u2 + 6.0 * u, point2);
    }

    double length(double start, double end, int maxIterations, double tolerance) const {
        return CurveHelper::getLength(*this, start, end, 2, maxIterations, tolerance);
    }

    void flatten(std::vector<P>& points, int maxIterations, double tolerance) const {
        CurveHelper::flatten(*this, points, maxIterations, tolerance);
    }
};

// Catmull-Rom spline between point2 and point3; point1 and point4 are the
// neighbors used to derive the tangents.
template <class P>
struct CatmullRomSegment {
    P point1{};
    P point2{};
    P point3{};
    P point4{};

    P point(double u) const {
        const double u2 = u * u;
        const double u3 = u2 * u;
        return PointOps<P>::combine(0.5 * (-u3 + 2.0 * u2 - u), point1,
                                    0.5 * (3.0 * u3 - 5.0 * u2 + 2.0), point2,
                                    0.5 * (-3.0 * u3 + 4.0 * u2 + u), point3,
                                    0.5 * (u3 - u2), point4);
    }

    P tangent(double u) const {
        const double u2 = u * u;
        return PointOps<P>::combine(0.5 * (-3.0 * u2 + 4.0 * u - 1.0), point1,
                                    0.5 * (9.0 * u2 - 10.0 * u), point2,
                                    0.5 * (-9.0 * u2 + 8.0 * u + 1.0), point3,
                                    0.5 * (3.0 * u2 - 2.0 * u), point4);
    }

    double length(double start, double end, int maxIterations, double tolerance) const {
        return CurveHelper::getLength(*this, start, end, 2, maxIterations, tolerance);
    }

    void flatten(std::vector<P>& points, int maxIterations, double tolerance) const {
        CurveHelper::flatten(*this, points, maxIterations, tolerance);
    }
};

// Cardinal spline between point2 and point3. tension = 0 gives Catmull-Rom,
// tension = 1 gives zero tangents.
template <class P>
struct CardinalSegment {
    P point1{};
    P point2{};
    P point3{};
    P point4{};
    double tension = 0.0;

    P point(double u) const {
        const double s = 0.5 * (1.0 - tension);
        const double u2 = u * u;
        const double u3 = u2 * u;
        const double h00 = 2.0 * u3 - 3.0 * u2 + 1.0;
        const double h10 = u3 - 2.0 * u2 + u;
        const double h01 = -2.0 * u3 + 3.0 * u2;
        const double h11 = u3 - u2;
        return PointOps<P>::combine(-s * h10, point1,
                                    h00 - s * h11, point2,
                                    s * h10 + h01, point3,
                                    s * h11, point4);
    }

    P tangent(double u) const {
        const double s = 0.5 * (1.0 - tension);
        const double u2 = u * u;
        const double h00 = 6.0 * u2 - 6.0 * u;
        const double h10 = 3.0 * u2 - 4.0 * u + 1.0;
        const double h01 = -6.0 * u2 + 6.0 * u;
        const double h11 = 3.0 * u2 - 2.0 * u;
        return PointOps<P>::combine(-s * h10, point1,
                                    h00 - s * h11, point2,
                                    s * h10 + h01, point3,
                                    s * h11, point4);
    }

    double length(double start, double end, int maxIterations, double tolerance) const {
        return CurveHelper::getLength(*this, start, end, 2, maxIterations, tolerance);
    }

    void flatten(std::vector<P>& points, int maxIterations, double tolerance) const {
        CurveHelper::flatten(*this, points, maxIterations, tolerance);
    }
};

// Uniform cubic B-spline segment. Approximates its control points: in general
// it passes neither through point2 nor through point3.
template <class P>
struct BSplineSegment {
    P point1{};
    P point2{};
    P point3{};
    P point4{};

    P point(double u) const {
        const double u2 = u * u;
        const double u3 = u2 * u;
        const double v = 1.0 - u;
        const double k = 1.0 / 6.0;
        return PointOps<P>::combine(k * v * v * v, point1,
                                    k * (3.0 * u3 - 6.0 * u2 + 4.0), point2,
                                    k * (-3.0 * u3 + 3.0 * u2 + 3.0 * u + 1.0), point3,
                                    k * u3, point4);
    }

    P tangent(double u) const {
        const double u2 = u * u;
        const double v = 1.0 - u;
        const double k = 1.0 / 6.0;
        return PointOps<P>::combine(k * -3.0 * v * v, point1,
                                    k * (9.0 * u2 - 12.0 * u), point2,
                                    k * (-9.0 * u2 + 6.0 * u + 3.0), point3,
                                    k * 3.0 * u2, point4);
    }

    double length(double start, double end, int maxIterations, double tolerance) const {
        return CurveHelper::getLength(*this, start, end, 2, maxIterations, tolerance);
    }

    void flatten(std::vector<P>& points, int maxIterations, double tolerance) const {
        CurveHelper::flatten(*this, points, maxIterations, tolerance);
    }
};

template <class P>
using Segment = std::variant<LineSegment<P>,
                             StepSegment<P>,
                             BezierSegment<P>,
                             HermiteSegment<P>,
                             CatmullRomSegment<P>,
                             CardinalSegment<P>,
                             BSplineSegment<P>>;

template <class P>
P segmentPoint(const Segment<P>& segment, double u) {
    return std::visit([u](const auto& s) { return s.point(u); }, segment);
}

template <class P>
P segmentTangent(const Segment<P>& segment, double u) {
    return std::visit([u](const auto& s) { return s.tangent(u); }, segment);
}

template <class P>
double segmentLength(const Segment<P>& segment, double start, double end, int maxIterations, double tolerance) {
    return std::visit([&](const auto& s) { return s.length(start, end, maxIterations, tolerance); }, segment);
}

template <class P>
void segmentFlatten(const Segment<P>& segment, std::vector<P>& points, int maxIterations, double tolerance) {
    std::visit([&](const auto& s) { s.flatten(points, maxIterations, tolerance); }, segment);
}

#endif // XFCURVES_SEGMENTS_HXX
