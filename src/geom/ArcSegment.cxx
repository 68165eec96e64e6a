#include "ArcSegment.hxx"
#include "CurveHelper.hxx"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
const double kTwoPi = 6.28318530717958647692;

inline double angleBetween(double ax, double ay, double bx, double by) {
    return std::atan2(ax * by - ay * bx, ax * bx + ay * by);
}

inline bool samePoint(const Point2& a, const Point2& b) {
    const double scale = std::max({1.0, std::fabs(a[0]), std::fabs(a[1])});
    return std::fabs(a[0] - b[0]) <= Numeric::Epsilon * scale
        && std::fabs(a[1] - b[1]) <= Numeric::Epsilon * scale;
}
} // anonymous namespace

Point2 ResolvedArc::point(double u) const {
    if (empty) return start;
    const double theta = startAngle + u * sweepAngle;
    const double lx = radiusX * std::cos(theta);
    const double ly = radiusY * std::sin(theta);
    const double c = std::cos(rotation);
    const double s = std::sin(rotation);
    return Point2{center[0] + c * lx - s * ly, center[1] + s * lx + c * ly};
}

Point2 ResolvedArc::tangent(double u) const {
    if (empty) return Point2{0.0, 0.0};
    const double theta = startAngle + u * sweepAngle;
    const double lx = -radiusX * std::sin(theta) * sweepAngle;
    const double ly = radiusY * std::cos(theta) * sweepAngle;
    const double c = std::cos(rotation);
    const double s = std::sin(rotation);
    return Point2{c * lx - s * ly, s * lx + c * ly};
}

double ResolvedArc::length(double start, double end, int maxIterations, double tolerance) const {
    CurveHelper::checkTolerance(tolerance);
    CurveHelper::checkIterations(maxIterations);
    if (empty) return 0.0;
    // Circular arcs have a closed form.
    if (radiusX == radiusY) return radiusX * std::fabs(sweepAngle) * std::fabs(end - start);
    return CurveHelper::getLength(*this, start, end, 2, maxIterations, tolerance);
}

void ResolvedArc::flatten(std::vector<Point2>& points, int maxIterations, double tolerance) const {
    CurveHelper::flatten(*this, points, maxIterations, tolerance);
}

ArcSegment2::ArcSegment2() = default;

ArcSegment2::ArcSegment2(const Point2& point1, const Point2& point2, const Point2& radius,
                         double rotationAngle, bool isLargeArc, bool sweepClockwise)
    : point1_(point1),
      point2_(point2),
      rotation_(rotationAngle),
      largeArc_(isLargeArc),
      clockwise_(sweepClockwise) {
    setRadius(radius);
}

void ArcSegment2::setRadius(const Point2& r) {
    if (!(r[0] > 0.0) || !(r[1] > 0.0)) {
        throw std::invalid_argument("ArcSegment2: radius components must be greater than zero");
    }
    radius_ = r;
}

// Endpoint to center conversion as described in the SVG implementation notes
// (F.6.5 / F.6.6).
ResolvedArc resolveArc(const ArcSegment2& segment) {
    const Point2& p1 = segment.point1();
    const Point2& p2 = segment.point2();
    const double rotation = segment.rotationAngle();
    const bool largeArc = segment.isLargeArc();
    const bool clockwise = segment.sweepClockwise();

    ResolvedArc arc;
    arc.start = p1;
    arc.rotation = rotation;
    arc.radiusX = segment.radius()[0];
    arc.radiusY = segment.radius()[1];

    const double c = std::cos(rotation);
    const double s = std::sin(rotation);
    const double sweepSign = clockwise ? -1.0 : 1.0;

    if (samePoint(p1, p2)) {
        if (!largeArc) return arc; // empty
        // Full ellipse starting (and ending) at point1.
        arc.empty = false;
        arc.center = Point2{p1[0] - c * arc.radiusX, p1[1] - s * arc.radiusX};
        arc.startAngle = 0.0;
        arc.sweepAngle = sweepSign * kTwoPi;
        return arc;
    }

    // Step 1: move the chord midpoint to the origin and undo the rotation.
    const double dx2 = 0.5 * (p1[0] - p2[0]);
    const double dy2 = 0.5 * (p1[1] - p2[1]);
    const double x1 = c * dx2 + s * dy2;
    const double y1 = -s * dx2 + c * dy2;

    // Radius correction.
    double rx = arc.radiusX;
    double ry = arc.radiusY;
    const double lambda = (x1 * x1) / (rx * rx) + (y1 * y1) / (ry * ry);
    if (lambda > 1.0) {
        const double k = std::sqrt(lambda);
        rx *= k;
        ry *= k;
    }
    arc.radiusX = rx;
    arc.radiusY = ry;

    // Step 2: center in the rotated frame.
    const double rx2 = rx * rx;
    const double ry2 = ry * ry;
    const double num = rx2 * ry2 - rx2 * y1 * y1 - ry2 * x1 * x1;
    const double den = rx2 * y1 * y1 + ry2 * x1 * x1;
    double coef = 0.0;
    if (den > 0.0) coef = std::sqrt(std::max(0.0, num / den));
    const bool positiveSweep = !clockwise;
    if (largeArc == positiveSweep) coef = -coef;
    const double cx1 = coef * rx * y1 / ry;
    const double cy1 = -coef * ry * x1 / rx;

    // Step 3: back to the original frame.
    arc.center = Point2{c * cx1 - s * cy1 + 0.5 * (p1[0] + p2[0]),
                        s * cx1 + c * cy1 + 0.5 * (p1[1] + p2[1])};

    // Step 4: angles.
    const double ux = (x1 - cx1) / rx;
    const double uy = (y1 - cy1) / ry;
    const double vx = (-x1 - cx1) / rx;
    const double vy = (-y1 - cy1) / ry;
    arc.startAngle = angleBetween(1.0, 0.0, ux, uy);
    double delta = std::fmod(angleBetween(ux, uy, vx, vy), kTwoPi);
    if (!positiveSweep && delta > 0.0) delta -= kTwoPi;
    if (positiveSweep && delta < 0.0) delta += kTwoPi;
    arc.sweepAngle = delta;
    arc.empty = Numeric::isZero(delta);
    return arc;
}

Point2 ArcSegment2::point(double u) const { return resolveArc(*this).point(u); }

Point2 ArcSegment2::tangent(double u) const { return resolveArc(*this).tangent(u); }

double ArcSegment2::length(double start, double end, int maxIterations, double tolerance) const {
    return resolveArc(*this).length(start, end, maxIterations, tolerance);
}

void ArcSegment2::flatten(std::vector<Point2>& points, int maxIterations, double tolerance) const {
    resolveArc(*this).flatten(points, maxIterations, tolerance);
}
