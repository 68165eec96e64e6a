#ifndef XFCURVES_ARC_SEGMENT_HXX
#define XFCURVES_ARC_SEGMENT_HXX

#include "PointOps.hxx"

#include <vector>

// Center parameterization of an elliptical arc. Produced by resolveArc();
// all fields are derived, nothing is cached.
struct ResolvedArc {
    bool empty = true;         // nothing to draw (coincident end points, small arc)
    Point2 start{};            // point returned for empty arcs
    Point2 center{};
    double radiusX = 0.0;      // radii after correction
    double radiusY = 0.0;
    double rotation = 0.0;     // rotation of the ellipse x-axis (radians)
    double startAngle = 0.0;   // ellipse angle at u = 0
    double sweepAngle = 0.0;   // signed; positive is counter-clockwise

    Point2 point(double u) const;
    Point2 tangent(double u) const;
    double length(double start, double end, int maxIterations, double tolerance) const;
    void flatten(std::vector<Point2>& points, int maxIterations, double tolerance) const;
};

// 2D elliptical arc segment from point1 to point2 (SVG style endpoint
// parameterization).
//
// If the radii are too small to span the chord they are scaled up uniformly
// until they do. If point1 and point2 coincide the arc is empty, unless
// isLargeArc is set, in which case the full ellipse through point1 is drawn.
class ArcSegment2 {
public:
    ArcSegment2();
    ArcSegment2(const Point2& point1, const Point2& point2, const Point2& radius,
                double rotationAngle = 0.0, bool isLargeArc = false, bool sweepClockwise = false);

    const Point2& point1() const { return point1_; }
    const Point2& point2() const { return point2_; }
    const Point2& radius() const { return radius_; }
    double rotationAngle() const { return rotation_; }
    bool isLargeArc() const { return largeArc_; }
    bool sweepClockwise() const { return clockwise_; }

    void setPoint1(const Point2& p) { point1_ = p; }
    void setPoint2(const Point2& p) { point2_ = p; }
    // Throws std::invalid_argument unless both components are > 0.
    void setRadius(const Point2& r);
    void setRotationAngle(double radians) { rotation_ = radians; }
    void setLargeArc(bool largeArc) { largeArc_ = largeArc; }
    void setSweepClockwise(bool clockwise) { clockwise_ = clockwise; }

    Point2 point(double u) const;
    Point2 tangent(double u) const;
    double length(double start, double end, int maxIterations, double tolerance) const;
    void flatten(std::vector<Point2>& points, int maxIterations, double tolerance) const;

private:
    Point2 point1_{};
    Point2 point2_{};
    Point2 radius_{1.0, 1.0};
    double rotation_{0.0};
    bool largeArc_{false};
    bool clockwise_{false};
};

// Computes center, corrected radii and angles from the arc's current settings.
ResolvedArc resolveArc(const ArcSegment2& arc);

#endif // XFCURVES_ARC_SEGMENT_HXX
