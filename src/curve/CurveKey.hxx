#ifndef XFCURVES_CURVE_KEY_HXX
#define XFCURVES_CURVE_KEY_HXX

#include "PointOps.hxx"

// Interpolation used for the segment that starts at a key.
enum class SplineInterpolation {
    Linear,
    StepLeft,
    StepCentered,
    StepRight,
    Bezier,
    BSpline,
    Hermite,
    CatmullRom
};

// Behavior of a piecewise curve before its first and after its last key.
enum class CurveLoopType {
    Constant,     // hold the boundary value
    Linear,       // extrapolate along the boundary tangent
    Cycle,        // repeat the curve
    CycleOffset,  // repeat the curve, shifted by the end difference per period
    Oscillate     // repeat the curve, every other period mirrored
};

inline bool isStepInterpolation(SplineInterpolation i) {
    return i == SplineInterpolation::StepLeft
        || i == SplineInterpolation::StepCentered
        || i == SplineInterpolation::StepRight;
}

// Key of a y = f(x) curve. The key parameter is point[0].
//
// tangentIn/tangentOut are interpreted per interpolation: absolute control
// points for Bezier, derivatives for Hermite, ignored otherwise.
struct CurveKey2 {
    Point2 point{};
    Point2 tangentIn{};
    Point2 tangentOut{};
    SplineInterpolation interpolation = SplineInterpolation::Linear;

    CurveKey2() = default;
    CurveKey2(const Point2& p, SplineInterpolation interp)
        : point(p), interpolation(interp) {}
    CurveKey2(const Point2& p, const Point2& tin, const Point2& tout, SplineInterpolation interp)
        : point(p), tangentIn(tin), tangentOut(tout), interpolation(interp) {}
};

// Key of a general path with an explicit curve parameter.
template <class P>
struct PathKey {
    double parameter = 0.0;
    P point{};
    P tangentIn{};
    P tangentOut{};
    SplineInterpolation interpolation = SplineInterpolation::Linear;

    PathKey() = default;
    PathKey(double t, const P& p, SplineInterpolation interp)
        : parameter(t), point(p), interpolation(interp) {}
    PathKey(double t, const P& p, const P& tin, const P& tout, SplineInterpolation interp)
        : parameter(t), point(p), tangentIn(tin), tangentOut(tout), interpolation(interp) {}
};

inline double keyParameter(const CurveKey2& key) { return key.point[0]; }

template <class P>
double keyParameter(const PathKey<P>& key) { return key.parameter; }

#endif // XFCURVES_CURVE_KEY_HXX
