#ifndef XFCURVES_CURVE2_HXX
#define XFCURVES_CURVE2_HXX

#include "CurveKey.hxx"
#include "PiecewiseCurve.hxx"
#include "PointOps.hxx"
#include "Segments.hxx"

#include <vector>

// 2D function curve y = f(x). The x coordinate of every key is its curve
// parameter, so getPoint(x) always returns a point whose x equals the query.
//
// Each key interval is evaluated as a pair of 1D segments (one per axis). For
// segment types whose x component is not linear in u (Bezier, BSpline,
// CatmullRom, Hermite) the local parameter is found by root finding on the x
// segment.
class Curve2 : public PiecewiseCurve<CurveKey2> {
public:
    // Returns (x, f(x)); NaN if the curve has no keys. May return a NaN y if
    // no BSpline segment covers x.
    Point2 getPoint(double parameter) const;

    // Returns d(x, y)/dx scaled by the key interval, i.e. (1, dy/dx) for
    // segments whose x is linear. Returns (1, 0) where the curve is constant.
    Point2 getTangent(double parameter) const;

    // Arc length is not defined for function curves; both throw std::logic_error.
    double getLength(double start, double end, int maxIterations, double tolerance) const;
    void flatten(std::vector<Point2>& points, int maxIterations, double tolerance) const;

private:
    // Iteration budget of the x root finder.
    static constexpr int kRootIterations = 20;

    double getCycleOffset(double parameter) const;

    // Tangent of the outer segment used for Linear pre-/post-loops. Not yet
    // divided by the segment length. With flatSteps a Step key yields (1, 0)
    // instead of the tangent of the adjacent segment.
    Point2 getBoundaryTangent(bool atStart, bool flatSteps) const;

    // Builds the 1D segments for key interval index (keys index, index+1).
    void getSplines(int index, Segment<double>& xSpline, Segment<double>& ySpline) const;

    // Finds the local parameter u of the segment containing loopedParameter and
    // leaves the corresponding splines in xSpline/ySpline.
    double getSplineParameter(int index, double loopedParameter,
                              Segment<double>& xSpline, Segment<double>& ySpline) const;
};

#endif // XFCURVES_CURVE2_HXX
