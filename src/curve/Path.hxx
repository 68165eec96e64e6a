#ifndef XFCURVES_PATH_HXX
#define XFCURVES_PATH_HXX

#include "CurveHelper.hxx"
#include "CurveKey.hxx"
#include "PiecewiseCurve.hxx"
#include "PointOps.hxx"
#include "Segments.hxx"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <variant>
#include <vector>

// Parametric path through keys with an explicit curve parameter. Unlike
// Curve2 the parameter is independent of the key positions, so segments are
// evaluated directly at u = (t - t_i) / (t_{i+1} - t_i).
//
// P is double, Point2 or Point3.
template <class P>
class Path : public PiecewiseCurve<PathKey<P>> {
public:
    using Key = PathKey<P>;
    using Ops = PointOps<P>;

    // Point at curve parameter t. NaN if the path has no keys.
    P getPoint(double parameter) const {
        const int numberOfKeys = static_cast<int>(this->keys_.size());
        if (numberOfKeys == 0) return Ops::nan();

        const double loopedParameter = this->loopParameter(parameter);

        const Key& firstKey = this->keys_.front();
        const Key& lastKey = this->keys_.back();
        const double curveStart = firstKey.parameter;
        const double curveEnd = lastKey.parameter;

        if (loopedParameter < curveStart) {
            const P tangent = getTangent(loopedParameter);
            return Ops::add(firstKey.point, Ops::scale(tangent, loopedParameter - curveStart));
        }
        if (loopedParameter > curveEnd) {
            const P tangent = getTangent(loopedParameter);
            return Ops::add(lastKey.point, Ops::scale(tangent, loopedParameter - curveEnd));
        }

        if (numberOfKeys == 1) return firstKey.point;

        const P cycleOffset = getCycleOffset(parameter);

        // BSplines do not pass through the last key.
        if (loopedParameter == curveEnd
            && this->keys_[static_cast<std::size_t>(numberOfKeys - 2)].interpolation != SplineInterpolation::BSpline) {
            return Ops::add(lastKey.point, cycleOffset);
        }

        int index = this->getKeyIndex(loopedParameter);
        if (index == numberOfKeys - 1) --index;

        const double splineStart = this->keys_[static_cast<std::size_t>(index)].parameter;
        const double splineLength = this->keys_[static_cast<std::size_t>(index + 1)].parameter - splineStart;
        const double u = Numeric::isZero(splineLength) ? 0.0 : (loopedParameter - splineStart) / splineLength;

        return Ops::add(segmentPoint(getSpline(index), u), cycleOffset);
    }

    // dC/dt. Zero where a Constant loop holds the path still.
    P getTangent(double parameter) const {
        const int numberOfKeys = static_cast<int>(this->keys_.size());
        if (numberOfKeys == 0) return Ops::zero();

        const Key& firstKey = this->keys_.front();
        const Key& lastKey = this->keys_.back();
        const double curveStart = firstKey.parameter;
        const double curveEnd = lastKey.parameter;

        if ((this->preLoop_ == CurveLoopType::Constant && parameter < curveStart)
            || (this->postLoop_ == CurveLoopType::Constant && parameter > curveEnd)) {
            return Ops::zero();
        }

        const double loopedParameter = this->loopParameter(parameter);

        // Segment tangents are relative to u in [0, 1]; divide by the segment
        // parameter length.
        if (loopedParameter < curveStart) {
            P tangent;
            if (firstKey.interpolation == SplineInterpolation::Bezier)
                tangent = Ops::scale(Ops::sub(firstKey.point, firstKey.tangentIn), 3.0);
            else if (firstKey.interpolation == SplineInterpolation::Hermite)
                tangent = firstKey.tangentIn;
            else if (numberOfKeys > 1)
                tangent = segmentTangent(getSpline(0), 0.0);
            else
                tangent = Ops::zero();

            const double splineLength = numberOfKeys > 1 ? this->keys_[1].parameter - curveStart : 0.0;
            return splineLength > 0.0 ? Ops::scale(tangent, 1.0 / splineLength) : tangent;
        }
        if (loopedParameter > curveEnd) {
            P tangent;
            if (lastKey.interpolation == SplineInterpolation::Bezier)
                tangent = Ops::scale(Ops::sub(lastKey.tangentOut, lastKey.point), 3.0);
            else if (lastKey.interpolation == SplineInterpolation::Hermite)
                tangent = lastKey.tangentOut;
            else if (numberOfKeys > 1)
                tangent = segmentTangent(getSpline(numberOfKeys - 2), 1.0);
            else
                tangent = Ops::zero();

            const double splineLength = numberOfKeys > 1
                ? curveEnd - this->keys_[static_cast<std::size_t>(numberOfKeys - 2)].parameter : 0.0;
            return splineLength > 0.0 ? Ops::scale(tangent, 1.0 / splineLength) : tangent;
        }

        if (numberOfKeys == 1) {
            // Unscaled: a single key has no parameter interval.
            if (this->postLoop_ == CurveLoopType::Linear) {
                if (firstKey.interpolation == SplineInterpolation::Bezier)
                    return Ops::scale(Ops::sub(firstKey.tangentOut, firstKey.point), 3.0);
                if (firstKey.interpolation == SplineInterpolation::Hermite)
                    return firstKey.tangentOut;
            } else if (this->preLoop_ == CurveLoopType::Linear) {
                if (firstKey.interpolation == SplineInterpolation::Bezier)
                    return Ops::scale(Ops::sub(firstKey.point, firstKey.tangentIn), 3.0);
                if (firstKey.interpolation == SplineInterpolation::Hermite)
                    return firstKey.tangentIn;
            }
            return Ops::zero();
        }

        int index = this->getKeyIndex(loopedParameter);
        if (index == numberOfKeys - 1) --index;

        const double splineStart = this->keys_[static_cast<std::size_t>(index)].parameter;
        const double splineLength = this->keys_[static_cast<std::size_t>(index + 1)].parameter - splineStart;
        if (Numeric::isZero(splineLength)) return Ops::zero();
        const double u = (loopedParameter - splineStart) / splineLength;

        const P tangent = Ops::scale(segmentTangent(getSpline(index), u), 1.0 / splineLength);
        return this->isInMirroredOscillation(parameter) ? Ops::scale(tangent, -1.0) : tangent;
    }

    // Arc length between two curve parameters (either order). Loops are
    // included, so start and end may lie outside of the key range.
    double getLength(double start, double end, int maxIterations, double tolerance) const {
        const std::size_t numberOfKeys = this->keys_.size();
        if (numberOfKeys == 0) return 0.0;
        if (numberOfKeys == 1
            && this->preLoop_ != CurveLoopType::Linear
            && this->postLoop_ != CurveLoopType::Linear) {
            return 0.0;
        }
        // Step jumps have no length; the integration error may exceed tolerance
        // across such discontinuities.
        return CurveHelper::getLength(Evaluator{this}, start, end, 5, maxIterations, tolerance);
    }

    // Appends line segments (as point pairs) approximating the key range.
    // The tolerance is shared equally among the segments.
    void flatten(std::vector<P>& points, int maxIterations, double tolerance) const {
        CurveHelper::checkTolerance(tolerance);
        CurveHelper::checkIterations(maxIterations);
        const int numberOfKeys = static_cast<int>(this->keys_.size());
        for (int i = 0; i < numberOfKeys - 1; ++i) {
            segmentFlatten(getSpline(i), points, maxIterations, tolerance / (numberOfKeys - 1));
        }
    }

    // Rewrites the key parameters so that each one equals the arc length from
    // the first key, which gets parameter 0.
    void parameterizeByLength(int maxIterations, double tolerance) {
        if (!(tolerance > 0.0)) throw std::invalid_argument("Path::parameterizeByLength: tolerance must be greater than zero");

        const std::size_t numberOfKeys = this->keys_.size();
        if (numberOfKeys == 0) return;

        this->keys_[0].parameter = 0.0;
        for (std::size_t i = 1; i < numberOfKeys; ++i) {
            const double length = segmentLength(getSpline(static_cast<int>(i - 1)), 0.0, 1.0, maxIterations, tolerance);
            this->keys_[i].parameter = this->keys_[i - 1].parameter + length;
        }
    }

    // Inverse of the arc length on a path parameterized by length: returns the
    // curve parameter whose distance from the first key equals length. Lengths
    // outside the key range follow the loop policies and yield parameters
    // outside of the range.
    double getParameterFromLength(double length, int maxIterations, double tolerance) const {
        if (!(tolerance > 0.0)) throw std::invalid_argument("Path::getParameterFromLength: tolerance must be greater than zero");

        const int numberOfKeys = static_cast<int>(this->keys_.size());
        if (numberOfKeys == 0) return std::numeric_limits<double>::quiet_NaN();

        const double curveStart = this->keys_.front().parameter;
        const double curveEnd = this->keys_.back().parameter;
        const double curveLength = curveEnd - curveStart;

        if (length < curveStart && this->preLoop_ == CurveLoopType::Linear) {
            const double speed = Ops::length(getTangent(curveStart));
            return curveStart - (curveStart - length) / speed;
        }
        if (length > curveEnd && this->postLoop_ == CurveLoopType::Linear) {
            const double speed = Ops::length(getTangent(curveEnd));
            return curveEnd + (length - curveEnd) / speed;
        }

        if (Numeric::isZero(curveLength)) return curveStart;

        const double loopedLength = this->loopParameter(length);

        int index = this->getKeyIndex(loopedLength);
        if (index == numberOfKeys - 1) --index;

        const double splineStart = this->keys_[static_cast<std::size_t>(index)].parameter;
        const double splineLength = this->keys_[static_cast<std::size_t>(index + 1)].parameter - splineStart;
        const double lengthOnSpline = loopedLength - splineStart;

        const Segment<P> spline = getSpline(index);
        const double u = std::visit([&](const auto& s) {
            return CurveHelper::getParameterFromLength(s, lengthOnSpline, splineLength, maxIterations, tolerance);
        }, spline);
        const double localParameter = splineStart + u * splineLength;

        // Outside lengths map to outside parameters so that the distance from
        // the first key includes the skipped periods.
        if (length < curveStart && this->preLoop_ != CurveLoopType::Constant) {
            const double periods = std::trunc((length - curveEnd) / curveLength);
            if (this->preLoop_ == CurveLoopType::Oscillate && std::fmod(periods, 2.0) == -1.0)
                return curveStart + curveStart - localParameter + curveLength * (periods + 1);
            return localParameter + periods * curveLength;
        }
        if (length > curveEnd && this->postLoop_ != CurveLoopType::Constant) {
            const double periods = std::trunc((length - curveStart) / curveLength);
            if (this->postLoop_ == CurveLoopType::Oscillate && std::fmod(periods, 2.0) == 1.0)
                return curveEnd + curveEnd - localParameter + curveLength * (periods - 1);
            return localParameter + periods * curveLength;
        }
        return localParameter;
    }

    // Segment between keys index and index + 1. Requires at least two keys.
    Segment<P> getSpline(int index) const {
        const int numberOfKeys = static_cast<int>(this->keys_.size());
        if (numberOfKeys < 2) throw std::logic_error("Path::getSpline: path has no complete segment");
        if (index < 0 || index >= numberOfKeys) throw std::out_of_range("Path::getSpline: index out of range");

        const Key& p2 = this->keys_[static_cast<std::size_t>(index)];
        const Key& p3 = this->keys_[static_cast<std::size_t>(std::min(numberOfKeys - 1, index + 1))];

        switch (p2.interpolation) {
        case SplineInterpolation::StepLeft:
            return StepSegment<P>{p2.point, p3.point, StepInterpolation::Left};
        case SplineInterpolation::StepCentered:
            return StepSegment<P>{p2.point, p3.point, StepInterpolation::Centered};
        case SplineInterpolation::StepRight:
            return StepSegment<P>{p2.point, p3.point, StepInterpolation::Right};
        case SplineInterpolation::Linear:
            return LineSegment<P>{p2.point, p3.point};
        case SplineInterpolation::Bezier:
            return BezierSegment<P>{p2.point, p2.tangentOut, p3.tangentIn, p3.point};
        case SplineInterpolation::Hermite:
            return HermiteSegment<P>{p2.point, p2.tangentOut, p3.tangentIn, p3.point};
        case SplineInterpolation::BSpline:
        case SplineInterpolation::CatmullRom:
            break;
        }

        const P& first = this->keys_.front().point;
        const P& second = this->keys_[1].point;
        const P& last = this->keys_.back().point;
        const P& beforeLast = this->keys_[static_cast<std::size_t>(numberOfKeys - 2)].point;
        const bool smooth = this->smoothEnds_;

        P p1;
        if (index > 0)
            p1 = this->keys_[static_cast<std::size_t>(index - 1)].point;
        else if (smooth && this->preLoop_ == CurveLoopType::Cycle)
            p1 = beforeLast;
        else if (smooth && this->preLoop_ == CurveLoopType::CycleOffset)
            p1 = Ops::sub(beforeLast, Ops::sub(last, first));
        else
            p1 = Ops::sub(first, Ops::sub(second, first));

        P p4;
        if (index + 2 < numberOfKeys)
            p4 = this->keys_[static_cast<std::size_t>(index + 2)].point;
        else if (smooth && this->postLoop_ == CurveLoopType::Cycle)
            p4 = second;
        else if (smooth && this->postLoop_ == CurveLoopType::CycleOffset)
            p4 = Ops::add(second, Ops::sub(last, first));
        else
            p4 = Ops::add(last, Ops::sub(last, beforeLast));

        if (p2.interpolation == SplineInterpolation::BSpline)
            return BSplineSegment<P>{p1, p2.point, p3.point, p4};
        return CatmullRomSegment<P>{p1, p2.point, p3.point, p4};
    }

private:
    // Adapts the path to the point/tangent interface of CurveHelper.
    struct Evaluator {
        const Path* path;
        P point(double t) const { return path->getPoint(t); }
        P tangent(double t) const { return path->getTangent(t); }
    };

    P getCycleOffset(double parameter) const {
        const double periods = this->getCyclePeriods(parameter);
        if (periods == 0.0) return Ops::zero();
        return Ops::scale(Ops::sub(this->keys_.back().point, this->keys_.front().point), periods);
    }
};

using Path1 = Path<double>;
using Path2 = Path<Point2>;
using Path3 = Path<Point3>;

#endif // XFCURVES_PATH_HXX
