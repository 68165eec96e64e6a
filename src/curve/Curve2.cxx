#include "Curve2.hxx"
#include "CurveHelper.hxx"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <variant>

namespace {
inline Point2 unitX() { return Point2{1.0, 0.0}; }

inline bool needsRootFinding(SplineInterpolation i) {
    return i == SplineInterpolation::Bezier
        || i == SplineInterpolation::BSpline
        || i == SplineInterpolation::CatmullRom
        || i == SplineInterpolation::Hermite;
}

inline StepInterpolation toStepType(SplineInterpolation i) {
    if (i == SplineInterpolation::StepCentered) return StepInterpolation::Centered;
    if (i == SplineInterpolation::StepRight) return StepInterpolation::Right;
    return StepInterpolation::Left;
}

inline double solveX(const Segment<double>& xSpline, double x, int maxIterations) {
    return std::visit([&](const auto& s) { return CurveHelper::getParameter(s, x, maxIterations); }, xSpline);
}
} // anonymous namespace

Point2 Curve2::getPoint(double parameter) const {
    const int numberOfKeys = static_cast<int>(keys_.size());
    if (numberOfKeys == 0) return PointOps<Point2>::nan();

    const CurveKey2& firstKey = keys_.front();
    const CurveKey2& lastKey = keys_.back();
    const double curveStart = keyParameter(firstKey);
    const double curveEnd = keyParameter(lastKey);

    const double loopedParameter = loopParameter(parameter);

    // Linear loops: extrapolate along the boundary slope.
    if (loopedParameter < curveStart) {
        const Point2 tangent = getBoundaryTangent(true, false);
        const double k = Numeric::isZero(tangent[0]) ? 0.0 : tangent[1] / tangent[0];
        return Point2{parameter, firstKey.point[1] + k * (loopedParameter - curveStart)};
    }
    if (loopedParameter > curveEnd) {
        const Point2 tangent = getBoundaryTangent(false, false);
        const double k = Numeric::isZero(tangent[0]) ? 0.0 : tangent[1] / tangent[0];
        return Point2{parameter, lastKey.point[1] + k * (loopedParameter - curveEnd)};
    }

    if (numberOfKeys == 1) return Point2{parameter, firstKey.point[1]};

    const double cycleOffset = getCycleOffset(parameter);

    // BSplines do not pass through their keys, so the last key is only exact
    // for the other types.
    if (loopedParameter == curveEnd
        && keys_[static_cast<std::size_t>(numberOfKeys - 2)].interpolation != SplineInterpolation::BSpline) {
        return Point2{parameter, lastKey.point[1] + cycleOffset};
    }

    int index = getKeyIndex(loopedParameter);
    if (index == numberOfKeys - 1) --index;

    Segment<double> xSpline;
    Segment<double> ySpline;
    const double u = getSplineParameter(index, loopedParameter, xSpline, ySpline);
    return Point2{parameter, segmentPoint(ySpline, u) + cycleOffset};
}

Point2 Curve2::getTangent(double parameter) const {
    const int numberOfKeys = static_cast<int>(keys_.size());
    if (numberOfKeys == 0) return PointOps<Point2>::zero();

    const CurveKey2& firstKey = keys_.front();
    const double curveStart = keyParameter(firstKey);
    const double curveEnd = keyParameter(keys_.back());

    if ((preLoop_ == CurveLoopType::Constant && parameter < curveStart)
        || (postLoop_ == CurveLoopType::Constant && parameter > curveEnd)) {
        return unitX();
    }

    const double loopedParameter = loopParameter(parameter);

    // Segment tangents are relative to u in [0, 1]; divide by the length of
    // the key interval to get d/dx.
    if (loopedParameter < curveStart) {
        const Point2 tangent = getBoundaryTangent(true, true);
        const double splineLength = numberOfKeys > 1 ? keyParameter(keys_[1]) - curveStart : 0.0;
        return splineLength > 0.0 ? PointOps<Point2>::scale(tangent, 1.0 / splineLength) : tangent;
    }
    if (loopedParameter > curveEnd) {
        const Point2 tangent = getBoundaryTangent(false, true);
        const double splineLength = numberOfKeys > 1
            ? curveEnd - keyParameter(keys_[static_cast<std::size_t>(numberOfKeys - 2)]) : 0.0;
        return splineLength > 0.0 ? PointOps<Point2>::scale(tangent, 1.0 / splineLength) : tangent;
    }

    if (numberOfKeys == 1) {
        // Not scaled: a single key has no interval length.
        if (postLoop_ == CurveLoopType::Linear) {
            if (firstKey.interpolation == SplineInterpolation::Bezier)
                return PointOps<Point2>::scale(PointOps<Point2>::sub(firstKey.tangentOut, firstKey.point), 3.0);
            if (firstKey.interpolation == SplineInterpolation::Hermite)
                return firstKey.tangentOut;
        } else if (preLoop_ == CurveLoopType::Linear) {
            if (firstKey.interpolation == SplineInterpolation::Bezier)
                return PointOps<Point2>::scale(PointOps<Point2>::sub(firstKey.point, firstKey.tangentIn), 3.0);
            if (firstKey.interpolation == SplineInterpolation::Hermite)
                return firstKey.tangentIn;
        }
        return unitX();
    }

    int index = getKeyIndex(loopedParameter);
    if (index == numberOfKeys - 1) --index;

    const CurveKey2& p2 = keys_[static_cast<std::size_t>(index)];
    const CurveKey2& p3 = keys_[static_cast<std::size_t>(index + 1)];
    if (isStepInterpolation(p2.interpolation)) return unitX();

    const double splineLength = keyParameter(p3) - keyParameter(p2);

    Segment<double> xSpline;
    Segment<double> ySpline;
    const double u = getSplineParameter(index, loopedParameter, xSpline, ySpline);

    const double tangentX = segmentTangent(xSpline, u);
    double tangentY = segmentTangent(ySpline, u);
    if (isInMirroredOscillation(parameter)) tangentY = -tangentY;

    return Point2{tangentX / splineLength, tangentY / splineLength};
}

double Curve2::getLength(double, double, int, double) const {
    throw std::logic_error("Curve2::getLength is not supported");
}

void Curve2::flatten(std::vector<Point2>&, int, double) const {
    throw std::logic_error("Curve2::flatten is not supported");
}

double Curve2::getCycleOffset(double parameter) const {
    const double periods = getCyclePeriods(parameter);
    if (periods == 0.0) return 0.0;
    return periods * (keys_.back().point[1] - keys_.front().point[1]);
}

Point2 Curve2::getBoundaryTangent(bool atStart, bool flatSteps) const {
    const int numberOfKeys = static_cast<int>(keys_.size());
    const CurveKey2& key = atStart ? keys_.front() : keys_.back();

    // Bezier and Hermite keys carry the exact outer tangent.
    switch (key.interpolation) {
    case SplineInterpolation::Bezier:
        return atStart
            ? PointOps<Point2>::scale(PointOps<Point2>::sub(key.point, key.tangentIn), 3.0)
            : PointOps<Point2>::scale(PointOps<Point2>::sub(key.tangentOut, key.point), 3.0);
    case SplineInterpolation::Hermite:
        return atStart ? key.tangentIn : key.tangentOut;
    case SplineInterpolation::StepLeft:
    case SplineInterpolation::StepCentered:
    case SplineInterpolation::StepRight:
        if (flatSteps) return unitX();
        break;
    default:
        break;
    }

    if (numberOfKeys < 2) return unitX();

    Segment<double> xSpline;
    Segment<double> ySpline;
    const double u = atStart ? 0.0 : 1.0;
    getSplines(atStart ? 0 : numberOfKeys - 2, xSpline, ySpline);
    return Point2{segmentTangent(xSpline, u), segmentTangent(ySpline, u)};
}

double Curve2::getSplineParameter(int index, double loopedParameter,
                                  Segment<double>& xSpline, Segment<double>& ySpline) const {
    const int numberOfKeys = static_cast<int>(keys_.size());
    const CurveKey2& p2 = keys_[static_cast<std::size_t>(index)];
    const double splineStart = keyParameter(p2);
    const double splineLength = keyParameter(keys_[static_cast<std::size_t>(index + 1)]) - splineStart;

    getSplines(index, xSpline, ySpline);
    if (Numeric::isZero(splineLength)) return 0.0;
    if (!needsRootFinding(p2.interpolation)) return (loopedParameter - splineStart) / splineLength;

    double u = solveX(xSpline, loopedParameter, kRootIterations);
    if (std::isnan(u) && p2.interpolation == SplineInterpolation::BSpline) {
        // A BSpline segment does not span exactly from its key to the next
        // one; the x value may be covered by a neighbor. Left first.
        if (index - 1 >= 0 && keys_[static_cast<std::size_t>(index - 1)].interpolation == SplineInterpolation::BSpline) {
            getSplines(index - 1, xSpline, ySpline);
            u = solveX(xSpline, loopedParameter, kRootIterations);
        }
        if (std::isnan(u) && index + 1 < numberOfKeys - 1
            && keys_[static_cast<std::size_t>(index + 1)].interpolation == SplineInterpolation::BSpline) {
            getSplines(index + 1, xSpline, ySpline);
            u = solveX(xSpline, loopedParameter, kRootIterations);
        }
    }
    return u;
}

void Curve2::getSplines(int index, Segment<double>& xSpline, Segment<double>& ySpline) const {
    const int count = static_cast<int>(keys_.size());
    const CurveKey2& p2 = keys_[static_cast<std::size_t>(index)];
    const CurveKey2& p3 = keys_[static_cast<std::size_t>(std::min(count - 1, index + 1))];

    switch (p2.interpolation) {
    case SplineInterpolation::StepLeft:
    case SplineInterpolation::StepCentered:
    case SplineInterpolation::StepRight: {
        const StepInterpolation stepType = toStepType(p2.interpolation);
        xSpline = StepSegment<double>{p2.point[0], p3.point[0], stepType};
        ySpline = StepSegment<double>{p2.point[1], p3.point[1], stepType};
        return;
    }
    case SplineInterpolation::Linear:
        xSpline = LineSegment<double>{p2.point[0], p3.point[0]};
        ySpline = LineSegment<double>{p2.point[1], p3.point[1]};
        return;
    case SplineInterpolation::Bezier:
        xSpline = BezierSegment<double>{p2.point[0], p2.tangentOut[0], p3.tangentIn[0], p3.point[0]};
        ySpline = BezierSegment<double>{p2.point[1], p2.tangentOut[1], p3.tangentIn[1], p3.point[1]};
        return;
    case SplineInterpolation::Hermite:
        xSpline = HermiteSegment<double>{p2.point[0], p2.tangentOut[0], p3.tangentIn[0], p3.point[0]};
        ySpline = HermiteSegment<double>{p2.point[1], p2.tangentOut[1], p3.tangentIn[1], p3.point[1]};
        return;
    case SplineInterpolation::BSpline:
    case SplineInterpolation::CatmullRom:
        break;
    }

    const Point2& first = keys_.front().point;
    const Point2& second = keys_[1].point;
    const Point2& last = keys_.back().point;
    const Point2& beforeLast = keys_[static_cast<std::size_t>(count - 2)].point;
    const bool catmullRom = p2.interpolation == SplineInterpolation::CatmullRom;

    // Neighbor p1 before p2.
    Point2 p1;
    if (index > 0) {
        p1 = keys_[static_cast<std::size_t>(index - 1)].point;
    } else if (smoothEnds_ && preLoop_ == CurveLoopType::Constant && catmullRom) {
        // Mirrored x, flat y. Not used for BSplines, which would then miss the first key.
        p1 = Point2{first[0] - (second[0] - first[0]), p2.point[1]};
    } else if (smoothEnds_ && preLoop_ == CurveLoopType::Cycle) {
        p1 = Point2{beforeLast[0] - (last[0] - first[0]), beforeLast[1]};
    } else if (smoothEnds_ && preLoop_ == CurveLoopType::CycleOffset) {
        p1 = PointOps<Point2>::sub(beforeLast, PointOps<Point2>::sub(last, first));
    } else if (smoothEnds_ && preLoop_ == CurveLoopType::Oscillate) {
        p1 = Point2{first[0] - (second[0] - first[0]), p3.point[1]};
    } else {
        p1 = PointOps<Point2>::sub(first, PointOps<Point2>::sub(second, first));
    }

    // Neighbor p4 after p3.
    Point2 p4;
    if (index + 2 < count) {
        p4 = keys_[static_cast<std::size_t>(index + 2)].point;
    } else if (smoothEnds_ && postLoop_ == CurveLoopType::Constant && catmullRom) {
        p4 = Point2{last[0] + (last[0] - beforeLast[0]), p3.point[1]};
    } else if (smoothEnds_ && postLoop_ == CurveLoopType::Cycle) {
        p4 = Point2{second[0] + (last[0] - first[0]), second[1]};
    } else if (smoothEnds_ && postLoop_ == CurveLoopType::CycleOffset) {
        p4 = PointOps<Point2>::add(second, PointOps<Point2>::sub(last, first));
    } else if (smoothEnds_ && postLoop_ == CurveLoopType::Oscillate) {
        p4 = Point2{last[0] + (last[0] - beforeLast[0]), p2.point[1]};
    } else {
        p4 = PointOps<Point2>::add(last, PointOps<Point2>::sub(last, beforeLast));
    }

    if (catmullRom) {
        xSpline = CatmullRomSegment<double>{p1[0], p2.point[0], p3.point[0], p4[0]};
        ySpline = CatmullRomSegment<double>{p1[1], p2.point[1], p3.point[1], p4[1]};
    } else {
        xSpline = BSplineSegment<double>{p1[0], p2.point[0], p3.point[0], p4[0]};
        ySpline = BSplineSegment<double>{p1[1], p2.point[1], p3.point[1], p4[1]};
    }
}
