#ifndef XFCURVES_PIECEWISE_CURVE_HXX
#define XFCURVES_PIECEWISE_CURVE_HXX

#include "CurveKey.hxx"
#include "PointOps.hxx"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Ordered list of curve keys plus the policies that control what happens
// outside of the key range. Keys are expected to be sorted by parameter
// (call sort() after editing parameters); this is not checked.
//
// Key needs a free function keyParameter(const Key&).
template <class Key>
class PiecewiseCurve {
public:
    using KeyType = Key;
    using iterator = typename std::vector<Key>::iterator;
    using const_iterator = typename std::vector<Key>::const_iterator;

    // Key collection
    std::size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }
    void add(const Key& key) { keys_.push_back(key); }
    // Throws std::out_of_range unless index <= size().
    void insert(std::size_t index, const Key& key) {
        if (index > keys_.size()) throw std::out_of_range("PiecewiseCurve::insert: index " + std::to_string(index) + " out of range");
        keys_.insert(keys_.begin() + static_cast<std::ptrdiff_t>(index), key);
    }
    // Throws std::out_of_range unless index < size().
    void removeAt(std::size_t index) {
        if (index >= keys_.size()) throw std::out_of_range("PiecewiseCurve::removeAt: index " + std::to_string(index) + " out of range");
        keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(index));
    }
    void clear() { keys_.clear(); }

    Key& operator[](std::size_t index) { return keys_[index]; }
    const Key& operator[](std::size_t index) const { return keys_[index]; }
    Key& at(std::size_t index) { return keys_.at(index); }
    const Key& at(std::size_t index) const { return keys_.at(index); }
    const std::vector<Key>& keys() const { return keys_; }

    iterator begin() { return keys_.begin(); }
    iterator end() { return keys_.end(); }
    const_iterator begin() const { return keys_.begin(); }
    const_iterator end() const { return keys_.end(); }

    // Stable sort by ascending key parameter.
    void sort() {
        std::stable_sort(keys_.begin(), keys_.end(), [](const Key& a, const Key& b) {
            return keyParameter(a) < keyParameter(b);
        });
    }

    // Policies
    CurveLoopType preLoop() const { return preLoop_; }
    CurveLoopType postLoop() const { return postLoop_; }
    bool smoothEnds() const { return smoothEnds_; }
    void setPreLoop(CurveLoopType loop) { preLoop_ = loop; }
    void setPostLoop(CurveLoopType loop) { postLoop_ = loop; }
    // Wrap or mirror neighbors at the curve ends for CatmullRom and BSpline
    // segments so that looped curves join smoothly.
    void setSmoothEnds(bool smooth) { smoothEnds_ = smooth; }

    // Index of the key with the largest parameter <= the looped parameter.
    // Returns -1 before the first key (Linear pre-loop only) and size()-1 at
    // or after the last key.
    int getKeyIndex(double parameter) const {
        const int n = static_cast<int>(keys_.size());
        if (n == 0) return -1;

        const double p = loopParameter(parameter);
        if (p < keyParameter(keys_.front())) return -1;
        if (p >= keyParameter(keys_.back())) return n - 1;

        // keys[lo] <= p < keys[hi]
        int lo = 0;
        int hi = n - 1;
        while (hi - lo > 1) {
            const int mid = (lo + hi) / 2;
            if (p < keyParameter(keys_[static_cast<std::size_t>(mid)])) hi = mid;
            else lo = mid;
        }
        return lo;
    }

    // Maps a parameter outside of the key range back into it according to the
    // loop policies. Linear loops return the parameter unchanged.
    double loopParameter(double parameter) const {
        if (keys_.empty()) return parameter;

        const double curveStart = keyParameter(keys_.front());
        const double curveEnd = keyParameter(keys_.back());
        const double curveLength = curveEnd - curveStart;

        if (parameter < curveStart) {
            if (preLoop_ == CurveLoopType::Constant) return curveStart;
            if (preLoop_ == CurveLoopType::Linear) return parameter;
            if (Numeric::isZero(curveLength)) return curveStart;

            const double periods = std::floor((curveEnd - parameter) / curveLength);
            const double looped = parameter + periods * curveLength;
            if (preLoop_ == CurveLoopType::Oscillate && isOdd(periods)) return curveStart + curveEnd - looped;
            return looped;
        }
        if (parameter > curveEnd) {
            if (postLoop_ == CurveLoopType::Constant) return curveEnd;
            if (postLoop_ == CurveLoopType::Linear) return parameter;
            if (Numeric::isZero(curveLength)) return curveStart;

            const double periods = std::floor((parameter - curveStart) / curveLength);
            const double looped = parameter - periods * curveLength;
            if (postLoop_ == CurveLoopType::Oscillate && isOdd(periods)) return curveStart + curveEnd - looped;
            return looped;
        }
        return parameter;
    }

    // True if the parameter lies in a reversed pass of an Oscillate loop.
    bool isInMirroredOscillation(double parameter) const {
        if (keys_.empty()) return false;

        const double curveStart = keyParameter(keys_.front());
        const double curveEnd = keyParameter(keys_.back());
        const double curveLength = curveEnd - curveStart;
        if (Numeric::isZero(curveLength)) return false;

        if (parameter < curveStart && preLoop_ == CurveLoopType::Oscillate)
            return isOdd(std::floor((curveEnd - parameter) / curveLength));
        if (parameter > curveEnd && postLoop_ == CurveLoopType::Oscillate)
            return isOdd(std::floor((parameter - curveStart) / curveLength));
        return false;
    }

    // Number of whole periods the raw parameter is away from the key range,
    // used to offset CycleOffset loops. Negative before the first key, zero
    // unless the matching loop policy is CycleOffset. Kept as a whole double
    // so parameters billions of periods away do not overflow.
    double getCyclePeriods(double parameter) const {
        if (keys_.empty()) return 0.0;

        const double curveStart = keyParameter(keys_.front());
        const double curveEnd = keyParameter(keys_.back());
        const double curveLength = curveEnd - curveStart;
        if (Numeric::isZero(curveLength)) return 0.0;

        if (parameter < curveStart && preLoop_ == CurveLoopType::CycleOffset)
            return std::trunc((parameter - curveEnd) / curveLength);
        if (parameter > curveEnd && postLoop_ == CurveLoopType::CycleOffset)
            return std::trunc((parameter - curveStart) / curveLength);
        return 0.0;
    }

protected:
    static bool isOdd(double wholeNumber) { return std::fmod(wholeNumber, 2.0) != 0.0; }

    std::vector<Key> keys_;
    CurveLoopType preLoop_ = CurveLoopType::Constant;
    CurveLoopType postLoop_ = CurveLoopType::Constant;
    bool smoothEnds_ = false;
};

#endif // XFCURVES_PIECEWISE_CURVE_HXX
