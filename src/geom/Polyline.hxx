#ifndef XFCURVES_POLYLINE_HXX
#define XFCURVES_POLYLINE_HXX

#include "PointOps.hxx"

#include <vector>

// Helpers for the point-pair output of the flatten() functions.
namespace Polyline {

template <class P>
bool samePoint(const P& a, const P& b, double tol) {
    return PointOps<P>::length(PointOps<P>::sub(a, b)) <= tol;
}

// Joins consecutive (start, end) pairs into one polyline. Points closer than
// tol to their predecessor are dropped, which also removes the shared points
// that adjacent pairs repeat.
template <class P>
std::vector<P> fromSegments(const std::vector<P>& pairs, double tol) {
    std::vector<P> out;
    out.reserve(pairs.size() / 2 + 1);
    for (const P& p : pairs) {
        if (out.empty() || !samePoint(out.back(), p, tol)) out.push_back(p);
    }
    return out;
}

// Removes the closing point of a polyline that ends where it starts. Returns
// true if the polyline was closed.
template <class P>
bool openClosedLoop(std::vector<P>& polyline, double tol) {
    if (polyline.size() < 2) return false;
    if (!samePoint(polyline.front(), polyline.back(), tol)) return false;
    polyline.pop_back();
    return true;
}

} // namespace Polyline

#endif // XFCURVES_POLYLINE_HXX
