#include "PathMesher.hxx"
#include "Polyline.hxx"
#include <gmsh.h>

#include <stdexcept>
#include <unordered_map>
#include <cmath>

struct PointKeyHash {
    std::size_t operator()(const std::pair<long long,long long>& k) const noexcept {
        const unsigned long long hi = static_cast<unsigned long long>(k.first) << 32;
        return std::hash<unsigned long long>()(hi ^ static_cast<unsigned long long>(k.second));
    }
};

using PointMap = std::unordered_map<std::pair<long long,long long>, int, PointKeyHash>;

static int getOrCreatePoint(const Point2& p, double h, int& nextPointTag, PointMap& map) {
    const double scale = 1e12; // tolerance bucket
    long long ix = static_cast<long long>(std::llround(p[0] * scale));
    long long iy = static_cast<long long>(std::llround(p[1] * scale));
    auto key = std::make_pair(ix, iy);
    auto it = map.find(key);
    if (it != map.end()) return it->second;
    int tag = nextPointTag++;
    gmsh::model::geo::addPoint(p[0], p[1], 0.0, h, tag);
    map.emplace(key, tag);
    return tag;
}

// Adds the polygon as a closed chain of lines and returns the curve loop tag.
static int addPolygonLoop(const std::vector<Point2>& polygon, double h,
                          int& nextPointTag, int& nextCurveTag, int& nextCurveLoopTag,
                          PointMap& pointMap) {
    std::vector<int> ptTags;
    ptTags.reserve(polygon.size());
    for (const auto& p : polygon) ptTags.push_back(getOrCreatePoint(p, h, nextPointTag, pointMap));

    std::vector<int> wire;
    wire.reserve(ptTags.size());
    for (std::size_t i = 0; i < ptTags.size(); ++i) {
        int curveTag = nextCurveTag++;
        gmsh::model::geo::addLine(ptTags[i], ptTags[(i + 1) % ptTags.size()], curveTag);
        wire.push_back(curveTag);
    }
    int loopTag = nextCurveLoopTag++;
    gmsh::model::geo::addCurveLoop(wire, loopTag);
    return loopTag;
}

std::vector<Point2> PathMesher::boundaryPolygon(const Path2& boundary, double tolerance, int maxIterations) {
    std::vector<Point2> pairs;
    boundary.flatten(pairs, maxIterations, tolerance);
    // Points closer than this are merged.
    const double mergeTol = 1e-9;
    std::vector<Point2> polygon = Polyline::fromSegments(pairs, mergeTol);
    if (!Polyline::openClosedLoop(polygon, mergeTol)) {
        throw std::invalid_argument("PathMesher: boundary path is not closed");
    }
    if (polygon.size() < 3) {
        throw std::invalid_argument("PathMesher: boundary path has fewer than three distinct points");
    }
    return polygon;
}

bool PathMesher::generate(const std::vector<Path2>& boundaries,
                          double h,
                          const std::string& mshPath,
                          double tolerance,
                          int maxIterations) {
    if (boundaries.empty()) throw std::invalid_argument("PathMesher: no boundary paths");
    if (!(h > 0.0)) throw std::invalid_argument("PathMesher: element size must be greater than zero");

    std::vector<std::vector<Point2>> polygons;
    polygons.reserve(boundaries.size());
    for (const auto& b : boundaries) polygons.push_back(boundaryPolygon(b, tolerance, maxIterations));

    gmsh::initialize();
    try {
        gmsh::model::add("xfcurves");
        // Tag counters (reset per generate call)
        int nextPointTag = 1;
        int nextCurveTag = 1;
        int nextCurveLoopTag = 1;
        PointMap pointMap;

        // First loop is the outer boundary, the rest are holes.
        std::vector<int> loopTags;
        for (const auto& polygon : polygons) {
            loopTags.push_back(addPolygonLoop(polygon, h, nextPointTag, nextCurveTag, nextCurveLoopTag, pointMap));
        }
        gmsh::model::geo::addPlaneSurface(loopTags, 1);

        gmsh::model::geo::synchronize();
        gmsh::model::mesh::generate(2);
        gmsh::write(mshPath);
    } catch (...) {
        gmsh::finalize();
        throw;
    }
    gmsh::finalize();
    return true;
}

bool PathMesher::generate(const std::vector<Path2>& boundaries,
                          double h,
                          const std::string& mshPath,
                          std::string* errorMessage,
                          double tolerance,
                          int maxIterations) {
    try {
        return generate(boundaries, h, mshPath, tolerance, maxIterations);
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}
