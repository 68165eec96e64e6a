#ifndef XFCURVES_PATH_MESHER_HXX
#define XFCURVES_PATH_MESHER_HXX

#include "Path.hxx"

#include <string>
#include <vector>

class PathMesher {
public:
    // Generate a 2D triangle mesh with Gmsh for the region bounded by closed
    // paths and write it to mshPath. boundaries[0] is the outer boundary, all
    // further paths are holes.
    // h: target element size
    // tolerance, maxIterations: passed to Path::flatten
    // Throws std::invalid_argument if a boundary is not a closed loop with at
    // least three distinct points. Returns true on success. (Gmsh is required
    // at build time.)
    static bool generate(const std::vector<Path2>& boundaries,
                         double h,
                         const std::string& mshPath,
                         double tolerance = 1e-3,
                         int maxIterations = 10);
    static bool generate(const std::vector<Path2>& boundaries,
                         double h,
                         const std::string& mshPath,
                         std::string* errorMessage,
                         double tolerance = 1e-3,
                         int maxIterations = 10);

    // Closed polyline approximating a boundary path, without the repeated
    // closing point.
    static std::vector<Point2> boundaryPolygon(const Path2& boundary, double tolerance, int maxIterations);
};

#endif // XFCURVES_PATH_MESHER_HXX
