#include "CurveIO.hxx"
#include "PathMesher.hxx"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static std::string replaceExt(const std::string& path, const std::string& newExt) {
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos) return path + newExt;
    return path.substr(0, pos) + newExt;
}

int main(int argc, char** argv) {
    if (argc < 3 || argc > 5) {
        std::fprintf(stderr, "Usage: %s <boundaries.crv> <target_h> [out.msh] [flatten_tol]\n", argv[0]);
        return 2;
    }
    const std::string crvPath = argv[1];
    const double h = std::atof(argv[2]);
    std::string mshPath = (argc >= 4) ? argv[3] : replaceExt(crvPath, ".msh");
    const double tol = (argc >= 5) ? std::atof(argv[4]) : 1e-3;

    // Load boundary paths (2D path blocks; the first one is the outer boundary)
    CurveSet set;
    std::string err;
    if (!CurveIO::readFile(crvPath, set, &err)) {
        std::fprintf(stderr, "Failed to read CRV %s: %s\n", crvPath.c_str(), err.c_str());
        return 1;
    }
    if (set.paths2.empty()) {
        std::fprintf(stderr, "No 'path 2' blocks in %s\n", crvPath.c_str());
        return 1;
    }

    // Generate mesh
    if (!PathMesher::generate(set.paths2, h, mshPath, &err, tol)) {
        std::fprintf(stderr, "Mesh generation failed: %s\n", err.c_str());
        return 1;
    }
    std::printf("Wrote mesh: %s (%zu boundaries)\n", mshPath.c_str(), set.paths2.size());
    return 0;
}
