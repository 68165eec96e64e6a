#include "CurveIO.hxx"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <string>

// Samples the first curve2 block (or path block) of a .crv file over [t0, t1].
static void printPoint(double p) { std::printf(" %.9g", p); }

template <std::size_t N>
static void printPoint(const std::array<double, N>& p) {
    for (double v : p) std::printf(" %.9g", v);
}

template <class Curve>
static void sample(const Curve& curve, double t0, double t1, int n) {
    for (int i = 0; i < n; ++i) {
        const double t = (n == 1) ? t0 : t0 + (t1 - t0) * i / (n - 1);
        std::printf("%.9g", t);
        printPoint(curve.getPoint(t));
        std::printf(" |");
        printPoint(curve.getTangent(t));
        std::printf("\n");
    }
}

int main(int argc, char** argv) {
    if (argc < 5 || argc > 6) {
        std::fprintf(stderr, "Usage: %s <curves.crv> <t0> <t1> <samples> [curve2|path1|path2|path3]\n", argv[0]);
        return 2;
    }
    const std::string crvPath = argv[1];
    const double t0 = std::atof(argv[2]);
    const double t1 = std::atof(argv[3]);
    const int n = std::atoi(argv[4]);
    const std::string kind = (argc >= 6) ? argv[5] : "curve2";
    if (n < 1) {
        std::fprintf(stderr, "Sample count must be at least 1\n");
        return 2;
    }

    CurveSet set;
    std::string err;
    if (!CurveIO::readFile(crvPath, set, &err)) {
        std::fprintf(stderr, "Failed to read CRV %s: %s\n", crvPath.c_str(), err.c_str());
        return 1;
    }

    // Columns: parameter, point..., '|', tangent...
    if (kind == "curve2" && !set.curves.empty()) {
        sample(set.curves.front(), t0, t1, n);
    } else if (kind == "path1" && !set.paths1.empty()) {
        sample(set.paths1.front(), t0, t1, n);
    } else if (kind == "path2" && !set.paths2.empty()) {
        sample(set.paths2.front(), t0, t1, n);
    } else if (kind == "path3" && !set.paths3.empty()) {
        sample(set.paths3.front(), t0, t1, n);
    } else {
        std::fprintf(stderr, "No %s block in %s\n", kind.c_str(), crvPath.c_str());
        return 1;
    }
    return 0;
}
