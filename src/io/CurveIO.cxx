#include "CurveIO.hxx"

#include <cctype>
#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace {
static inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static void splitTokens(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
}

static std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

[[noreturn]] static void fail(int lineNo, const std::string& what) {
    throw std::runtime_error("CRV: line " + std::to_string(lineNo) + ": " + what);
}

static double parseNumber(const std::string& tok, int lineNo) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(tok, &used);
    } catch (const std::exception&) {
        fail(lineNo, "invalid number '" + tok + "'");
    }
    if (used != tok.size()) fail(lineNo, "invalid number '" + tok + "'");
    return v;
}

// Key as read from the file, before the dimension is known to the caller.
struct RawKey {
    SplineInterpolation interpolation = SplineInterpolation::Linear;
    bool hasParameter = false;
    double parameter = 0.0;
    std::vector<double> point, tangentIn, tangentOut;
};

// One curve2/path block being parsed.
struct Block {
    bool isPath = false;
    int dim = 2;
    CurveLoopType preLoop = CurveLoopType::Constant;
    CurveLoopType postLoop = CurveLoopType::Constant;
    bool smoothEnds = false;
    std::vector<RawKey> keys;
};

static void toPoint(const std::vector<double>& c, double& p) { p = c.empty() ? 0.0 : c[0]; }

template <std::size_t N>
static void toPoint(const std::vector<double>& c, std::array<double, N>& p) {
    p.fill(0.0);
    for (std::size_t i = 0; i < N && i < c.size(); ++i) p[i] = c[i];
}

static void writeCoords(std::ostream& os, double p) { os << ' ' << p; }

template <std::size_t N>
static void writeCoords(std::ostream& os, const std::array<double, N>& p) {
    for (double v : p) os << ' ' << v;
}

template <class Curve>
static void applyPolicies(const Block& b, Curve& c) {
    c.setPreLoop(b.preLoop);
    c.setPostLoop(b.postLoop);
    c.setSmoothEnds(b.smoothEnds);
}

template <class P>
static Path<P> buildPath(const Block& b) {
    Path<P> path;
    applyPolicies(b, path);
    for (const RawKey& rk : b.keys) {
        PathKey<P> key;
        key.parameter = rk.parameter;
        key.interpolation = rk.interpolation;
        toPoint(rk.point, key.point);
        toPoint(rk.tangentIn, key.tangentIn);
        toPoint(rk.tangentOut, key.tangentOut);
        path.add(key);
    }
    return path;
}

static Curve2 buildCurve(const Block& b) {
    Curve2 curve;
    applyPolicies(b, curve);
    for (const RawKey& rk : b.keys) {
        CurveKey2 key;
        key.interpolation = rk.interpolation;
        toPoint(rk.point, key.point);
        toPoint(rk.tangentIn, key.tangentIn);
        toPoint(rk.tangentOut, key.tangentOut);
        curve.add(key);
    }
    return curve;
}

static void finishBlockOrThrow(const Block& b, int lineNo, CurveSet& out) {
    if (b.keys.empty()) fail(lineNo, "block without keys");
    if (!b.isPath) { out.curves.push_back(buildCurve(b)); return; }
    switch (b.dim) {
    case 1: out.paths1.push_back(buildPath<double>(b)); break;
    case 2: out.paths2.push_back(buildPath<Point2>(b)); break;
    default: out.paths3.push_back(buildPath<Point3>(b)); break;
    }
}

// key <interpolation> [param <t>] point <c...> [tin <c...>] [tout <c...>]
static RawKey parseKey(const std::vector<std::string>& toks, const Block& b, int lineNo) {
    if (toks.size() < 2) fail(lineNo, "key requires an interpolation");
    RawKey key;
    try {
        key.interpolation = CurveIO::parseInterpolation(toks[1]);
    } catch (const std::runtime_error& e) {
        fail(lineNo, e.what());
    }

    const std::size_t dim = static_cast<std::size_t>(b.dim);
    std::size_t i = 2;
    while (i < toks.size()) {
        const std::string& word = toks[i++];
        if (word == "param") {
            if (!b.isPath) fail(lineNo, "'param' is only valid in path blocks");
            if (i >= toks.size()) fail(lineNo, "'param' requires a value");
            key.parameter = parseNumber(toks[i++], lineNo);
            key.hasParameter = true;
        } else if (word == "point" || word == "tin" || word == "tout") {
            if (i + dim > toks.size()) fail(lineNo, "'" + word + "' requires " + std::to_string(dim) + " coordinates");
            std::vector<double> coords;
            for (std::size_t k = 0; k < dim; ++k) coords.push_back(parseNumber(toks[i++], lineNo));
            if (word == "point") key.point = coords;
            else if (word == "tin") key.tangentIn = coords;
            else key.tangentOut = coords;
        } else {
            fail(lineNo, "unknown key attribute '" + word + "'");
        }
    }
    if (key.point.empty()) fail(lineNo, "key without 'point'");
    if (b.isPath && !key.hasParameter) fail(lineNo, "path key without 'param'");
    return key;
}

template <class Curve>
static void writePolicies(std::ostream& os, const Curve& c) {
    os << "preloop " << CurveIO::toString(c.preLoop()) << "\n";
    os << "postloop " << CurveIO::toString(c.postLoop()) << "\n";
    os << "smoothends " << (c.smoothEnds() ? 1 : 0) << "\n";
}

template <class P>
static void writePath(std::ostream& os, const Path<P>& path, int dim) {
    os << "path " << dim << "\n";
    writePolicies(os, path);
    for (const auto& k : path) {
        os << "key " << CurveIO::toString(k.interpolation) << " param " << k.parameter << " point";
        writeCoords(os, k.point);
        os << " tin";
        writeCoords(os, k.tangentIn);
        os << " tout";
        writeCoords(os, k.tangentOut);
        os << "\n";
    }
    os << "endpath\n\n";
}
} // anonymous namespace

namespace CurveIO {

//
// CRV text format
// Lines starting with '*' are comments. Inline comments after '#' are ignored.
// Whitespace separated tokens, keywords are case insensitive.
//
//    curve2
//    preloop <constant|linear|cycle|cycleoffset|oscillate>
//    postloop <...>
//    smoothends <0|1>
//    key <interpolation> point <x> <y> [tin <x> <y>] [tout <x> <y>]
//    endcurve
//
//    path <1|2|3>
//    preloop / postloop / smoothends as above
//    key <interpolation> param <t> point <c...> [tin <c...>] [tout <c...>]
//    endpath
//
// interpolation: linear, stepleft, stepcentered, stepright, bezier, bspline,
// hermite, catmullrom. Keys are stored in file order (not sorted).
//

std::string toString(SplineInterpolation interpolation) {
    switch (interpolation) {
    case SplineInterpolation::Linear: return "linear";
    case SplineInterpolation::StepLeft: return "stepleft";
    case SplineInterpolation::StepCentered: return "stepcentered";
    case SplineInterpolation::StepRight: return "stepright";
    case SplineInterpolation::Bezier: return "bezier";
    case SplineInterpolation::BSpline: return "bspline";
    case SplineInterpolation::Hermite: return "hermite";
    case SplineInterpolation::CatmullRom: return "catmullrom";
    }
    return "linear";
}

std::string toString(CurveLoopType loop) {
    switch (loop) {
    case CurveLoopType::Constant: return "constant";
    case CurveLoopType::Linear: return "linear";
    case CurveLoopType::Cycle: return "cycle";
    case CurveLoopType::CycleOffset: return "cycleoffset";
    case CurveLoopType::Oscillate: return "oscillate";
    }
    return "constant";
}

SplineInterpolation parseInterpolation(const std::string& keyword) {
    const std::string k = lower(keyword);
    if (k == "linear") return SplineInterpolation::Linear;
    if (k == "stepleft") return SplineInterpolation::StepLeft;
    if (k == "stepcentered") return SplineInterpolation::StepCentered;
    if (k == "stepright") return SplineInterpolation::StepRight;
    if (k == "bezier") return SplineInterpolation::Bezier;
    if (k == "bspline") return SplineInterpolation::BSpline;
    if (k == "hermite") return SplineInterpolation::Hermite;
    if (k == "catmullrom") return SplineInterpolation::CatmullRom;
    throw std::runtime_error("unknown interpolation '" + keyword + "'");
}

CurveLoopType parseLoopType(const std::string& keyword) {
    const std::string k = lower(keyword);
    if (k == "constant") return CurveLoopType::Constant;
    if (k == "linear") return CurveLoopType::Linear;
    if (k == "cycle") return CurveLoopType::Cycle;
    if (k == "cycleoffset") return CurveLoopType::CycleOffset;
    if (k == "oscillate") return CurveLoopType::Oscillate;
    throw std::runtime_error("unknown loop type '" + keyword + "'");
}

void read(std::istream& in, CurveSet& out) {
    std::string line;
    std::vector<std::string> toks;
    bool inBlock = false;
    Block block;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        // Strip inline comments after '#'
        auto hashPos = line.find('#');
        if (hashPos != std::string::npos) line = line.substr(0, hashPos);
        std::string t = trim(line);
        if (t.empty()) continue;
        if (t[0] == '*') continue; // full-line comment

        splitTokens(t, toks);
        if (toks.empty()) continue;
        const std::string word = lower(toks[0]);

        if (!inBlock) {
            block = Block();
            if (word == "curve2") {
                block.isPath = false;
                block.dim = 2;
            } else if (word == "path") {
                block.isPath = true;
                if (toks.size() < 2) fail(lineNo, "path requires a dimension (1, 2 or 3)");
                const double dim = parseNumber(toks[1], lineNo);
                if (dim != 1.0 && dim != 2.0 && dim != 3.0) fail(lineNo, "path dimension must be 1, 2 or 3");
                block.dim = static_cast<int>(dim);
            } else {
                fail(lineNo, "expected 'curve2' or 'path'");
            }
            inBlock = true;
            continue;
        }

        if (word == "preloop" || word == "postloop") {
            if (toks.size() < 2) fail(lineNo, "'" + word + "' requires a loop type");
            CurveLoopType loop = CurveLoopType::Constant;
            try {
                loop = parseLoopType(toks[1]);
            } catch (const std::runtime_error& e) {
                fail(lineNo, e.what());
            }
            if (word == "preloop") block.preLoop = loop; else block.postLoop = loop;
        } else if (word == "smoothends") {
            if (toks.size() < 2) fail(lineNo, "'smoothends' requires 0 or 1");
            const std::string v = lower(toks[1]);
            if (v == "1" || v == "true") block.smoothEnds = true;
            else if (v == "0" || v == "false") block.smoothEnds = false;
            else fail(lineNo, "'smoothends' requires 0 or 1");
        } else if (word == "key") {
            block.keys.push_back(parseKey(toks, block, lineNo));
        } else if ((word == "endcurve" && !block.isPath) || (word == "endpath" && block.isPath)) {
            finishBlockOrThrow(block, lineNo, out);
            inBlock = false;
        } else {
            fail(lineNo, "unknown token '" + toks[0] + "'");
        }
    }
    if (inBlock) throw std::runtime_error("CRV: unterminated block");
}

void write(std::ostream& os, const CurveSet& set) {
    const std::streamsize oldPrecision = os.precision(std::numeric_limits<double>::max_digits10);
    os << "* xf-curves CRV format\n";
    for (const Curve2& c : set.curves) {
        os << "curve2\n";
        writePolicies(os, c);
        for (const CurveKey2& k : c) {
            os << "key " << toString(k.interpolation) << " point";
            writeCoords(os, k.point);
            os << " tin";
            writeCoords(os, k.tangentIn);
            os << " tout";
            writeCoords(os, k.tangentOut);
            os << "\n";
        }
        os << "endcurve\n\n";
    }
    for (const Path1& p : set.paths1) writePath(os, p, 1);
    for (const Path2& p : set.paths2) writePath(os, p, 2);
    for (const Path3& p : set.paths3) writePath(os, p, 3);
    os.precision(oldPrecision);
}

bool readFile(const std::string& path, CurveSet& out) {
    std::ifstream ifs(path);
    if (!ifs) return false;
    read(ifs, out);
    return true;
}

bool readFile(const std::string& path, CurveSet& out, std::string* errorMessage) {
    try {
        if (readFile(path, out)) return true;
        if (errorMessage) *errorMessage = "CRV: cannot open '" + path + "'";
        return false;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

bool writeFile(const std::string& path, const CurveSet& set) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    write(ofs, set);
    return static_cast<bool>(ofs);
}

bool writeFile(const std::string& path, const CurveSet& set, std::string* errorMessage) {
    try {
        if (writeFile(path, set)) return true;
        if (errorMessage) *errorMessage = "CRV: cannot write '" + path + "'";
        return false;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

} // namespace CurveIO
