#ifndef XFCURVES_CURVE_IO_HXX
#define XFCURVES_CURVE_IO_HXX

#include "Curve2.hxx"
#include "CurveKey.hxx"
#include "Path.hxx"

#include <iosfwd>
#include <string>
#include <vector>

// Everything a .crv file can hold. Blocks of each kind keep their file order.
struct CurveSet {
    std::vector<Curve2> curves;
    std::vector<Path1> paths1;
    std::vector<Path2> paths2;
    std::vector<Path3> paths3;

    std::size_t size() const { return curves.size() + paths1.size() + paths2.size() + paths3.size(); }
    bool empty() const { return size() == 0; }
};

namespace CurveIO {

// CRV text format. See CurveIO.cxx for the grammar.

// Parse from a stream and append to 'out'. Throws std::runtime_error on
// malformed input.
void read(std::istream& in, CurveSet& out);
// Write all curves and paths of 'set' to a stream.
void write(std::ostream& out, const CurveSet& set);

// Read a .crv file and append to 'out'. Returns false if the file cannot be
// opened; throws std::runtime_error on malformed input.
bool readFile(const std::string& path, CurveSet& out);
bool readFile(const std::string& path, CurveSet& out, std::string* errorMessage);

// Write a .crv file. Returns true on success.
bool writeFile(const std::string& path, const CurveSet& set);
bool writeFile(const std::string& path, const CurveSet& set, std::string* errorMessage);

// Keyword <-> enum helpers. The parse functions throw std::runtime_error on
// unknown keywords.
std::string toString(SplineInterpolation interpolation);
std::string toString(CurveLoopType loop);
SplineInterpolation parseInterpolation(const std::string& keyword);
CurveLoopType parseLoopType(const std::string& keyword);

} // namespace CurveIO

#endif // XFCURVES_CURVE_IO_HXX
