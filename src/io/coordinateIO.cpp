#include "spcalc/io/coordinateIO.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace spcalc { namespace io {

using algebra::FormatError;
using Index  = MatrixSparse::Index;
using Scalar = MatrixSparse::Scalar;

static std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

// Whole-token base-10 integer. Out-of-range magnitudes saturate and set overflow.
static bool parse_integer(const std::string& tok, long long& out, bool& overflow)
{
    if (tok.empty()) return false;
    const char* p = tok.c_str();
    char* end = nullptr;
    errno = 0;
    out = std::strtoll(p, &end, 10);
    if (end == p || *end != '\0') return false;
    overflow = (errno == ERANGE);
    return true;
}

// Whole-token finite decimal value. Hex floats, nan, inf and values that
// overflow to inf are rejected; gradual underflow is accepted.
static bool parse_real(const std::string& tok, Scalar& out)
{
    if (tok.empty()) return false;
    if (tok.find_first_of("xX") != std::string::npos) return false;
    const char* p = tok.c_str();
    char* end = nullptr;
    errno = 0;
    out = std::strtod(p, &end);
    if (end == p || *end != '\0') return false;
    if (errno == ERANGE && std::isinf(out)) return false;
    return std::isfinite(out);
}

// "<key>=<non-negative integer>"
static Index parse_dimension(const std::string& line, const std::string& key, std::size_t lineno)
{
    const std::string prefix = key + "=";
    if (line.compare(0, prefix.size(), prefix) != 0)
        throw FormatError("missing '" + prefix + "' declaration, got '" + line + "'", lineno);

    const std::string tok = trim(line.substr(prefix.size()));
    long long v = 0;
    bool overflow = false;
    if (!parse_integer(tok, v, overflow) || overflow)
        throw FormatError("invalid '" + prefix + "' value '" + tok + "'", lineno);
    if (v < 0)
        throw FormatError("negative dimension in '" + line + "'", lineno);
    return static_cast<Index>(v);
}

std::vector<std::pair<ParseStats::Position, std::size_t>>
ParseStats::topOutOfBounds(std::size_t k) const
{
    std::vector<std::pair<Position, std::size_t>> v(out_of_bounds.begin(), out_of_bounds.end());
    // Most frequent first; ties keep position order
    std::stable_sort(v.begin(), v.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (v.size() > k) v.resize(k);
    return v;
}

bool likelyOneBasedColumns(const ParseStats& stats, Index rows, Index cols)
{
    for (const auto& kv : stats.out_of_bounds) {
        const long long r = kv.first.first;
        const long long c = kv.first.second;
        if (r >= 0 && static_cast<Index>(r) < rows && c >= 0 && static_cast<Index>(c) == cols)
            return true;
    }
    return false;
}

MatrixDOK parse(std::istream& is, ParseStats* stats)
{
    std::string raw;
    std::size_t lineno = 0;
    auto next_line = [&](std::string& out) -> bool {
        while (std::getline(is, raw)) {
            ++lineno;
            out = trim(raw);
            if (!out.empty()) return true;
        }
        return false;
    };

    std::string line;
    if (!next_line(line))
        throw FormatError("missing rows/cols declaration (empty input)");
    const Index rows = parse_dimension(line, "rows", lineno);
    if (!next_line(line))
        throw FormatError("missing 'cols=' declaration", lineno);
    const Index cols = parse_dimension(line, "cols", lineno);

    MatrixDOK A(rows, cols);
    ParseStats st;

    while (next_line(line)) {
        if (line.size() < 2 || line.front() != '(' || line.back() != ')')
            throw FormatError("expected '(row, col, value)', got '" + line + "'", lineno);

        const std::string inner = line.substr(1, line.size() - 2);
        std::vector<std::string> fields;
        std::istringstream ss(inner);
        std::string tok;
        while (std::getline(ss, tok, ',')) fields.push_back(trim(tok));
        if (!inner.empty() && inner.back() == ',') fields.push_back(""); // getline drops a trailing empty field
        if (fields.size() != 3)
            throw FormatError("expected 3 values, got " + std::to_string(fields.size())
                              + " in '" + line + "'", lineno);

        long long r = 0, c = 0;
        bool r_over = false, c_over = false;
        Scalar v = 0.0;
        if (!parse_integer(fields[0], r, r_over) || !parse_integer(fields[1], c, c_over))
            throw FormatError("non-integer index in '" + line + "'", lineno);
        if (!parse_real(fields[2], v))
            throw FormatError("non-numeric or non-finite value in '" + line + "'", lineno);

        ++st.total_entries;

        if (r_over || c_over || r < 0 || c < 0
            || static_cast<unsigned long long>(r) >= rows
            || static_cast<unsigned long long>(c) >= cols) {
            ++st.skipped_out_of_bounds;
            ++st.out_of_bounds[ParseStats::Position(r, c)];
            continue;
        }

        const Index i = static_cast<Index>(r);
        const Index j = static_cast<Index>(c);
        if (v == Scalar{0}) {
            ++st.skipped_zero;
        } else if (A.contains(i, j)) {
            ++st.overwritten;
        }
        A.set(i, j, v);
    }

    if (stats) *stats = std::move(st);
    return A;
}

MatrixDOK parseString(const std::string& text, ParseStats* stats)
{
    std::istringstream is(text);
    return parse(is, stats);
}

MatrixDOK readFile(const std::string& filename, ParseStats* stats)
{
    std::ifstream ifs(filename);
    if (!ifs) throw std::runtime_error("readFile: cannot open '" + filename + "'");
    return parse(ifs, stats);
}

bool write(std::ostream& os, const MatrixSparse& A)
{
    os << "rows=" << A.rows() << "\n";
    os << "cols=" << A.cols() << "\n";
    char buf[96];
    A.forEachNZ([&](Index i, Index j, Scalar v) {
        std::snprintf(buf, sizeof(buf), "(%zu, %zu, %.17g)\n", i, j, v);
        os << buf;
    });
    return static_cast<bool>(os);
}

std::string format(const MatrixSparse& A)
{
    std::ostringstream oss;
    if (!write(oss, A))
        throw std::runtime_error("format: failed to render matrix");
    return oss.str();
}

bool writeFile(const std::string& filename, const MatrixSparse& A)
{
    std::ofstream ofs(filename);
    if (!ofs) return false;
    return write(ofs, A);
}

}} // namespace spcalc::io
