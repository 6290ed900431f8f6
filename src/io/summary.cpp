#include "spcalc/io/summary.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <ostream>

namespace spcalc { namespace io {

// Minimal JSON string escaping (quotes, backslash, control characters).
static std::string quoted(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
    return out;
}

// JSON has no nan/inf literals; an overflowed result entry is written as null.
static std::string number(double v)
{
    if (!std::isfinite(v)) return "null";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

std::string MatrixInfo::dimensions() const
{
    return std::to_string(rows) + "x" + std::to_string(cols);
}

MatrixInfo describe(const MatrixSparse& A)
{
    MatrixInfo info;
    info.rows = A.rows();
    info.cols = A.cols();
    info.nnz  = A.nnz();
    return info;
}

std::string makeTimestamp(std::time_t t)
{
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return buf;
}

std::string baseName(const std::string& path)
{
    const auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

OperationSummary summarize(const algebra::OperationResult& r,
                           const MatrixDOK& a, const MatrixDOK& b,
                           std::size_t samples, std::time_t when)
{
    OperationSummary s;
    s.timestamp = makeTimestamp(when);
    s.operation = algebra::toString(r.operation);
    s.input_a   = baseName(r.operand_a);
    s.input_b   = baseName(r.operand_b);
    s.matrix_a  = describe(a);
    s.matrix_b  = describe(b);
    s.result    = describe(r.result);
    for (const auto& kv : r.result) {
        if (s.sample_entries.size() >= samples) break;
        s.sample_entries.push_back(algebra::Triplet{kv.first.first, kv.first.second, kv.second});
    }
    return s;
}

static void write_info(std::ostream& os, const MatrixInfo& m, const char* indent)
{
    os << indent << "\"dimensions\": " << quoted(m.dimensions()) << ",\n"
       << indent << "\"non_zero_elements\": " << m.nnz;
}

bool writeSummaryJson(std::ostream& os, const OperationSummary& s)
{
    os << "{\n";
    os << "  \"operation_info\": {\n"
       << "    \"timestamp\": " << quoted(s.timestamp) << ",\n"
       << "    \"operation_type\": " << quoted(s.operation) << ",\n"
       << "    \"input_files\": {\n"
       << "      \"matrix1\": " << quoted(s.input_a) << ",\n"
       << "      \"matrix2\": " << quoted(s.input_b) << "\n"
       << "    }\n"
       << "  },\n";

    os << "  \"input_matrices\": {\n"
       << "    \"matrix1\": {\n";
    write_info(os, s.matrix_a, "      ");
    os << "\n    },\n"
       << "    \"matrix2\": {\n";
    write_info(os, s.matrix_b, "      ");
    os << "\n    }\n"
       << "  },\n";

    os << "  \"result\": {\n";
    write_info(os, s.result, "    ");
    os << ",\n    \"sample_entries\": [";
    for (std::size_t k = 0; k < s.sample_entries.size(); ++k) {
        const auto& t = s.sample_entries[k];
        os << (k ? ",\n" : "\n")
           << "      {\"row\": " << t.row << ", \"col\": " << t.col
           << ", \"value\": " << number(t.value) << "}";
    }
    os << (s.sample_entries.empty() ? "]\n" : "\n    ]\n");
    os << "  },\n";

    os << "  \"timing\": {\n"
       << "    \"load_seconds\": " << number(s.load_seconds) << ",\n"
       << "    \"operation_seconds\": " << number(s.operation_seconds) << "\n"
       << "  }\n";
    os << "}\n";
    return static_cast<bool>(os);
}

bool writeSummaryFile(const std::string& filename, const OperationSummary& s)
{
    std::ofstream ofs(filename);
    if (!ofs) return false;
    return writeSummaryJson(ofs, s);
}

}} // namespace spcalc::io
