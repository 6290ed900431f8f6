#pragma once

#include <cstddef>
#include <ctime>
#include <iosfwd>
#include <string>
#include <vector>

#include "spcalc/algebra/DOK.hpp"
#include "spcalc/algebra/operations.hpp"

namespace spcalc { namespace io {

using algebra::MatrixDOK;
using algebra::MatrixSparse;

/// Shape and fill of one matrix, as reported in a run summary.
struct MatrixInfo {
    MatrixSparse::Index rows = 0;
    MatrixSparse::Index cols = 0;
    MatrixSparse::Index nnz  = 0;

    /// "RxC"
    std::string dimensions() const;
};

MatrixInfo describe(const MatrixSparse& A);

/**
 * @brief Everything a run reports about one operation.
 *
 * Serialized by writeSummaryJson() as
 *   { "operation_info": {...}, "input_matrices": {...}, "result": {...}, "timing": {...} }
 */
struct OperationSummary {
    std::string timestamp;        // YYYYmmdd_HHMMSS
    std::string operation;        // Add | Subtract | Multiply
    std::string input_a;          // file base names
    std::string input_b;
    MatrixInfo  matrix_a;
    MatrixInfo  matrix_b;
    MatrixInfo  result;
    std::vector<algebra::Triplet> sample_entries; // first few result nonzeros, row-major
    double load_seconds      = 0.0;
    double operation_seconds = 0.0;
};

/// Local time formatted as YYYYmmdd_HHMMSS.
std::string makeTimestamp(std::time_t t);

/// Last path component ("dir/a.txt" -> "a.txt").
std::string baseName(const std::string& path);

/**
 * @brief Build a summary from an operation and its operands.
 *
 * Operand names in @p r are reduced to their base names; at most
 * @p samples result entries are kept.
 */
OperationSummary summarize(const algebra::OperationResult& r,
                           const MatrixDOK& a, const MatrixDOK& b,
                           std::size_t samples = 5,
                           std::time_t when = std::time(nullptr));

/// Indented JSON rendering; returns false if the stream failed.
bool writeSummaryJson(std::ostream& os, const OperationSummary& s);

/// Write the JSON summary to a file; returns false on error.
bool writeSummaryFile(const std::string& filename, const OperationSummary& s);

}} // namespace spcalc::io
