#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "spcalc/algebra/DOK.hpp"
#include "spcalc/algebra/errors.hpp"

namespace spcalc { namespace io {

using algebra::MatrixDOK;
using algebra::MatrixSparse;

// ---------------------------------------------------------------------------
// Coordinate text format
//
//   rows=<R>
//   cols=<C>
//   (<row>, <col>, <value>)
//   ...
//
// Blank lines are ignored anywhere. Indices are 0-based. Entries outside
// [0,R) x [0,C) are dropped, zero values are not stored and a repeated
// position keeps the last value read. Syntax errors throw FormatError.
// ---------------------------------------------------------------------------

/// Bookkeeping of what the parser accepted, dropped and overwrote.
struct ParseStats {
    using Position = std::pair<long long, long long>;

    std::size_t total_entries         = 0; // well-formed entry lines
    std::size_t skipped_out_of_bounds = 0;
    std::size_t skipped_zero          = 0; // zero values (they erase an earlier value)
    std::size_t overwritten           = 0; // nonzero value replaced by a later line
    std::map<Position, std::size_t> out_of_bounds; // offending position -> count

    /// The @p k most frequent out-of-bounds positions, most frequent first.
    std::vector<std::pair<Position, std::size_t>> topOutOfBounds(std::size_t k = 5) const;
};

/// True when some dropped entry sits at column == cols inside the row range:
/// the usual sign of 1-based column indices.
bool likelyOneBasedColumns(const ParseStats& stats, MatrixSparse::Index rows, MatrixSparse::Index cols);

/// Parse coordinate text from a stream. Throws algebra::FormatError.
MatrixDOK parse(std::istream& is, ParseStats* stats = nullptr);

/// Parse coordinate text held in memory.
MatrixDOK parseString(const std::string& text, ParseStats* stats = nullptr);

/// Parse a coordinate file; throws std::runtime_error if it cannot be opened.
MatrixDOK readFile(const std::string& filename, ParseStats* stats = nullptr);

/// Render any sparse matrix as coordinate text, nonzeros in row-major order.
std::string format(const MatrixSparse& A);

/// Stream the coordinate text of @p A; returns false if the stream failed.
bool write(std::ostream& os, const MatrixSparse& A);

/// Write the coordinate text of @p A to a file; returns false on error.
bool writeFile(const std::string& filename, const MatrixSparse& A);

}} // namespace spcalc::io
