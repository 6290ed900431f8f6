#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace spcalc { namespace algebra {

/**
 * @brief Malformed coordinate text (bad header or bad entry syntax).
 *
 * Carries the 1-based line number of the offending line; 0 when the
 * error is not attached to a particular line (e.g. truncated input).
 */
class FormatError : public std::runtime_error {
public:
    FormatError(const std::string& what, std::size_t line = 0)
        : std::runtime_error(line ? what + " (line " + std::to_string(line) + ")" : what),
          line_(line) {}

    std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_{0};
};

/// Strict construction path: a position outside the declared shape.
class IndexError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/// Operand shapes incompatible with the requested operation.
class DimensionMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}} // namespace spcalc::algebra
