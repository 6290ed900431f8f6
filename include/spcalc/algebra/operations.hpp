#pragma once

#include <string>

#include "spcalc/algebra/DOK.hpp"
#include "spcalc/algebra/errors.hpp"

namespace spcalc { namespace algebra {

/// Operation selector presented to the engine.
enum class Operation { Add, Subtract, Multiply };

/// "Add", "Subtract" or "Multiply".
const char* toString(Operation op) noexcept;

/**
 * @brief Parse an operation name.
 *
 * Accepts add|subtract|sub|multiply|mul (case-insensitive) and the menu
 * keys 1|2|3. Throws std::invalid_argument on anything else.
 */
Operation parseOperation(const std::string& name);

/**
 * @brief Validate operand shapes for @p op.
 *
 * Add/Subtract need identical shapes, Multiply needs a.cols() == b.rows().
 * Throws DimensionMismatchError naming both shapes otherwise.
 */
void checkDimensions(const MatrixSparse& a, const MatrixSparse& b, Operation op);

/**
 * @brief C = A + B.
 *
 * Two-cursor merge over the row-major key sets of A and B, so the cost is
 * O(nnz(A) + nnz(B)) and independent of rows*cols. Sums that cancel to
 * exactly zero are not stored.
 */
MatrixDOK add(const MatrixDOK& a, const MatrixDOK& b);

/// C = A - B, same merge as add().
MatrixDOK subtract(const MatrixDOK& a, const MatrixDOK& b);

/**
 * @brief C = A * B, shape (A.rows, B.cols).
 *
 * Row-wise Gustavson product: each nonzero (i,k) of A is paired with row k
 * of B only, read from a CSR index of B. Row i of C is accumulated in a
 * sparse per-row accumulator and flushed in column order; exact zeros
 * (cancellation) are dropped. Fill-in is expected: nnz(C) may exceed
 * nnz(A) + nnz(B).
 */
MatrixDOK multiply(const MatrixDOK& a, const MatrixDOK& b);

/// Dispatch on the operation selector.
MatrixDOK apply(Operation op, const MatrixDOK& a, const MatrixDOK& b);

/// An operation, the names of its operands and the matrix it produced.
struct OperationResult {
    Operation   operation{Operation::Add};
    std::string operand_a;
    std::string operand_b;
    MatrixDOK   result;
};

/// apply() wrapped with operand bookkeeping.
OperationResult compute(Operation op,
                        const std::string& name_a, const MatrixDOK& a,
                        const std::string& name_b, const MatrixDOK& b);

}} // namespace spcalc::algebra
