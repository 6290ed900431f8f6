#pragma once

#include <cstddef>
#include <vector>
#include <memory>
#include <functional>
#include <string>
#include <stdexcept>
#include <utility>

namespace spcalc { namespace algebra {

// Identify the concrete storage layout behind a MatrixSparse
enum class SparseFormat { DOK, CSR };

/**
 * @brief Abstract base for sparse matrices.
 *
 * Child classes (MatrixDOK, MatrixCSR) store only nonzero values and
 * implement the core virtual methods. The base provides utilities that
 * can be expressed generically over the nonzeros (norms, pretty-print,
 * value comparison) without assuming a particular storage format.
 */
class MatrixSparse {
public:
    using Scalar = double;
    using Index  = std::size_t;
    using TripletVisitor = std::function<void(Index i, Index j, Scalar v)>;

    virtual ~MatrixSparse() = default;

    // ----- Shape & identity -----
    virtual Index rows()   const noexcept = 0;
    virtual Index cols()   const noexcept = 0;
    virtual Index nnz()    const noexcept = 0;
    virtual SparseFormat format() const noexcept = 0;

    std::pair<Index, Index> dimensions() const noexcept { return {rows(), cols()}; }

    // ----- Element access -----
    // Value at (i,j); zero when nothing is stored there. Throws IndexError out of shape.
    virtual Scalar get(Index i, Index j) const = 0;

    // ----- Structure access -----
    // Visit all nonzero entries (i,j,val) in row-major order.
    virtual void forEachNZ(const TripletVisitor& f) const = 0;

    // Polymorphic copy.
    virtual std::unique_ptr<MatrixSparse> clone() const = 0;

    // ----- Generic utilities -----
    // Frobenius norm: sqrt(sum |v|^2).
    Scalar frobeniusNorm() const;
    // Maximum absolute value of any stored element.
    Scalar maxAbs() const;
    // True when both matrices have the same shape and the same nonzeros,
    // whatever their storage format.
    bool sameValues(const MatrixSparse& other) const;
    // Produce a human-readable preview of the matrix. Limits the number of lines.
    std::string toString(std::size_t max_lines = 40) const;
};

}} // namespace spcalc::algebra
