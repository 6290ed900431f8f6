#pragma once

#include <vector>
#include <cstddef>
#include <memory>
#include <stdexcept>

#include "spcalc/algebra/matrixSparse.hpp"
#include "spcalc/algebra/errors.hpp"

namespace spcalc { namespace algebra {

    class MatrixDOK;

/**
 * @brief Sparse matrix in Compressed Sparse Row (CSR) format.
 *
 * Stores three arrays: row pointers (ptr), column indices (col) and
 * values (val). Column indices are sorted inside each row. Used as a
 * read-only row index over a MatrixDOK: the nonzeros of row i are
 * [ptr[i], ptr[i+1]) and can be walked without any lookup.
 */
class MatrixCSR final : public MatrixSparse {
public:
    using Scalar = MatrixSparse::Scalar;
    using Index  = MatrixSparse::Index;

    MatrixCSR() = default;

    /// Build the row index of a DOK matrix in O(nnz).
    explicit MatrixCSR(const MatrixDOK& A);

    // ----- MatrixSparse interface -----
    Index rows() const noexcept override { return m_rows; }
    Index cols() const noexcept override { return m_cols; }
    Index nnz()  const noexcept override { return static_cast<Index>(m_val.size()); }
    SparseFormat format() const noexcept override { return SparseFormat::CSR; }

    /// Binary search inside row i.
    Scalar get(Index i, Index j) const override;

    void forEachNZ(const TripletVisitor& f) const override
    {
        for (Index i = 0; i < m_rows; ++i) {
            for (Index k = m_ptr[i]; k < m_ptr[i+1]; ++k) {
                f(i, m_col[k], m_val[k]);
            }
        }
    }

    std::unique_ptr<MatrixSparse> clone() const override
    {
        return std::make_unique<MatrixCSR>(*this);
    }

    /// Access the CSR arrays (read-only).
    const std::vector<Index>& rowPtr() const noexcept { return m_ptr; }
    const std::vector<Index>& colIndex() const noexcept { return m_col; }
    const std::vector<Scalar>& values()  const noexcept { return m_val; }

private:
    Index m_rows{0}, m_cols{0};
    std::vector<Index>  m_ptr{0}; // size = rows+1
    std::vector<Index>  m_col;
    std::vector<Scalar> m_val;
};

}} // namespace spcalc::algebra
