#pragma once

#include <vector>
#include <cstddef>
#include <map>
#include <memory>
#include <utility>
#include <tuple>
#include <initializer_list>
#include <cstdint>

#include "spcalc/algebra/matrixSparse.hpp"
#include "spcalc/algebra/errors.hpp"

namespace spcalc { namespace algebra {

    class MatrixCSR;

/// One stored nonzero, as handed out by MatrixDOK::entries().
struct Triplet {
    MatrixSparse::Index  row;
    MatrixSparse::Index  col;
    MatrixSparse::Scalar value;

    bool operator==(const Triplet& o) const noexcept
    { return row == o.row && col == o.col && value == o.value; }
    bool operator!=(const Triplet& o) const noexcept { return !(*this == o); }
};

/**
 * @brief Sparse matrix in Dictionary-Of-Keys (DOK) format.
 *
 * Nonzeros live in an ordered map keyed by (row, col), so iteration is
 * row-major and reproducible. Two invariants hold at all times:
 *  - no stored value is exactly zero;
 *  - every key lies inside [0, rows) x [0, cols).
 * Writing a zero erases the position; writing outside the shape throws
 * IndexError.
 */
class MatrixDOK final : public MatrixSparse {
public:
    using Scalar  = MatrixSparse::Scalar;
    using Index   = MatrixSparse::Index;
    using Key     = std::pair<Index, Index>;
    using Storage = std::map<Key, Scalar>;
    using const_iterator = Storage::const_iterator;

    /// Construct an empty 0x0 matrix.
    MatrixDOK() = default;
    /// Construct an empty matrix with fixed dimension; no nonzeros initially.
    MatrixDOK(Index rows, Index cols) : m_rows(rows), m_cols(cols) {}

    /// Construct from an initializer list of triplets { {i,j,v}, ... }; later triplets win.
    MatrixDOK(Index rows, Index cols, std::initializer_list<std::tuple<Index,Index,Scalar>> triplets)
        : m_rows(rows), m_cols(cols)
    {
        for (auto& t : triplets) {
            Index i,j; Scalar v;
            std::tie(i,j,v) = t;
            set(i,j,v);
        }
    }

    explicit MatrixDOK(const MatrixCSR& A);

    /// Create a zero matrix with given shape.
    static MatrixDOK Zero(Index rows, Index cols) { return MatrixDOK(rows, cols); }
    /// Create an identity matrix of size n x n.
    static MatrixDOK Identity(Index n)
    {
        MatrixDOK I(n, n);
        for (Index i = 0; i < n; ++i) I.append(i, i, Scalar{1});
        return I;
    }

    /**
     * @brief Random matrix with about density*rows*cols nonzeros.
     *
     * Values are drawn uniformly from [-1, 1) (never zero). The same seed
     * always yields the same matrix. Throws std::invalid_argument when
     * density is outside [0, 1].
     */
    static MatrixDOK Random(Index rows, Index cols, double density, std::uint64_t seed = 42);

    // ----- Assembly -----
    /// Insert or overwrite (i,j) = v; v == 0 erases. Throws IndexError if out of shape.
    void set(Index i, Index j, Scalar v)
    {
        checkIndex_(i, j, "MatrixDOK::set");
        if (v == Scalar{0}) {
            m_map.erase(Key(i, j));
        } else {
            m_map[Key(i, j)] = v;
        }
    }

    /**
     * @brief Ordered assembly: store (i,j) = v, expecting (i,j) to follow every
     * stored key in row-major order.
     *
     * Amortized O(1) when the expectation holds; still correct (O(log nnz))
     * otherwise. Same result as set(): an existing key is overwritten and
     * a zero erases whatever was stored at (i,j).
     */
    void append(Index i, Index j, Scalar v);

    /// Remove every nonzero; the shape is kept.
    void clear() noexcept { m_map.clear(); }

    // ----- MatrixSparse interface -----
    Index rows() const noexcept override { return m_rows; }
    Index cols() const noexcept override { return m_cols; }
    Index nnz()  const noexcept override { return static_cast<Index>(m_map.size()); }
    SparseFormat format() const noexcept override { return SparseFormat::DOK; }

    Scalar get(Index i, Index j) const override;

    void forEachNZ(const TripletVisitor& f) const override
    {
        for (const auto& kv : m_map) f(kv.first.first, kv.first.second, kv.second);
    }

    std::unique_ptr<MatrixSparse> clone() const override
    {
        return std::make_unique<MatrixDOK>(*this);
    }

    // ----- Queries -----
    /// Whether a nonzero is stored at (i,j). Out-of-shape positions are never stored.
    bool contains(Index i, Index j) const { return m_map.count(Key(i, j)) != 0; }
    bool empty() const noexcept { return m_map.empty(); }

    /// Lazy row-major walk over the nonzeros: each element is ((row, col), value).
    const_iterator begin() const noexcept { return m_map.begin(); }
    const_iterator end()   const noexcept { return m_map.end(); }

    /// Nonzeros of row i only, as a [first, last) iterator range.
    std::pair<const_iterator, const_iterator> row(Index i) const;

    /// Materialized copy of the nonzeros in row-major order.
    std::vector<Triplet> entries() const;

    // ----- Extra utilities -----
    /// In-place scale all values by a factor; values that become zero are erased.
    void scale(Scalar alpha);
    /// In-place entrywise negation.
    void negate() noexcept { for (auto& kv : m_map) kv.second = -kv.second; }

    /// Return the transpose of this matrix.
    MatrixDOK transpose() const;

    /// Shape and value equality (storage order is irrelevant for a map).
    bool operator==(const MatrixDOK& other) const
    {
        return m_rows == other.m_rows && m_cols == other.m_cols && m_map == other.m_map;
    }
    bool operator!=(const MatrixDOK& other) const { return !(*this == other); }

private:
    void checkIndex_(Index i, Index j, const char* who) const
    {
        if (i >= m_rows || j >= m_cols)
            throw IndexError(std::string(who) + ": index (" + std::to_string(i) + ", "
                             + std::to_string(j) + ") out of bounds for "
                             + std::to_string(m_rows) + "x" + std::to_string(m_cols));
    }

    Index   m_rows{0}, m_cols{0};
    Storage m_map;
};

}} // namespace spcalc::algebra
