#include "spcalc/algebra/CSR.hpp"
#include "spcalc/algebra/DOK.hpp"

#include <algorithm>
#include <string>

namespace spcalc { namespace algebra {

MatrixCSR::MatrixCSR(const MatrixDOK& A)
{
    m_rows = A.rows();
    m_cols = A.cols();
    const Index nz = A.nnz();
    m_ptr.assign(m_rows + 1, 0);
    m_col.reserve(nz);
    m_val.reserve(nz);
    // DOK keys are already row-major: count per row while copying
    for (const auto& kv : A) {
        ++m_ptr[kv.first.first + 1];
        m_col.push_back(kv.first.second);
        m_val.push_back(kv.second);
    }
    // Prefix sum to get starting positions
    for (Index i = 0; i < m_rows; ++i) {
        m_ptr[i + 1] += m_ptr[i];
    }
}

MatrixCSR::Scalar MatrixCSR::get(Index i, Index j) const
{
    if (i >= m_rows || j >= m_cols)
        throw IndexError("MatrixCSR::get: index (" + std::to_string(i) + ", "
                         + std::to_string(j) + ") out of bounds");
    const auto first = m_col.begin() + static_cast<std::ptrdiff_t>(m_ptr[i]);
    const auto last  = m_col.begin() + static_cast<std::ptrdiff_t>(m_ptr[i+1]);
    const auto it = std::lower_bound(first, last, j);
    if (it == last || *it != j) return Scalar{0};
    return m_val[static_cast<Index>(it - m_col.begin())];
}

}} // namespace spcalc::algebra
