#include "spcalc/algebra/DOK.hpp"
#include "spcalc/algebra/CSR.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace spcalc { namespace algebra {

MatrixDOK::MatrixDOK(const MatrixCSR& A)
: m_rows(A.rows()), m_cols(A.cols())
{
    const auto& ptr = A.rowPtr();    // size = m_rows + 1
    const auto& col = A.colIndex();  // size = nnz
    const auto& val = A.values();    // size = nnz

    for (Index i = 0; i < m_rows; ++i) {
        for (Index p = ptr[i]; p < ptr[i + 1]; ++p) {
            append(i, col[p], val[p]);
        }
    }
}

MatrixDOK MatrixDOK::Random(Index rows, Index cols, double density, std::uint64_t seed)
{
    if (!(density >= 0.0 && density <= 1.0))
        throw std::invalid_argument("MatrixDOK::Random: density must be in [0, 1]");

    MatrixDOK R(rows, cols);
    if (rows == 0 || cols == 0 || density == 0.0) return R;

    std::mt19937_64 gen(seed);
    std::uniform_real_distribution<Scalar> value(-1.0, 1.0);
    auto draw = [&]() {
        Scalar v = value(gen);
        while (v == Scalar{0}) v = value(gen);
        return v;
    };

    const long double cells = static_cast<long double>(rows) * static_cast<long double>(cols);

    // Dense-ish requests: one Bernoulli trial per cell, in order.
    if (density > 0.25) {
        std::bernoulli_distribution keep(density);
        for (Index i = 0; i < rows; ++i)
            for (Index j = 0; j < cols; ++j)
                if (keep(gen)) R.append(i, j, draw());
        return R;
    }

    // Sparse requests: rejection sampling of distinct positions.
    const Index target = static_cast<Index>(std::llround(density * cells));
    std::uniform_int_distribution<Index> pick_row(0, rows - 1);
    std::uniform_int_distribution<Index> pick_col(0, cols - 1);
    while (R.nnz() < target) {
        const Index i = pick_row(gen);
        const Index j = pick_col(gen);
        if (!R.contains(i, j)) R.set(i, j, draw());
    }
    return R;
}

void MatrixDOK::append(Index i, Index j, Scalar v)
{
    checkIndex_(i, j, "MatrixDOK::append");
    if (v == Scalar{0}) {
        m_map.erase(Key(i, j));
        return;
    }
    auto it = m_map.emplace_hint(m_map.end(), Key(i, j), v);
    it->second = v;
}

MatrixDOK::Scalar MatrixDOK::get(Index i, Index j) const
{
    checkIndex_(i, j, "MatrixDOK::get");
    auto it = m_map.find(Key(i, j));
    return it == m_map.end() ? Scalar{0} : it->second;
}

std::pair<MatrixDOK::const_iterator, MatrixDOK::const_iterator>
MatrixDOK::row(Index i) const
{
    // Row i spans keys [(i, 0), (i+1, 0)).
    auto first = m_map.lower_bound(Key(i, 0));
    auto last  = (i + 1 == 0) ? m_map.end() : m_map.lower_bound(Key(i + 1, 0));
    return {first, last};
}

std::vector<Triplet> MatrixDOK::entries() const
{
    std::vector<Triplet> out;
    out.reserve(m_map.size());
    for (const auto& kv : m_map) out.push_back(Triplet{kv.first.first, kv.first.second, kv.second});
    return out;
}

void MatrixDOK::scale(Scalar alpha)
{
    if (alpha == Scalar{0}) { m_map.clear(); return; }
    for (auto it = m_map.begin(); it != m_map.end(); ) {
        it->second *= alpha;
        // Underflow can turn a tiny product into an exact zero.
        if (it->second == Scalar{0}) it = m_map.erase(it);
        else ++it;
    }
}

MatrixDOK MatrixDOK::transpose() const
{
    MatrixDOK T(m_cols, m_rows);
    for (const auto& kv : m_map) {
        T.m_map.emplace(Key(kv.first.second, kv.first.first), kv.second);
    }
    return T;
}

}} // namespace spcalc::algebra
