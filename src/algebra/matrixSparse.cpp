#include "spcalc/algebra/matrixSparse.hpp"

#include <cmath>
#include <sstream>
#include <algorithm>
#include <vector>
#include <tuple>

namespace spcalc { namespace algebra {

MatrixSparse::Scalar MatrixSparse::frobeniusNorm() const
{
    long double sum = 0.0L;
    forEachNZ([&](Index, Index, Scalar v){ sum += static_cast<long double>(v) * v; });
    return static_cast<Scalar>(std::sqrt(sum));
}

MatrixSparse::Scalar MatrixSparse::maxAbs() const
{
    Scalar m = 0.0;
    forEachNZ([&](Index, Index, Scalar v){ m = std::max(m, v >= Scalar{0} ? v : -v); });
    return m;
}

bool MatrixSparse::sameValues(const MatrixSparse& other) const
{
    if (rows() != other.rows() || cols() != other.cols() || nnz() != other.nnz())
        return false;

    // Both sides visit in row-major order, so a flat comparison is enough.
    using Triplet = std::tuple<Index, Index, Scalar>;
    std::vector<Triplet> lhs, rhs;
    lhs.reserve(nnz());
    rhs.reserve(other.nnz());
    forEachNZ([&](Index i, Index j, Scalar v){ lhs.emplace_back(i, j, v); });
    other.forEachNZ([&](Index i, Index j, Scalar v){ rhs.emplace_back(i, j, v); });
    return lhs == rhs;
}

std::string MatrixSparse::toString(std::size_t max_lines) const
{
    std::ostringstream oss;
    oss << "MatrixSparse(" << rows() << "x" << cols() << ", nnz=" << nnz() << ")\n";
    std::size_t printed = 0;
    forEachNZ([&](Index i, Index j, Scalar v){
        if (printed < max_lines) {
            oss << "  (" << i << "," << j << ") = " << v << "\n";
            ++printed;
        }
    });
    if (nnz() > printed) oss << "  ...\n";
    return oss.str();
}

}} // namespace spcalc::algebra
