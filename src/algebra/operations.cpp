#include "spcalc/algebra/operations.hpp"
#include "spcalc/algebra/CSR.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>
#include <string>

namespace spcalc { namespace algebra {

static std::string shape(const MatrixSparse& m)
{
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

// C = A + sign * B, merging the two row-major key sequences.
static MatrixDOK merge_(const MatrixDOK& a, const MatrixDOK& b, MatrixSparse::Scalar sign)
{
    using Scalar = MatrixSparse::Scalar;

    MatrixDOK C(a.rows(), a.cols());
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() || ib != b.end()) {
        if (ib == b.end() || (ia != a.end() && ia->first < ib->first)) {
            C.append(ia->first.first, ia->first.second, ia->second);
            ++ia;
        } else if (ia == a.end() || ib->first < ia->first) {
            C.append(ib->first.first, ib->first.second, sign * ib->second);
            ++ib;
        } else {
            const Scalar v = ia->second + sign * ib->second;
            C.append(ia->first.first, ia->first.second, v); // append drops v == 0
            ++ia;
            ++ib;
        }
    }
    return C;
}

const char* toString(Operation op) noexcept
{
    switch (op) {
        case Operation::Add:      return "Add";
        case Operation::Subtract: return "Subtract";
        case Operation::Multiply: return "Multiply";
    }
    return "Unknown";
}

Operation parseOperation(const std::string& name)
{
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "add" || s == "1")                           return Operation::Add;
    if (s == "subtract" || s == "sub" || s == "2")        return Operation::Subtract;
    if (s == "multiply" || s == "mul" || s == "3")        return Operation::Multiply;
    throw std::invalid_argument("parseOperation: unknown operation '" + name + "'");
}

void checkDimensions(const MatrixSparse& a, const MatrixSparse& b, Operation op)
{
    switch (op) {
        case Operation::Add:
        case Operation::Subtract:
            if (a.rows() != b.rows() || a.cols() != b.cols())
                throw DimensionMismatchError(std::string(toString(op))
                    + ": matrix dimensions must match (" + shape(a) + " vs " + shape(b) + ")");
            return;
        case Operation::Multiply:
            if (a.cols() != b.rows())
                throw DimensionMismatchError("Multiply: columns of A must equal rows of B ("
                    + shape(a) + " * " + shape(b) + ")");
            return;
    }
    throw std::invalid_argument("checkDimensions: unknown operation");
}

MatrixDOK add(const MatrixDOK& a, const MatrixDOK& b)
{
    checkDimensions(a, b, Operation::Add);
    return merge_(a, b, 1.0);
}

MatrixDOK subtract(const MatrixDOK& a, const MatrixDOK& b)
{
    checkDimensions(a, b, Operation::Subtract);
    return merge_(a, b, -1.0);
}

MatrixDOK multiply(const MatrixDOK& a, const MatrixDOK& b)
{
    using Index  = MatrixSparse::Index;
    using Scalar = MatrixSparse::Scalar;

    checkDimensions(a, b, Operation::Multiply);

    MatrixDOK C(a.rows(), b.cols());
    if (a.empty() || b.empty()) return C;

    const MatrixCSR B(b);
    const auto& ptr = B.rowPtr();
    const auto& col = B.colIndex();
    const auto& val = B.values();

    std::map<Index, Scalar> acc; // row i of C, keyed by column
    auto it = a.begin();
    while (it != a.end()) {
        const Index i = it->first.first;
        acc.clear();
        for (; it != a.end() && it->first.first == i; ++it) {
            const Index  k  = it->first.second;
            const Scalar av = it->second;
            for (Index p = ptr[k]; p < ptr[k + 1]; ++p) {
                acc[col[p]] += av * val[p];
            }
        }
        for (const auto& kv : acc) C.append(i, kv.first, kv.second);
    }
    return C;
}

MatrixDOK apply(Operation op, const MatrixDOK& a, const MatrixDOK& b)
{
    switch (op) {
        case Operation::Add:      return add(a, b);
        case Operation::Subtract: return subtract(a, b);
        case Operation::Multiply: return multiply(a, b);
    }
    throw std::invalid_argument("apply: unknown operation");
}

OperationResult compute(Operation op,
                        const std::string& name_a, const MatrixDOK& a,
                        const std::string& name_b, const MatrixDOK& b)
{
    OperationResult r;
    r.operation = op;
    r.operand_a = name_a;
    r.operand_b = name_b;
    r.result    = apply(op, a, b);
    return r;
}

}} // namespace spcalc::algebra
