#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>

#include "spcalc/algebra/DOK.hpp"
#include "spcalc/algebra/CSR.hpp"
#include "spcalc/algebra/errors.hpp"
#include "../tests/test_util.hpp"

using spcalctest::expect_true;
using spcalctest::expect_eq;
using spcalctest::expect_throw;

using spcalc::algebra::MatrixDOK;
using spcalc::algebra::MatrixCSR;
using spcalc::algebra::IndexError;
using Index = MatrixCSR::Index;

static MatrixDOK build_dok_example()
{
    // [ 1 0 4 0 ]
    // [ 0 0 0 0 ]
    // [ 3 2 0 6 ]
    MatrixDOK A(3,4);
    A.set(2,3,6.0);
    A.set(0,0,1.0);
    A.set(2,0,3.0);
    A.set(0,2,4.0);
    A.set(2,1,2.0);
    return A;
}

static void test_build_from_dok()
{
    MatrixCSR C(build_dok_example());
    expect_eq(C.rows(), (Index)3, __func__, "rows", "3");
    expect_eq(C.cols(), (Index)4, __func__, "cols", "4");
    expect_eq(C.nnz(),  (Index)5, __func__, "nnz", "5");

    const std::vector<Index> ptr = {0, 2, 2, 5};
    const std::vector<Index> col = {0, 2, 0, 1, 3};
    const std::vector<double> val = {1.0, 4.0, 3.0, 2.0, 6.0};
    expect_true(C.rowPtr() == ptr, __func__, "row pointers");
    expect_true(C.colIndex() == col, __func__, "column indices sorted per row");
    expect_true(C.values() == val, __func__, "values follow columns");
    expect_eq(C.rowPtr()[2] - C.rowPtr()[1], (Index)0, __func__, "empty row", "0");
    expect_eq(C.rowPtr()[3] - C.rowPtr()[2], (Index)3, __func__, "row 2 nnz", "3");
}

static void test_get()
{
    MatrixCSR C(build_dok_example());
    expect_eq(C.get(0,2), 4.0, __func__, "C(0,2)", "4");
    expect_eq(C.get(2,3), 6.0, __func__, "C(2,3)", "6");
    expect_eq(C.get(2,2), 0.0, __func__, "C(2,2) absent", "0");
    expect_eq(C.get(1,0), 0.0, __func__, "empty row reads zero", "0");
    expect_throw<IndexError>([&]{ (void)C.get(3,0); }, __func__, "row out of bounds");
    expect_throw<IndexError>([&]{ (void)C.get(0,4); }, __func__, "col out of bounds");
}

static void test_empty_and_views()
{
    MatrixCSR E(MatrixDOK(0, 5));
    expect_eq(E.rowPtr().size(), (std::size_t)1, __func__, "0-row ptr size", "1");
    expect_eq(E.nnz(), (Index)0, __func__, "0-row nnz", "0");

    MatrixCSR Z(MatrixDOK(3, 2));
    expect_true(Z.rowPtr() == std::vector<Index>(4, 0), __func__, "empty rows share one offset");
    expect_eq(Z.get(2,1), 0.0, __func__, "empty matrix reads zero", "0");

    MatrixDOK A = build_dok_example();
    MatrixCSR C(A);
    expect_true(C.sameValues(A) && MatrixDOK(C) == A, __func__, "same nonzeros as the DOK");
    auto P = C.clone();
    expect_true(P->sameValues(C), __func__, "clone keeps values");
}

int main()
{
    test_build_from_dok();
    test_get();
    test_empty_and_views();

    return spcalctest::summarize_and_exit();
}
