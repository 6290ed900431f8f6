#include <iostream>
#include <string>
#include <sstream>
#include <ctime>

#include "spcalc/algebra/DOK.hpp"
#include "spcalc/algebra/operations.hpp"
#include "spcalc/io/summary.hpp"
#include "spcalc/utils/timing.hpp"
#include "../tests/test_util.hpp"

using spcalctest::expect_true;
using spcalctest::expect_eq;

using spcalc::algebra::MatrixDOK;
using spcalc::algebra::Operation;

namespace sio = spcalc::io;

static bool contains(const std::string& s, const std::string& what)
{
    return s.find(what) != std::string::npos;
}

static void test_helpers()
{
    expect_eq(sio::baseName("dir/sub/a.txt"), std::string("a.txt"), __func__, "posix path", "a.txt");
    expect_eq(sio::baseName("c:\\m\\b.txt"), std::string("b.txt"), __func__, "windows path", "b.txt");
    expect_eq(sio::baseName("plain.txt"), std::string("plain.txt"), __func__, "no directory", "plain.txt");

    const std::string ts = sio::makeTimestamp(std::time(nullptr));
    expect_eq(ts.size(), (std::size_t)15, __func__, "timestamp length", "15");
    expect_eq(ts[8], '_', __func__, "timestamp separator", "_");

    sio::MatrixInfo info = sio::describe(MatrixDOK::Identity(4));
    expect_eq(info.dimensions(), std::string("4x4"), __func__, "dimensions()", "4x4");
    expect_eq(info.nnz, (std::size_t)4, __func__, "nnz", "4");
}

static void test_summarize()
{
    const MatrixDOK A = MatrixDOK::Random(8, 8, 0.5, 3);
    const MatrixDOK B = MatrixDOK::Random(8, 8, 0.5, 4);
    auto r = spcalc::algebra::compute(Operation::Multiply, "in/a.txt", A, "in/b.txt", B);

    auto s = sio::summarize(r, A, B, 3);
    expect_eq(s.operation, std::string("Multiply"), __func__, "operation", "Multiply");
    expect_eq(s.input_a, std::string("a.txt"), __func__, "input_a base name", "a.txt");
    expect_eq(s.input_b, std::string("b.txt"), __func__, "input_b base name", "b.txt");
    expect_eq(s.matrix_a.nnz, A.nnz(), __func__, "matrix_a nnz", "A.nnz()");
    expect_eq(s.result.nnz, r.result.nnz(), __func__, "result nnz", "C.nnz()");
    expect_eq(s.sample_entries.size(), (std::size_t)3, __func__, "sample count", "3");

    const auto all = r.result.entries();
    bool prefix = true;
    for (std::size_t k = 0; k < s.sample_entries.size(); ++k) prefix = prefix && s.sample_entries[k] == all[k];
    expect_true(prefix, __func__, "samples are the first result entries");

    auto none = sio::summarize(r, A, B, 0);
    expect_true(none.sample_entries.empty(), __func__, "zero samples requested");
}

static void test_json()
{
    const MatrixDOK A(2, 2, {{0,0,1.0}, {1,1,2.0}});
    const MatrixDOK B(2, 2, {{0,1,3.0}, {1,0,4.0}});
    auto r = spcalc::algebra::compute(Operation::Add, "A \"q\".txt", A, "B.txt", B);
    auto s = sio::summarize(r, A, B, 2);
    s.timestamp = "20240101_120000";
    s.load_seconds = 0.5;

    std::ostringstream os;
    expect_true(sio::writeSummaryJson(os, s), __func__, "stream ok");
    const std::string j = os.str();
    expect_true(contains(j, "\"operation_type\": \"Add\""), __func__, "operation type");
    expect_true(contains(j, "\"timestamp\": \"20240101_120000\""), __func__, "timestamp");
    expect_true(contains(j, "\"matrix1\": \"A \\\"q\\\".txt\""), __func__, "quotes escaped");
    expect_true(contains(j, "\"dimensions\": \"2x2\""), __func__, "dimensions");
    expect_true(contains(j, "\"non_zero_elements\": 4"), __func__, "result nnz");
    expect_true(contains(j, "{\"row\": 0, \"col\": 0, \"value\": 1}"), __func__, "first sample");
    expect_true(contains(j, "{\"row\": 0, \"col\": 1, \"value\": 3}"), __func__, "second sample");
    expect_true(!contains(j, "\"value\": 4}"), __func__, "third entry not sampled");
    expect_true(contains(j, "\"load_seconds\": 0.5"), __func__, "timing");
    expect_true(j.front() == '{' && contains(j, "}\n") && j[j.size() - 2] == '}', __func__, "one object");

    auto empty = sio::summarize(r, A, B, 0);
    std::ostringstream oe;
    expect_true(sio::writeSummaryJson(oe, empty) && contains(oe.str(), "\"sample_entries\": []"),
                __func__, "empty sample list");
}

static void test_json_overflowed_value()
{
    const MatrixDOK A(1, 1, {{0,0,1e300}});
    auto r = spcalc::algebra::compute(Operation::Multiply, "a.txt", A, "a.txt", A);
    auto s = sio::summarize(r, A, A, 1);

    std::ostringstream os;
    expect_true(sio::writeSummaryJson(os, s), __func__, "stream ok");
    expect_true(contains(os.str(), "\"value\": null}"), __func__, "inf written as null");
    expect_true(!contains(os.str(), ": inf") && !contains(os.str(), ": nan"), __func__, "no bare non-finite literal");
}

static void test_timing_registry()
{
    spcalc::util::Registry reg;
    {
        SPCALC_TIMED_SCOPE_X("parse", reg, 12, "a.txt");
    }
    {
        SPCALC_TIMED_SCOPE("operation", reg);
    }
    expect_eq(reg.data().size(), (std::size_t)2, __func__, "two records", "2");
    expect_eq(reg.data()[0].nnz, (std::uint64_t)12, __func__, "nnz tag", "12");
    expect_true(reg.seconds("operation") >= 0.0 && reg.seconds("missing") == 0.0, __func__, "seconds lookup");

    std::ostringstream os;
    reg.print_table(os);
    expect_true(contains(os.str(), "name,wall_s,cpu_s,nnz,note") && contains(os.str(), "\"a.txt\""),
                __func__, "CSV table");
}

int main()
{
    test_helpers();
    test_summarize();
    test_json();
    test_json_overflowed_value();
    test_timing_registry();

    return spcalctest::summarize_and_exit();
}
