#include <iostream>
#include <string>
#include <cstdlib>
#include <stdexcept>

#include "spcalc/algebra/DOK.hpp"
#include "spcalc/algebra/operations.hpp"
#include "spcalc/io/coordinateIO.hpp"
#include "spcalc/io/summary.hpp"
#include "spcalc/utils/arg_parser.hpp"
#include "spcalc/utils/timing.hpp"

using spcalc::algebra::MatrixDOK;
using spcalc::algebra::Operation;
using spcalc::algebra::OperationResult;
using spcalc::io::ParseStats;

// Report what the parser dropped from one input file.
static void report_skipped(std::ostream& log, const std::string& path,
                           const ParseStats& st, const MatrixDOK& A)
{
    if (st.skipped_out_of_bounds == 0) return;

    const double pct = st.total_entries
        ? 100.0 * double(st.skipped_out_of_bounds) / double(st.total_entries) : 0.0;
    log << "Warning: " << path << ": skipped " << st.skipped_out_of_bounds << " of "
        << st.total_entries << " entries (" << pct << "%) outside "
        << A.rows() << "x" << A.cols() << "\n";

    log << "  Most common out-of-bounds positions:\n";
    for (const auto& kv : st.topOutOfBounds(5)) {
        log << "    (" << kv.first.first << ", " << kv.first.second << "): "
            << kv.second << " occurrences\n";
    }
    if (spcalc::io::likelyOneBasedColumns(st, A.rows(), A.cols())) {
        log << "  Some column indices equal cols=" << A.cols()
            << "; the file may use 1-based columns (subtract 1 from each column).\n";
    }
}

int main(int argc, char** argv)
{
    // --------------------------------------------------
    // 1. Parse CLI options
    // --------------------------------------------------
    const auto cfg = spcalc::util::CalcConfig::from_cli(argc, argv);
    if (cfg.help) {
        spcalc::util::CalcConfig::usage(std::cout);
        return EXIT_SUCCESS;
    }
    if (cfg.a.empty() || cfg.b.empty()) {
        std::cerr << "spcalc: both --a and --b are required\n";
        spcalc::util::CalcConfig::usage(std::cerr);
        return EXIT_FAILURE;
    }

    // The result goes to stdout when no --out is given; keep progress off it.
    std::ostream& log = cfg.out.empty() ? std::cerr : std::cout;

    try {
        const Operation op = spcalc::algebra::parseOperation(cfg.op);
        spcalc::util::Registry reg;

        // --------------------------------------------------
        // 2. Load operands
        // --------------------------------------------------
        ParseStats stats_a, stats_b;
        MatrixDOK A, B;
        {
            SPCALC_TIMED_SCOPE("load", reg);
            A = spcalc::io::readFile(cfg.a, &stats_a);
            B = spcalc::io::readFile(cfg.b, &stats_b);
        }
        if (!cfg.quiet) {
            log << "Matrices loaded in " << reg.seconds("load") << " seconds\n";
            log << "Matrix 1: " << A.rows() << "x" << A.cols() << " with " << A.nnz() << " non-zero elements\n";
            log << "Matrix 2: " << B.rows() << "x" << B.cols() << " with " << B.nnz() << " non-zero elements\n";
            report_skipped(log, cfg.a, stats_a, A);
            report_skipped(log, cfg.b, stats_b, B);
        }

        // --------------------------------------------------
        // 3. Compute
        // --------------------------------------------------
        OperationResult r;
        {
            SPCALC_TIMED_SCOPE_X("operation", reg, A.nnz() + B.nnz(),
                                 spcalc::algebra::toString(op));
            r = spcalc::algebra::compute(op, cfg.a, A, cfg.b, B);
        }
        if (!cfg.quiet) {
            log << spcalc::algebra::toString(op) << " completed in "
                << reg.seconds("operation") << " seconds\n";
            log << "Result: " << r.result.rows() << "x" << r.result.cols() << " with "
                << r.result.nnz() << " non-zero elements\n";
        }

        // --------------------------------------------------
        // 4. Emit result, summary and timings
        // --------------------------------------------------
        if (cfg.out.empty()) {
            if (!spcalc::io::write(std::cout, r.result))
                throw std::runtime_error("failed to write result to stdout");
        } else {
            if (!spcalc::io::writeFile(cfg.out, r.result))
                throw std::runtime_error("cannot write result to '" + cfg.out + "'");
            if (!cfg.quiet) log << "Result saved to " << cfg.out << "\n";
        }

        if (!cfg.summary.empty()) {
            auto s = spcalc::io::summarize(r, A, B,
                                           cfg.samples > 0 ? static_cast<std::size_t>(cfg.samples) : 0);
            s.load_seconds      = reg.seconds("load");
            s.operation_seconds = reg.seconds("operation");
            if (!spcalc::io::writeSummaryFile(cfg.summary, s))
                throw std::runtime_error("cannot write summary to '" + cfg.summary + "'");
            if (!cfg.quiet) log << "Summary saved to " << cfg.summary << "\n";
        }

        if (!cfg.timings.empty() && !reg.to_csv(cfg.timings))
            throw std::runtime_error("cannot write timings to '" + cfg.timings + "'");
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
