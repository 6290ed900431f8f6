#include <iostream>
#include <string>
#include <cstdio>
#include <cstdlib>

#include "spcalc/algebra/DOK.hpp"
#include "spcalc/algebra/operations.hpp"
#include "spcalc/utils/arg_parser.hpp"
#include "spcalc/utils/timing.hpp"

using spcalc::algebra::MatrixDOK;

int main(int argc, char** argv)
{
    // --------------------------------------------------
    // 1. Parse CLI options
    //    Expected: --rows, --cols, --density, --seed, --repeat
    // --------------------------------------------------
    const auto cfg = spcalc::util::BenchConfig::from_cli(argc, argv);
    if (cfg.repeat <= 0) {
        std::cerr << "bench_operations: --repeat must be positive.\n";
        return EXIT_FAILURE;
    }

    try {
        // --------------------------------------------------
        // 2. Build operands: A, B (rows x cols) and Bt (cols x rows) for the product
        // --------------------------------------------------
        std::cout << "Creating random matrices " << cfg.rows << "x" << cfg.cols
                  << ", density " << cfg.density << std::endl;
        const MatrixDOK A  = MatrixDOK::Random(cfg.rows, cfg.cols, cfg.density, cfg.seed);
        const MatrixDOK B  = MatrixDOK::Random(cfg.rows, cfg.cols, cfg.density, cfg.seed + 1);
        const MatrixDOK Bt = B.transpose();
        std::printf("A: %zu x %zu, nnz=%zu\n", A.rows(), A.cols(), A.nnz());
        std::printf("B: %zu x %zu, nnz=%zu\n", B.rows(), B.cols(), B.nnz());

        // --------------------------------------------------
        // 3. Time each operation
        // --------------------------------------------------
        MatrixDOK C;
        const double t_add = spcalc::util::time_it([&]{ C = spcalc::algebra::add(A, B); }, 1, cfg.repeat);
        const std::size_t nnz_add = C.nnz();
        const double t_sub = spcalc::util::time_it([&]{ C = spcalc::algebra::subtract(A, B); }, 1, cfg.repeat);
        const std::size_t nnz_sub = C.nnz();
        const double t_mul = spcalc::util::time_it([&]{ C = spcalc::algebra::multiply(A, Bt); }, 1, cfg.repeat);
        const std::size_t nnz_mul = C.nnz();

        // --------------------------------------------------
        // 4. CSV lines: op,rows,cols,density,nnz_a,nnz_b,nnz_c,seconds
        // --------------------------------------------------
        std::cout << "op,rows,cols,density,nnz_a,nnz_b,nnz_c,seconds\n";
        auto line = [&](const char* op, std::size_t nnz_b, std::size_t nnz_c, double t) {
            std::cout << op << "," << cfg.rows << "," << cfg.cols << "," << cfg.density << ","
                      << A.nnz() << "," << nnz_b << "," << nnz_c << "," << t << "\n";
        };
        line("add",      B.nnz(),  nnz_add, t_add);
        line("subtract", B.nnz(),  nnz_sub, t_sub);
        line("multiply", Bt.nnz(), nnz_mul, t_mul);
    }
    catch (const std::exception& e) {
        std::cerr << "bench_operations: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return 0;
}
