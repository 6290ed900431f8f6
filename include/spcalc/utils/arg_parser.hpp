#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>

namespace spcalc { namespace util {

// Options of the spcalc command-line driver.
struct CalcConfig
{
    std::string op       = "add";   // add | subtract | multiply (or 1|2|3)
    std::string a;                  // first operand file
    std::string b;                  // second operand file
    std::string out;                // result in coordinate text; empty = stdout
    std::string summary;            // JSON run summary; empty = none
    std::string timings;            // CSV of timed sections; empty = none
    int         samples  = 5;       // result entries copied into the summary
    bool        quiet    = false;   // no progress output
    bool        help     = false;

    static void usage(std::ostream& os)
    {
        os << "Usage: spcalc --op OP --a FILE --b FILE [options]\n"
           << "  --op [add|subtract|multiply|1|2|3]\n"
           << "  --a FILE          first matrix (coordinate text)\n"
           << "  --b FILE          second matrix (coordinate text)\n"
           << "  --out FILE        write the result here (default: stdout)\n"
           << "  --summary FILE    write a JSON run summary\n"
           << "  --timings FILE    write timed sections as CSV\n"
           << "  --samples K       result entries in the summary (default 5)\n"
           << "  --quiet           only errors are printed\n";
    }

    static CalcConfig from_cli(int argc, char** argv)
    {
        CalcConfig cfg;

        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);

            if (a == "--op" && i + 1 < argc) {
                cfg.op = argv[++i];
            }
            else if (a == "--a" && i + 1 < argc) {
                cfg.a = argv[++i];
            }
            else if (a == "--b" && i + 1 < argc) {
                cfg.b = argv[++i];
            }
            else if (a == "--out" && i + 1 < argc) {
                cfg.out = argv[++i];
            }
            else if (a == "--summary" && i + 1 < argc) {
                cfg.summary = argv[++i];
            }
            else if (a == "--timings" && i + 1 < argc) {
                cfg.timings = argv[++i];
            }
            else if (a == "--samples" && i + 1 < argc) {
                cfg.samples = std::atoi(argv[++i]);
            }
            else if (a == "--quiet") {
                cfg.quiet = true;
            }
            else if (a == "--help") {
                cfg.help = true;
            }
            else {
                std::cerr << "spcalc: ignoring unknown argument '" << a << "'\n";
            }
        }

        return cfg;
    }
};

// Options of the operations benchmark.
struct BenchConfig
{
    std::size_t   rows    = 2000;
    std::size_t   cols    = 2000;
    double        density = 1e-3;
    std::uint64_t seed    = 42;
    int           repeat  = 3;

    static BenchConfig from_cli(int argc, char** argv)
    {
        BenchConfig cfg;

        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);

            if (a == "--rows" && i + 1 < argc) {
                cfg.rows = std::strtoull(argv[++i], nullptr, 10);
            }
            else if (a == "--cols" && i + 1 < argc) {
                cfg.cols = std::strtoull(argv[++i], nullptr, 10);
            }
            else if (a == "--density" && i + 1 < argc) {
                cfg.density = std::atof(argv[++i]);
            }
            else if (a == "--seed" && i + 1 < argc) {
                cfg.seed = std::strtoull(argv[++i], nullptr, 10);
            }
            else if (a == "--repeat" && i + 1 < argc) {
                cfg.repeat = std::atoi(argv[++i]);
            }
            else if (a == "--help") {
                std::cout << "Available parameters:\n"
                          << "  --rows R\n"
                          << "  --cols C\n"
                          << "  --density D   (fraction of nonzeros, 0..1)\n"
                          << "  --seed S\n"
                          << "  --repeat N\n";
                std::exit(0);
            }
        }

        return cfg;
    }
};

}} // namespace spcalc::util
