#pragma once
// spcalc/utils/timing.hpp - small wall/CPU timing helpers for the driver and benches.
// Header-only. Collect named sections in a Registry, print or export them as CSV.
// Example:
//   spcalc::util::Registry reg;
//   {
//     SPCALC_TIMED_SCOPE("multiply", reg);
//     C = multiply(A, B);
//   }
//   reg.print_table();

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <iostream>
#include <fstream>
#include <iomanip>

namespace spcalc { namespace util {

struct Record {
    std::string   name;             // logical section name
    double        wall_seconds = 0; // elapsed wall-clock seconds
    double        cpu_seconds  = 0; // process CPU seconds
    std::uint64_t nnz          = 0; // optional: nonzeros produced/consumed
    std::string   note;             // free-form tag (e.g. shapes, operation)
};

// Simple wall/CPU timer
class Timer {
public:
    using clock = std::chrono::steady_clock;

    void start() {
        if (running_) return;
        running_ = true;
        t0_ = clock::now();
        cpu0_ = std::clock();
    }

    // Stop and return last interval (seconds)
    double stop() {
        if (!running_) return 0.0;
        const double dt = std::chrono::duration<double>(clock::now() - t0_).count();
        accumulated_ += dt;
        running_ = false;

        const std::clock_t cpu1 = std::clock();
        if (cpu1 != (std::clock_t)-1 && cpu0_ != (std::clock_t)-1) {
            accumulated_cpu_ += double(cpu1 - cpu0_) / double(CLOCKS_PER_SEC);
        }
        return dt;
    }

    void reset() { running_ = false; accumulated_ = 0.0; accumulated_cpu_ = 0.0; }

    double elapsed() const {
        if (!running_) return accumulated_;
        return accumulated_ + std::chrono::duration<double>(clock::now() - t0_).count();
    }

    double cpu_elapsed() const { return accumulated_cpu_; }

private:
    clock::time_point t0_{};
    std::clock_t      cpu0_{};
    double            accumulated_    {0.0};
    double            accumulated_cpu_{0.0};
    bool              running_        {false};
};

// Registry: collect records, dump as CSV
class Registry {
public:
    void add(const Record& r) { records_.push_back(r); }

    // Wall seconds of the last record called `name`, 0 if none.
    double seconds(const std::string& name) const {
        for (auto it = records_.rbegin(); it != records_.rend(); ++it)
            if (it->name == name) return it->wall_seconds;
        return 0.0;
    }

    void print_table(std::ostream& os = std::cout) const {
        const auto flags = os.flags();
        const auto prec  = os.precision();
        os << std::fixed << std::setprecision(6);
        write_rows_(os);
        os.flags(flags);
        os.precision(prec);
    }

    // Write CSV to file (overwrite). Returns false if the file cannot be written.
    bool to_csv(const std::string& path) const {
        std::ofstream f(path);
        if (!f) return false;
        f << std::fixed << std::setprecision(6);
        write_rows_(f);
        return static_cast<bool>(f);
    }

    const std::vector<Record>& data() const { return records_; }

private:
    void write_rows_(std::ostream& os) const {
        os << "name,wall_s,cpu_s,nnz,note\n";
        for (const auto& r : records_) {
            os << r.name << "," << r.wall_seconds << "," << r.cpu_seconds << ","
               << r.nnz << "," << '"' << r.note << '"' << "\n";
        }
    }

    std::vector<Record> records_;
};

// RAII scope timer. Starts on construction, records on destruction.
class Scoped {
public:
    Scoped(const std::string& name,
           Registry& reg,
           std::uint64_t nnz=0,
           const std::string& note="")
    : name_(name), reg_(reg), nnz_(nnz), note_(note) {
        timer_.start();
    }

    ~Scoped() {
        timer_.stop();
        Record r;
        r.name = name_;
        r.wall_seconds = timer_.elapsed();
        r.cpu_seconds  = timer_.cpu_elapsed();
        r.nnz  = nnz_;
        r.note = note_;
        reg_.add(r);
    }

private:
    std::string   name_;
    Registry&     reg_;
    std::uint64_t nnz_{};
    std::string   note_;
    Timer         timer_{};
};

// Time a callable, averaged over `repeat` runs after `warmup` untimed runs.
template<class F>
inline double time_it(F&& fn, int warmup=1, int repeat=3) {
    for (int i = 0; i < warmup; ++i) fn();
    Timer t; t.start();
    for (int i = 0; i < repeat; ++i) fn();
    t.stop();
    return t.elapsed() / double(repeat);
}

}} // namespace spcalc::util

// -----------------------------------------------------------------------------
// Helper macros for scoped timing
// -----------------------------------------------------------------------------
#define SPCALC_CONCAT_INNER(a,b) a##b
#define SPCALC_CONCAT(a,b) SPCALC_CONCAT_INNER(a,b)

#define SPCALC_TIMED_SCOPE(NAME, REGISTRY) \
    spcalc::util::Scoped SPCALC_CONCAT(_spcalc_scope_, __LINE__)(NAME, REGISTRY)

#define SPCALC_TIMED_SCOPE_X(NAME, REGISTRY, NNZ, NOTE) \
    spcalc::util::Scoped SPCALC_CONCAT(_spcalc_scope_, __LINE__)(NAME, REGISTRY, NNZ, NOTE)
