#pragma once

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include <tlx/timestamp.hpp>

template <class Benchmark>
class BenchmarkRunner {
    using Subject = typename Benchmark::subject_type;

    const size_t min_items, max_items;

    // The number of items to be processed in one benchmark batch
    size_t batch_size = min_items;

    struct Result {
        const size_t run_size, num_runs;
        const double time;

        friend std::ostream &operator<<(std::ostream &os, const Result &r) {
            // clang-format off
            return os << "RESULT"
                << " container=" << Subject::name()
                << " op=" << Benchmark::name()
                << " items=" << r.run_size
                << " repeat=" << r.num_runs
                << std::fixed << std::setprecision(10)
                << " time_total=" << r.time
                << " time=" << r.time / static_cast<double>(r.num_runs)
                << " time_per_item=" << r.time / static_cast<double>(r.num_runs * r.run_size);
            // clang-format on
        }
    };

    // Repeat benchmark runs of given size until enough time elapsed
    Result run_until_stable(size_t run_size) {
        if (batch_size < run_size) batch_size = run_size;

        double time;
        while ((time = run_batch(run_size)) < 1.0) {
            batch_size *= 2;
        }
        return {run_size, batch_size / run_size, time};
    }

    // Run a batch of benchmark runs of given size and return total time
    double run_batch(size_t run_size) {
        size_t num_runs = batch_size / run_size;
        Benchmark benchmark;

        double ts1 = tlx::timestamp();
        for (size_t r = 0; r < num_runs; ++r) {
            benchmark.run(run_size);
        }
        double ts2 = tlx::timestamp();

        return ts2 - ts1;
    }

public:
    // NOLINTNEXTLINE(hicpp-member-init, cppcoreguidelines-pro-type-member-init)
    BenchmarkRunner() : BenchmarkRunner(125, 1u << 20) {}

    BenchmarkRunner(size_t min_items, size_t max_items)
        : min_items(min_items), max_items(max_items) {}

    void run_benchmark() {
        std::cout << "Benchmark " << Subject::name() << " " << Benchmark::name()
                  << " " << min_items << ".." << max_items << "\n";

        for (size_t items = min_items; items <= max_items; items *= 2) {
            std::cout << run_until_stable(items) << std::endl;
        }
    }
};
