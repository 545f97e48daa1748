#include <benchmark_runner.hpp>
#include <subjects/DAryHeap.hpp>
#include <subjects/RadixHeap.hpp>
#include <subjects/StdQueue.hpp>
#include <subjects/TlxRadixHeap.hpp>
#include <workloads.hpp>

#include <cstddef>
#include <iostream>
#include <string>

namespace {

template <template <template <typename> class> class Driver,
          template <typename> class Subject>
void runWiggles(std::size_t min_items, std::size_t max_items) {
    BenchmarkRunner<typename Wiggle<0, Driver>::template type<Subject>>(
        min_items, max_items)
        .run_benchmark();
    BenchmarkRunner<typename Wiggle<1, Driver>::template type<Subject>>(
        min_items, max_items)
        .run_benchmark();
    BenchmarkRunner<typename Wiggle<8, Driver>::template type<Subject>>(
        min_items, max_items)
        .run_benchmark();
}

template <template <typename> class Subject>
void runSubject(std::size_t min_items, std::size_t max_items) {
    runWiggles<Monotone<1000>::type, Subject>(min_items, max_items);
    runWiggles<Monotone<(1u << 16)>::type, Subject>(min_items, max_items);
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc > 3) {
        std::cerr << "usage: " << argv[0] << " [min_items [max_items]]\n";
        return 1;
    }

    std::size_t min_items = 125, max_items = 1u << 20;
    if (argc > 1) min_items = std::stoul(argv[1]);
    if (argc > 2) max_items = std::stoul(argv[2]);

    runSubject<RadixHeap>(min_items, max_items);
    runSubject<TlxRadixHeap>(min_items, max_items);
    runSubject<DAryHeap<4>::type>(min_items, max_items);
    runSubject<StdQueue>(min_items, max_items);
}
