#include <radixheap/radixheap.hpp>

#include <range/v3/algorithm/equal.hpp>
#include <range/v3/core.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/join.hpp>

#include <tlx/die.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::string join(const std::vector<std::string> &words) {
    return words | ranges::views::join(' ') | ranges::to<std::string>();
}

} // namespace

int main() {
    radixheap::RadixHeap<std::string> heap(8);

    heap.push(18, "of");
    heap.push(93, "rust");
    heap.push(7, "amazing");
    heap.push(1, "hello");
    heap.push(13, "world");
    heap.push(211, "development");

    die_unequal(heap.size(), 6u);
    die_unless(heap.capacity() >= heap.size());
    die_unequal(heap.capacity(), 264u);
    die_unless(ranges::equal(heap.keys(),
                             std::vector<std::uint32_t>{1, 7, 13, 18, 93, 211}));

    const auto words = join(heap.values());
    die_unequal(words, "hello amazing world of rust development");
    std::cout << words << std::endl;

    heap.pop();
    die_unequal(heap.peek()->second, "amazing");

    while (heap.size() > 2) heap.pop();
    die_unequal(join(heap.values()), "rust development");

    heap.clear();
    die_unless(heap.empty());
}
