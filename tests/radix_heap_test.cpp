#include <radixheap/radixheap.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/core.hpp>

#include <tlx/die.hpp>

#include <cstdint>
#include <string>
#include <vector>

using Heap = radixheap::RadixHeap<std::string>;
using Entry = Heap::Entry;

struct Cfg64 : radixheap::DefaultCfg {
    using Key = std::uint64_t;
};

using Heap64 = radixheap::RadixHeap<std::string, Cfg64>;
using Entry64 = Heap64::Entry;

int main() {
    { // basic push, peek & pop
        Heap heap;
        die_unless(heap.empty());
        die_unless(!heap.peek());
        die_unless(!heap.pop());

        heap.push(7, "a");
        die_unequal(heap.size(), 1u);
        heap.push(2, "b");
        heap.push(9, "c");

        die_unless(heap.peek() == Entry(2, "b"));
        die_unless(heap.pop() == Entry(2, "b"));
        die_unequal(heap.lastKey(), 2u);
        die_unless(heap.pop() == Entry(7, "a"));
        die_unequal(heap.lastKey(), 7u);
        die_unless(heap.pop() == Entry(9, "c"));
        die_unequal(heap.lastKey(), 9u);
        die_unless(heap.empty());
        die_unless(!heap.pop());
        die_unequal(heap.lastKey(), 9u);
    }

    { // the words example
        Heap heap(8);
        heap.push(18, "of");
        heap.push(93, "rust");
        heap.push(7, "amazing");
        heap.push(1, "hello");
        heap.push(13, "world");
        heap.push(211, "development");

        die_unequal(heap.size(), 6u);
        die_unequal(heap.capacity(), 264u);
        die_unless(!heap.empty());
        die_unless(heap.peek() == Entry(1, "hello"));
        die_unless(heap.entries().front() == Entry(1, "hello"));
        die_unless(ranges::equal(heap.keys(),
                                 std::vector<std::uint32_t>{1, 7, 13, 18, 93,
                                                            211}));

        heap.pop();
        die_unless(heap.peek() == Entry(7, "amazing"));

        while (heap.size() > 2) {
            heap.pop();
            die_unless(!heap.empty());
        }
        die_unless(ranges::equal(
            heap.values(), std::vector<std::string>{"rust", "development"}));

        heap.clear();
        die_unequal(heap.size(), 0u);
        die_unless(heap.empty());
    }

    { // capacity hint is given to every bucket
        Heap heap(12);
        die_unequal(heap.capacity(), 396u);
        die_unequal(heap.size(), 0u);
        die_unless(heap.empty());

        Heap unhinted;
        die_unequal(unhinted.capacity(), 0u);
        die_unequal(unhinted.buckets().size(), 33u);
    }

    { // keys below the last extracted key are rejected without side effects
        Heap heap;
        heap.push(100, "x");
        heap.push(300, "y");
        die_unless(heap.pop() == Entry(100, "x"));

        die_unless_throws((heap.push(99, "too small")), Heap::InvalidKey);
        die_unless(!heap.tryPush(0, "too small"));
        die_unequal(heap.size(), 1u);
        die_unless(heap.peek() == Entry(300, "y"));

        try {
            heap.push(42, "z");
            die("expected InvalidKey");
        } catch (const Heap::InvalidKey &e) {
            die_unequal(e.key(), 42u);
            die_unequal(e.lastKey(), 100u);
        }

        // equal to the last extracted key is fine
        heap.push(100, "again");
        die_unless(heap.tryPush(101, "next"));
        die_unequal(heap.size(), 3u);
        die_unless(heap.pop() == Entry(100, "again"));
        die_unless(heap.pop() == Entry(101, "next"));
        die_unless(heap.pop() == Entry(300, "y"));
    }

    { // clear does not reset the baseline
        Heap heap(4);
        heap.push(50, "p");
        heap.push(60, "q");
        heap.pop();
        heap.clear();

        die_unless(heap.empty());
        die_unequal(heap.lastKey(), 50u);
        die_unless_throws((heap.push(49, "r")), Heap::InvalidKey);
        heap.push(50, "s");
        die_unless(heap.peek() == Entry(50, "s"));
    }

    { // entries sit in the bucket of their highest differing bit
        Heap heap;
        heap.push(0, "zero");
        heap.push(1, "one");
        heap.push(6, "six");
        heap.push(0xffffffffu, "max");

        const auto &buckets = heap.buckets();
        die_unequal(buckets[0].size(), 1u);
        die_unequal(buckets[1].size(), 1u);
        die_unequal(buckets[3].size(), 1u);
        die_unequal(buckets[32].size(), 1u);

        die_unless(heap.pop() == Entry(0, "zero"));
        die_unless(heap.pop() == Entry(1, "one"));
        die_unless(heap.pop() == Entry(6, "six"));
        die_unless(heap.pop() == Entry(0xffffffffu, "max"));

        for (auto &b : buckets) {
            die_unless(b.index() >= 0 && b.index() < 33);
        }
        die_unless(ranges::all_of(buckets, [](auto &b) { return b.empty(); }));
    }

    { // redistribution moves entries into finer buckets
        // 8 = 0b1000, 9 = 0b1001 and 12 = 0b1100 share bucket 4 below 16
        Heap heap(2);
        heap.push(12, "twelve");
        heap.push(9, "nine");
        heap.push(8, "eight");
        die_unequal(heap.buckets()[4].size(), 3u);

        // popping 8 moves 12 into bucket 3 and 9 into bucket 1
        die_unless(heap.pop() == Entry(8, "eight"));
        die_unequal(heap.lastKey(), 8u);
        die_unequal(heap.buckets()[4].size(), 0u);
        die_unequal(heap.buckets()[4].capacity(), 0u);
        die_unequal(heap.buckets()[3].size(), 1u);
        die_unequal(heap.buckets()[1].size(), 1u);
        die_unequal(heap.size(), 2u);
        die_unless(heap.peek() == Entry(9, "nine"));
    }

    { // equal keys come out in insertion order
        Heap heap;
        heap.push(5, "first");
        heap.push(5, "second");
        heap.push(5, "third");
        die_unless(heap.pop() == Entry(5, "first"));
        die_unless(heap.pop() == Entry(5, "second"));
        die_unless(heap.pop() == Entry(5, "third"));
    }

    { // 64-bit keys get one bucket per bit
        Heap64 heap(2);
        die_unequal(heap.buckets().size(), 65u);
        die_unequal(heap.capacity(), 130u);

        heap.push(1ull << 40, "two to the forty");
        heap.push(~0ull, "max");
        heap.push(3, "three");
        die_unequal(heap.buckets()[41].size(), 1u);
        die_unequal(heap.buckets()[64].size(), 1u);
        die_unequal(heap.buckets()[2].size(), 1u);

        die_unless(heap.pop() == Entry64(3, "three"));
        die_unless(heap.pop() == Entry64(1ull << 40, "two to the forty"));
        die_unequal(heap.lastKey(), 1ull << 40);
        die_unless(heap.pop() == Entry64(~0ull, "max"));
        die_unless(heap.empty());
    }

    { // redistribution above the 32-bit boundary
        const std::uint64_t base = 1ull << 32;
        Heap64 heap;
        heap.push(base + (1ull << 20), "far");
        heap.push(base + 7, "seven");
        heap.push(base + 5, "five");
        die_unequal(heap.buckets()[33].size(), 3u);

        // popping base + 5 moves the other two below bit 32
        die_unless(heap.pop() == Entry64(base + 5, "five"));
        die_unequal(heap.lastKey(), base + 5);
        die_unequal(heap.buckets()[33].size(), 0u);
        die_unequal(heap.buckets()[2].size(), 1u);
        die_unequal(heap.buckets()[21].size(), 1u);

        die_unless_throws((heap.push(base + 4, "below")),
                          radixheap::InvalidKey<std::uint64_t>);
        die_unless_throws((heap.push(5, "far below")), Heap64::InvalidKey);
        die_unequal(heap.size(), 2u);

        die_unless(heap.pop() == Entry64(base + 7, "seven"));
        die_unless(heap.pop() == Entry64(base + (1ull << 20), "far"));
        die_unless(heap.empty());
    }
}
