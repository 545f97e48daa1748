#pragma once

#include <tlx/container/radix_heap.hpp>

#include <cstddef>
#include <utility>

template <typename T>
class TlxRadixHeap {
    using key_type = decltype(T::key);
    using value_type = decltype(T::value);

    // top() moves tlx's insertion limit, hence mutable
    mutable tlx::RadixHeapPair<key_type, value_type> heap_;

public:
    static auto name() { return "tlx_radix_heap"; }

    std::size_t size() const noexcept { return heap_.size(); }
    bool empty() const noexcept { return heap_.empty(); }

    void push(const T &item) { heap_.push({item.key, item.value}); }

    T top() const {
        const auto &entry = heap_.top();
        return T(entry.first, entry.second);
    }

    void pop() { heap_.pop(); }
};
