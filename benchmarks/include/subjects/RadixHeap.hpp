#pragma once

#include <radixheap/radixheap.hpp>

#include <cstddef>

template <typename T>
class RadixHeap {
    using key_type = decltype(T::key);
    using value_type = decltype(T::value);

    struct Cfg : radixheap::DefaultCfg {
        using Key = key_type;
    };

    radixheap::RadixHeap<value_type, Cfg> heap_;

public:
    static auto name() { return "radixheap"; }

    //! Allocates an empty heap.
    explicit RadixHeap() {}

    // Disable {copy,move} ctor and assignment operator
    RadixHeap(RadixHeap const &) = delete;
    RadixHeap &operator=(RadixHeap const &) = delete;

    std::size_t size() const noexcept { return heap_.size(); }
    bool empty() const noexcept { return heap_.empty(); }

    //! Inserts a new item.
    void push(const T &item) { heap_.push(item.key, item.value); }

    //! Returns the top item.
    T top() const {
        const auto &entry = heap_.top();
        return T(entry.first, entry.second);
    }

    //! Removes the top item.
    void pop() { heap_.pop(); }
};
