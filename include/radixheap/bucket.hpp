#pragma once

#include "util.hpp"

#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/core.hpp>

#include <cassert>
#include <cstddef>
#include <functional>
#include <iterator>
#include <utility>
#include <vector>

namespace radixheap::detail {

/**
 * Holds all entries of one distance class in insertion order and tracks the
 * position of the first entry with the smallest key.
 */
template <class Cfg>
class Bucket {
public:
    using Key = typename Cfg::Key;
    using Value = typename Cfg::Value;
    using Entry = typename Cfg::Entry;
    using BucketIdx = typename Cfg::BucketIdx;
    using Buffer = std::vector<Entry>;

    explicit Bucket(BucketIdx idx, std::size_t capacity = 0) : idx_(idx) {
        buf_.reserve(capacity);
    }

    BucketIdx index() const { return idx_; }
    std::size_t size() const { return buf_.size(); }
    std::size_t capacity() const { return buf_.capacity(); }
    bool empty() const { return buf_.empty(); }
    const Buffer &entries() const { return buf_; }

    const Entry &top() const {
        assert(!empty());
        return buf_[min_];
    }

    void push(Key key, Value value) {
        // strict comparison keeps the earliest of several equal keys on top
        const bool new_min = empty() || key < Cfg::getKey(top());
        buf_.emplace_back(key, std::move(value));
        if (new_min) min_ = buf_.size() - 1;
    }

    Entry pop() {
        assert(!empty());

        auto it = buf_.begin() + num_cast<std::ptrdiff_t>(min_);
        auto entry = std::move(*it);
        buf_.erase(it);

        // rescan, O(size())
        min_ = findMin();
        return entry;
    }

    void clear() {
        buf_.clear();
        min_ = 0;
    }

    // Moves all entries out and leaves a fresh, unallocated buffer behind
    Buffer release() {
        Buffer result;
        std::swap(result, buf_);
        min_ = 0;
        return result;
    }

    // Functor to get the capacity of a bucket
    static constexpr struct GetCapacity {
        auto operator()(const Bucket &b) const noexcept {
            return b.capacity();
        }
    } getCapacity{};

    // Functor to get the number of entries in a bucket
    static constexpr struct GetSize {
        auto operator()(const Bucket &b) const noexcept { return b.size(); }
    } getSize{};

private:
    std::size_t findMin() const {
        // min_element returns the first of several minimal elements
        auto it = ranges::min_element(buf_, std::less<>{}, Cfg::getKey);
        return num_cast<std::size_t>(std::distance(buf_.begin(), it));
    }

    BucketIdx idx_ = 0;
    Buffer buf_;

    // position of the minimum in buf_, meaningless while empty
    std::size_t min_ = 0;
};

} // namespace radixheap::detail
