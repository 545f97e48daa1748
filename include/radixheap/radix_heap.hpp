#pragma once

#include "bucket.hpp"
#include "invalid_key.hpp"
#include "util.hpp"

#include <range/v3/action/stable_sort.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/core.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/map.hpp>
#include <range/v3/view/transform.hpp>

#include <cassert>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace radixheap::detail {

/**
 * A monotone min-priority queue on unsigned integer keys.
 *
 * Bucket i > 0 holds the entries whose key first differs from the last
 * extracted key in bit i (1-based), bucket 0 those equal to it. Keys smaller
 * than the last extracted key are rejected.
 */
template <class Cfg>
class RadixHeap {
public:
    using Key = typename Cfg::Key;
    using Value = typename Cfg::Value;
    using Entry = typename Cfg::Entry;
    using Bucket = ::radixheap::detail::Bucket<Cfg>;
    using BucketIdx = typename Cfg::BucketIdx;
    using Buckets = std::vector<Bucket>;
    using InvalidKey = ::radixheap::InvalidKey<Key>;

    /**
     * @param capacity number of entries reserved in *each* bucket
     */
    explicit RadixHeap(std::optional<std::size_t> capacity = std::nullopt) {
        buckets_.reserve(Cfg::kNumBuckets);
        for (BucketIdx i = 0; i < Cfg::kNumBuckets; ++i) {
            buckets_.emplace_back(i, capacity.value_or(0));
        }
    }

    std::size_t size() const { return size_; }

    bool empty() const { return size() == 0; }

    // Allocated entries over all buckets. Diagnostic only.
    std::size_t capacity() const {
        auto capacities = buckets_ | rv::transform(Bucket::getCapacity);
        return ranges::accumulate(capacities, std::size_t{0});
    }

    Key lastKey() const { return last_; }

    const Buckets &buckets() const { return buckets_; }

    void push(Key key, Value value) {
        if (!tryPush(key, std::move(value))) throw InvalidKey(key, last_);
    }

    /** Like push(), but reports a key below lastKey() by returning false. */
    bool tryPush(Key key, Value value) {
        if (key < last_) return false;
        insert(key, std::move(value));
        ++size_;
        return true;
    }

    const Entry &top() const {
        assert(!empty());
        return bucket(minBucketIdx()).top();
    }

    std::optional<Entry> peek() const {
        if (empty()) return std::nullopt;
        return top();
    }

    std::optional<Entry> pop() {
        if (empty()) return std::nullopt;

        auto &b = bucket(minBucketIdx());
        auto entry = b.pop();
        --size_;

        if (b.index() == 0) {
            // bucket 0 only ever holds keys equal to last_
            assert(Cfg::getKey(entry) == last_);
            return entry;
        }

        // the only place the baseline advances
        assert(last_ < Cfg::getKey(entry));
        last_ = Cfg::getKey(entry);

        if (!b.empty()) redistribute(b);

        traceState("pop:after");
        return entry;
    }

    // Empties all buckets. lastKey() stays as it is.
    void clear() {
        for (auto &b : buckets_) b.clear();
        size_ = 0;
    }

    // All entries in bucket order, not sorted by key
    std::vector<Entry> entries() const {
        return buckets_ | rv::transform(&Bucket::entries) | rv::join |
               ranges::to<std::vector>();
    }

    std::vector<Entry> sortedEntries() const {
        return entries() |
               ranges::actions::stable_sort(std::less<>{}, Cfg::getKey);
    }

    std::vector<Key> keys() const {
        const auto sorted = sortedEntries();
        return sorted | rv::keys | ranges::to<std::vector>();
    }

    std::vector<Value> values() const {
        const auto sorted = sortedEntries();
        return sorted | rv::values | ranges::to<std::vector>();
    }

private:
    static BucketIdx bucketIndex(Key key, Key last) {
        return highestDifferingBit(key, last);
    }

    void insert(Key key, Value value) {
        assert(!(key < last_));
        bucket(bucketIndex(key, last_)).push(key, std::move(value));
    }

    // helper for getting a bucket with a signed index
    Bucket &bucket(BucketIdx i) {
        assert(i >= 0);
        assert(i < Cfg::kNumBuckets);
        return *(buckets_.begin() + i);
    }

    const Bucket &bucket(BucketIdx i) const {
        assert(i >= 0);
        assert(i < Cfg::kNumBuckets);
        return *(buckets_.begin() + i);
    }

    /**
     * Moves the remaining entries of b into the buckets they belong to under
     * the new baseline.
     * @pre last_ was just set to the smallest key formerly in b
     */
    void redistribute(Bucket &b) {
        RADIXHEAP_TRACE << "event=redistribute"
                        << " idx=" << b.index() << " size=" << b.size()
                        << " last=" << last_ << "\n";

        auto scratch = b.release();
        for (auto &entry : scratch) {
            // every entry moves to a strictly finer bucket
            assert(bucketIndex(Cfg::getKey(entry), last_) < b.index());
            insert(Cfg::getKey(entry), std::move(entry.second));
        }

        assert(b.empty());
    }

    // index of the first non-empty bucket
    BucketIdx minBucketIdx() const {
        assert(!empty());
        auto it = ranges::find_if(buckets_, std::not_fn(&Bucket::empty));
        assert(it != buckets_.end());
        return std::distance(buckets_.begin(), it);
    }

    void traceState(const char *event_name) const {
        RADIXHEAP_TRACE << "event=RadixHeap::" << event_name
                        << " size=" << size_ << " last=" << last_
                        << " bucket_sizes="
                        << rv::transform(buckets_, Bucket::getSize) << "\n";
    }

    Buckets buckets_;

    // key of the most recently extracted entry
    Key last_ = Cfg::KeyRange::inf();

    // The total number of entries in all buckets
    std::size_t size_ = 0;
};

} // namespace radixheap::detail
