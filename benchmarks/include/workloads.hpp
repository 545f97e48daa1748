#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <type_traits>

#include <tlx/die.hpp>

//! The queue item used by all workloads
template <typename K, typename V = std::uint32_t>
struct Item {
    K key;
    V value;

    Item() : Item<K, V>(0, 0){};
    Item(K key, V value) : key(key), value(value){};

    constexpr bool operator<(const Item<K, V> &b) const noexcept {
        return key < b.key;
    }
    constexpr bool operator>(const Item<K, V> &b) const noexcept {
        return key > b.key;
    }
};

using IntItem = Item<std::uint32_t>;

template <typename HeapType>
class BaseDriver {
protected:
    HeapType heap_;
    std::minstd_rand rand_engine_;

public:
    using heap_type = HeapType;

    BaseDriver() : rand_engine_(42) {}
    size_t size() const noexcept { return heap_.size(); }
    bool empty() const noexcept { return heap_.empty(); }
};

/**
 * Pushes keys at a geometrically distributed distance above the last popped
 * key, like the tentative distances of a shortest path search. Small values
 * of MeanStep produce many equal keys.
 */
template <unsigned MeanStep>
struct Monotone {
    template <template <class> class HeapTemplate, class ItemType = IntItem>
    class type : public BaseDriver<HeapTemplate<ItemType>> {
        using key_type = decltype(ItemType::key);
        static_assert(std::is_unsigned_v<key_type>);

        key_type max_deleted_key_{0};
        std::geometric_distribution<key_type> incr_dist_{1.0 / (MeanStep + 1)};

    public:
        static auto name() { return "monotone_" + std::to_string(MeanStep); }

        void push() {
            auto key = max_deleted_key_ + incr_dist_(this->rand_engine_);
            this->heap_.push(ItemType(key, key));
        }

        void pop() {
            max_deleted_key_ = this->heap_.top().key;
            this->heap_.pop();
        }
    };
};

template <unsigned S, template <template <typename> class> class Driver>
struct Wiggle {
    static constexpr unsigned wiggle_count = S;

    template <template <typename> class HeapType>
    class type {
        using DriverType = Driver<HeapType>;

    public:
        using subject_type = typename DriverType::heap_type;

        static auto name() {
            return "heap_wiggle_" + std::to_string(wiggle_count) + "_" +
                   DriverType::name();
        }

        void run(size_t items) {
            DriverType heap;

            // Fill heap
            for (size_t i = 0; i < items; i++) {
                for (size_t j = 0; j < wiggle_count; j++) {
                    heap.push();
                    heap.pop();
                }
                heap.push();
            }

            die_unless(heap.size() == items);

            // Empty heap
            for (size_t i = 0; i < items; i++) {
                heap.pop();
                for (size_t j = 0; j < wiggle_count; j++) {
                    heap.push();
                    heap.pop();
                }
            }

            die_unless(heap.empty());
        }
    };
};
