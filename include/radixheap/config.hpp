#pragma once

#include "util.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>

namespace radixheap {

struct DefaultCfg {
    // Any unsigned integer type at least as wide as unsigned int.
    // The heap keeps one bucket per bit plus one for the baseline itself.
    using Key = std::uint32_t;
};

namespace detail {

/**
 * Extends user-config Base with the value type and derived constants.
 *
 * Base could be derived from DefaultCfg to provide defaults.
 */
template <class Base, class V>
struct ExtendedCfg : Base {
    using typename Base::Key;
    using Value = V;
    using Entry = std::pair<Key, Value>;
    using KeyRange = detail::NumberRange<Key>;

    // should be a signed integer to avoid unsigned arithmetic pitfalls
    using BucketIdx = std::ptrdiff_t;

    static constexpr BucketIdx kKeyBits = std::numeric_limits<Key>::digits;
    static constexpr BucketIdx kNumBuckets = kKeyBits + 1;

    static constexpr const Key &getKey(const Entry &e) noexcept {
        return e.first;
    }

    static_assert(std::is_unsigned_v<Key>);

    // tlx::clz is only provided for int-sized and wider types
    static_assert(sizeof(Key) >= sizeof(unsigned));
};

} // namespace detail

} // namespace radixheap
