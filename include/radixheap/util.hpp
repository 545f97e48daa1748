#pragma once

#include <tlx/math/clz.hpp>

#include <range/v3/core.hpp>

#include <cassert>
#include <cstddef>
#include <iostream>
#include <limits>
#include <type_traits>

// replace true with false to show verbose trace output
#define RADIXHEAP_TRACE if (true) {} else std::cerr << "TRACE "

namespace radixheap::detail {

// Convenience alias for ranges::views
namespace rv = ranges::views;

/**
 * A poor man's boost::numeric_cast that uses assert to check for loss of range.
 *
 * Inspired by: https://codereview.stackexchange.com/q/5515/11013
 */
template <typename TargetT, typename SourceT>
constexpr TargetT num_cast(SourceT input) {
    static_assert(std::is_arithmetic<SourceT>::value);
    static_assert(std::is_arithmetic<TargetT>::value);

    auto output = static_cast<TargetT>(input);

    // We can cast back to SourceT without losing information
    assert(static_cast<SourceT>(output) == input);

    // Output is positive iff input is positive
    assert((SourceT(0) < input) == (TargetT(0) < output));

    return output;
}

/**
 * Provides the smallest value of an unsigned key type.
 */
template <typename T>
struct NumberRange {
    static_assert(std::is_unsigned_v<T>, "keys must be unsigned integers");

    using limits = std::numeric_limits<T>;

    static constexpr T inf() noexcept { return limits::min(); }
};

/**
 * Position (1-based, counted from the least significant bit) of the highest
 * bit in which a and b differ, or 0 if they are equal.
 */
template <typename Key>
inline std::ptrdiff_t highestDifferingBit(Key a, Key b) {
    if (a == b) return 0;
    const Key diff = a ^ b;
    return std::numeric_limits<Key>::digits -
           static_cast<std::ptrdiff_t>(tlx::clz(diff));
}

} // namespace radixheap::detail
