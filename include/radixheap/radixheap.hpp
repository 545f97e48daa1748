#pragma once

#include "bucket.hpp"
#include "config.hpp"
#include "invalid_key.hpp"
#include "radix_heap.hpp"

namespace radixheap {

template <class Value, class Cfg = DefaultCfg>
using RadixHeap = detail::RadixHeap<detail::ExtendedCfg<Cfg, Value>>;

template <class Value, class Cfg = DefaultCfg>
using Bucket = detail::Bucket<detail::ExtendedCfg<Cfg, Value>>;

} // namespace radixheap
