#pragma once

#include <tlx/container/d_ary_heap.hpp>

#include <string>

template <unsigned Arity> struct DAryHeap {
    template <typename T> struct type : tlx::DAryHeap<T, Arity> {
        static auto name() { return "dary_heap_" + std::to_string(Arity); }
    };
};
