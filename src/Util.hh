// SPDX-License-Identifier: MIT
#pragma once
#include <cstdint>
#include <type_traits>
#include <utility>

namespace Util {

template<typename T>
struct IntRange {
    static_assert(std::is_integral<T>::value);
    T start, end_;
    struct end_marker {T val;};
    struct iterator {
        T val;
        iterator &operator++() {++val; return *this;}
        iterator operator++(int) {iterator res {val}; ++val; return res;}
        T operator*() const {return val;}
        constexpr bool operator!=(const end_marker &end) const {return val < end.val;}
    };

    IntRange(T end) : start{0}, end_{end} {}
    IntRange(T start, T end) : start{start}, end_{end} {}
    iterator begin() const {return {start};}
    end_marker end() const {return {end_};}
};

template<typename T> IntRange(T) -> IntRange<T>;
template<typename T> IntRange(T, T) -> IntRange<T>;

template<typename T>
std::pair<T, T> ordered(T a, T b) {
    return a <= b ? std::make_pair(a, b) : std::make_pair(b, a);
}

/// packs two 32-bit values into one key, first value in the high bits
inline uint64_t packPair(const std::pair<uint32_t, uint32_t> &p) {
    return uint64_t(p.first) << 32 | p.second;
}

}
