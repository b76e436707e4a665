/// @file sequence.hpp
/// @brief Set-style helpers over ordered sequences: subtract, intersect and
///        order-insensitive equality.
///
/// All helpers take an equality predicate, defaulting to equals() for
/// Value, so they work on element types with no ordering or hash.
/// They are quadratic, which is fine for the short arrays patches touch.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <algorithm>
#include <cstddef>
#include <ranges>
#include <vector>

namespace jsonpatch_cpp {

/// Default element comparison: deep equality for Value, operator== otherwise.
struct DeepEqual {
    auto operator()(const Value& a, const Value& b) const -> bool { return equals(a, b); }

    template <typename T>
    auto operator()(const T& a, const T& b) const -> bool { return a == b; }
};

/// Elements of `a` that have no equal element in `b`, in the order of `a`.
///
/// @code
/// subtract(Array{1, 2, 3, 2}, Array{2}) // {1, 3}
/// @endcode
template <std::ranges::input_range A, std::ranges::input_range B,
          typename Eq = DeepEqual>
auto subtract(const A& a, const B& b, Eq eq = {})
    -> std::vector<std::ranges::range_value_t<A>> {
    auto out = std::vector<std::ranges::range_value_t<A>>{};
    for (const auto& x : a) {
        const auto in_b = std::ranges::any_of(b, [&](const auto& y) { return eq(x, y); });
        if (!in_b) out.push_back(x);
    }
    return out;
}

/// Elements of `a` that have an equal element in `b`, in the order of `a`.
template <std::ranges::input_range A, std::ranges::input_range B,
          typename Eq = DeepEqual>
auto intersect(const A& a, const B& b, Eq eq = {})
    -> std::vector<std::ranges::range_value_t<A>> {
    auto out = std::vector<std::ranges::range_value_t<A>>{};
    for (const auto& x : a) {
        const auto in_b = std::ranges::any_of(b, [&](const auto& y) { return eq(x, y); });
        if (in_b) out.push_back(x);
    }
    return out;
}

/// True if `a` and `b` hold the same elements with the same multiplicities,
/// in any order.
template <std::ranges::forward_range A, std::ranges::forward_range B,
          typename Eq = DeepEqual>
auto equals_unordered(const A& a, const B& b, Eq eq = {}) -> bool {
    const auto size_a = static_cast<std::size_t>(std::ranges::distance(a));
    const auto size_b = static_cast<std::size_t>(std::ranges::distance(b));
    if (size_a != size_b) return false;

    // Each element of `a` claims one unclaimed equal element of `b`.
    auto claimed = std::vector<bool>(size_b, false);
    for (const auto& x : a) {
        auto matched = false;
        auto i = std::size_t{0};
        for (const auto& y : b) {
            if (!claimed[i] && eq(x, y)) {
                claimed[i] = true;
                matched = true;
                break;
            }
            ++i;
        }
        if (!matched) return false;
    }
    return true;
}

}  // namespace jsonpatch_cpp
