#pragma once

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace hopstrip::core {

// Container aliases backed by ankerl::unordered_dense.
// Dense storage keeps key-value pairs contiguous, so iteration is close to a
// std::vector walk and lookups beat std::unordered_map.
// Iterator invalidation follows std::vector rules (insertion invalidates).
//
// Usage:
//   hopstrip::core::fast_map<int, size_t> request_counts;
//   hopstrip::core::fast_string_set names;  // find() accepts std::string_view

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

/// Transparent string hash: lets std::string keyed containers be queried with
/// std::string_view without materializing a temporary std::string.
struct string_hash {
    using is_transparent = void;
    using is_avalanching = void;

    [[nodiscard]] auto operator()(std::string_view str) const noexcept -> uint64_t {
        return ankerl::unordered_dense::hash<std::string_view>{}(str);
    }
};

using fast_string_set = ankerl::unordered_dense::set<std::string, string_hash, std::equal_to<>>;

}  // namespace hopstrip::core
