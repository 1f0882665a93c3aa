#pragma once

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace tokengate::core {

// Container aliases backed by ankerl::unordered_dense
// Dense storage with vector-like iterator invalidation (invalidates on insertion)

// Transparent string hash: lookups by string_view or const char* without a temporary std::string
struct string_hash {
    using is_transparent = void;
    using is_avalanching = void;

    [[nodiscard]] auto operator()(std::string_view value) const noexcept -> uint64_t {
        return ankerl::unordered_dense::hash<std::string_view>{}(value);
    }
};

// String-keyed map with heterogeneous lookup
//
// Usage:
//   tokengate::core::string_map<std::string> metadata;
//   metadata.find(std::string_view{"REMOTE_USER"});
template <typename Value>
using string_map = ankerl::unordered_dense::map<std::string, Value, string_hash, std::equal_to<>>;

}  // namespace tokengate::core
