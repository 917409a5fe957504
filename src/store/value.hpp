#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <variant>

#include "zset/sorted_set.hpp"

namespace kvmock {

// ── Typed values ─────────────────────────────────────────────────────────────
//
// Each key maps to exactly one of these.  Ordered containers keep set members
// and hash fields in a deterministic order for enumeration.

using List  = std::deque<std::string>;
using Set   = std::set<std::string>;
using Hash  = std::map<std::string, std::string>;
using ZSet  = zset::SortedSet;

using Value = std::variant<std::string, List, Set, Hash, ZSet>;

enum class ValueType : uint8_t {
    String = 0,
    List   = 1,
    Set    = 2,
    Hash   = 3,
    ZSet   = 4,
};

// Name reported by TYPE: "string", "list", "set", "hash", "zset".
[[nodiscard]] std::string_view to_string(ValueType type) noexcept;

[[nodiscard]] ValueType type_of(const Value& value) noexcept;

// True for a collection that holds no elements (strings are never "empty").
[[nodiscard]] bool is_empty_collection(const Value& value) noexcept;

// Compile-time tag for each alternative, used by KeySpace::get_typed.
template <typename T> struct ValueTraits;

template <> struct ValueTraits<std::string> { static constexpr ValueType type = ValueType::String; };
template <> struct ValueTraits<List>        { static constexpr ValueType type = ValueType::List; };
template <> struct ValueTraits<Set>         { static constexpr ValueType type = ValueType::Set; };
template <> struct ValueTraits<Hash>        { static constexpr ValueType type = ValueType::Hash; };
template <> struct ValueTraits<ZSet>        { static constexpr ValueType type = ValueType::ZSet; };

} // namespace kvmock
