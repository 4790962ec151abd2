#pragma once

#include "common/clock.hpp"
#include "storage/sorted_set.hpp"

#include <deque>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <variant>

namespace memkv {

// ── Value kinds ──────────────────────────────────────────────────────────────

enum class ValueKind {
    String,
    Hash,
    List,
    Set,
    SortedSet,
};

[[nodiscard]] constexpr const char* to_string(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::String:    return "string";
        case ValueKind::Hash:      return "hash";
        case ValueKind::List:      return "list";
        case ValueKind::Set:       return "set";
        case ValueKind::SortedSet: return "zset";
    }
    return "unknown";
}

using HashValue = std::unordered_map<std::string, std::string>;
using ListValue = std::deque<std::string>;
using SetValue  = std::unordered_set<std::string>;

// One alternative per kind.  The kind of a Value is the index of its active
// alternative; it cannot change without replacing the whole payload.
using Payload = std::variant<std::string, HashValue, ListValue, SetValue, SortedSet>;

// Maps a payload alternative to its kind at compile time.  Adding a kind
// without extending this trait fails to compile wherever it is used.
template <typename T> struct KindOf;
template <> struct KindOf<std::string> { static constexpr ValueKind value = ValueKind::String; };
template <> struct KindOf<HashValue>   { static constexpr ValueKind value = ValueKind::Hash; };
template <> struct KindOf<ListValue>   { static constexpr ValueKind value = ValueKind::List; };
template <> struct KindOf<SetValue>    { static constexpr ValueKind value = ValueKind::Set; };
template <> struct KindOf<SortedSet>   { static constexpr ValueKind value = ValueKind::SortedSet; };

// ── Value ────────────────────────────────────────────────────────────────────

struct Value {
    Payload payload;
    std::optional<Clock::time_point> expiry; // absent: never expires

    [[nodiscard]] ValueKind kind() const noexcept {
        return std::visit(
            [](const auto& p) { return KindOf<std::decay_t<decltype(p)>>::value; },
            payload);
    }

    // Expired at `now` when the deadline has been reached.  The sweep and the
    // lazy read/write checks all go through this predicate.
    [[nodiscard]] bool expired(Clock::time_point now) const noexcept {
        return expiry.has_value() && *expiry <= now;
    }

    // True for a container payload with no elements left.
    [[nodiscard]] bool empty_container() const noexcept {
        return std::visit(
            [](const auto& p) -> bool {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return false;
                } else {
                    return p.empty();
                }
            },
            payload);
    }
};

} // namespace memkv
