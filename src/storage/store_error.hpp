#pragma once

#include <system_error>
#include <type_traits>
#include <variant>

namespace memkv {

// ── Store error codes ────────────────────────────────────────────────────────
//
// Errors a keyspace operation can return.  Missing keys are not errors; they
// surface as std::nullopt or an empty result.

enum class StoreErrc {
    wrong_type = 1,     // key exists with a different kind
    invalid_cursor,     // negative SCAN cursor
};

[[nodiscard]] const std::error_category& store_category() noexcept;

[[nodiscard]] std::error_code make_error_code(StoreErrc e) noexcept;

// Result of a fallible store operation: the value, or the error describing why
// the store was left untouched.
template <typename T>
using Result = std::variant<T, std::error_code>;

template <typename T>
[[nodiscard]] bool is_error(const Result<T>& r) noexcept {
    return std::holds_alternative<std::error_code>(r);
}

} // namespace memkv

template <>
struct std::is_error_code_enum<memkv::StoreErrc> : std::true_type {};
