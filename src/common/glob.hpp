#pragma once

#include <string_view>

namespace memkv {

// Shell-style glob match of `text` against `pattern`.
//
//   *       any sequence of bytes (including empty)
//   ?       exactly one byte
//   [abc]   one byte from the set; ranges like [a-z] are allowed
//   [^abc]  one byte not in the set ([!abc] is accepted too)
//   \x      the literal byte x
//
// A malformed pattern (unterminated class, trailing backslash) matches
// nothing.  Matching is byte-wise and case-sensitive.
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text) noexcept;

} // namespace memkv
