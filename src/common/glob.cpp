#include "common/glob.hpp"

#include <cstddef>

namespace memkv {

namespace {

enum class ClassMatch { Match, NoMatch, Malformed };

// Match one byte against the class that starts right after '[' at p.
// On success `p` is left just past the closing ']'.
ClassMatch match_class(std::string_view pattern, std::size_t& p, unsigned char c) {
    bool negate = false;
    if (p < pattern.size() && (pattern[p] == '^' || pattern[p] == '!')) {
        negate = true;
        ++p;
    }

    bool matched = false;
    bool first = true;
    for (;;) {
        if (p >= pattern.size()) {
            return ClassMatch::Malformed;
        }
        unsigned char lo = static_cast<unsigned char>(pattern[p]);
        if (lo == ']' && !first) {
            ++p;
            break;
        }
        first = false;

        if (lo == '\\') {
            if (++p >= pattern.size()) return ClassMatch::Malformed;
            lo = static_cast<unsigned char>(pattern[p]);
        }
        ++p;

        unsigned char hi = lo;
        if (p + 1 < pattern.size() && pattern[p] == '-' && pattern[p + 1] != ']') {
            ++p;
            hi = static_cast<unsigned char>(pattern[p]);
            if (hi == '\\') {
                if (++p >= pattern.size()) return ClassMatch::Malformed;
                hi = static_cast<unsigned char>(pattern[p]);
            }
            ++p;
            if (lo > hi) {
                const unsigned char tmp = lo;
                lo = hi;
                hi = tmp;
            }
        }

        if (c >= lo && c <= hi) {
            matched = true;
        }
    }

    return matched != negate ? ClassMatch::Match : ClassMatch::NoMatch;
}

} // anonymous namespace

bool glob_match(std::string_view pattern, std::string_view text) noexcept {
    std::size_t p = 0;
    std::size_t t = 0;

    // Backtracking point for the most recent '*'.
    std::size_t star_p = std::string_view::npos;
    std::size_t star_t = 0;

    while (t < text.size()) {
        if (p < pattern.size()) {
            const char pc = pattern[p];
            if (pc == '*') {
                star_p = ++p;
                star_t = t;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++t;
                continue;
            }
            if (pc == '[') {
                std::size_t q = p + 1;
                const auto m = match_class(pattern, q, static_cast<unsigned char>(text[t]));
                if (m == ClassMatch::Malformed) {
                    return false;
                }
                if (m == ClassMatch::Match) {
                    p = q;
                    ++t;
                    continue;
                }
            } else if (pc == '\\') {
                if (p + 1 >= pattern.size()) {
                    return false;
                }
                if (pattern[p + 1] == text[t]) {
                    p += 2;
                    ++t;
                    continue;
                }
            } else if (pc == text[t]) {
                ++p;
                ++t;
                continue;
            }
        }

        // Mismatch: let the last '*' swallow one more byte.
        if (star_p == std::string_view::npos) {
            return false;
        }
        p = star_p;
        t = ++star_t;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

} // namespace memkv
