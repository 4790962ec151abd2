#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace memkv {

// ── Replies ───────────────────────────────────────────────────────────────────
//
// Result of executing one command, independent of the wire encoding.  Each
// reply shape is a plain struct; the whole thing is wrapped in a std::variant
// so the encoder can std::visit over it without inheritance.

struct SimpleStringReply {
    std::string value;
};

// `message` is sent verbatim, including its "ERR " / "WRONGTYPE " prefix.
struct ErrorReply {
    std::string message;
};

struct IntegerReply {
    std::int64_t value = 0;
};

struct BulkStringReply {
    std::string value;
};

struct NullBulkReply {};

// Array of bulk strings.
struct ArrayReply {
    std::vector<std::string> elements;
};

// [cursor, [elements...]] as returned by the SCAN family.
struct PagedReply {
    std::uint64_t cursor = 0;
    std::vector<std::string> elements;
};

// [score, member] for one sorted-set entry.
struct ScoreMemberReply {
    double score = 0.0;
    std::string member;
};

// Array of [score, member] pairs.
struct ScoredArrayReply {
    std::vector<ScoreMemberReply> pairs;
};

using Reply = std::variant<SimpleStringReply, ErrorReply, IntegerReply, BulkStringReply,
                           NullBulkReply, ArrayReply, PagedReply, ScoreMemberReply,
                           ScoredArrayReply>;

[[nodiscard]] inline bool is_error_reply(const Reply& reply) noexcept {
    return std::holds_alternative<ErrorReply>(reply);
}

} // namespace memkv
