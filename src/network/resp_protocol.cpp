#include "network/resp_protocol.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace memkv::network {

namespace {

class RespCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "resp"; }

    std::string message(int ev) const override {
        switch (static_cast<RespErrc>(ev)) {
            case RespErrc::invalid_array_length: return "invalid array length";
            case RespErrc::array_too_large:      return "array length too large";
            case RespErrc::expected_bulk_string: return "expected bulk string";
            case RespErrc::invalid_bulk_length:  return "invalid bulk string length";
            case RespErrc::bulk_too_large:       return "bulk string exceeds max length";
            case RespErrc::missing_crlf:         return "malformed bulk string: missing CRLF";
            case RespErrc::line_too_long:        return "line too long";
            case RespErrc::incomplete_input:     return "incomplete input";
        }
        return "unknown protocol error";
    }
};

// A located line: `text` is the content without its terminator; `next` is the
// offset just past the terminating '\n'.
struct Line {
    std::string_view text;
    std::size_t next = 0;
};

// Finds the line starting at `pos`.  Returns false if no '\n' is buffered yet.
bool find_line(std::string_view buffer, std::size_t pos, Line& line) {
    const std::size_t nl = buffer.find('\n', pos);
    if (nl == std::string_view::npos) {
        return false;
    }
    std::string_view text = buffer.substr(pos, nl - pos);
    if (!text.empty() && text.back() == '\r') {
        text.remove_suffix(1);
    }
    line = Line{text, nl + 1};
    return true;
}

bool parse_int(std::string_view sv, std::int64_t& out) {
    if (sv.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

DecodeResult error(RespErrc e, std::size_t consumed) {
    DecodeResult r;
    r.status   = DecodeStatus::Error;
    r.consumed = consumed;
    r.error    = make_error_code(e);
    return r;
}

// No terminator yet: either wait for more bytes or give up on an oversized line.
DecodeResult unterminated(std::string_view buffer, std::size_t line_start,
                          std::size_t max_line_length) {
    if (buffer.size() - line_start > max_line_length) {
        return error(RespErrc::line_too_long, buffer.size());
    }
    return DecodeResult{};
}

std::string bulk(std::string_view s) {
    std::string out = "$" + std::to_string(s.size()) + "\r\n";
    out.append(s.data(), s.size());
    out += "\r\n";
    return out;
}

std::string array_of(const std::vector<std::string>& elements) {
    std::string out = "*" + std::to_string(elements.size()) + "\r\n";
    for (const auto& e : elements) {
        out += bulk(e);
    }
    return out;
}

std::string score_member(const ScoreMemberReply& p) {
    return "*2\r\n" + bulk(format_score(p.score)) + bulk(p.member);
}

} // anonymous namespace

const std::error_category& resp_category() noexcept {
    static const RespCategory category;
    return category;
}

std::error_code make_error_code(RespErrc e) noexcept {
    return {static_cast<int>(e), resp_category()};
}

// ── RESP decoder ─────────────────────────────────────────────────────────────

DecodeResult RespDecoder::decode(std::string_view buffer) const {
    if (buffer.empty()) {
        return DecodeResult{};
    }
    if (buffer.front() == '*') {
        return decode_array(buffer);
    }
    return decode_inline(buffer);
}

DecodeResult RespDecoder::decode_inline(std::string_view buffer) const {
    Line line;
    if (!find_line(buffer, 0, line)) {
        return unterminated(buffer, 0, limits_.max_line_length);
    }

    DecodeResult r;
    r.status   = DecodeStatus::Complete;
    r.consumed = line.next;

    std::size_t i = 0;
    const std::string_view text = line.text;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) {
            ++i;
        }
        const std::size_t start = i;
        while (i < text.size() && !is_space(text[i])) {
            ++i;
        }
        if (i > start) {
            r.args.emplace_back(text.substr(start, i - start));
        }
    }
    return r;
}

DecodeResult RespDecoder::decode_array(std::string_view buffer) const {
    Line header;
    if (!find_line(buffer, 0, header)) {
        return unterminated(buffer, 0, limits_.max_line_length);
    }

    std::int64_t count = 0;
    if (!parse_int(header.text.substr(1), count) || count < 0) {
        return error(RespErrc::invalid_array_length, header.next);
    }
    if (static_cast<std::uint64_t>(count) > limits_.max_array_length) {
        return error(RespErrc::array_too_large, header.next);
    }

    std::vector<std::string> args;
    args.reserve(static_cast<std::size_t>(std::min<std::int64_t>(count, 1024)));

    std::size_t pos = header.next;
    for (std::int64_t i = 0; i < count; ++i) {
        Line element;
        if (!find_line(buffer, pos, element)) {
            return unterminated(buffer, pos, limits_.max_line_length);
        }
        if (element.text.empty() || element.text.front() != '$') {
            return error(RespErrc::expected_bulk_string, element.next);
        }

        std::int64_t length = 0;
        if (!parse_int(element.text.substr(1), length) || length < -1) {
            return error(RespErrc::invalid_bulk_length, element.next);
        }
        if (length == -1) {
            // Null bulk string inside a request decodes as an empty argument.
            args.emplace_back();
            pos = element.next;
            continue;
        }
        if (static_cast<std::uint64_t>(length) > limits_.max_bulk_length) {
            return error(RespErrc::bulk_too_large, element.next);
        }

        const auto size = static_cast<std::size_t>(length);
        const std::size_t data_end = element.next + size;
        if (buffer.size() < data_end + 2) {
            return DecodeResult{};
        }
        if (buffer[data_end] != '\r' || buffer[data_end + 1] != '\n') {
            return error(RespErrc::missing_crlf, data_end + 2);
        }

        args.emplace_back(buffer.substr(element.next, size));
        pos = data_end + 2;
    }

    DecodeResult r;
    r.status   = DecodeStatus::Complete;
    r.args     = std::move(args);
    r.consumed = pos;
    return r;
}

// ── RESP serializer ──────────────────────────────────────────────────────────

std::string format_score(double score) {
    return fmt::format("{:f}", score);
}

std::string serialize_reply(const Reply& reply) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, SimpleStringReply>) {
                return "+" + r.value + "\r\n";
            } else if constexpr (std::is_same_v<T, ErrorReply>) {
                return "-" + r.message + "\r\n";
            } else if constexpr (std::is_same_v<T, IntegerReply>) {
                return ":" + std::to_string(r.value) + "\r\n";
            } else if constexpr (std::is_same_v<T, BulkStringReply>) {
                return bulk(r.value);
            } else if constexpr (std::is_same_v<T, NullBulkReply>) {
                return "$-1\r\n";
            } else if constexpr (std::is_same_v<T, ArrayReply>) {
                return array_of(r.elements);
            } else if constexpr (std::is_same_v<T, PagedReply>) {
                return "*2\r\n" + bulk(std::to_string(r.cursor)) + array_of(r.elements);
            } else if constexpr (std::is_same_v<T, ScoreMemberReply>) {
                return score_member(r);
            } else if constexpr (std::is_same_v<T, ScoredArrayReply>) {
                std::string out = "*" + std::to_string(r.pairs.size()) + "\r\n";
                for (const auto& p : r.pairs) {
                    out += score_member(p);
                }
                return out;
            }
        },
        reply);
}

// ── RESP client-side helper ──────────────────────────────────────────────────

std::string serialize_resp_request(const std::vector<std::string>& args) {
    return array_of(args);
}

} // namespace memkv::network
