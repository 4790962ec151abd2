#pragma once

#include "network/reply.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace memkv::network {

// ── Protocol error codes ─────────────────────────────────────────────────────

enum class RespErrc {
    invalid_array_length = 1,   // "*" header is not an integer, or negative
    array_too_large,            // element count above RespLimits::max_array_length
    expected_bulk_string,       // array element header does not start with '$'
    invalid_bulk_length,        // "$" header is not an integer, or below -1
    bulk_too_large,             // bulk length above RespLimits::max_bulk_length
    missing_crlf,               // bulk payload not followed by "\r\n"
    line_too_long,              // header line without terminator exceeds the limit
    incomplete_input,           // peer closed the connection mid-frame
};

[[nodiscard]] const std::error_category& resp_category() noexcept;

[[nodiscard]] std::error_code make_error_code(RespErrc e) noexcept;

// ── RESP decoder ─────────────────────────────────────────────────────────────

struct RespLimits {
    std::size_t max_array_length = 1'000'000;
    std::size_t max_bulk_length  = 512 * 1024 * 1024;
    std::size_t max_line_length  = 64 * 1024;
};

enum class DecodeStatus {
    Complete,     // one request decoded; `consumed` bytes belong to it
    Incomplete,   // need more bytes; nothing consumed
    Error,        // protocol error; drop `consumed` bytes and reply with `error`
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Incomplete;
    std::vector<std::string> args;   // empty for a blank inline line or "*0"
    std::size_t consumed = 0;
    std::error_code error;
};

// Decodes one request from the front of a byte buffer.
//
// First byte '*' selects a multi-bulk array of bulk strings; anything else
// is an inline command split on ASCII whitespace.  Lines end in "\n" with an
// optional preceding "\r".  Bulk payloads are binary-safe.
//
// Stateless and thread-safe: the caller owns the buffer and erases
// `consumed` bytes after each call.
class RespDecoder {
public:
    RespDecoder() = default;
    explicit RespDecoder(RespLimits limits) : limits_{limits} {}

    [[nodiscard]] DecodeResult decode(std::string_view buffer) const;

    [[nodiscard]] const RespLimits& limits() const noexcept { return limits_; }

private:
    [[nodiscard]] DecodeResult decode_inline(std::string_view buffer) const;
    [[nodiscard]] DecodeResult decode_array(std::string_view buffer) const;

    RespLimits limits_;
};

// ── RESP serializer ──────────────────────────────────────────────────────────

// Serialize a Reply into RESP wire format.
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string serialize_reply(const Reply& reply);

// Sorted-set score as sent on the wire: fixed notation, six decimals.
[[nodiscard]] std::string format_score(double score);

// ── RESP client-side helper ──────────────────────────────────────────────────

// Serialize an argument vector (command name first) into a RESP array request.
[[nodiscard]] std::string serialize_resp_request(const std::vector<std::string>& args);

} // namespace memkv::network

template <>
struct std::is_error_code_enum<memkv::network::RespErrc> : std::true_type {};
