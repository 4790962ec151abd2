#include "command/dispatcher.hpp"

#include "network/resp_protocol.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>

namespace memkv {

namespace {

using Args = std::vector<std::string>;
using Handler = Reply (*)(Keyspace&, const Args&);

constexpr const char* kNotInteger  = "ERR value is not an integer or out of range";
constexpr const char* kNotFloat    = "ERR value is not a valid float";
constexpr const char* kSyntaxError = "ERR syntax error";

// ── Argument helpers ─────────────────────────────────────────────────────────

std::string to_upper(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string to_lower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<std::int64_t> parse_integer(std::string_view s) {
    std::int64_t value = 0;
    if (s.empty()) {
        return std::nullopt;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// Accepts what strtod-style parsers accept for scores, including "inf",
// "+inf" and "-inf".  NaN is not a valid score.
std::optional<double> parse_score(std::string_view s) {
    if (s.size() > 1 && s.front() == '+' && s[1] != '-' && s[1] != '+') {
        s.remove_prefix(1);
    }
    if (s.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || std::isnan(value)) {
        return std::nullopt;
    }
    return value;
}

Reply error_reply(const std::error_code& ec) {
    return ErrorReply{ec.message()};
}

// Unwraps a store Result: the error becomes an ErrorReply, the value is
// handed to `on_value`.
template <typename T, typename F>
Reply reply_from(Result<T> result, F&& on_value) {
    if (auto* ec = std::get_if<std::error_code>(&result)) {
        return error_reply(*ec);
    }
    return on_value(std::move(std::get<T>(result)));
}

Reply integer(std::size_t n) {
    return IntegerReply{static_cast<std::int64_t>(n)};
}

Reply optional_bulk(std::optional<std::string> value) {
    if (!value) {
        return NullBulkReply{};
    }
    return BulkStringReply{std::move(*value)};
}

Args tail(const Args& args, std::size_t from) {
    return Args(args.begin() + static_cast<std::ptrdiff_t>(from), args.end());
}

// Parses "[MATCH pattern] [COUNT n]" starting at `pos`.  Returns an error
// reply on malformed options.
std::optional<Reply> parse_scan_options(const Args& args, std::size_t pos,
                                        std::string& pattern, std::int64_t& count) {
    pattern = "*";
    count   = kDefaultScanCount;
    while (pos < args.size()) {
        const std::string option = to_upper(args[pos]);
        if (pos + 1 >= args.size()) {
            return Reply{ErrorReply{kSyntaxError}};
        }
        if (option == "MATCH") {
            pattern = args[pos + 1];
        } else if (option == "COUNT") {
            auto n = parse_integer(args[pos + 1]);
            if (!n) {
                return Reply{ErrorReply{kNotInteger}};
            }
            count = *n;
        } else {
            return Reply{ErrorReply{kSyntaxError}};
        }
        pos += 2;
    }
    return std::nullopt;
}

std::optional<std::int64_t> parse_cursor(const std::string& s) {
    return parse_integer(s);
}

Reply paged(ScanPage page) {
    return PagedReply{page.next_cursor, std::move(page.elements)};
}

// ── Connection / meta ────────────────────────────────────────────────────────

Reply cmd_ping(Keyspace&, const Args& args) {
    if (args.empty()) {
        return SimpleStringReply{"PONG"};
    }
    return BulkStringReply{args[0]};
}

Reply cmd_echo(Keyspace&, const Args& args) {
    return BulkStringReply{args[0]};
}

// Client handshake (e.g. "COMMAND DOCS"); acknowledged without content.
Reply cmd_command(Keyspace&, const Args&) {
    return SimpleStringReply{"OK"};
}

// ── Strings and keys ─────────────────────────────────────────────────────────

Reply cmd_set(Keyspace& ks, const Args& args) {
    std::chrono::milliseconds ttl{0};
    for (std::size_t i = 2; i < args.size(); i += 2) {
        if (i + 1 >= args.size()) {
            return ErrorReply{kSyntaxError};
        }
        const std::string option = to_upper(args[i]);
        if (option != "EX" && option != "PX") {
            return ErrorReply{kSyntaxError};
        }
        auto n = parse_integer(args[i + 1]);
        if (!n) {
            return ErrorReply{kNotInteger};
        }
        if (*n <= 0 || (option == "EX" && *n > INT64_MAX / 1000)) {
            return ErrorReply{"ERR invalid expire time in 'set' command"};
        }
        ttl = option == "EX" ? std::chrono::seconds{*n} : std::chrono::milliseconds{*n};
    }
    ks.set_string(args[0], args[1], ttl);
    return SimpleStringReply{"OK"};
}

Reply cmd_get(Keyspace& ks, const Args& args) {
    return optional_bulk(ks.get_string(args[0]));
}

Reply cmd_del(Keyspace& ks, const Args& args) {
    return integer(ks.del(args));
}

Reply cmd_exists(Keyspace& ks, const Args& args) {
    return integer(ks.exists(args));
}

Reply cmd_keys(Keyspace& ks, const Args& args) {
    const std::string_view pattern = args.empty() ? std::string_view{"*"} : args[0];
    return ArrayReply{ks.keys(pattern)};
}

Reply cmd_scan(Keyspace& ks, const Args& args) {
    auto cursor = parse_cursor(args[0]);
    if (!cursor) {
        return error_reply(make_error_code(StoreErrc::invalid_cursor));
    }
    std::string pattern;
    std::int64_t count = 0;
    if (auto err = parse_scan_options(args, 1, pattern, count)) {
        return std::move(*err);
    }
    return reply_from(ks.scan(*cursor, pattern, count), paged);
}

Reply cmd_dbsize(Keyspace& ks, const Args&) {
    return integer(ks.keys("*").size());
}

Reply cmd_flushdb(Keyspace& ks, const Args&) {
    ks.clear();
    return SimpleStringReply{"OK"};
}

// ── Hash ─────────────────────────────────────────────────────────────────────

Reply cmd_hset(Keyspace& ks, const Args& args) {
    if ((args.size() - 1) % 2 != 0) {
        return ErrorReply{"ERR wrong number of arguments for 'hset' command"};
    }
    std::vector<std::pair<std::string, std::string>> pairs;
    pairs.reserve((args.size() - 1) / 2);
    for (std::size_t i = 1; i < args.size(); i += 2) {
        pairs.emplace_back(args[i], args[i + 1]);
    }
    return reply_from(ks.hash_set_many(args[0], std::move(pairs)), integer);
}

Reply cmd_hget(Keyspace& ks, const Args& args) {
    return reply_from(ks.hash_get(args[0], args[1]), optional_bulk);
}

Reply cmd_hdel(Keyspace& ks, const Args& args) {
    return reply_from(ks.hash_del(args[0], tail(args, 1)), integer);
}

Reply cmd_hgetall(Keyspace& ks, const Args& args) {
    return reply_from(ks.hash_get_all(args[0]), [](HashValue hash) -> Reply {
        std::vector<std::pair<std::string, std::string>> sorted(hash.begin(), hash.end());
        std::sort(sorted.begin(), sorted.end());
        ArrayReply out;
        out.elements.reserve(sorted.size() * 2);
        for (auto& [field, value] : sorted) {
            out.elements.push_back(std::move(field));
            out.elements.push_back(std::move(value));
        }
        return out;
    });
}

Reply cmd_hscan(Keyspace& ks, const Args& args) {
    auto cursor = parse_cursor(args[1]);
    if (!cursor) {
        return error_reply(make_error_code(StoreErrc::invalid_cursor));
    }
    std::string pattern;
    std::int64_t count = 0;
    if (auto err = parse_scan_options(args, 2, pattern, count)) {
        return std::move(*err);
    }
    return reply_from(ks.hash_scan(args[0], *cursor, pattern, count), paged);
}

// ── List ─────────────────────────────────────────────────────────────────────

Reply cmd_lpush(Keyspace& ks, const Args& args) {
    return reply_from(ks.list_lpush(args[0], tail(args, 1)), integer);
}

Reply cmd_rpush(Keyspace& ks, const Args& args) {
    return reply_from(ks.list_rpush(args[0], tail(args, 1)), integer);
}

Reply cmd_lpop(Keyspace& ks, const Args& args) {
    return reply_from(ks.list_lpop(args[0]), optional_bulk);
}

Reply cmd_rpop(Keyspace& ks, const Args& args) {
    return reply_from(ks.list_rpop(args[0]), optional_bulk);
}

Reply cmd_lrange(Keyspace& ks, const Args& args) {
    auto start = parse_integer(args[1]);
    auto stop  = parse_integer(args[2]);
    if (!start || !stop) {
        return ErrorReply{kNotInteger};
    }
    return reply_from(ks.list_range(args[0], *start, *stop),
                      [](std::vector<std::string> v) -> Reply { return ArrayReply{std::move(v)}; });
}

// ── Set ──────────────────────────────────────────────────────────────────────

Reply cmd_sadd(Keyspace& ks, const Args& args) {
    return reply_from(ks.set_add(args[0], tail(args, 1)), integer);
}

Reply cmd_srem(Keyspace& ks, const Args& args) {
    return reply_from(ks.set_remove(args[0], tail(args, 1)), integer);
}

Reply cmd_smembers(Keyspace& ks, const Args& args) {
    return reply_from(ks.set_members(args[0]),
                      [](std::vector<std::string> v) -> Reply { return ArrayReply{std::move(v)}; });
}

Reply cmd_sismember(Keyspace& ks, const Args& args) {
    return reply_from(ks.set_is_member(args[0], args[1]),
                      [](bool present) -> Reply { return IntegerReply{present ? 1 : 0}; });
}

Reply cmd_sscan(Keyspace& ks, const Args& args) {
    auto cursor = parse_cursor(args[1]);
    if (!cursor) {
        return error_reply(make_error_code(StoreErrc::invalid_cursor));
    }
    std::string pattern;
    std::int64_t count = 0;
    if (auto err = parse_scan_options(args, 2, pattern, count)) {
        return std::move(*err);
    }
    return reply_from(ks.set_scan(args[0], *cursor, pattern, count), paged);
}

// ── Sorted set ───────────────────────────────────────────────────────────────

// Counts members added or whose score changed.
Reply cmd_zadd(Keyspace& ks, const Args& args) {
    if ((args.size() - 1) % 2 != 0) {
        return ErrorReply{"ERR wrong number of arguments for 'zadd' command"};
    }

    // Reject the whole command before touching the store if any score is bad.
    std::vector<ScoredMember> members;
    members.reserve((args.size() - 1) / 2);
    for (std::size_t i = 1; i < args.size(); i += 2) {
        auto score = parse_score(args[i]);
        if (!score) {
            return ErrorReply{kNotFloat};
        }
        members.push_back(ScoredMember{args[i + 1], *score});
    }
    return reply_from(ks.zadd_many(args[0], members), integer);
}

Reply cmd_zscore(Keyspace& ks, const Args& args) {
    return reply_from(ks.zscore(args[0], args[1]), [](std::optional<double> score) -> Reply {
        if (!score) {
            return NullBulkReply{};
        }
        return BulkStringReply{network::format_score(*score)};
    });
}

Reply cmd_zrange(Keyspace& ks, const Args& args) {
    auto start = parse_integer(args[1]);
    auto stop  = parse_integer(args[2]);
    if (!start || !stop) {
        return ErrorReply{kNotInteger};
    }

    if (args.size() == 4) {
        if (to_upper(args[3]) != "WITHSCORES") {
            return ErrorReply{kSyntaxError};
        }
        return reply_from(ks.zrange_with_scores(args[0], *start, *stop),
                          [](std::vector<ScoredMember> members) -> Reply {
                              ScoredArrayReply out;
                              out.pairs.reserve(members.size());
                              for (auto& m : members) {
                                  out.pairs.push_back(ScoreMemberReply{m.score, std::move(m.member)});
                              }
                              return out;
                          });
    }
    return reply_from(ks.zrange(args[0], *start, *stop),
                      [](std::vector<std::string> v) -> Reply { return ArrayReply{std::move(v)}; });
}

Reply cmd_zrem(Keyspace& ks, const Args& args) {
    return reply_from(ks.zrem(args[0], tail(args, 1)), integer);
}

// ── Command table ────────────────────────────────────────────────────────────

struct CommandSpec {
    Handler handler;
    std::size_t min_args;   // arguments after the command name
    std::size_t max_args;   // kUnbounded for variadic commands
    bool write;
};

constexpr std::size_t kUnbounded = static_cast<std::size_t>(-1);

const std::unordered_map<std::string, CommandSpec>& command_table() {
    static const std::unordered_map<std::string, CommandSpec> table{
        {"PING",      {cmd_ping,      0, 1,          false}},
        {"ECHO",      {cmd_echo,      1, 1,          false}},
        {"COMMAND",   {cmd_command,   0, kUnbounded, false}},
        {"SET",       {cmd_set,       2, kUnbounded, true}},
        {"GET",       {cmd_get,       1, 1,          false}},
        {"DEL",       {cmd_del,       1, kUnbounded, true}},
        {"EXISTS",    {cmd_exists,    1, kUnbounded, false}},
        {"KEYS",      {cmd_keys,      0, 1,          false}},
        {"SCAN",      {cmd_scan,      1, kUnbounded, false}},
        {"DBSIZE",    {cmd_dbsize,    0, 0,          false}},
        {"FLUSHDB",   {cmd_flushdb,   0, 0,          true}},
        {"HSET",      {cmd_hset,      3, kUnbounded, true}},
        {"HGET",      {cmd_hget,      2, 2,          false}},
        {"HDEL",      {cmd_hdel,      2, kUnbounded, true}},
        {"HGETALL",   {cmd_hgetall,   1, 1,          false}},
        {"HSCAN",     {cmd_hscan,     2, kUnbounded, false}},
        {"LPUSH",     {cmd_lpush,     2, kUnbounded, true}},
        {"RPUSH",     {cmd_rpush,     2, kUnbounded, true}},
        {"LPOP",      {cmd_lpop,      1, 1,          true}},
        {"RPOP",      {cmd_rpop,      1, 1,          true}},
        {"LRANGE",    {cmd_lrange,    3, 3,          false}},
        {"SADD",      {cmd_sadd,      2, kUnbounded, true}},
        {"SREM",      {cmd_srem,      2, kUnbounded, true}},
        {"SMEMBERS",  {cmd_smembers,  1, 1,          false}},
        {"SISMEMBER", {cmd_sismember, 2, 2,          false}},
        {"SSCAN",     {cmd_sscan,     2, kUnbounded, false}},
        {"ZADD",      {cmd_zadd,      3, kUnbounded, true}},
        {"ZSCORE",    {cmd_zscore,    2, 2,          false}},
        {"ZRANGE",    {cmd_zrange,    3, 4,          false}},
        {"ZREM",      {cmd_zrem,      2, kUnbounded, true}},
    };
    return table;
}

} // anonymous namespace

Dispatcher::Dispatcher(Keyspace& keyspace) : keyspace_(keyspace) {}

Reply Dispatcher::execute(std::string_view command, const std::vector<std::string>& args) {
    const auto& table = command_table();
    auto it = table.find(to_upper(command));
    if (it == table.end()) {
        spdlog::debug("Unknown command '{}'", command);
        return ErrorReply{fmt::format("ERR unknown command '{}'", command)};
    }

    const CommandSpec& spec = it->second;
    if (args.size() < spec.min_args || args.size() > spec.max_args) {
        return ErrorReply{
            fmt::format("ERR wrong number of arguments for '{}' command", to_lower(command))};
    }
    return spec.handler(keyspace_, args);
}

Reply Dispatcher::execute(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return ErrorReply{"ERR empty command"};
    }
    return execute(argv.front(), tail(argv, 1));
}

bool Dispatcher::is_write_command(std::string_view command) {
    const auto& table = command_table();
    auto it = table.find(to_upper(command));
    return it != table.end() && it->second.write;
}

} // namespace memkv
