#pragma once

#include "network/reply.hpp"
#include "storage/keyspace.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace memkv {

// ── Dispatcher ───────────────────────────────────────────────────────────────
//
// Maps a command name to a keyspace operation: validates arity and numeric
// arguments, calls the store and turns the outcome into a Reply.  Command
// names are case-insensitive.
//
// Holds no state of its own besides the keyspace reference, so execute() is
// re-entrant and may be called from every session concurrently.  The same
// entry point replays the append-only log at startup.

class Dispatcher {
public:
    explicit Dispatcher(Keyspace& keyspace);

    // `args` are the arguments after the command name.
    [[nodiscard]] Reply execute(std::string_view command, const std::vector<std::string>& args);

    // Convenience overload: argv[0] is the command name.  An empty argv is
    // answered with an error reply.
    [[nodiscard]] Reply execute(const std::vector<std::string>& argv);

    // True for commands that modify the keyspace and are appended to the log.
    [[nodiscard]] static bool is_write_command(std::string_view command);

private:
    Keyspace& keyspace_;
};

} // namespace memkv
