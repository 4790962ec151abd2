#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace memkv::persistence {

static constexpr const char* kAofFileName = "commands.aof";

// ── Command record ───────────────────────────────────────────────────────────
//
// One JSON object per line:
//
//   {"ts":1718000000000000000,"cmd":"SET","args":["k","v"]}
//
// `ts` is wall-clock nanoseconds since the Unix epoch.  `cmd` is args[0] as
// the client sent it and `args` holds the remaining arguments.  A string that
// is not valid UTF-8 is written as an array of byte values instead, e.g.
// [0,255,10], so every argument survives the round trip byte for byte.

struct AofRecord {
    uint64_t timestamp_ns = 0;       // wall-clock time the command was logged
    std::vector<std::string> args;   // args[0] is the command name
};

// Encodes `rec` as one log line, including the trailing '\n'.
// `rec.args` must not be empty.
[[nodiscard]] std::string serialise_record(const AofRecord& rec);

// Decodes one log line (without its '\n').  On failure returns std::nullopt
// and describes the problem in `error`.
[[nodiscard]] std::optional<AofRecord> parse_record(std::string_view line, std::string& error);

// ── Append-only command log ──────────────────────────────────────────────────
//
// Every record is handed to the kernel on append; fdatasync runs at most once
// per `fsync_interval` (on the first append after the interval elapsed, or
// on an explicit sync()) and always on close().  A crash can therefore lose
// up to one interval of commands, and may leave a torn last line behind.
//
// Thread-safe: sessions append concurrently under an internal mutex.

class Aof {
public:
    explicit Aof(std::filesystem::path path,
                 std::chrono::milliseconds fsync_interval = std::chrono::seconds{1});
    ~Aof();

    Aof(const Aof&) = delete;
    Aof& operator=(const Aof&) = delete;
    Aof(Aof&&) = delete;
    Aof& operator=(Aof&&) = delete;

    // Opens (or creates) the log and its parent directories.  If the file
    // ends in a torn line, a newline is appended so new records start clean.
    [[nodiscard]] std::error_code open();

    // Syncs outstanding records and closes the file.
    void close();

    // Appends one command.  Returns an error if the file is not open or the
    // write fails.
    [[nodiscard]] std::error_code append(const std::vector<std::string>& args);

    // fdatasync if anything was appended since the last sync.
    [[nodiscard]] std::error_code sync();

    // Empties the log; it stays open.
    [[nodiscard]] std::error_code truncate();

    // Reads every well-formed record of the log at `path`, in order.
    // Blank lines are ignored.  Malformed lines (including a torn last line)
    // are logged and skipped; `skipped`, when given, receives their count.
    // Only I/O failures are errors.
    [[nodiscard]] static std::error_code replay(const std::filesystem::path& path,
                                                std::vector<AofRecord>& records,
                                                std::size_t* skipped = nullptr);

    [[nodiscard]] bool is_open() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    [[nodiscard]] std::error_code open_locked();
    void close_locked();
    [[nodiscard]] std::error_code sync_locked();

    // Appends a newline if the file's last byte is not one.
    [[nodiscard]] std::error_code terminate_torn_line();

    std::filesystem::path path_;
    std::chrono::milliseconds fsync_interval_;

    mutable std::mutex mutex_;
    int fd_ = -1;
    bool dirty_ = false;
    std::chrono::steady_clock::time_point last_sync_{};
};

} // namespace memkv::persistence
