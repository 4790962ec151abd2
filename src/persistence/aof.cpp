#include "persistence/aof.hpp"

#include <cerrno>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace memkv::persistence {

namespace {

using json = nlohmann::ordered_json;

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code make_error(std::errc e) {
    return std::make_error_code(e);
}

std::error_code write_all(int fd, std::string_view data) {
    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        auto n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code read_all(int fd, std::string& data) {
    char buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        if (n == 0) break;
        data.append(buf, static_cast<std::size_t>(n));
    }
    return {};
}

uint64_t wall_clock_ns() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// ── Argument encoding ────────────────────────────────────────────────────────

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
bool valid_utf8(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (s.size() - i <= extra) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        static constexpr uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

// A JSON string for UTF-8 text, otherwise an array of byte values.
json encode_arg(const std::string& arg) {
    if (valid_utf8(arg)) {
        return arg;
    }
    json bytes = json::array();
    for (char c : arg) {
        bytes.push_back(static_cast<unsigned char>(c));
    }
    return bytes;
}

bool decode_arg(const json& j, std::string& out) {
    if (j.is_string()) {
        out = j.get<std::string>();
        return true;
    }
    if (!j.is_array()) {
        return false;
    }
    out.clear();
    out.reserve(j.size());
    for (const auto& b : j) {
        if (!b.is_number_unsigned() || b.get<uint64_t>() > 0xFF) {
            return false;
        }
        out.push_back(static_cast<char>(b.get<uint64_t>()));
    }
    return true;
}

} // anonymous namespace

// ── Serialisation ────────────────────────────────────────────────────────────

std::string serialise_record(const AofRecord& rec) {
    json args = json::array();
    for (std::size_t i = 1; i < rec.args.size(); ++i) {
        args.push_back(encode_arg(rec.args[i]));
    }

    json line;
    line["ts"] = rec.timestamp_ns;
    line["cmd"] = encode_arg(rec.args.front());
    line["args"] = std::move(args);

    std::string out = line.dump();
    out.push_back('\n');
    return out;
}

std::optional<AofRecord> parse_record(std::string_view line, std::string& error) {
    json j;
    try {
        j = json::parse(line.begin(), line.end());
    } catch (const json::exception& e) {
        error = e.what();
        return std::nullopt;
    }

    if (!j.is_object()) {
        error = "record is not a JSON object";
        return std::nullopt;
    }
    auto ts = j.find("ts");
    auto cmd = j.find("cmd");
    auto args = j.find("args");
    if (ts == j.end() || !ts->is_number_unsigned()) {
        error = "missing or invalid \"ts\"";
        return std::nullopt;
    }
    if (args == j.end() || !args->is_array()) {
        error = "missing or invalid \"args\"";
        return std::nullopt;
    }

    AofRecord rec;
    rec.timestamp_ns = ts->get<uint64_t>();
    rec.args.resize(args->size() + 1);
    if (cmd == j.end() || !decode_arg(*cmd, rec.args[0]) || rec.args[0].empty()) {
        error = "missing or invalid \"cmd\"";
        return std::nullopt;
    }
    for (std::size_t i = 0; i < args->size(); ++i) {
        if (!decode_arg((*args)[i], rec.args[i + 1])) {
            error = "argument " + std::to_string(i) + " is neither a string nor a byte array";
            return std::nullopt;
        }
    }
    return rec;
}

// ── Aof implementation ───────────────────────────────────────────────────────

Aof::Aof(std::filesystem::path path, std::chrono::milliseconds fsync_interval)
    : path_(std::move(path)), fsync_interval_(fsync_interval) {}

Aof::~Aof() {
    close();
}

std::error_code Aof::open() {
    std::lock_guard lock(mutex_);
    return open_locked();
}

std::error_code Aof::open_locked() {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) return ec;
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND, 0644);
    if (fd_ < 0) {
        return make_errno_error();
    }

    if (auto torn_ec = terminate_torn_line()) {
        close_locked();
        return torn_ec;
    }

    last_sync_ = std::chrono::steady_clock::now();
    spdlog::info("AOF opened at {}", path_.string());
    return {};
}

std::error_code Aof::terminate_torn_line() {
    const off_t size = ::lseek(fd_, 0, SEEK_END);
    if (size < 0) {
        return make_errno_error();
    }
    if (size == 0) {
        return {};
    }

    char last = 0;
    if (::pread(fd_, &last, 1, size - 1) != 1) {
        return make_errno_error();
    }
    if (last == '\n') {
        return {};
    }

    spdlog::warn("AOF {} does not end in a newline; terminating the last record",
                 path_.string());
    auto ec = write_all(fd_, "\n");
    if (!ec) {
        dirty_ = true;
    }
    return ec;
}

void Aof::close() {
    std::lock_guard lock(mutex_);
    close_locked();
}

void Aof::close_locked() {
    if (fd_ == -1) {
        return;
    }
    if (auto ec = sync_locked()) {
        spdlog::error("AOF: sync on close failed: {}", ec.message());
    }
    ::close(fd_);
    fd_ = -1;
}

std::error_code Aof::append(const std::vector<std::string>& args) {
    if (args.empty()) return make_error(std::errc::invalid_argument);

    std::lock_guard lock(mutex_);
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    if (auto ec = write_all(fd_, serialise_record(AofRecord{wall_clock_ns(), args}))) {
        return ec;
    }
    dirty_ = true;

    if (std::chrono::steady_clock::now() - last_sync_ >= fsync_interval_) {
        return sync_locked();
    }
    return {};
}

std::error_code Aof::sync() {
    std::lock_guard lock(mutex_);
    return sync_locked();
}

std::error_code Aof::sync_locked() {
    if (fd_ == -1 || !dirty_) {
        return {};
    }
    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    dirty_ = false;
    last_sync_ = std::chrono::steady_clock::now();
    return {};
}

std::error_code Aof::truncate() {
    std::lock_guard lock(mutex_);
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    if (::ftruncate(fd_, 0) < 0 || ::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    dirty_ = false;
    last_sync_ = std::chrono::steady_clock::now();
    spdlog::info("AOF truncated");
    return {};
}

bool Aof::is_open() const {
    std::lock_guard lock(mutex_);
    return fd_ != -1;
}

std::error_code Aof::replay(const std::filesystem::path& path, std::vector<AofRecord>& records,
                            std::size_t* skipped) {
    records.clear();
    if (skipped != nullptr) {
        *skipped = 0;
    }

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return make_errno_error();
    }
    std::string data;
    auto read_ec = read_all(fd, data);
    ::close(fd);
    if (read_ec) return read_ec;

    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos < data.size()) {
        std::size_t end = data.find('\n', pos);
        if (end == std::string::npos) {
            end = data.size();
        }
        std::string_view line(data.data() + pos, end - pos);
        pos = end + 1;
        ++line_no;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }

        std::string error;
        if (auto rec = parse_record(line, error)) {
            records.push_back(std::move(*rec));
        } else {
            spdlog::warn("AOF {}: skipping malformed line {}: {}", path.string(), line_no, error);
            if (skipped != nullptr) {
                ++*skipped;
            }
        }
    }

    return {};
}

} // namespace memkv::persistence
