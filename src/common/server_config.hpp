#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace memkv {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one memkv-server process.
// Populated by parse_config() from CLI arguments and an optional config file.

struct ServerConfig {
    std::string   host             = "0.0.0.0";   // Bind address for client connections
    uint16_t      port             = 6378;        // Client port
    uint32_t      max_connections  = 1000;        // Concurrent session limit
    std::chrono::milliseconds cleanup_interval{1000};  // Expiry sweep period
    std::chrono::milliseconds read_timeout{30000};     // Idle read deadline, 0 = none
    std::chrono::milliseconds write_timeout{30000};    // Reply write deadline, 0 = none
    uint64_t      max_request_size = 512ULL * 1024 * 1024;  // Max bulk length accepted
    bool          appendonly       = false;       // Enable the append-only log
    std::string   data_dir         = "./data";    // Directory holding commands.aof
    std::string   log_level        = "info";      // spdlog level string
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments (and the file named by --config, if any) into a
// ServerConfig.  Values given on the command line win over the config file.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the usage text.
//
// Config file format is Boost.Program_options INI: one "key = value" per
// line, keys named like the long options without the leading dashes.
//   port = 6400
//   appendonly = true

[[nodiscard]] ServerConfig parse_config(int argc, const char* const argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate an options_description with the options shared by the command line
// and the config file.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace memkv
