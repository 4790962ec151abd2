#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace memkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger ("memkv").  Used by the server loop,
// the dispatcher and tests.  Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a logger for one subsystem.
//   component – short name embedded in every log line, e.g. "aof", "sweeper"
//   level     – initial log level
std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& component,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace memkv
