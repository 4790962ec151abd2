#include "common/server_config.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace memkv {

namespace {

constexpr std::array<std::string_view, 6> kLogLevels{
    "trace", "debug", "info", "warn", "error", "critical"};

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    if (cfg.port == 0) {
        throw std::runtime_error("Port for --port must be in [1, 65535], got 0");
    }
    if (cfg.max_connections == 0) {
        throw std::runtime_error("--max-connections must be > 0");
    }
    if (cfg.cleanup_interval.count() == 0) {
        throw std::runtime_error("--cleanup-interval-ms must be > 0");
    }
    if (cfg.max_request_size == 0) {
        throw std::runtime_error("--max-request-size must be > 0");
    }
    if (cfg.appendonly && cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty when --appendonly is set");
    }

    bool known_level = false;
    for (auto level : kLogLevels) {
        known_level = known_level || level == cfg.log_level;
    }
    if (!known_level) {
        throw std::runtime_error(fmt::format(
            "--log-level must be one of trace|debug|info|warn|error|critical, got '{}'",
            cfg.log_level));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const ServerConfig defaults;
    desc.add_options()
        ("host",
            po::value<std::string>()->default_value(defaults.host),
            "Bind address for client connections")
        ("port",
            po::value<uint16_t>()->default_value(defaults.port),
            "Port for client (RESP) connections")
        ("max-connections",
            po::value<uint32_t>()->default_value(defaults.max_connections),
            "Maximum number of concurrent client connections")
        ("cleanup-interval-ms",
            po::value<uint32_t>()->default_value(
                static_cast<uint32_t>(defaults.cleanup_interval.count())),
            "Period of the background expiry sweep, in milliseconds")
        ("read-timeout-ms",
            po::value<uint32_t>()->default_value(
                static_cast<uint32_t>(defaults.read_timeout.count())),
            "Close a connection idle for this long, in milliseconds (0 disables)")
        ("write-timeout-ms",
            po::value<uint32_t>()->default_value(
                static_cast<uint32_t>(defaults.write_timeout.count())),
            "Close a connection whose reply write takes this long (0 disables)")
        ("max-request-size",
            po::value<uint64_t>()->default_value(defaults.max_request_size),
            "Largest bulk string accepted in a request, in bytes")
        ("appendonly",
            po::value<bool>()->default_value(defaults.appendonly)->implicit_value(true),
            "Log write commands to <data-dir>/commands.aof and replay it on start")
        ("data-dir",
            po::value<std::string>()->default_value(defaults.data_dir),
            "Directory for the append-only log")
        ("log-level",
            po::value<std::string>()->default_value(defaults.log_level),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, const char* const argv[]) {
    po::options_description shared("memkv-server options");
    add_options(shared);

    po::options_description cli_only("Generic options");
    cli_only.add_options()
        ("help,h",
            "Show this help message and exit")
        ("config,c",
            po::value<std::string>(),
            "Path to a config file (key = value per line)");

    po::options_description cli;
    cli.add(cli_only).add(shared);

    po::variables_map vm;
    try {
        // The first store() of an option wins, so the command line goes first
        // and the config file only fills in what it left unset.
        po::store(po::parse_command_line(argc, argv, cli), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << cli;
            throw std::runtime_error(oss.str());
        }

        if (vm.count("config")) {
            const auto& path = vm["config"].as<std::string>();
            std::ifstream file{path};
            if (!file) {
                throw std::runtime_error(fmt::format("Cannot open config file '{}'", path));
            }
            po::store(po::parse_config_file(file, shared), vm);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host             = vm["host"].as<std::string>();
    cfg.port             = vm["port"].as<uint16_t>();
    cfg.max_connections  = vm["max-connections"].as<uint32_t>();
    cfg.cleanup_interval = std::chrono::milliseconds{vm["cleanup-interval-ms"].as<uint32_t>()};
    cfg.read_timeout     = std::chrono::milliseconds{vm["read-timeout-ms"].as<uint32_t>()};
    cfg.write_timeout    = std::chrono::milliseconds{vm["write-timeout-ms"].as<uint32_t>()};
    cfg.max_request_size = vm["max-request-size"].as<uint64_t>();
    cfg.appendonly       = vm["appendonly"].as<bool>();
    cfg.data_dir         = vm["data-dir"].as<std::string>();
    cfg.log_level        = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace memkv
