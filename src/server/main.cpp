#include "command/dispatcher.hpp"
#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "persistence/aof.hpp"
#include "persistence/aof_loader.hpp"
#include "storage/keyspace.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    memkv::ServerConfig cfg;
    try {
        cfg = memkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    memkv::init_default_logger(memkv::parse_log_level(cfg.log_level));

    spdlog::info("memkv-server starting – {}:{} max_connections={} appendonly={}",
                 cfg.host, cfg.port, cfg.max_connections, cfg.appendonly);

    memkv::Keyspace keyspace;

    // ── Append-only log: replay, then open for appending ─────────────────────
    std::unique_ptr<memkv::persistence::Aof> aof;
    if (cfg.appendonly) {
        namespace fs = std::filesystem;
        const fs::path aof_path = fs::path{cfg.data_dir} / memkv::persistence::kAofFileName;

        memkv::Dispatcher replay_dispatcher{keyspace};
        memkv::persistence::AofLoadStats stats;
        if (auto ec = memkv::persistence::load_aof(aof_path, replay_dispatcher, stats)) {
            spdlog::error("Failed to replay AOF at {}: {}", aof_path.string(), ec.message());
            return 1;
        }
        if (stats.rejected > 0) {
            spdlog::warn("AOF replay: {} command(s) were rejected", stats.rejected);
        }

        aof = std::make_unique<memkv::persistence::Aof>(aof_path);
        if (auto ec = aof->open()) {
            spdlog::error("Failed to open AOF at {}: {}", aof_path.string(), ec.message());
            return 1;
        }
    }

    // ── Serve ────────────────────────────────────────────────────────────────
    try {
        memkv::network::Server server{cfg, keyspace, aof.get()};
        server.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Server failed: {}", e.what());
        return 1;
    }

    if (aof) {
        aof->close();
    }
    spdlog::info("memkv-server stopped");
    return 0;
}
