#include "persistence/aof_loader.hpp"

#include "persistence/aof.hpp"

#include <spdlog/spdlog.h>

#include <variant>
#include <vector>

namespace memkv::persistence {

std::error_code load_aof(const std::filesystem::path& path, Dispatcher& dispatcher,
                         AofLoadStats& stats) {
    stats = {};

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) return ec;
        spdlog::info("No AOF at {}, starting empty", path.string());
        return {};
    }

    std::vector<AofRecord> records;
    ec = Aof::replay(path, records, &stats.skipped);
    if (ec) {
        return ec;
    }

    for (const auto& rec : records) {
        Reply reply = dispatcher.execute(rec.args);
        if (auto* err = std::get_if<ErrorReply>(&reply)) {
            ++stats.rejected;
            spdlog::warn("AOF replay: '{}' failed: {}",
                         rec.args.empty() ? std::string{} : rec.args.front(), err->message);
        } else {
            ++stats.applied;
        }
    }

    spdlog::info("AOF replay applied {} command(s) from {} ({} rejected, {} malformed)",
                 stats.applied, path.string(), stats.rejected, stats.skipped);
    return {};
}

} // namespace memkv::persistence
