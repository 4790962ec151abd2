#pragma once

#include "command/dispatcher.hpp"

#include <cstddef>
#include <filesystem>
#include <system_error>

namespace memkv::persistence {

struct AofLoadStats {
    std::size_t applied = 0;    // records executed successfully
    std::size_t rejected = 0;   // records whose execution returned an error reply
    std::size_t skipped = 0;    // malformed lines left out of the replay
};

// Rebuilds the keyspace by executing every record of the log at `path`
// through `dispatcher`.  A missing file is an empty log and malformed lines
// are skipped.  I/O errors from Aof::replay() are returned unchanged and
// nothing is executed.
[[nodiscard]] std::error_code load_aof(const std::filesystem::path& path,
                                       Dispatcher& dispatcher,
                                       AofLoadStats& stats);

} // namespace memkv::persistence
