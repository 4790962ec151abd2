#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace memkv {

// Page size used when a scan is called with a non-positive count.
inline constexpr std::int64_t kDefaultScanCount = 10;

// One page of a cursor scan.  next_cursor == 0 means the scan is complete.
struct ScanPage {
    std::uint64_t next_cursor = 0;
    std::vector<std::string> elements;
};

// Returns the slice [cursor, cursor + count) of `sorted`, clamped to its
// length, and the cursor for the following call.
//
// Stateless: the cursor is an offset into a snapshot rebuilt on every call.
// If the collection is not modified between calls, following next_cursor
// visits every element exactly once.  Concurrent inserts or removals shift
// the offsets, so elements may then be skipped or repeated.
[[nodiscard]] ScanPage paginate(std::vector<std::string> sorted,
                                std::uint64_t cursor,
                                std::int64_t count);

} // namespace memkv
