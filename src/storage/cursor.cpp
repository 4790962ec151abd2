#include "storage/cursor.hpp"

#include <iterator>
#include <utility>

namespace memkv {

ScanPage paginate(std::vector<std::string> sorted, std::uint64_t cursor, std::int64_t count) {
    if (count <= 0) {
        count = kDefaultScanCount;
    }

    ScanPage page;
    const std::uint64_t total = sorted.size();
    if (cursor >= total) {
        return page; // past the end: empty, complete
    }

    std::uint64_t end = cursor + static_cast<std::uint64_t>(count);
    if (end > total || end < cursor) {
        end = total;
    }

    page.elements.assign(
        std::make_move_iterator(sorted.begin() + static_cast<std::ptrdiff_t>(cursor)),
        std::make_move_iterator(sorted.begin() + static_cast<std::ptrdiff_t>(end)));
    page.next_cursor = end < total ? end : 0;
    return page;
}

} // namespace memkv
