#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memkv {

struct ScoredMember {
    std::string member;
    double score = 0.0;
};

// Orders by score ascending, then member ascending (byte-wise).
struct ScoreMemberLess {
    bool operator()(const ScoredMember& a, const ScoredMember& b) const noexcept {
        if (a.score != b.score) {
            return a.score < b.score;
        }
        return a.member < b.member;
    }
};

// ── SortedSet ────────────────────────────────────────────────────────────────
//
// Ordered (score, member) tree plus a member → score index.  Both structures
// are always updated together, so the index holds exactly the members of the
// tree with the same scores.
//
// Not thread-safe.  A SortedSet lives inside one keyspace entry and is only
// touched while the keyspace lock is held.

class SortedSet {
public:
    // Adds `member` with `score`.
    // Returns true if the member is new or its score changed (the old entry
    // is moved to its new position), false if it already had this score.
    bool add(const std::string& member, double score);

    // Removes `member`.  Returns false if it was not present.
    bool remove(const std::string& member);

    [[nodiscard]] std::optional<double> score(std::string_view member) const;

    // Members ranked [start, stop], inclusive, with negative indices counted
    // from the end (-1 is the highest-ranked member).
    [[nodiscard]] std::vector<std::string> range(std::int64_t start, std::int64_t stop) const;

    // Same as range() but keeps the scores.
    [[nodiscard]] std::vector<ScoredMember> range_with_scores(std::int64_t start,
                                                              std::int64_t stop) const;

    [[nodiscard]] std::size_t size() const noexcept { return index_.size(); }
    [[nodiscard]] bool empty() const noexcept { return index_.empty(); }

    // True when tree and index describe the same (member, score) pairs.
    [[nodiscard]] bool consistent() const;

private:
    using Tree = std::set<ScoredMember, ScoreMemberLess>;

    // Resolves [start, stop] into tree iterators; returns false for an empty range.
    bool resolve(std::int64_t start, std::int64_t stop,
                 Tree::const_iterator& first, std::size_t& count) const;

    Tree tree_;
    std::unordered_map<std::string, double> index_;
};

// Translates a Python-style inclusive [start, stop] range over a sequence of
// `length` elements into a half-open [first, last) range of positions.
// Returns false when the resolved range is empty.
// Shared by list and sorted-set range queries.
[[nodiscard]] bool resolve_range(std::int64_t start, std::int64_t stop, std::size_t length,
                                 std::size_t& first, std::size_t& last) noexcept;

} // namespace memkv
