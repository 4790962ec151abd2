#include "storage/sorted_set.hpp"

#include <iterator>

namespace memkv {

bool resolve_range(std::int64_t start, std::int64_t stop, std::size_t length,
                   std::size_t& first, std::size_t& last) noexcept {
    if (length == 0) {
        return false;
    }
    const auto len = static_cast<std::int64_t>(length);

    if (start < 0) start += len;
    if (stop < 0)  stop += len;
    if (start < 0) start = 0;
    if (stop >= len) stop = len - 1;

    if (start > stop || start >= len) {
        return false;
    }

    first = static_cast<std::size_t>(start);
    last  = static_cast<std::size_t>(stop) + 1;
    return true;
}

bool SortedSet::add(const std::string& member, double score) {
    auto it = index_.find(member);
    if (it != index_.end()) {
        if (it->second == score) {
            return false;
        }
        tree_.erase(ScoredMember{member, it->second});
        it->second = score;
        tree_.insert(ScoredMember{member, score});
        return true;
    }

    index_.emplace(member, score);
    tree_.insert(ScoredMember{member, score});
    return true;
}

bool SortedSet::remove(const std::string& member) {
    auto it = index_.find(member);
    if (it == index_.end()) {
        return false;
    }
    tree_.erase(ScoredMember{member, it->second});
    index_.erase(it);
    return true;
}

std::optional<double> SortedSet::score(std::string_view member) const {
    auto it = index_.find(std::string(member));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SortedSet::resolve(std::int64_t start, std::int64_t stop,
                        Tree::const_iterator& first, std::size_t& count) const {
    std::size_t lo = 0;
    std::size_t hi = 0;
    if (!resolve_range(start, stop, tree_.size(), lo, hi)) {
        return false;
    }
    first = std::next(tree_.begin(), static_cast<std::ptrdiff_t>(lo));
    count = hi - lo;
    return true;
}

std::vector<std::string> SortedSet::range(std::int64_t start, std::int64_t stop) const {
    std::vector<std::string> out;
    Tree::const_iterator it;
    std::size_t count = 0;
    if (!resolve(start, stop, it, count)) {
        return out;
    }
    out.reserve(count);
    for (; count > 0; --count, ++it) {
        out.push_back(it->member);
    }
    return out;
}

std::vector<ScoredMember> SortedSet::range_with_scores(std::int64_t start,
                                                       std::int64_t stop) const {
    std::vector<ScoredMember> out;
    Tree::const_iterator it;
    std::size_t count = 0;
    if (!resolve(start, stop, it, count)) {
        return out;
    }
    out.reserve(count);
    for (; count > 0; --count, ++it) {
        out.push_back(*it);
    }
    return out;
}

bool SortedSet::consistent() const {
    if (tree_.size() != index_.size()) {
        return false;
    }
    for (const auto& entry : tree_) {
        auto it = index_.find(entry.member);
        if (it == index_.end() || it->second != entry.score) {
            return false;
        }
    }
    return true;
}

} // namespace memkv
