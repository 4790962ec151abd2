#include "storage/keyspace.hpp"

#include "common/glob.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace memkv {

namespace {

// Buckets examined per lock acquisition in cleanup_expired().
constexpr std::size_t kSweepBucketsPerBatch = 256;

const SteadyClock& default_clock() {
    static const SteadyClock clock;
    return clock;
}

// Kind mismatch for an operation on payload type T against `value`.
template <typename T>
std::error_code wrong_type(const std::string& key, const Value& value) {
    spdlog::debug("WRONGTYPE: '{}' holds a {}, not a {}", key, to_string(value.kind()),
                  to_string(KindOf<T>::value));
    return make_error_code(StoreErrc::wrong_type);
}

// Sorted snapshot of the elements of `source` that match `pattern`.
template <typename Range, typename Project>
std::vector<std::string> matching_sorted(const Range& source, std::string_view pattern,
                                         Project project) {
    std::vector<std::string> out;
    for (const auto& element : source) {
        const std::string& name = project(element);
        if (glob_match(pattern, name)) {
            out.push_back(name);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // anonymous namespace

Keyspace::Keyspace() : Keyspace(default_clock()) {}

Keyspace::Keyspace(const Clock& clock) : clock_(&clock) {}

// ── Lookup helpers ───────────────────────────────────────────────────────────

template <typename T>
std::variant<T*, std::error_code> Keyspace::writable(const std::string& key, bool create) {
    auto it = map_.find(key);
    if (it != map_.end() && it->second.expired(clock_->now())) {
        map_.erase(it);
        it = map_.end();
    }

    if (it == map_.end()) {
        if (!create) {
            return static_cast<T*>(nullptr);
        }
        it = map_.emplace(key, Value{T{}, std::nullopt}).first;
    }

    T* payload = std::get_if<T>(&it->second.payload);
    if (payload == nullptr) {
        return wrong_type<T>(key, it->second);
    }
    return payload;
}

template <typename T>
std::variant<const T*, std::error_code> Keyspace::readable(const std::string& key) const {
    auto it = map_.find(key);
    if (it == map_.end() || it->second.expired(clock_->now())) {
        return static_cast<const T*>(nullptr);
    }

    const T* payload = std::get_if<T>(&it->second.payload);
    if (payload == nullptr) {
        return wrong_type<T>(key, it->second);
    }
    return payload;
}

void Keyspace::erase_if_empty(const std::string& key) {
    auto it = map_.find(key);
    if (it != map_.end() && it->second.empty_container()) {
        map_.erase(it);
    }
}

// ── Generic key operations ───────────────────────────────────────────────────

void Keyspace::set_string(std::string key, std::string value, std::chrono::milliseconds ttl) {
    std::unique_lock lock(mutex_);
    Value v{std::move(value), std::nullopt};
    if (ttl > std::chrono::milliseconds::zero()) {
        v.expiry = clock_->deadline_after(ttl);
    }
    map_.insert_or_assign(std::move(key), std::move(v));
}

std::optional<std::string> Keyspace::get_string(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto found = readable<std::string>(key);
    if (std::holds_alternative<std::error_code>(found)) {
        return std::nullopt; // wrong kind reads as "not found"
    }
    const std::string* s = std::get<const std::string*>(found);
    if (s == nullptr) {
        return std::nullopt;
    }
    return *s;
}

std::size_t Keyspace::del(const std::vector<std::string>& keys) {
    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    for (const auto& key : keys) {
        removed += map_.erase(key);
    }
    return removed;
}

std::size_t Keyspace::exists(const std::vector<std::string>& keys) const {
    std::shared_lock lock(mutex_);
    const auto now = clock_->now();
    std::size_t count = 0;
    for (const auto& key : keys) {
        auto it = map_.find(key);
        if (it != map_.end() && !it->second.expired(now)) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> Keyspace::keys(std::string_view pattern) const {
    std::shared_lock lock(mutex_);
    const auto now = clock_->now();
    std::vector<std::string> result;
    for (const auto& [k, v] : map_) {
        if (!v.expired(now) && glob_match(pattern, k)) {
            result.push_back(k);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t Keyspace::cleanup_expired() {
    std::size_t removed = 0;
    std::size_t bucket = 0;
    std::size_t seen_bucket_count = 0;

    for (;;) {
        std::unique_lock lock(mutex_);
        const std::size_t bucket_count = map_.bucket_count();
        // A rehash between batches moves entries across buckets; start over
        // so none are missed.  Rehashing only grows the table, so this ends.
        if (bucket_count != seen_bucket_count) {
            seen_bucket_count = bucket_count;
            bucket = 0;
        }
        if (bucket >= bucket_count) {
            break;
        }

        const auto now = clock_->now();
        const std::size_t last = std::min(bucket_count, bucket + kSweepBucketsPerBatch);
        std::vector<std::string> expired;
        for (; bucket < last; ++bucket) {
            for (auto it = map_.cbegin(bucket); it != map_.cend(bucket); ++it) {
                if (it->second.expired(now)) {
                    expired.push_back(it->first);
                }
            }
        }
        for (const auto& key : expired) {
            map_.erase(key);
        }
        removed += expired.size();
    }

    return removed;
}

std::size_t Keyspace::size() const {
    std::shared_lock lock(mutex_);
    return map_.size();
}

void Keyspace::clear() {
    std::unique_lock lock(mutex_);
    map_.clear();
}

// ── Hash ─────────────────────────────────────────────────────────────────────

Result<bool> Keyspace::hash_set(const std::string& key, const std::string& field,
                                std::string value) {
    std::vector<std::pair<std::string, std::string>> pairs;
    pairs.emplace_back(field, std::move(value));
    auto r = hash_set_many(key, std::move(pairs));
    if (auto* ec = std::get_if<std::error_code>(&r)) {
        return *ec;
    }
    return std::get<std::size_t>(r) == 1;
}

Result<std::size_t> Keyspace::hash_set_many(const std::string& key,
                                            std::vector<std::pair<std::string, std::string>> pairs) {
    std::unique_lock lock(mutex_);
    auto found = writable<HashValue>(key, true);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    HashValue& hash = *std::get<HashValue*>(found);
    std::size_t added = 0;
    for (auto& [field, value] : pairs) {
        if (hash.insert_or_assign(std::move(field), std::move(value)).second) {
            ++added;
        }
    }
    erase_if_empty(key);
    return added;
}

Result<std::optional<std::string>> Keyspace::hash_get(const std::string& key,
                                                      const std::string& field) const {
    std::shared_lock lock(mutex_);
    auto found = readable<HashValue>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    const HashValue* hash = std::get<const HashValue*>(found);
    if (hash == nullptr) {
        return std::optional<std::string>{};
    }
    auto it = hash->find(field);
    if (it == hash->end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

Result<std::size_t> Keyspace::hash_del(const std::string& key,
                                       const std::vector<std::string>& fields) {
    std::unique_lock lock(mutex_);
    auto found = writable<HashValue>(key, false);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    HashValue* hash = std::get<HashValue*>(found);
    if (hash == nullptr) {
        return std::size_t{0};
    }
    std::size_t removed = 0;
    for (const auto& f : fields) {
        removed += hash->erase(f);
    }
    erase_if_empty(key);
    return removed;
}

Result<HashValue> Keyspace::hash_get_all(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto found = readable<HashValue>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    const HashValue* hash = std::get<const HashValue*>(found);
    if (hash == nullptr) {
        return HashValue{};
    }
    return *hash; // copy: callers never see the live container
}

// ── List ─────────────────────────────────────────────────────────────────────

Result<std::size_t> Keyspace::list_lpush(const std::string& key,
                                         const std::vector<std::string>& values) {
    std::unique_lock lock(mutex_);
    auto found = writable<ListValue>(key, true);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    ListValue& list = *std::get<ListValue*>(found);
    for (const auto& v : values) {
        list.push_front(v);
    }
    const std::size_t length = list.size();
    erase_if_empty(key); // LPUSH with no values must not leave an empty list behind
    return length;
}

Result<std::size_t> Keyspace::list_rpush(const std::string& key,
                                         const std::vector<std::string>& values) {
    std::unique_lock lock(mutex_);
    auto found = writable<ListValue>(key, true);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    ListValue& list = *std::get<ListValue*>(found);
    list.insert(list.end(), values.begin(), values.end());
    const std::size_t length = list.size();
    erase_if_empty(key);
    return length;
}

Result<std::optional<std::string>> Keyspace::list_lpop(const std::string& key) {
    std::unique_lock lock(mutex_);
    auto found = writable<ListValue>(key, false);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    ListValue* list = std::get<ListValue*>(found);
    if (list == nullptr || list->empty()) {
        return std::optional<std::string>{};
    }
    std::string head = std::move(list->front());
    list->pop_front();
    erase_if_empty(key);
    return std::optional<std::string>{std::move(head)};
}

Result<std::optional<std::string>> Keyspace::list_rpop(const std::string& key) {
    std::unique_lock lock(mutex_);
    auto found = writable<ListValue>(key, false);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    ListValue* list = std::get<ListValue*>(found);
    if (list == nullptr || list->empty()) {
        return std::optional<std::string>{};
    }
    std::string tail = std::move(list->back());
    list->pop_back();
    erase_if_empty(key);
    return std::optional<std::string>{std::move(tail)};
}

Result<std::vector<std::string>> Keyspace::list_range(const std::string& key,
                                                      std::int64_t start,
                                                      std::int64_t stop) const {
    std::shared_lock lock(mutex_);
    auto found = readable<ListValue>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    const ListValue* list = std::get<const ListValue*>(found);
    std::vector<std::string> out;
    std::size_t first = 0;
    std::size_t last = 0;
    if (list != nullptr && resolve_range(start, stop, list->size(), first, last)) {
        out.assign(list->begin() + static_cast<std::ptrdiff_t>(first),
                   list->begin() + static_cast<std::ptrdiff_t>(last));
    }
    return out;
}

// ── Set ──────────────────────────────────────────────────────────────────────

Result<std::size_t> Keyspace::set_add(const std::string& key,
                                      const std::vector<std::string>& members) {
    std::unique_lock lock(mutex_);
    auto found = writable<SetValue>(key, true);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    SetValue& set = *std::get<SetValue*>(found);
    std::size_t added = 0;
    for (const auto& m : members) {
        if (set.insert(m).second) {
            ++added;
        }
    }
    erase_if_empty(key);
    return added;
}

Result<std::size_t> Keyspace::set_remove(const std::string& key,
                                         const std::vector<std::string>& members) {
    std::unique_lock lock(mutex_);
    auto found = writable<SetValue>(key, false);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    SetValue* set = std::get<SetValue*>(found);
    if (set == nullptr) {
        return std::size_t{0};
    }
    std::size_t removed = 0;
    for (const auto& m : members) {
        removed += set->erase(m);
    }
    erase_if_empty(key);
    return removed;
}

Result<std::vector<std::string>> Keyspace::set_members(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto found = readable<SetValue>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    const SetValue* set = std::get<const SetValue*>(found);
    std::vector<std::string> out;
    if (set != nullptr) {
        out.assign(set->begin(), set->end());
        std::sort(out.begin(), out.end());
    }
    return out;
}

Result<bool> Keyspace::set_is_member(const std::string& key, const std::string& member) const {
    std::shared_lock lock(mutex_);
    auto found = readable<SetValue>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    const SetValue* set = std::get<const SetValue*>(found);
    const bool present = set != nullptr && set->contains(member);
    return present;
}

// ── Sorted set ───────────────────────────────────────────────────────────────

Result<bool> Keyspace::zadd(const std::string& key, double score, const std::string& member) {
    auto r = zadd_many(key, {ScoredMember{member, score}});
    if (auto* ec = std::get_if<std::error_code>(&r)) {
        return *ec;
    }
    return std::get<std::size_t>(r) == 1;
}

Result<std::size_t> Keyspace::zadd_many(const std::string& key,
                                        const std::vector<ScoredMember>& members) {
    std::unique_lock lock(mutex_);
    auto found = writable<SortedSet>(key, true);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    SortedSet& zset = *std::get<SortedSet*>(found);
    std::size_t changed = 0;
    for (const auto& m : members) {
        if (zset.add(m.member, m.score)) {
            ++changed;
        }
    }
    erase_if_empty(key);
    return changed;
}

Result<std::optional<double>> Keyspace::zscore(const std::string& key,
                                               const std::string& member) const {
    std::shared_lock lock(mutex_);
    auto found = readable<SortedSet>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    const SortedSet* zset = std::get<const SortedSet*>(found);
    if (zset == nullptr) {
        return std::optional<double>{};
    }
    return zset->score(member);
}

Result<std::vector<std::string>> Keyspace::zrange(const std::string& key,
                                                  std::int64_t start,
                                                  std::int64_t stop) const {
    std::shared_lock lock(mutex_);
    auto found = readable<SortedSet>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    const SortedSet* zset = std::get<const SortedSet*>(found);
    if (zset == nullptr) {
        return std::vector<std::string>{};
    }
    return zset->range(start, stop);
}

Result<std::vector<ScoredMember>> Keyspace::zrange_with_scores(const std::string& key,
                                                               std::int64_t start,
                                                               std::int64_t stop) const {
    std::shared_lock lock(mutex_);
    auto found = readable<SortedSet>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    const SortedSet* zset = std::get<const SortedSet*>(found);
    if (zset == nullptr) {
        return std::vector<ScoredMember>{};
    }
    return zset->range_with_scores(start, stop);
}

Result<std::size_t> Keyspace::zrem(const std::string& key,
                                   const std::vector<std::string>& members) {
    std::unique_lock lock(mutex_);
    auto found = writable<SortedSet>(key, false);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    SortedSet* zset = std::get<SortedSet*>(found);
    if (zset == nullptr) {
        return std::size_t{0};
    }
    std::size_t removed = 0;
    for (const auto& m : members) {
        if (zset->remove(m)) {
            ++removed;
        }
    }
    erase_if_empty(key);
    return removed;
}

// ── Cursor scans ─────────────────────────────────────────────────────────────

Result<ScanPage> Keyspace::scan(std::int64_t cursor, std::string_view pattern,
                                std::int64_t count) const {
    if (cursor < 0) {
        return make_error_code(StoreErrc::invalid_cursor);
    }

    std::vector<std::string> matching;
    {
        std::shared_lock lock(mutex_);
        const auto now = clock_->now();
        for (const auto& [k, v] : map_) {
            if (!v.expired(now) && glob_match(pattern, k)) {
                matching.push_back(k);
            }
        }
    }
    std::sort(matching.begin(), matching.end());
    return paginate(std::move(matching), static_cast<std::uint64_t>(cursor), count);
}

Result<ScanPage> Keyspace::hash_scan(const std::string& key, std::int64_t cursor,
                                     std::string_view pattern, std::int64_t count) const {
    std::shared_lock lock(mutex_);
    auto found = readable<HashValue>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    if (cursor < 0) {
        return make_error_code(StoreErrc::invalid_cursor);
    }
    const HashValue* hash = std::get<const HashValue*>(found);
    if (hash == nullptr) {
        return ScanPage{};
    }

    auto fields = matching_sorted(*hash, pattern,
                                  [](const auto& kv) -> const std::string& { return kv.first; });
    ScanPage page = paginate(std::move(fields), static_cast<std::uint64_t>(cursor), count);

    std::vector<std::string> pairs;
    pairs.reserve(page.elements.size() * 2);
    for (auto& field : page.elements) {
        const std::string& value = hash->at(field);
        pairs.push_back(std::move(field));
        pairs.push_back(value);
    }
    page.elements = std::move(pairs);
    return page;
}

Result<ScanPage> Keyspace::set_scan(const std::string& key, std::int64_t cursor,
                                    std::string_view pattern, std::int64_t count) const {
    std::shared_lock lock(mutex_);
    auto found = readable<SetValue>(key);
    if (auto* ec = std::get_if<std::error_code>(&found)) {
        return *ec;
    }
    if (cursor < 0) {
        return make_error_code(StoreErrc::invalid_cursor);
    }
    const SetValue* set = std::get<const SetValue*>(found);
    if (set == nullptr) {
        return ScanPage{};
    }

    auto members = matching_sorted(*set, pattern,
                                   [](const std::string& m) -> const std::string& { return m; });
    return paginate(std::move(members), static_cast<std::uint64_t>(cursor), count);
}

} // namespace memkv
