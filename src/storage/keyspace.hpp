#pragma once

#include "common/clock.hpp"
#include "storage/cursor.hpp"
#include "storage/sorted_set.hpp"
#include "storage/store_error.hpp"
#include "storage/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace memkv {

// Thread-safe typed keyspace: key → Value (string, hash, list, set or sorted
// set) with optional per-key expiry.
//
// Concurrency model:
//   - Read operations (get_string, exists, keys, *_get, *_range, members,
//     scans, size) acquire a shared (read) lock.
//   - Write operations acquire an exclusive (write) lock.
//   Every public call holds its lock for the whole operation, so each call is
//   atomic with respect to every other call.
//
// Expiry:
//   - An expired entry is invisible to every operation (lazy expiry).  Reads
//     skip it; writes erase it first and then behave as if the key were
//     absent.
//   - cleanup_expired() removes expired entries proactively; size() counts
//     entries that have expired but were not removed yet.
//
// Kinds:
//   - Per-kind operations on a key holding another kind return
//     StoreErrc::wrong_type and change nothing.
//   - A container emptied by a removal is deleted from the keyspace.
class Keyspace {
public:
    // Uses the process-wide steady clock.
    Keyspace();

    // Uses `clock` for expiry decisions.  `clock` must outlive the keyspace.
    explicit Keyspace(const Clock& clock);

    // Not copyable – copies of a live store would silently race.
    Keyspace(const Keyspace&)            = delete;
    Keyspace& operator=(const Keyspace&) = delete;

    // ── Generic key operations ───────────────────────────────────────────────

    // Stores `value` as a string, replacing whatever `key` held.  A positive
    // `ttl` sets the expiry to now + ttl; otherwise the key never expires.
    void set_string(std::string key, std::string value,
                    std::chrono::milliseconds ttl = std::chrono::milliseconds::zero());

    // Returns the string stored at `key`.  std::nullopt when the key is
    // missing, expired, or holds another kind (this is not a type error).
    [[nodiscard]] std::optional<std::string> get_string(const std::string& key) const;

    // Removes each key that is physically present, expired or not.
    // Returns the number of keys removed.
    std::size_t del(const std::vector<std::string>& keys);

    // Counts the keys that are present and not expired.  A key named twice is
    // counted twice.
    [[nodiscard]] std::size_t exists(const std::vector<std::string>& keys) const;

    // All live keys matching the glob `pattern`, sorted.
    [[nodiscard]] std::vector<std::string> keys(std::string_view pattern) const;

    // Removes expired entries.  Works through the map in bounded batches,
    // releasing the lock between batches.  Returns the number removed.
    std::size_t cleanup_expired();

    // Raw number of entries, including expired ones not yet removed.
    [[nodiscard]] std::size_t size() const;

    // Removes every entry.
    void clear();

    // ── Hash ─────────────────────────────────────────────────────────────────

    // Sets `field` to `value`.  Returns true if the field is new.
    Result<bool> hash_set(const std::string& key, const std::string& field, std::string value);

    // Sets every (field, value) pair in one step; a later pair for the same
    // field wins.  Returns the number of fields that were new.  On a kind
    // mismatch nothing is written.
    Result<std::size_t> hash_set_many(const std::string& key,
                                      std::vector<std::pair<std::string, std::string>> pairs);

    [[nodiscard]] Result<std::optional<std::string>> hash_get(const std::string& key,
                                                              const std::string& field) const;

    // Returns the number of fields removed.
    Result<std::size_t> hash_del(const std::string& key, const std::vector<std::string>& fields);

    // Copy of the whole hash; empty when the key is missing.
    [[nodiscard]] Result<HashValue> hash_get_all(const std::string& key) const;

    // ── List ─────────────────────────────────────────────────────────────────

    // Pushes each value onto the head in argument order, so pushing a, b, c
    // yields [c, b, a].  Returns the new length.
    Result<std::size_t> list_lpush(const std::string& key, const std::vector<std::string>& values);

    // Appends values in argument order.  Returns the new length.
    Result<std::size_t> list_rpush(const std::string& key, const std::vector<std::string>& values);

    Result<std::optional<std::string>> list_lpop(const std::string& key);
    Result<std::optional<std::string>> list_rpop(const std::string& key);

    // Elements [start, stop] inclusive; negative indices count from the tail
    // and both bounds are clamped to the list.
    [[nodiscard]] Result<std::vector<std::string>> list_range(const std::string& key,
                                                              std::int64_t start,
                                                              std::int64_t stop) const;

    // ── Set ──────────────────────────────────────────────────────────────────

    // Returns the number of members that were not already present.
    Result<std::size_t> set_add(const std::string& key, const std::vector<std::string>& members);

    // Returns the number of members removed.
    Result<std::size_t> set_remove(const std::string& key, const std::vector<std::string>& members);

    // All members, sorted.
    [[nodiscard]] Result<std::vector<std::string>> set_members(const std::string& key) const;

    [[nodiscard]] Result<bool> set_is_member(const std::string& key, const std::string& member) const;

    // ── Sorted set ───────────────────────────────────────────────────────────

    // Returns true when the member is new or its score changed; false when it
    // already had exactly this score.
    Result<bool> zadd(const std::string& key, double score, const std::string& member);

    // Adds or rescores every member in one step.  Returns how many were new
    // or changed score.  On a kind mismatch nothing is written.
    Result<std::size_t> zadd_many(const std::string& key, const std::vector<ScoredMember>& members);

    [[nodiscard]] Result<std::optional<double>> zscore(const std::string& key,
                                                       const std::string& member) const;

    // Members ranked [start, stop] by (score, member), same index rules as
    // list_range().
    [[nodiscard]] Result<std::vector<std::string>> zrange(const std::string& key,
                                                          std::int64_t start,
                                                          std::int64_t stop) const;

    [[nodiscard]] Result<std::vector<ScoredMember>> zrange_with_scores(const std::string& key,
                                                                       std::int64_t start,
                                                                       std::int64_t stop) const;

    // Returns the number of members removed.
    Result<std::size_t> zrem(const std::string& key, const std::vector<std::string>& members);

    // ── Cursor scans ─────────────────────────────────────────────────────────
    //
    // Each call snapshots the matching keys/fields/members in sorted order and
    // returns the slice starting at `cursor`.  `count <= 0` means the default
    // page size.  A negative cursor is StoreErrc::invalid_cursor.

    [[nodiscard]] Result<ScanPage> scan(std::int64_t cursor, std::string_view pattern,
                                        std::int64_t count) const;

    // Pages over fields; each page lists field, value, field, value, …
    [[nodiscard]] Result<ScanPage> hash_scan(const std::string& key, std::int64_t cursor,
                                             std::string_view pattern, std::int64_t count) const;

    [[nodiscard]] Result<ScanPage> set_scan(const std::string& key, std::int64_t cursor,
                                            std::string_view pattern, std::int64_t count) const;

private:
    using Map = std::unordered_map<std::string, Value>;

    // Payload of kind T at `key` for a write.  Erases an expired entry first.
    // Returns nullptr if the key is absent and `create` is false; creates an
    // empty T if it is absent and `create` is true.
    // Caller must hold the exclusive lock.
    template <typename T>
    std::variant<T*, std::error_code> writable(const std::string& key, bool create);

    // Payload of kind T at `key` for a read; nullptr if absent or expired.
    // Caller must hold at least the shared lock.
    template <typename T>
    std::variant<const T*, std::error_code> readable(const std::string& key) const;

    // Deletes `key` if its container has become empty.  Exclusive lock held.
    void erase_if_empty(const std::string& key);

    const Clock* clock_;
    mutable std::shared_mutex mutex_;
    Map map_;
};

} // namespace memkv
