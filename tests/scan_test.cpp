#include "storage/cursor.hpp"
#include "storage/keyspace.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace memkv {

namespace {

std::vector<std::string> numbered(const std::string& prefix, int n) {
    std::vector<std::string> out;
    for (int i = 0; i < n; ++i) {
        out.push_back(prefix + std::to_string(i));
    }
    std::sort(out.begin(), out.end());
    return out;
}

template <typename T>
T ok(Result<T> r) {
    return std::get<T>(std::move(r));
}

} // namespace

// ── paginate() ───────────────────────────────────────────────────────────────

TEST(PaginateTest, FirstPageAndContinuationCursor) {
    auto page = paginate({"a", "b", "c", "d", "e"}, 0, 2);
    EXPECT_EQ(page.elements, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(page.next_cursor, 2u);
}

TEST(PaginateTest, LastPageReturnsZeroCursor) {
    auto page = paginate({"a", "b", "c", "d", "e"}, 4, 2);
    EXPECT_EQ(page.elements, (std::vector<std::string>{"e"}));
    EXPECT_EQ(page.next_cursor, 0u);
}

TEST(PaginateTest, ExactFitEndsScan) {
    auto page = paginate({"a", "b"}, 0, 2);
    EXPECT_EQ(page.elements.size(), 2u);
    EXPECT_EQ(page.next_cursor, 0u);
}

TEST(PaginateTest, CursorPastEndIsEmptyAndComplete) {
    auto page = paginate({"a", "b"}, 7, 10);
    EXPECT_TRUE(page.elements.empty());
    EXPECT_EQ(page.next_cursor, 0u);
}

TEST(PaginateTest, NonPositiveCountUsesDefault) {
    auto page = paginate(numbered("k", 25), 0, 0);
    EXPECT_EQ(page.elements.size(), static_cast<std::size_t>(kDefaultScanCount));
    EXPECT_EQ(page.next_cursor, static_cast<std::uint64_t>(kDefaultScanCount));

    page = paginate(numbered("k", 25), 0, -5);
    EXPECT_EQ(page.elements.size(), static_cast<std::size_t>(kDefaultScanCount));
}

TEST(PaginateTest, HugeCountDoesNotOverflow) {
    auto page = paginate({"a", "b", "c"}, 1, INT64_MAX);
    EXPECT_EQ(page.elements, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(page.next_cursor, 0u);
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class ScanTest : public ::testing::Test {
protected:
    MockClock clock_;
    Keyspace ks_{clock_};
};

// ── SCAN ─────────────────────────────────────────────────────────────────────

TEST_F(ScanTest, FullTraversalVisitsEveryKeyOnce) {
    for (int i = 0; i < 57; ++i) {
        ks_.set_string("key:" + std::to_string(i), "v");
    }

    std::vector<std::string> seen;
    std::uint64_t cursor = 0;
    int calls = 0;
    do {
        auto page = ok(ks_.scan(static_cast<std::int64_t>(cursor), "*", 7));
        seen.insert(seen.end(), page.elements.begin(), page.elements.end());
        cursor = page.next_cursor;
        ASSERT_LT(++calls, 100);
    } while (cursor != 0);

    EXPECT_EQ(seen, numbered("key:", 57));
}

TEST_F(ScanTest, MatchFiltersBeforePaging) {
    ks_.set_string("user:1", "v");
    ks_.set_string("user:2", "v");
    ks_.set_string("order:1", "v");
    ks_.set_string("user:3", "v");

    auto page = ok(ks_.scan(0, "user:*", 2));
    EXPECT_EQ(page.elements, (std::vector<std::string>{"user:1", "user:2"}));
    EXPECT_EQ(page.next_cursor, 2u);

    page = ok(ks_.scan(2, "user:*", 2));
    EXPECT_EQ(page.elements, (std::vector<std::string>{"user:3"}));
    EXPECT_EQ(page.next_cursor, 0u);
}

TEST_F(ScanTest, SkipsExpiredKeys) {
    ks_.set_string("live", "v");
    ks_.set_string("dead", "v", std::chrono::milliseconds{5});
    clock_.advance(std::chrono::milliseconds{10});

    auto page = ok(ks_.scan(0, "*", 10));
    EXPECT_EQ(page.elements, (std::vector<std::string>{"live"}));
}

TEST_F(ScanTest, NegativeCursorIsRejected) {
    auto r = ks_.scan(-1, "*", 10);
    ASSERT_TRUE(is_error(r));
    EXPECT_EQ(std::get<std::error_code>(r), StoreErrc::invalid_cursor);
}

TEST_F(ScanTest, EmptyKeyspaceCompletesImmediately) {
    auto page = ok(ks_.scan(0, "*", 10));
    EXPECT_TRUE(page.elements.empty());
    EXPECT_EQ(page.next_cursor, 0u);
}

// ── HSCAN ────────────────────────────────────────────────────────────────────

TEST_F(ScanTest, HashScanInterleavesFieldsAndValues) {
    ASSERT_FALSE(is_error(ks_.hash_set("h", "b", "2")));
    ASSERT_FALSE(is_error(ks_.hash_set("h", "a", "1")));
    ASSERT_FALSE(is_error(ks_.hash_set("h", "c", "3")));

    auto page = ok(ks_.hash_scan("h", 0, "*", 2));
    EXPECT_EQ(page.elements, (std::vector<std::string>{"a", "1", "b", "2"}));
    // The cursor counts fields, not elements.
    EXPECT_EQ(page.next_cursor, 2u);

    page = ok(ks_.hash_scan("h", 2, "*", 2));
    EXPECT_EQ(page.elements, (std::vector<std::string>{"c", "3"}));
    EXPECT_EQ(page.next_cursor, 0u);
}

TEST_F(ScanTest, HashScanMatchAppliesToFields) {
    ASSERT_FALSE(is_error(ks_.hash_set("h", "name", "alice")));
    ASSERT_FALSE(is_error(ks_.hash_set("h", "age", "30")));

    auto page = ok(ks_.hash_scan("h", 0, "n*", 10));
    EXPECT_EQ(page.elements, (std::vector<std::string>{"name", "alice"}));
}

TEST_F(ScanTest, HashScanOfMissingKeyIsEmpty) {
    auto page = ok(ks_.hash_scan("missing", 0, "*", 10));
    EXPECT_TRUE(page.elements.empty());
    EXPECT_EQ(page.next_cursor, 0u);
}

TEST_F(ScanTest, HashScanErrors) {
    ks_.set_string("s", "v");
    auto wrong = ks_.hash_scan("s", 0, "*", 10);
    ASSERT_TRUE(is_error(wrong));
    EXPECT_EQ(std::get<std::error_code>(wrong), StoreErrc::wrong_type);

    ASSERT_FALSE(is_error(ks_.hash_set("h", "f", "v")));
    auto bad = ks_.hash_scan("h", -3, "*", 10);
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(std::get<std::error_code>(bad), StoreErrc::invalid_cursor);
}

// ── SSCAN ────────────────────────────────────────────────────────────────────

TEST_F(ScanTest, SetScanFullTraversal) {
    const auto members = numbered("m", 23);
    ASSERT_FALSE(is_error(ks_.set_add("s", members)));

    std::set<std::string> seen;
    std::uint64_t cursor = 0;
    do {
        auto page = ok(ks_.set_scan("s", static_cast<std::int64_t>(cursor), "*", 5));
        for (const auto& m : page.elements) {
            EXPECT_TRUE(seen.insert(m).second) << "duplicate " << m;
        }
        cursor = page.next_cursor;
    } while (cursor != 0);

    EXPECT_EQ(seen.size(), members.size());
}

TEST_F(ScanTest, SetScanOnHashIsWrongType) {
    ASSERT_FALSE(is_error(ks_.hash_set("h", "f", "v")));
    auto r = ks_.set_scan("h", 0, "*", 10);
    ASSERT_TRUE(is_error(r));
    EXPECT_EQ(std::get<std::error_code>(r), StoreErrc::wrong_type);
}

} // namespace memkv
