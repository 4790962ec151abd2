#include "command/dispatcher.hpp"
#include "network/resp_protocol.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace memkv {

using namespace std::chrono_literals;

// ── Fixture ───────────────────────────────────────────────────────────────────

// Commands are executed and compared by their RESP encoding, which pins both
// the reply shape and its content.
class DispatcherTest : public ::testing::Test {
protected:
    std::string run(const std::vector<std::string>& argv) {
        return network::serialize_reply(dispatcher_.execute(argv));
    }

    static std::string bulk(const std::string& s) {
        return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n";
    }

    static std::string integer(long long n) {
        return ":" + std::to_string(n) + "\r\n";
    }

    static constexpr const char* kOk       = "+OK\r\n";
    static constexpr const char* kNil      = "$-1\r\n";
    static constexpr const char* kWrongType =
        "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n";

    MockClock clock_;
    Keyspace ks_{clock_};
    Dispatcher dispatcher_{ks_};
};

// ── Dispatch ─────────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, CommandNamesAreCaseInsensitive) {
    EXPECT_EQ(run({"set", "k", "v"}), kOk);
    EXPECT_EQ(run({"GeT", "k"}), bulk("v"));
}

TEST_F(DispatcherTest, UnknownCommandEchoesName) {
    EXPECT_EQ(run({"FLY", "away"}), "-ERR unknown command 'FLY'\r\n");
}

TEST_F(DispatcherTest, EmptyArgvIsAnError) {
    EXPECT_TRUE(is_error_reply(dispatcher_.execute(std::vector<std::string>{})));
}

TEST_F(DispatcherTest, ArityErrorsNameTheCommandInLowercase) {
    EXPECT_EQ(run({"GET"}), "-ERR wrong number of arguments for 'get' command\r\n");
    EXPECT_EQ(run({"Get", "a", "b"}), "-ERR wrong number of arguments for 'get' command\r\n");
    EXPECT_EQ(run({"SET", "k"}), "-ERR wrong number of arguments for 'set' command\r\n");
    EXPECT_EQ(run({"LRANGE", "l", "0"}),
              "-ERR wrong number of arguments for 'lrange' command\r\n");
    EXPECT_EQ(run({"DBSIZE", "x"}), "-ERR wrong number of arguments for 'dbsize' command\r\n");
}

TEST_F(DispatcherTest, ExecuteWithSeparateCommandName) {
    EXPECT_EQ(network::serialize_reply(dispatcher_.execute("ECHO", {"hi"})), bulk("hi"));
}

// ── Connection / meta ────────────────────────────────────────────────────────

TEST_F(DispatcherTest, Ping) {
    EXPECT_EQ(run({"PING"}), "+PONG\r\n");
    EXPECT_EQ(run({"PING", "hello"}), bulk("hello"));
}

TEST_F(DispatcherTest, Echo) {
    EXPECT_EQ(run({"ECHO", "hello world"}), bulk("hello world"));
}

TEST_F(DispatcherTest, CommandHandshakeIsAcknowledged) {
    EXPECT_EQ(run({"COMMAND", "DOCS"}), kOk);
}

// ── Strings and keys ─────────────────────────────────────────────────────────

TEST_F(DispatcherTest, SetAndGet) {
    EXPECT_EQ(run({"SET", "greeting", "hello"}), kOk);
    EXPECT_EQ(run({"GET", "greeting"}), bulk("hello"));
    EXPECT_EQ(run({"GET", "missing"}), kNil);
}

TEST_F(DispatcherTest, GetOnOtherKindIsNil) {
    EXPECT_EQ(run({"RPUSH", "l", "a"}), integer(1));
    EXPECT_EQ(run({"GET", "l"}), kNil);
}

TEST_F(DispatcherTest, SetWithExpirySeconds) {
    EXPECT_EQ(run({"SET", "k", "v", "EX", "10"}), kOk);
    clock_.advance(9999ms);
    EXPECT_EQ(run({"GET", "k"}), bulk("v"));
    clock_.advance(1ms);
    EXPECT_EQ(run({"GET", "k"}), kNil);
}

TEST_F(DispatcherTest, SetWithExpiryMilliseconds) {
    EXPECT_EQ(run({"SET", "k", "v", "px", "50"}), kOk);
    clock_.advance(49ms);
    EXPECT_EQ(run({"EXISTS", "k"}), integer(1));
    clock_.advance(1ms);
    EXPECT_EQ(run({"EXISTS", "k"}), integer(0));
}

TEST_F(DispatcherTest, SetWithHugeExpiryKeepsKey) {
    EXPECT_EQ(run({"SET", "ms", "v", "PX", "9223372036854775807"}), kOk);
    EXPECT_EQ(run({"SET", "s", "v", "EX", "10000000000000"}), kOk);
    EXPECT_EQ(run({"SET", "edge", "v", "EX", "9223372036854775"}), kOk);

    EXPECT_EQ(run({"GET", "ms"}), bulk("v"));
    EXPECT_EQ(run({"GET", "s"}), bulk("v"));
    EXPECT_EQ(run({"GET", "edge"}), bulk("v"));

    clock_.advance(std::chrono::hours{24 * 365 * 10});
    EXPECT_EQ(run({"EXISTS", "ms", "s", "edge"}), integer(3));
    EXPECT_EQ(ks_.cleanup_expired(), 0u);
}

TEST_F(DispatcherTest, SetRejectsSecondsThatOverflowMilliseconds) {
    EXPECT_EQ(run({"SET", "k", "v", "EX", "9223372036854776"}),
              "-ERR invalid expire time in 'set' command\r\n");
    EXPECT_EQ(run({"GET", "k"}), kNil);
}

TEST_F(DispatcherTest, SetOptionErrors) {
    EXPECT_EQ(run({"SET", "k", "v", "EX"}), "-ERR syntax error\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "KEEPTTL", "1"}), "-ERR syntax error\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "EX", "ten"}),
              "-ERR value is not an integer or out of range\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "EX", "0"}),
              "-ERR invalid expire time in 'set' command\r\n");
    EXPECT_EQ(run({"SET", "k", "v", "PX", "-5"}),
              "-ERR invalid expire time in 'set' command\r\n");
    // None of the rejected commands stored anything.
    EXPECT_EQ(run({"GET", "k"}), kNil);
}

TEST_F(DispatcherTest, DelAndExists) {
    run({"SET", "a", "1"});
    run({"SET", "b", "2"});
    EXPECT_EQ(run({"EXISTS", "a", "b", "c", "a"}), integer(3));
    EXPECT_EQ(run({"DEL", "a", "c"}), integer(1));
    EXPECT_EQ(run({"EXISTS", "a"}), integer(0));
}

TEST_F(DispatcherTest, KeysWithAndWithoutPattern) {
    run({"SET", "user:1", "x"});
    run({"SET", "user:2", "x"});
    run({"SADD", "tags", "x"});
    EXPECT_EQ(run({"KEYS", "user:*"}),
              "*2\r\n" + bulk("user:1") + bulk("user:2"));
    EXPECT_EQ(run({"KEYS"}),
              "*3\r\n" + bulk("tags") + bulk("user:1") + bulk("user:2"));
}

TEST_F(DispatcherTest, DbsizeCountsLiveKeys) {
    run({"SET", "a", "1"});
    run({"SET", "b", "2", "PX", "10"});
    EXPECT_EQ(run({"DBSIZE"}), integer(2));
    clock_.advance(20ms);
    EXPECT_EQ(run({"DBSIZE"}), integer(1));
}

TEST_F(DispatcherTest, FlushdbClearsEverything) {
    run({"SET", "a", "1"});
    run({"HSET", "h", "f", "v"});
    EXPECT_EQ(run({"FLUSHDB"}), kOk);
    EXPECT_EQ(run({"DBSIZE"}), integer(0));
}

// ── SCAN family ──────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, ScanWithMatchAndCount) {
    for (const char* k : {"a1", "a2", "a3", "b1"}) {
        run({"SET", k, "v"});
    }
    EXPECT_EQ(run({"SCAN", "0", "match", "a*", "COUNT", "2"}),
              "*2\r\n" + bulk("2") + "*2\r\n" + bulk("a1") + bulk("a2"));
    EXPECT_EQ(run({"SCAN", "2", "MATCH", "a*", "COUNT", "2"}),
              "*2\r\n" + bulk("0") + "*1\r\n" + bulk("a3"));
}

TEST_F(DispatcherTest, ScanOptionErrors) {
    EXPECT_EQ(run({"SCAN", "-1"}), "-ERR invalid cursor\r\n");
    EXPECT_EQ(run({"SCAN", "abc"}), "-ERR invalid cursor\r\n");
    EXPECT_EQ(run({"SCAN", "0", "COUNT"}), "-ERR syntax error\r\n");
    EXPECT_EQ(run({"SCAN", "0", "LIMIT", "5"}), "-ERR syntax error\r\n");
    EXPECT_EQ(run({"SCAN", "0", "COUNT", "many"}),
              "-ERR value is not an integer or out of range\r\n");
}

TEST_F(DispatcherTest, HscanInterleavesPairs) {
    run({"HSET", "h", "b", "2", "a", "1"});
    EXPECT_EQ(run({"HSCAN", "h", "0"}),
              "*2\r\n" + bulk("0") + "*4\r\n" + bulk("a") + bulk("1") + bulk("b") + bulk("2"));
}

TEST_F(DispatcherTest, SscanReturnsSortedMembers) {
    run({"SADD", "s", "z", "y", "x"});
    EXPECT_EQ(run({"SSCAN", "s", "0", "COUNT", "2"}),
              "*2\r\n" + bulk("2") + "*2\r\n" + bulk("x") + bulk("y"));
}

TEST_F(DispatcherTest, ScansOnWrongKind) {
    run({"SET", "str", "v"});
    EXPECT_EQ(run({"HSCAN", "str", "0"}), kWrongType);
    EXPECT_EQ(run({"SSCAN", "str", "0"}), kWrongType);
}

// ── Hash ─────────────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, HsetCountsNewFields) {
    EXPECT_EQ(run({"HSET", "h", "f1", "v1", "f2", "v2"}), integer(2));
    EXPECT_EQ(run({"HSET", "h", "f1", "changed", "f3", "v3"}), integer(1));
    EXPECT_EQ(run({"HGET", "h", "f1"}), bulk("changed"));
    EXPECT_EQ(run({"HGET", "h", "nope"}), kNil);
    EXPECT_EQ(run({"HGET", "missing", "f"}), kNil);
}

TEST_F(DispatcherTest, HsetRequiresFieldValuePairs) {
    EXPECT_EQ(run({"HSET", "h", "f1", "v1", "f2"}),
              "-ERR wrong number of arguments for 'hset' command\r\n");
    EXPECT_EQ(run({"EXISTS", "h"}), integer(0));
}

TEST_F(DispatcherTest, HgetallIsSortedByField) {
    run({"HSET", "h", "zeta", "26", "alpha", "1", "mid", "13"});
    EXPECT_EQ(run({"HGETALL", "h"}),
              "*6\r\n" + bulk("alpha") + bulk("1") + bulk("mid") + bulk("13") +
                  bulk("zeta") + bulk("26"));
    EXPECT_EQ(run({"HGETALL", "missing"}), "*0\r\n");
}

TEST_F(DispatcherTest, HdelRemovesFieldsAndEmptyHash) {
    run({"HSET", "h", "a", "1", "b", "2"});
    EXPECT_EQ(run({"HDEL", "h", "a", "x"}), integer(1));
    EXPECT_EQ(run({"HDEL", "h", "b"}), integer(1));
    EXPECT_EQ(run({"EXISTS", "h"}), integer(0));
}

TEST_F(DispatcherTest, HashCommandsOnStringAreWrongType) {
    run({"SET", "s", "v"});
    EXPECT_EQ(run({"HSET", "s", "f", "v"}), kWrongType);
    EXPECT_EQ(run({"HGET", "s", "f"}), kWrongType);
    EXPECT_EQ(run({"HDEL", "s", "f"}), kWrongType);
    EXPECT_EQ(run({"HGETALL", "s"}), kWrongType);
    EXPECT_EQ(run({"GET", "s"}), bulk("v"));
}

// ── List ─────────────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, PushPopAndRange) {
    EXPECT_EQ(run({"LPUSH", "l", "a", "b", "c"}), integer(3));
    EXPECT_EQ(run({"RPUSH", "l", "d"}), integer(4));
    EXPECT_EQ(run({"LRANGE", "l", "0", "-1"}),
              "*4\r\n" + bulk("c") + bulk("b") + bulk("a") + bulk("d"));
    EXPECT_EQ(run({"LPOP", "l"}), bulk("c"));
    EXPECT_EQ(run({"RPOP", "l"}), bulk("d"));
    EXPECT_EQ(run({"LRANGE", "l", "-1", "-1"}), "*1\r\n" + bulk("a"));
}

TEST_F(DispatcherTest, PopOnMissingListIsNil) {
    EXPECT_EQ(run({"LPOP", "nope"}), kNil);
    EXPECT_EQ(run({"RPOP", "nope"}), kNil);
}

TEST_F(DispatcherTest, LrangeRejectsNonIntegerIndex) {
    run({"RPUSH", "l", "a"});
    EXPECT_EQ(run({"LRANGE", "l", "zero", "1"}),
              "-ERR value is not an integer or out of range\r\n");
}

TEST_F(DispatcherTest, ListCommandsOnSetAreWrongType) {
    run({"SADD", "s", "m"});
    EXPECT_EQ(run({"LPUSH", "s", "a"}), kWrongType);
    EXPECT_EQ(run({"LPOP", "s"}), kWrongType);
    EXPECT_EQ(run({"LRANGE", "s", "0", "-1"}), kWrongType);
}

// ── Set ──────────────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, SetCommands) {
    EXPECT_EQ(run({"SADD", "s", "b", "a", "b"}), integer(2));
    EXPECT_EQ(run({"SISMEMBER", "s", "a"}), integer(1));
    EXPECT_EQ(run({"SISMEMBER", "s", "z"}), integer(0));
    EXPECT_EQ(run({"SMEMBERS", "s"}), "*2\r\n" + bulk("a") + bulk("b"));
    EXPECT_EQ(run({"SREM", "s", "a", "q"}), integer(1));
    EXPECT_EQ(run({"SREM", "s", "b"}), integer(1));
    EXPECT_EQ(run({"SMEMBERS", "s"}), "*0\r\n");
    EXPECT_EQ(run({"EXISTS", "s"}), integer(0));
}

TEST_F(DispatcherTest, SetCommandsOnHashAreWrongType) {
    run({"HSET", "h", "f", "v"});
    EXPECT_EQ(run({"SADD", "h", "m"}), kWrongType);
    EXPECT_EQ(run({"SISMEMBER", "h", "m"}), kWrongType);
    EXPECT_EQ(run({"SMEMBERS", "h"}), kWrongType);
}

// ── Sorted set ───────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, ZaddCountsAddedAndChanged) {
    EXPECT_EQ(run({"ZADD", "z", "1", "a", "2", "b"}), integer(2));
    EXPECT_EQ(run({"ZADD", "z", "1", "a"}), integer(0));
    EXPECT_EQ(run({"ZADD", "z", "5", "a", "3", "c"}), integer(2));
    EXPECT_EQ(run({"ZSCORE", "z", "a"}), bulk("5.000000"));
}

TEST_F(DispatcherTest, ZaddRejectsBadScoreWithoutPartialApply) {
    EXPECT_EQ(run({"ZADD", "z", "1", "a", "abc", "b"}), "-ERR value is not a valid float\r\n");
    EXPECT_EQ(run({"ZADD", "z", "nan", "a"}), "-ERR value is not a valid float\r\n");
    EXPECT_EQ(run({"EXISTS", "z"}), integer(0));
}

TEST_F(DispatcherTest, ZaddRequiresScoreMemberPairs) {
    EXPECT_EQ(run({"ZADD", "z", "1", "a", "2"}),
              "-ERR wrong number of arguments for 'zadd' command\r\n");
}

TEST_F(DispatcherTest, ZaddAcceptsInfinity) {
    EXPECT_EQ(run({"ZADD", "z", "+inf", "top", "-inf", "bottom", "0", "mid"}), integer(3));
    EXPECT_EQ(run({"ZRANGE", "z", "0", "-1"}),
              "*3\r\n" + bulk("bottom") + bulk("mid") + bulk("top"));
}

TEST_F(DispatcherTest, ZrangeWithScores) {
    run({"ZADD", "z", "2", "b", "1", "a", "2", "a2"});
    EXPECT_EQ(run({"ZRANGE", "z", "0", "1", "withscores"}),
              "*2\r\n"
              "*2\r\n" + bulk("1.000000") + bulk("a") +
              "*2\r\n" + bulk("2.000000") + bulk("a2"));
    EXPECT_EQ(run({"ZRANGE", "z", "0", "-1", "SCORES"}), "-ERR syntax error\r\n");
}

TEST_F(DispatcherTest, ZscoreAndZremOnMissing) {
    EXPECT_EQ(run({"ZSCORE", "z", "a"}), kNil);
    EXPECT_EQ(run({"ZREM", "z", "a"}), integer(0));
    run({"ZADD", "z", "1", "a"});
    EXPECT_EQ(run({"ZREM", "z", "a", "b"}), integer(1));
    EXPECT_EQ(run({"EXISTS", "z"}), integer(0));
}

TEST_F(DispatcherTest, SortedSetCommandsOnListAreWrongType) {
    run({"RPUSH", "l", "a"});
    EXPECT_EQ(run({"ZADD", "l", "1", "a"}), kWrongType);
    EXPECT_EQ(run({"ZSCORE", "l", "a"}), kWrongType);
    EXPECT_EQ(run({"ZRANGE", "l", "0", "-1"}), kWrongType);
    EXPECT_EQ(run({"ZREM", "l", "a"}), kWrongType);
}

// ── Write classification ─────────────────────────────────────────────────────

TEST(DispatcherWriteCommandTest, ClassifiesMutatingCommands) {
    for (const char* cmd : {"SET", "DEL", "HSET", "HDEL", "LPUSH", "RPUSH", "LPOP", "RPOP",
                            "SADD", "SREM", "ZADD", "ZREM", "FLUSHDB", "set", "zAdd"}) {
        EXPECT_TRUE(Dispatcher::is_write_command(cmd)) << cmd;
    }
    for (const char* cmd : {"GET", "EXISTS", "KEYS", "SCAN", "HGET", "HGETALL", "HSCAN",
                            "LRANGE", "SMEMBERS", "SISMEMBER", "SSCAN", "ZSCORE", "ZRANGE",
                            "PING", "ECHO", "DBSIZE", "COMMAND", "NOPE"}) {
        EXPECT_FALSE(Dispatcher::is_write_command(cmd)) << cmd;
    }
}

} // namespace memkv
