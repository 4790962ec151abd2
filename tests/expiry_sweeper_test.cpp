#include "storage/expiry_sweeper.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <string>

namespace {

using namespace memkv;
using namespace std::chrono_literals;
namespace asio = boost::asio;

// ════════════════════════════════════════════════════════════════════════════
//  ExpirySweeper tests
// ════════════════════════════════════════════════════════════════════════════

class ExpirySweeperTest : public ::testing::Test {
protected:
    asio::io_context ioc_;
    MockClock clock_;
    Keyspace ks_{clock_};
};

// sweep_once() removes exactly the entries whose deadline has passed.
TEST_F(ExpirySweeperTest, SweepOnceRemovesExpiredEntries) {
    ExpirySweeper sweeper{ioc_, ks_, 10ms};
    ks_.set_string("a", "1", 50ms);
    ks_.set_string("b", "2", 500ms);
    ks_.set_string("c", "3");

    EXPECT_EQ(sweeper.sweep_once(), 0u);
    clock_.advance(100ms);
    EXPECT_EQ(sweeper.sweep_once(), 1u);
    EXPECT_EQ(ks_.size(), 2u);
    EXPECT_EQ(sweeper.sweep_once(), 0u);
}

// The background loop sweeps without any reads touching the keys.
TEST_F(ExpirySweeperTest, LoopRemovesExpiredKeysInBackground) {
    for (int i = 0; i < 100; ++i) {
        ks_.set_string("k" + std::to_string(i), "v", 1ms);
    }
    ks_.set_string("keep", "v");
    clock_.advance(5ms);
    ASSERT_EQ(ks_.size(), 101u);

    ExpirySweeper sweeper{ioc_, ks_, 5ms};
    sweeper.start();
    EXPECT_TRUE(sweeper.running());

    asio::steady_timer stopper{ioc_};
    stopper.expires_after(100ms);
    stopper.async_wait([&](const boost::system::error_code&) { sweeper.stop(); });

    ioc_.run();

    EXPECT_FALSE(sweeper.running());
    EXPECT_EQ(ks_.size(), 1u);
    EXPECT_EQ(ks_.get_string("keep"), "v");
}

// stop() ends the loop promptly even with a long interval.
TEST_F(ExpirySweeperTest, StopCancelsPendingWait) {
    ExpirySweeper sweeper{ioc_, ks_, std::chrono::milliseconds{60'000}};
    sweeper.start();
    sweeper.stop();

    const auto begin = std::chrono::steady_clock::now();
    ioc_.run();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_FALSE(sweeper.running());
}

// start() twice spawns a single loop; stop() twice is harmless.
TEST_F(ExpirySweeperTest, StartAndStopAreIdempotent) {
    ExpirySweeper sweeper{ioc_, ks_, 5ms};
    sweeper.start();
    sweeper.start();
    sweeper.stop();
    sweeper.stop();

    ioc_.run();
    EXPECT_FALSE(sweeper.running());
}

} // namespace
