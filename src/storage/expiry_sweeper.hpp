#pragma once

#include "storage/keyspace.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

namespace memkv {

// ── ExpirySweeper ────────────────────────────────────────────────────────────
//
// Periodically calls Keyspace::cleanup_expired() from a coroutine on the
// given io_context.  The timer lives on its own strand, so start() and stop()
// may be called from any thread.
//
// The keyspace must outlive the sweeper, and the sweeper must outlive the
// io_context's run() (the loop coroutine refers back to it).

class ExpirySweeper {
public:
    // Logs through `logger`, or the default logger when none is given.
    ExpirySweeper(boost::asio::io_context& ioc, Keyspace& keyspace,
                  std::chrono::milliseconds interval,
                  std::shared_ptr<spdlog::logger> logger = {});

    ExpirySweeper(const ExpirySweeper&)            = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    // Spawns the sweep loop.  Calling start() on a running sweeper is a no-op.
    void start();

    // Cancels the timer; the loop exits at its next wake-up.  Idempotent.
    void stop();

    // One sweep pass.  Returns the number of entries removed.
    std::size_t sweep_once();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

private:
    boost::asio::awaitable<void> run();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    Keyspace& keyspace_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<bool> running_{false};
};

} // namespace memkv
