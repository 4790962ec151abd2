#pragma once

#include "command/dispatcher.hpp"
#include "common/server_config.hpp"
#include "persistence/aof.hpp"
#include "storage/expiry_sweeper.hpp"
#include "storage/keyspace.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace memkv::network {

// Owns the io_context, the TCP acceptor and the expiry sweeper.
//
// Usage:
//   Server srv{cfg, keyspace, aof_or_null};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
//
// The constructor binds and listens, so a bad address or a busy port throws
// boost::system::system_error before run() is called.
class Server {
public:
    // `aof` may be null (persistence disabled).  `keyspace` and `aof` must
    // outlive the server.
    Server(const ServerConfig& cfg, Keyspace& keyspace, persistence::Aof* aof = nullptr);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Starts the thread pool, begins accepting connections, starts the expiry
    // sweeper and installs signal handlers for graceful shutdown.
    // Blocks until the server stops.
    void run();

    // Closes the acceptor, stops the sweeper and the io_context, causing
    // run() to return.  Safe to call from any thread.
    void stop();

    // Port actually bound (useful when the configured port is 0).
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] std::size_t active_connections() const noexcept { return active_.load(); }

private:
    // Accept loop coroutine – runs on strand_ until the acceptor is closed.
    boost::asio::awaitable<void> accept_loop();

    // Turns away a connection over the limit with an error reply.
    boost::asio::awaitable<void> reject(boost::asio::ip::tcp::socket socket);

    // Syncs the AOF once per interval so idle periods do not leave records
    // unsynced.
    boost::asio::awaitable<void> aof_sync_loop();

    ServerConfig cfg_;
    Dispatcher dispatcher_;
    persistence::Aof* aof_;

    std::uint16_t port_ = 0;
    std::atomic<std::size_t> active_{0};   // decremented by Session destructors
    std::atomic<bool> stopping_{false};

    // Declared after everything sessions touch: destroying the io_context
    // destroys any sessions still pending.
    boost::asio::io_context ioc_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer aof_timer_;
    ExpirySweeper sweeper_;
};

} // namespace memkv::network
