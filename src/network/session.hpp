#pragma once

#include "command/dispatcher.hpp"
#include "network/resp_protocol.hpp"
#include "persistence/aof.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace memkv::network {

struct SessionOptions {
    RespLimits limits;
    std::chrono::milliseconds read_timeout{0};    // 0 = wait forever
    std::chrono::milliseconds write_timeout{0};   // 0 = wait forever
};

// Handles one TCP connection for its lifetime.
//
// Created by Server::accept_loop() and started with start(), which spawns
// two coroutines on a per-connection strand: the request loop and a watchdog
// that closes the socket when the current read or write deadline passes.
// The Session keeps itself alive (shared_from_this) until both have finished.
//
// Requests are decoded with RespDecoder, executed through the Dispatcher and
// answered in order.  All complete requests already buffered are answered
// with a single write, so pipelined clients see one reply per request.
// A protocol error is answered with "-ERR Protocol error: ..." and the
// connection stays open.
class Session : public std::enable_shared_from_this<Session> {
public:
    // `aof` may be null (persistence disabled).  `on_closed` runs when the
    // Session is destroyed.
    Session(boost::asio::ip::tcp::socket socket, Dispatcher& dispatcher,
            persistence::Aof* aof, SessionOptions options,
            std::function<void()> on_closed = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void start();

private:
    // Request loop.  Returns when the peer disconnects or I/O fails.
    boost::asio::awaitable<void> run();

    // Closes the socket once the active deadline has passed.
    boost::asio::awaitable<void> watchdog();

    // Execute one request and log it to the AOF when it changed the keyspace.
    [[nodiscard]] Reply handle(const std::vector<std::string>& args);

    void arm_deadline(std::chrono::milliseconds timeout);
    void close();

    boost::asio::ip::tcp::socket socket_;
    boost::asio::strand<boost::asio::ip::tcp::socket::executor_type> strand_;
    boost::asio::steady_timer deadline_timer_;
    std::chrono::steady_clock::time_point deadline_;

    Dispatcher& dispatcher_;
    persistence::Aof* aof_;
    SessionOptions options_;
    RespDecoder decoder_;
    std::function<void()> on_closed_;
    std::string remote_;
};

} // namespace memkv::network
