#include "network/server.hpp"
#include "common/logger.hpp"
#include "network/resp_protocol.hpp"
#include "network/session.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace memkv::network {

namespace {

constexpr auto kAofSyncInterval = std::chrono::seconds{1};

} // namespace

Server::Server(const ServerConfig& cfg, Keyspace& keyspace, persistence::Aof* aof)
    : cfg_(cfg),
      dispatcher_(keyspace),
      aof_(aof),
      ioc_(static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))),
      strand_(boost::asio::make_strand(ioc_)),
      acceptor_(strand_),
      aof_timer_(strand_),
      sweeper_(ioc_, keyspace, cfg.cleanup_interval,
               make_component_logger("sweeper", parse_log_level(cfg.log_level))) {
    const auto address = boost::asio::ip::make_address(cfg_.host);
    const boost::asio::ip::tcp::endpoint endpoint{address, cfg_.port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    spdlog::info("Server listening on {}:{}", cfg_.host, port_);
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    boost::asio::co_spawn(strand_, accept_loop(), boost::asio::detached);
    if (aof_ != nullptr) {
        boost::asio::co_spawn(strand_, aof_sync_loop(), boost::asio::detached);
    }
    sweeper_.start();

    // Run the io_context across a thread pool.
    const unsigned int nthreads = std::max(1u, std::thread::hardware_concurrency());
    std::vector<std::thread> pool;
    pool.reserve(nthreads - 1);
    for (unsigned int i = 1; i < nthreads; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    spdlog::info("Server: io_context stopped, all threads joined");
}

void Server::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    sweeper_.stop();
    boost::asio::post(strand_, [this] {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        aof_timer_.cancel();
        ioc_.stop();
    });
}

boost::asio::awaitable<void> Server::accept_loop() {
    spdlog::info("Server: accept loop started");

    const SessionOptions options{
        RespLimits{RespLimits{}.max_array_length,
                   static_cast<std::size_t>(cfg_.max_request_size),
                   RespLimits{}.max_line_length},
        cfg_.read_timeout,
        cfg_.write_timeout,
    };

    for (;;) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(
            ioc_, boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Server: accept error: {}", ec.message());
            }
            break; // Acceptor was closed – time to stop.
        }

        if (active_.load() >= cfg_.max_connections) {
            spdlog::warn("Server: connection limit ({}) reached, rejecting client",
                         cfg_.max_connections);
            boost::asio::co_spawn(ioc_, reject(std::move(socket)), boost::asio::detached);
            continue;
        }

        // Disable Nagle – send responses immediately.
        boost::system::error_code opt_ec;
        socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

        ++active_;
        auto session = std::make_shared<Session>(
            std::move(socket), dispatcher_, aof_, options, [this] { --active_; });
        session->start();
    }

    spdlog::info("Server: accept loop exited");
}

boost::asio::awaitable<void> Server::reject(boost::asio::ip::tcp::socket socket) {
    const std::string wire = serialize_reply(ErrorReply{"ERR max number of clients reached"});
    boost::system::error_code ec;
    co_await boost::asio::async_write(socket, boost::asio::buffer(wire),
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    socket.close(ec);
}

boost::asio::awaitable<void> Server::aof_sync_loop() {
    for (;;) {
        aof_timer_.expires_after(kAofSyncInterval);
        boost::system::error_code ec;
        co_await aof_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            break; // cancelled by stop()
        }
        if (auto sync_ec = aof_->sync()) {
            spdlog::error("Server: AOF sync failed: {}", sync_ec.message());
        }
    }
}

} // namespace memkv::network
