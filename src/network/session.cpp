#include "network/session.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <utility>

namespace memkv::network {

namespace {

constexpr std::size_t kReadChunkSize = 16 * 1024;

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::bad_descriptor;
}

} // namespace

Session::Session(boost::asio::ip::tcp::socket socket, Dispatcher& dispatcher,
                 persistence::Aof* aof, SessionOptions options,
                 std::function<void()> on_closed)
    : socket_(std::move(socket)),
      strand_(boost::asio::make_strand(socket_.get_executor())),
      deadline_timer_(strand_),
      deadline_(std::chrono::steady_clock::time_point::max()),
      dispatcher_(dispatcher),
      aof_(aof),
      options_(options),
      decoder_(options.limits),
      on_closed_(std::move(on_closed)) {
    boost::system::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
}

Session::~Session() {
    spdlog::debug("Session {}: closed", remote_);
    if (on_closed_) {
        on_closed_();
    }
}

void Session::start() {
    spdlog::debug("Session {}: client connected", remote_);
    auto self = shared_from_this();
    boost::asio::co_spawn(strand_, [self]() { return self->run(); }, boost::asio::detached);
    boost::asio::co_spawn(strand_, [self]() { return self->watchdog(); }, boost::asio::detached);
}

void Session::arm_deadline(std::chrono::milliseconds timeout) {
    deadline_ = timeout.count() > 0 ? std::chrono::steady_clock::now() + timeout
                                    : std::chrono::steady_clock::time_point::max();
    deadline_timer_.cancel();   // wake the watchdog so it re-arms on the new deadline
}

void Session::close() {
    boost::system::error_code ignored;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    deadline_timer_.cancel();
}

boost::asio::awaitable<void> Session::watchdog() {
    while (socket_.is_open()) {
        deadline_timer_.expires_at(deadline_);

        boost::system::error_code ec;
        co_await deadline_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (deadline_ <= std::chrono::steady_clock::now()) {
            spdlog::info("Session {}: timed out, closing", remote_);
            close();
        }
    }
}

Reply Session::handle(const std::vector<std::string>& args) {
    Reply reply = dispatcher_.execute(args);

    if (aof_ != nullptr && !is_error_reply(reply) &&
        Dispatcher::is_write_command(args.front())) {
        // A failed append is logged; the client still gets its reply.
        if (auto ec = aof_->append(args)) {
            spdlog::error("Session {}: AOF append failed: {}", remote_, ec.message());
        }
    }
    return reply;
}

boost::asio::awaitable<void> Session::run() {
    std::string buf;
    std::string out;
    std::array<char, kReadChunkSize> chunk{};

    for (;;) {
        // Answer every complete request already buffered.
        for (;;) {
            DecodeResult r = decoder_.decode(buf);
            if (r.status == DecodeStatus::Incomplete) {
                break;
            }
            buf.erase(0, r.consumed);

            if (r.status == DecodeStatus::Error) {
                spdlog::debug("Session {}: protocol error: {}", remote_, r.error.message());
                out += serialize_reply(ErrorReply{"ERR Protocol error: " + r.error.message()});
                continue;
            }
            if (r.args.empty()) {
                continue;
            }
            out += serialize_reply(handle(r.args));
        }

        if (!out.empty()) {
            arm_deadline(options_.write_timeout);
            boost::system::error_code wec;
            co_await boost::asio::async_write(
                socket_, boost::asio::buffer(out),
                boost::asio::redirect_error(boost::asio::use_awaitable, wec));
            if (wec) {
                if (!is_disconnect(wec)) {
                    spdlog::warn("Session {}: write error: {}", remote_, wec.message());
                }
                break;
            }
            out.clear();
        }

        arm_deadline(options_.read_timeout);
        boost::system::error_code ec;
        const std::size_t n = co_await socket_.async_read_some(
            boost::asio::buffer(chunk),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            if (ec == boost::asio::error::eof && !buf.empty()) {
                spdlog::warn("Session {}: {} ({} byte(s) pending)", remote_,
                             make_error_code(RespErrc::incomplete_input).message(), buf.size());
            } else if (!is_disconnect(ec)) {
                spdlog::warn("Session {}: read error: {}", remote_, ec.message());
            }
            break;
        }
        buf.append(chunk.data(), n);
    }

    close();
}

} // namespace memkv::network
