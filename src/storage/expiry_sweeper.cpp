#include "storage/expiry_sweeper.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <utility>

namespace memkv {

ExpirySweeper::ExpirySweeper(boost::asio::io_context& ioc, Keyspace& keyspace,
                             std::chrono::milliseconds interval,
                             std::shared_ptr<spdlog::logger> logger)
    : strand_{boost::asio::make_strand(ioc)}
    , timer_{strand_}
    , keyspace_{keyspace}
    , interval_{interval}
    , logger_{logger ? std::move(logger) : spdlog::default_logger()}
{}

void ExpirySweeper::start()
{
    if (running_.exchange(true)) {
        return;
    }
    logger_->debug("Expiry sweeper started (interval {} ms)", interval_.count());
    boost::asio::co_spawn(strand_, run(), boost::asio::detached);
}

void ExpirySweeper::stop()
{
    if (!running_.exchange(false)) {
        return;
    }
    boost::asio::post(strand_, [this] { timer_.cancel(); });
}

std::size_t ExpirySweeper::sweep_once()
{
    const std::size_t removed = keyspace_.cleanup_expired();
    if (removed > 0) {
        logger_->debug("Expiry sweep removed {} key(s)", removed);
    }
    return removed;
}

boost::asio::awaitable<void> ExpirySweeper::run()
{
    while (running_.load()) {
        timer_.expires_after(interval_);

        boost::system::error_code ec;
        co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        // operation_aborted means stop() cancelled the wait.
        if (ec || !running_.load()) {
            break;
        }
        sweep_once();
    }
    logger_->debug("Expiry sweeper stopped");
}

} // namespace memkv
