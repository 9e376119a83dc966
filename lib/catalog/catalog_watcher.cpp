#include "mediaserv/catalog/catalog_watcher.hpp"
#include "mediaserv/catalog/catalog_index.hpp"
#include "mediaserv/util/use_awaitable.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>

namespace mediaserv::catalog {

catalog_watcher::catalog_watcher(const net::any_io_executor& ex,
                                 catalog_index& index,
                                 std::chrono::steady_clock::duration interval)
    : index_(index)
    , timer_(net::make_strand(ex))
    , interval_(interval)
{
}

void catalog_watcher::start()
{
    if (interval_ <= std::chrono::steady_clock::duration::zero()) {
        index_.get_logger()->info("periodic rescans disabled");
        return;
    }
    net::co_spawn(timer_.get_executor(), co_run(), net::detached);
}

void catalog_watcher::stop()
{
    stopped_ = true;
    net::post(timer_.get_executor(), [this]() { timer_.cancel(); });
}

net::awaitable<void> catalog_watcher::co_run()
{
    boost::system::error_code ec;
    while (!stopped_) {
        timer_.expires_after(interval_);
        co_await timer_.async_wait(util::net_awaitable[ec]);
        if (ec || stopped_)
            break;

        try {
            index_.scan();
        }
        catch (const std::exception& e) {
            index_.get_logger()->warn("periodic rescan failed: {}", e.what());
        }
    }
    index_.get_logger()->trace("catalog watcher stopped: {}", ec.message());
}

} // namespace mediaserv::catalog
