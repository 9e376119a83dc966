#pragma once
#include "mediaserv/config.hpp"
#include <atomic>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>

namespace mediaserv::catalog {

class catalog_index;

// Rescans a catalog_index on a fixed interval from the given executor.
class catalog_watcher
{
public:
    catalog_watcher(const net::any_io_executor& ex,
                    catalog_index& index,
                    std::chrono::steady_clock::duration interval);

    void start();
    void stop();

private:
    net::awaitable<void> co_run();

    catalog_index& index_;
    net::steady_timer timer_;
    std::chrono::steady_clock::duration interval_;
    std::atomic_bool stopped_ = false;
};

} // namespace mediaserv::catalog
