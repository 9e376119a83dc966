#pragma once
#include "mediaserv/config.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_set>

namespace mediaserv {
struct setting;
}

namespace mediaserv::server {

class router;
class router_impl;
class session;

class http_server
{
public:
    explicit http_server(const net::any_io_executor& ex);
    ~http_server();

    // Throws boost::system::system_error when the address cannot be bound.
    http_server& listen(std::string_view host,
                        uint16_t port,
                        int backlog = net::socket_base::max_listen_connections);

    // Binds cfg.host:cfg.port and takes the read and write timeouts from cfg.
    http_server& listen(const setting& cfg);

    void async_run();
    void stop();

    server::router& router();

    tcp::endpoint local_endpoint() const;

    void set_read_timeout(const std::chrono::steady_clock::duration& dur);
    void set_write_timeout(const std::chrono::steady_clock::duration& dur);

    const std::chrono::steady_clock::duration& read_timeout() const;
    const std::chrono::steady_clock::duration& write_timeout() const;

    std::shared_ptr<spdlog::logger> get_logger() const;
    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    net::awaitable<boost::system::error_code> co_run();
    net::awaitable<boost::system::error_code> co_accept();
    net::awaitable<void> handle_accept(tcp::socket sock);

private:
    net::any_io_executor ex_;

    std::unique_ptr<router_impl> router_;
    tcp::acceptor acceptor_;

    std::mutex session_mutex_;
    std::unordered_set<std::shared_ptr<session>> sessions_;
    bool stopped_ = false;

    std::chrono::steady_clock::duration read_timeout_  = std::chrono::seconds(30);
    std::chrono::steady_clock::duration write_timeout_ = std::chrono::seconds(30);

    std::shared_ptr<spdlog::logger> default_logger_;
    std::shared_ptr<spdlog::logger> custom_logger_;
};
} // namespace mediaserv::server
