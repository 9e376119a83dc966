#pragma once
#include "mediaserv/config.hpp"
#include "mediaserv/server/request.hpp"
#include "mediaserv/server/response.hpp"
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <atomic>
#include <memory>

namespace mediaserv::server {
class http_server;
class router_impl;

// One accepted connection: reads requests, routes them and writes the
// responses until the peer goes away, keep-alive ends, or abort() is called.
class session : public std::enable_shared_from_this<session>
{
public:
    static constexpr std::uint64_t request_body_limit = 1024 * 1024;

    session(tcp::socket&& stream, http_server& serv, const router_impl& router);
    ~session();

public:
    void abort();
    net::awaitable<void> run();

private:
    net::awaitable<bool> async_write(const request& req, response& resp);

private:
    http_server& serv_;
    const router_impl& router_;

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;

    tcp::endpoint local_endpoint_;
    tcp::endpoint remote_endpoint_;

    std::atomic_bool abort_ = false;
};

} // namespace mediaserv::server
