#include "session.hpp"
#include "mediaserv/util/use_awaitable.hpp"
#include "mediaserv/server/server.hpp"
#include "router_impl.h"
#include <boost/asio/post.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <spdlog/spdlog.h>

namespace mediaserv::server {

session::session(tcp::socket&& stream, http_server& serv, const router_impl& router)
    : serv_(serv)
    , router_(router)
    , stream_(std::move(stream))
{
    boost::system::error_code ec;
    local_endpoint_  = stream_.socket().local_endpoint(ec);
    remote_endpoint_ = stream_.socket().remote_endpoint(ec);
}

session::~session()
{
}

void session::abort()
{
    if (abort_.exchange(true))
        return;

    net::post(stream_.get_executor(), [self = shared_from_this()]() {
        boost::system::error_code ec;
        self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        self->stream_.close();
    });
}

net::awaitable<void> session::run()
{
    boost::system::error_code ec;
    while (!abort_) {
        http::request_parser<http::empty_body> header_parser;
        header_parser.body_limit(request_body_limit);

        stream_.expires_after(serv_.read_timeout());
        co_await http::async_read_header(stream_, buffer_, header_parser, util::net_awaitable[ec]);
        stream_.expires_never();
        if (ec) {
            serv_.get_logger()->trace("read http header failed: {}", ec.message());
            co_return;
        }

        // Playback requests carry no body; whatever is sent is read and dropped
        // so the next request on the connection starts at a message boundary.
        http::request_parser<http::string_body> body_parser(std::move(header_parser));
        while (!body_parser.is_done()) {
            stream_.expires_after(serv_.read_timeout());
            co_await http::async_read_some(stream_, buffer_, body_parser, util::net_awaitable[ec]);
            stream_.expires_never();
            if (ec) {
                serv_.get_logger()->trace("read http body failed: {}", ec.message());
                co_return;
            }
        }

        request req(local_endpoint_, remote_endpoint_, body_parser.release());
        req.body().clear();
        response resp(req.version(), req.keep_alive());

        auto start_time = std::chrono::steady_clock::now();

        try {
            co_await router_.proc_routing(req, resp);
        }
        catch (const std::exception& e) {
            serv_.get_logger()->warn("exception in business function, reason: {}", e.what());
            resp.set_string_content(std::string_view(e.what()),
                                    "text/plain; charset=utf-8",
                                    http::status::internal_server_error);
        }

        auto span_time = std::chrono::steady_clock::now() - start_time;
        serv_.get_logger()->debug(
            "{} {} ({}:{} -> {}:{}) {} {}ms",
            req.method_string(),
            req.target(),
            remote_endpoint_.address().to_string(),
            remote_endpoint_.port(),
            local_endpoint_.address().to_string(),
            local_endpoint_.port(),
            resp.result_int(),
            std::chrono::duration_cast<std::chrono::milliseconds>(span_time).count());

        if (!co_await async_write(req, resp))
            co_return;

        if (!resp.keep_alive()) {
            // This means we should close the connection, usually
            // because the response indicated the "Connection: close"
            // semantic.
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            stream_.close();
            co_return;
        }
    }
}

net::awaitable<bool> session::async_write(const request& req, response& resp)
{
    if (!resp.has_content_length())
        resp.prepare_payload();

    boost::system::error_code ec;
    http::response_serializer<body::any_body> serializer(resp);
    stream_.expires_after(serv_.write_timeout());
    co_await http::async_write_header(stream_, serializer, util::net_awaitable[ec]);
    stream_.expires_never();
    if (ec) {
        serv_.get_logger()->trace("write http header failed: {}", ec.message());
        co_return false;
    }

    if (req.method() == http::verb::head)
        co_return true;

    while (!serializer.is_done()) {
        stream_.expires_after(serv_.write_timeout());
        co_await http::async_write_some(stream_, serializer, util::net_awaitable[ec]);
        stream_.expires_never();
        if (ec) {
            serv_.get_logger()->warn("{} {} aborted ({}:{}): {}",
                                     req.method_string(),
                                     req.target(),
                                     remote_endpoint_.address().to_string(),
                                     remote_endpoint_.port(),
                                     ec.message());
            co_return false;
        }
    }
    co_return true;
}

} // namespace mediaserv::server
