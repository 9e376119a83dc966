#include "mediaserv/server/server.hpp"
#include "mediaserv/setting.hpp"
#include "router_impl.h"
#include "session.hpp"
#include "mediaserv/util/use_awaitable.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mediaserv::server {

http_server::http_server(const net::any_io_executor& ex)
    : ex_(ex)
    , router_(std::make_unique<router_impl>())
    , acceptor_(net::make_strand(ex))
{
    auto console_sink                 = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    spdlog::sinks_init_list sink_list = {console_sink};
    default_logger_ = std::make_shared<spdlog::logger>("mediaserv.server", sink_list);
    default_logger_->set_level(spdlog::level::info);
}

http_server::~http_server()
{
}

http_server& http_server::listen(std::string_view host,
                                 uint16_t port,
                                 int backlog /*= net::socket_base::max_listen_connections*/)
{
    tcp::resolver resolver(ex_);
    auto results = resolver.resolve(host, std::to_string(port));

    tcp::endpoint endp(*results.begin());
    acceptor_.open(endp.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endp);
    acceptor_.listen(backlog);

    auto listen_endp = local_endpoint();
    get_logger()->info(
        "Http Server Listen on: [{}:{}]", listen_endp.address().to_string(), listen_endp.port());
    return *this;
}

http_server& http_server::listen(const setting& cfg)
{
    set_read_timeout(cfg.read_timeout);
    set_write_timeout(cfg.write_timeout);
    return listen(cfg.host, cfg.port);
}

void http_server::async_run()
{
    net::co_spawn(
        acceptor_.get_executor(),
        [this]() -> net::awaitable<void> { co_await co_run(); },
        [](std::exception_ptr ex) {
            // if an exception occurred in the coroutine,
            // it's something critical, e.g. out of memory
            // we capture normal errors in the ec
            // so we just rethrow the exception here,
            // which will cause `ioc.run()` to throw
            if (ex)
                std::rethrow_exception(ex);
        });
}

void http_server::stop()
{
    net::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

server::router& http_server::router()
{
    return *router_;
}

net::awaitable<boost::system::error_code> http_server::co_run()
{
    auto ec = co_await co_accept();
    {
        std::lock_guard lck(session_mutex_);
        stopped_ = true;
        for (const auto& v : sessions_)
            v->abort();
    }
    if (ec == net::error::operation_aborted)
        ec = {};
    co_return ec;
}

net::awaitable<boost::system::error_code> http_server::co_accept()
{
    boost::system::error_code ec;
    for (;;) {
        tcp::socket sock(net::make_strand(ex_));
        co_await acceptor_.async_accept(sock, util::net_awaitable[ec]);
        if (ec) {
            if (ec == boost::system::errc::too_many_files_open ||
                ec == boost::system::errc::too_many_files_open_in_system)
            {
                ec = {};
                using namespace std::chrono_literals;
                net::steady_timer retry_timer(acceptor_.get_executor());
                retry_timer.expires_after(100ms);
                co_await retry_timer.async_wait(util::net_awaitable[ec]);
                if (!ec && acceptor_.is_open())
                    continue;
            }
            break;
        }
        auto sock_ex = sock.get_executor();
        net::co_spawn(sock_ex, handle_accept(std::move(sock)), net::detached);
    }
    get_logger()->trace("async_accept: {}", ec.message());
    co_return ec;
}

net::awaitable<void> http_server::handle_accept(tcp::socket sock)
{
    boost::system::error_code ec;
    auto remote_endp = sock.remote_endpoint(ec);
    get_logger()->trace(
        "accept new connection [{}:{}]", remote_endp.address().to_string(), remote_endp.port());

    auto conn = std::make_shared<session>(std::move(sock), *this, *router_);
    {
        std::lock_guard lck(session_mutex_);
        sessions_.insert(conn);
        if (stopped_)
            conn->abort();
    }
    try {
        co_await conn->run();
    }
    catch (const std::exception& e) {
        get_logger()->warn("session::run() exception: {}", e.what());
    }
    {
        std::lock_guard lck(session_mutex_);
        sessions_.erase(conn);
    }
    get_logger()->trace(
        "close connection [{}:{}]", remote_endp.address().to_string(), remote_endp.port());
}

void http_server::set_read_timeout(const std::chrono::steady_clock::duration& dur)
{
    read_timeout_ = dur;
}

void http_server::set_write_timeout(const std::chrono::steady_clock::duration& dur)
{
    write_timeout_ = dur;
}

const std::chrono::steady_clock::duration& http_server::read_timeout() const
{
    return read_timeout_;
}

const std::chrono::steady_clock::duration& http_server::write_timeout() const
{
    return write_timeout_;
}

tcp::endpoint http_server::local_endpoint() const
{
    boost::system::error_code ec;
    return acceptor_.local_endpoint(ec);
}

std::shared_ptr<spdlog::logger> http_server::get_logger() const
{
    if (custom_logger_)
        return custom_logger_;
    return default_logger_;
}

void http_server::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    custom_logger_ = logger;
}

} // namespace mediaserv::server
