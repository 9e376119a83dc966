#include "mediaserv/catalog/catalog_index.hpp"
#include "mediaserv/catalog/catalog_watcher.hpp"
#include "mediaserv/server/request.hpp"
#include "mediaserv/server/response.hpp"
#include "mediaserv/server/router.hpp"
#include "mediaserv/server/server.hpp"
#include "mediaserv/server/stream_responder.hpp"
#include "mediaserv/setting.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/system_error.hpp>
#include <csignal>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace mediaserv;

int main(int argc, char** argv)
{
    setting cfg;
    try {
        cfg = setting::from_env();
    }
    catch (const std::invalid_argument& e) {
        cfg.get_logger()->error("bad configuration: {}", e.what());
        return 1;
    }
    if (argc > 1)
        cfg.media_dir = argv[1];

    auto level = spdlog::level::from_str(cfg.log_level);
    cfg.get_logger()->set_level(level);

    catalog::catalog_index index(cfg.media_dir);
    index.get_logger()->set_level(level);
    index.scan();

    net::thread_pool pool(cfg.worker_threads());
    server::http_server svr(pool.get_executor());
    svr.get_logger()->set_level(level);

    try {
        svr.listen(cfg);
    }
    catch (const boost::system::system_error& e) {
        cfg.get_logger()->error("listen on {}:{} failed: {}", cfg.host, cfg.port, e.what());
        pool.join();
        return 1;
    }

    auto& router = svr.router();

    // http://127.0.0.1:5000/media/movies/clip.mp4
    router.set_http_handler<http::verb::get, http::verb::head>(
        "/media/*", server::stream_responder(index, svr.get_logger()));

    router.set_http_handler<http::verb::get>(
        "/health", [](server::request& req, server::response& resp) {
            resp.set_string_content(std::string_view("ok"), "text/plain");
        });

    catalog::catalog_watcher watcher(pool.get_executor(), index, cfg.scan_interval);
    watcher.start();

    net::signal_set signals(pool, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec)
            return;
        cfg.get_logger()->info("signal {} received, shutting down", signo);
        watcher.stop();
        svr.stop();
    });

    svr.async_run();
    pool.join();
    return 0;
}
