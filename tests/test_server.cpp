#include "mediaserv/catalog/catalog_index.hpp"
#include "mediaserv/server/request.hpp"
#include "mediaserv/server/response.hpp"
#include "mediaserv/server/router.hpp"
#include "mediaserv/server/server.hpp"
#include "mediaserv/server/stream_responder.hpp"
#include "mediaserv/setting.hpp"
#include "test_util.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace mediaserv;

class server_test : public ::testing::Test
{
protected:
    server_test()
        : index_(dir_.path())
        , pool_(2)
        , server_(pool_.get_executor())
    {
        index_.set_logger(test::null_logger());
        server_.set_logger(test::null_logger());
    }

    void SetUp() override
    {
        content_ = test::make_content(4096);
        test::write_file(dir_.path() / "movies" / "clip one.mp4", content_);
        index_.scan();

        server_.listen("127.0.0.1", 0);
        auto& router = server_.router();
        router.set_http_handler<http::verb::get, http::verb::head>(
            "/media/*", server::stream_responder(index_, test::null_logger()));
        router.set_http_handler<http::verb::get>(
            "/health", [](server::request& req, server::response& resp) {
                resp.set_string_content(std::string_view("ok"), "text/plain");
            });
        router.set_http_handler<http::verb::get>(
            "/boom", [](server::request& req, server::response& resp) -> net::awaitable<void> {
                throw std::runtime_error("boom");
                co_return;
            });
        server_.async_run();

        stream_.connect(server_.local_endpoint());
    }

    void TearDown() override
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.close();
        server_.stop();
        pool_.join();
    }

    http::response<http::string_body> request(http::verb method,
                                              std::string_view target,
                                              std::string_view range = {})
    {
        http::request<http::empty_body> req(method, target, 11);
        req.set(http::field::host, "127.0.0.1");
        if (!range.empty())
            req.set(http::field::range, range);
        http::write(stream_, req);

        http::response_parser<http::string_body> parser;
        parser.body_limit(16 * 1024 * 1024);
        parser.skip(method == http::verb::head);
        http::read(stream_, buffer_, parser);
        return parser.release();
    }

    test::temp_dir dir_;
    catalog::catalog_index index_;
    net::thread_pool pool_;
    server::http_server server_;

    net::io_context ioc_;
    beast::tcp_stream stream_ {ioc_};
    beast::flat_buffer buffer_;
    std::string content_;
};

TEST_F(server_test, full_and_partial_over_one_connection)
{
    auto full = request(http::verb::get, "/media/movies/clip%20one.mp4");
    EXPECT_EQ(full.result(), http::status::ok);
    EXPECT_EQ(full[http::field::accept_ranges], "bytes");
    EXPECT_EQ(full.body(), content_);

    auto part = request(http::verb::get, "/media/movies/clip%20one.mp4", "bytes=100-199");
    EXPECT_EQ(part.result(), http::status::partial_content);
    EXPECT_EQ(part[http::field::content_range], "bytes 100-199/4096");
    EXPECT_EQ(part.body(), content_.substr(100, 100));
}

TEST_F(server_test, multipart_response)
{
    auto resp = request(http::verb::get, "/media/movies/clip%20one.mp4", "bytes=0-9,20-29");
    EXPECT_EQ(resp.result(), http::status::partial_content);
    EXPECT_NE(resp[http::field::content_type].find("multipart/byteranges; boundary="),
              std::string_view::npos);
    EXPECT_NE(resp.body().find("Content-Range: bytes 20-29/4096"), std::string::npos);
}

TEST_F(server_test, head_sends_headers_only)
{
    auto resp = request(http::verb::head, "/media/movies/clip%20one.mp4");
    EXPECT_EQ(resp.result(), http::status::ok);
    EXPECT_EQ(resp[http::field::content_length], "4096");
    EXPECT_TRUE(resp.body().empty());

    // the connection is still usable
    EXPECT_EQ(request(http::verb::get, "/health").result(), http::status::ok);
}

TEST_F(server_test, status_codes)
{
    EXPECT_EQ(request(http::verb::get, "/media/missing.mp4").result(), http::status::not_found);
    EXPECT_EQ(request(http::verb::get, "/media/movies/clip%20one.mp4", "bytes=9000-").result(),
              http::status::range_not_satisfiable);
    EXPECT_EQ(request(http::verb::get, "/nowhere").result(), http::status::not_found);
    EXPECT_EQ(request(http::verb::post, "/media/movies/clip%20one.mp4").result(),
              http::status::not_found);
    EXPECT_EQ(request(http::verb::get, "/boom").result(), http::status::internal_server_error);

    auto health = request(http::verb::get, "/health");
    EXPECT_EQ(health.result(), http::status::ok);
    EXPECT_EQ(health.body(), "ok");
}

TEST(http_server, listen_applies_setting)
{
    net::thread_pool pool(1);
    server::http_server svr(pool.get_executor());
    svr.set_logger(test::null_logger());

    setting cfg;
    cfg.host          = "127.0.0.1";
    cfg.port          = 0;
    cfg.read_timeout  = std::chrono::seconds(5);
    cfg.write_timeout = std::chrono::seconds(7);
    svr.listen(cfg);

    auto endp = svr.local_endpoint();
    EXPECT_TRUE(endp.address().is_loopback());
    EXPECT_NE(endp.port(), 0);
    EXPECT_EQ(svr.read_timeout(), std::chrono::steady_clock::duration(std::chrono::seconds(5)));
    EXPECT_EQ(svr.write_timeout(), std::chrono::steady_clock::duration(std::chrono::seconds(7)));

    svr.stop();
    pool.join();
}
