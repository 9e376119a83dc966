#include "mediaserv/setting.hpp"
#include <cstdlib>
#include <gtest/gtest.h>
#include <stdexcept>

using mediaserv::setting;

namespace {

class scoped_env
{
public:
    scoped_env(const char* name, const char* value)
        : name_(name)
    {
        ::setenv(name, value, 1);
    }
    ~scoped_env() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(setting, defaults)
{
    setting cfg = setting::from_env();
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.media_dir, mediaserv::fs::path("./videos"));
    EXPECT_EQ(cfg.scan_interval, std::chrono::seconds(3600));
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_GE(cfg.worker_threads(), 1u);
    EXPECT_NE(cfg.get_logger(), nullptr);
}

TEST(setting, reads_environment)
{
    scoped_env host("MEDIASERV_HOST", "127.0.0.1");
    scoped_env port("MEDIASERV_PORT", "8080");
    scoped_env dir("MEDIASERV_MEDIA_DIR", "/srv/media");
    scoped_env interval("MEDIASERV_SCAN_INTERVAL", "0");
    scoped_env level("MEDIASERV_LOG_LEVEL", "DEBUG");
    scoped_env threads("MEDIASERV_THREADS", "3");

    setting cfg = setting::from_env();
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.media_dir, mediaserv::fs::path("/srv/media"));
    EXPECT_EQ(cfg.scan_interval, std::chrono::seconds(0));
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.worker_threads(), 3u);
}

TEST(setting, invalid_numbers_throw)
{
    {
        scoped_env port("MEDIASERV_PORT", "70000");
        EXPECT_THROW(setting::from_env(), std::invalid_argument);
    }
    {
        scoped_env port("MEDIASERV_PORT", "80a");
        EXPECT_THROW(setting::from_env(), std::invalid_argument);
    }
    {
        scoped_env interval("MEDIASERV_SCAN_INTERVAL", "-5");
        EXPECT_THROW(setting::from_env(), std::invalid_argument);
    }
}

TEST(setting, invalid_log_level_throws)
{
    scoped_env level("MEDIASERV_LOG_LEVEL", "loud");
    EXPECT_THROW(setting::from_env(), std::invalid_argument);
}
