#pragma once
#include "mediaserv/config.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace mediaserv {

struct setting
{
    std::string host = "0.0.0.0";
    uint16_t port    = 5000;
    fs::path media_dir = "./videos";

    // zero disables periodic rescans
    std::chrono::seconds scan_interval = std::chrono::seconds(3600);

    std::chrono::steady_clock::duration read_timeout  = std::chrono::seconds(30);
    std::chrono::steady_clock::duration write_timeout = std::chrono::seconds(30);

    std::string log_level = "info";
    std::size_t threads   = 0; // 0 means hardware concurrency

public:
    setting();

    // Reads the MEDIASERV_* environment variables on top of the defaults.
    // Throws std::invalid_argument for values that do not parse.
    static setting from_env();

    std::size_t worker_threads() const;

public:
    std::shared_ptr<spdlog::logger> get_logger() const;
    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    std::shared_ptr<spdlog::logger> default_logger_;
    std::shared_ptr<spdlog::logger> custom_logger_;
};

} // namespace mediaserv
