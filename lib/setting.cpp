#include "mediaserv/setting.hpp"
#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <charconv>
#include <cstdlib>
#include <fmt/format.h>
#include <limits>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace mediaserv {

namespace detail {

static const char* get_env(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0')
        return nullptr;
    return value;
}

static std::uint64_t parse_number(const char* name, std::string_view value, std::uint64_t max)
{
    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size() || result > max)
        throw std::invalid_argument(fmt::format("invalid value for {}: '{}'", name, value));
    return result;
}

} // namespace detail

setting::setting()
{
    auto console_sink                 = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    spdlog::sinks_init_list sink_list = {console_sink};
    default_logger_ = std::make_shared<spdlog::logger>("mediaserv", sink_list);
    default_logger_->set_level(spdlog::level::info);
}

setting setting::from_env()
{
    setting result;

    if (auto v = detail::get_env("MEDIASERV_HOST"))
        result.host = v;

    if (auto v = detail::get_env("MEDIASERV_PORT")) {
        result.port = static_cast<uint16_t>(
            detail::parse_number("MEDIASERV_PORT", v, std::numeric_limits<uint16_t>::max()));
    }

    if (auto v = detail::get_env("MEDIASERV_MEDIA_DIR"))
        result.media_dir = v;

    if (auto v = detail::get_env("MEDIASERV_SCAN_INTERVAL")) {
        result.scan_interval = std::chrono::seconds(detail::parse_number(
            "MEDIASERV_SCAN_INTERVAL", v, std::numeric_limits<std::int32_t>::max()));
    }

    if (auto v = detail::get_env("MEDIASERV_LOG_LEVEL")) {
        auto level = boost::algorithm::to_lower_copy(std::string(v));
        if (spdlog::level::from_str(level) == spdlog::level::off && level != "off")
            throw std::invalid_argument(
                fmt::format("invalid value for MEDIASERV_LOG_LEVEL: '{}'", v));
        result.log_level = level;
    }

    if (auto v = detail::get_env("MEDIASERV_THREADS")) {
        result.threads =
            detail::parse_number("MEDIASERV_THREADS", v, std::numeric_limits<uint16_t>::max());
    }

    return result;
}

std::size_t setting::worker_threads() const
{
    if (threads != 0)
        return threads;
    return std::max(1u, std::thread::hardware_concurrency());
}

std::shared_ptr<spdlog::logger> setting::get_logger() const
{
    if (custom_logger_)
        return custom_logger_;
    return default_logger_;
}

void setting::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    custom_logger_ = logger;
}

} // namespace mediaserv
