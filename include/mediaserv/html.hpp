#pragma once
#include "mediaserv/config.hpp"
#include "mediaserv/html/http_ranges.hpp"
#include <ctime>
#include <string>
#include <system_error>

namespace mediaserv {
namespace html {

std::time_t file_last_write_time(const fs::path& path, std::error_code& ec);
std::time_t to_time_t(const fs::file_time_type& ftime);

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string format_http_gmt_date(const std::time_t& time);
std::string format_http_current_gmt_date();

std::string generate_boundary();

} // namespace html
} // namespace mediaserv
