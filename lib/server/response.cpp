#include "mediaserv/server/response.hpp"
#include "mediaserv/html.hpp"
#include <fmt/format.h>

namespace mediaserv::server {

inline constexpr std::string_view server_name = "mediaserv";

response::response(unsigned int version, bool keep_alive)
{
    this->result(http::status::not_found);
    this->version(version);
    this->set(http::field::server, server_name);
    this->set(http::field::date, html::format_http_current_gmt_date());
    this->keep_alive(keep_alive);
}

void response::set_empty_content(http::status status)
{
    this->result(status);
    this->body() = http::empty_body::value_type {};
    this->content_length(0);
}

void response::set_error_content(http::status status)
{
    auto content = fmt::format(
        R"(<html>
<head><title>{0} {1}</title></head>
<body bgcolor="white">
<center><h1>{0} {1}</h1></center>
<hr><center>{2}</center>
</body>
</html>)",
        (int)status,
        http::obsolete_reason(status),
        server_name);

    this->set_string_content(std::move(content), "text/html; charset=utf-8", status);
}

void response::set_string_content(std::string&& data,
                                  std::string_view content_type,
                                  http::status status /*= http::status::ok*/)
{
    this->content_length(data.size());
    this->set(http::field::content_type, content_type);
    this->result(status);
    this->body() = std::move(data);
}

void response::set_media_content(body::media_body::value_type&& media, http::status status)
{
    this->result(status);
    if (media.is_multipart()) {
        this->set(http::field::content_type,
                  fmt::format("multipart/byteranges; boundary={}", media.boundary));
    }
    else {
        this->set(http::field::content_type, media.content_type);
    }
    this->content_length(media.size());
    this->body() = std::move(media);
}

} // namespace mediaserv::server
