#pragma once
#include "mediaserv/body/any_body.hpp"
#include "mediaserv/config.hpp"
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <string>
#include <string_view>

namespace mediaserv::server {

struct response : public http::response<body::any_body>
{
public:
    using http::response<body::any_body>::message;

    response(unsigned int version, bool keep_alive);

    void set_empty_content(http::status status);
    void set_error_content(http::status status);

    void set_string_content(std::string_view data,
                            std::string_view content_type,
                            http::status status = http::status::ok)
    {
        set_string_content(std::string(data), content_type, status);
    }
    void set_string_content(std::string&& data,
                            std::string_view content_type,
                            http::status status = http::status::ok);

    // Content-Type and Content-Length follow from the body; range related
    // headers are the caller's business.
    void set_media_content(body::media_body::value_type&& media, http::status status);
};

} // namespace mediaserv::server
