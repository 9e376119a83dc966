#pragma once
#include "mediaserv/config.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mediaserv::server {

struct request : public http::request<http::string_body>
{
public:
    request(const tcp::endpoint& local_endpoint,
            const tcp::endpoint& remote_endpoint,
            http::request<http::string_body>&& other);

    request& operator=(request&& other) noexcept;
    request(request&& other) noexcept;

    ~request();

public:
    // Percent-decoded target without the query string.
    std::string_view path() const;

    const tcp::endpoint& local_endpoint() const;
    const tcp::endpoint& remote_endpoint() const;

    std::string_view path_param(const std::string& key) const;
    void add_path_param(const std::string& key, const std::string& val);
    void set_path_param(std::unordered_map<std::string, std::string>&& params);

private:
    std::string decoded_path_;

    tcp::endpoint local_endpoint_;
    tcp::endpoint remote_endpoint_;

    std::unordered_map<std::string, std::string> path_params_;
};

} // namespace mediaserv::server
