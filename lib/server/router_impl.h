#pragma once
#include "mediaserv/server/request.hpp"
#include "mediaserv/server/response.hpp"
#include "mediaserv/server/router.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace mediaserv::server {

class router_impl : public router
{
public:
    router_impl() = default;

    net::awaitable<void> proc_routing(request& req, response& resp) const;

protected:
    void set_http_handler_impl(http::verb method,
                               std::string_view key,
                               coro_http_handler_type&& handler) override;
    void set_not_found_handler_impl(coro_http_handler_type&& handler) override;

private:
    using handler_map = std::unordered_map<http::verb, coro_http_handler_type>;

    struct wildcard_entry
    {
        std::string prefix; // key without the trailing '*'
        handler_map handlers;
    };

    std::unordered_map<std::string, handler_map> static_routes_;
    std::vector<wildcard_entry> wildcard_routes_; // longest prefix first

    coro_http_handler_type not_found_handler_;
};

} // namespace mediaserv::server
