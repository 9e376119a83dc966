#include "router_impl.h"
#include <algorithm>

namespace mediaserv::server {

void router_impl::set_http_handler_impl(http::verb method,
                                        std::string_view key,
                                        coro_http_handler_type&& handler)
{
    if (key.ends_with("/*")) {
        auto prefix = std::string(key.substr(0, key.size() - 1));
        auto iter   = std::find_if(wildcard_routes_.begin(),
                                 wildcard_routes_.end(),
                                 [&](const wildcard_entry& e) { return e.prefix == prefix; });
        if (iter == wildcard_routes_.end()) {
            wildcard_routes_.push_back(wildcard_entry {prefix, {}});
            std::stable_sort(wildcard_routes_.begin(),
                             wildcard_routes_.end(),
                             [](const wildcard_entry& a, const wildcard_entry& b) {
                                 return a.prefix.size() > b.prefix.size();
                             });
            iter = std::find_if(wildcard_routes_.begin(),
                                wildcard_routes_.end(),
                                [&](const wildcard_entry& e) { return e.prefix == prefix; });
        }
        iter->handlers[method] = std::move(handler);
        return;
    }
    static_routes_[std::string(key)][method] = std::move(handler);
}

void router_impl::set_not_found_handler_impl(coro_http_handler_type&& handler)
{
    not_found_handler_ = std::move(handler);
}

net::awaitable<void> router_impl::proc_routing(request& req, response& resp) const
{
    auto path = req.path();

    if (auto iter = static_routes_.find(std::string(path)); iter != static_routes_.end()) {
        if (auto h = iter->second.find(req.method()); h != iter->second.end()) {
            co_await h->second(req, resp);
            co_return;
        }
    }

    for (const auto& entry : wildcard_routes_) {
        if (!path.starts_with(entry.prefix) || path.size() == entry.prefix.size())
            continue;
        auto h = entry.handlers.find(req.method());
        if (h == entry.handlers.end())
            continue;

        req.add_path_param("*", std::string(path.substr(entry.prefix.size())));
        co_await h->second(req, resp);
        co_return;
    }

    if (not_found_handler_) {
        co_await not_found_handler_(req, resp);
        co_return;
    }
    resp.set_error_content(http::status::not_found);
}

} // namespace mediaserv::server
