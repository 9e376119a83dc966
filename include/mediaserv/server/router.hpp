#pragma once
#include "mediaserv/config.hpp"
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>
#include <functional>
#include <string_view>
#include <type_traits>

namespace mediaserv::server {

struct request;
struct response;

namespace helper {

template<typename T>
struct is_awaitable : std::false_type
{
};

template<typename T, typename Executor>
struct is_awaitable<net::awaitable<T, Executor>> : std::true_type
{
};

template<typename T>
constexpr inline bool is_awaitable_v = is_awaitable<std::remove_cvref_t<T>>::value;

} // namespace helper

/**
 * Maps a method and a path to a handler.
 *
 * Keys are either exact paths ("/health") or prefixes ending in "/*"
 * ("/media/*"), in which case the rest of the decoded path is available as
 * req.path_param("*"). Handlers may be plain functions or coroutines
 * returning net::awaitable<void>.
 */
class router
{
public:
    virtual ~router() = default;

public:
    template<typename Func>
    void set_http_handler(http::verb method, std::string_view key, Func&& handler)
    {
        set_http_handler_impl(method, key, make_coro_http_handler(std::forward<Func>(handler)));
    }

    template<http::verb... method, typename Func>
    void set_http_handler(std::string_view key, Func&& handler)
    {
        static_assert(sizeof...(method) >= 1, "must set method");
        (set_http_handler(method, key, handler), ...);
    }

    template<typename Func>
    void set_http_not_found_handler(Func&& handler)
    {
        set_not_found_handler_impl(make_coro_http_handler(std::forward<Func>(handler)));
    }

protected:
    using coro_http_handler_type =
        std::function<net::awaitable<void>(request& req, response& resp)>;

    template<typename Func>
    static coro_http_handler_type make_coro_http_handler(Func&& handler)
    {
        using return_type = std::invoke_result_t<std::decay_t<Func>&, request&, response&>;
        if constexpr (helper::is_awaitable_v<return_type>) {
            return coro_http_handler_type(std::forward<Func>(handler));
        }
        else {
            return [handler = std::forward<Func>(handler)](
                       request& req, response& resp) mutable -> net::awaitable<void> {
                handler(req, resp);
                co_return;
            };
        }
    }

    virtual void set_http_handler_impl(http::verb method,
                                       std::string_view key,
                                       coro_http_handler_type&& handler)      = 0;
    virtual void set_not_found_handler_impl(coro_http_handler_type&& handler) = 0;
};

} // namespace mediaserv::server
