#pragma once
#include "mediaserv/config.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace mediaserv::util {

// co_await op(..., net_awaitable[ec]) stores the failure in ec instead of throwing.
struct net_awaitable_t
{
    auto operator[](boost::system::error_code& ec) const
    {
        return net::redirect_error(net::use_awaitable, ec);
    }
};

inline constexpr net_awaitable_t net_awaitable {};

} // namespace mediaserv::util
