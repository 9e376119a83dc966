#pragma once
#include <filesystem>

namespace boost
{
namespace asio
{
namespace ip
{
class tcp;
}
} // namespace asio

namespace beast
{
namespace http
{
}
} // namespace beast

} // namespace boost

namespace spdlog
{
class logger;
}

namespace mediaserv
{
namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace beast = boost::beast;
namespace http = beast::http;
namespace fs = std::filesystem;


} // namespace mediaserv
