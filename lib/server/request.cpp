#include "mediaserv/server/request.hpp"
#include "mediaserv/util/misc.hpp"

namespace mediaserv::server {

request::request(const tcp::endpoint& local_endpoint,
                 const tcp::endpoint& remote_endpoint,
                 http::request<http::string_body>&& other)
    : http::request<http::string_body>(std::move(other))
    , local_endpoint_(local_endpoint)
    , remote_endpoint_(remote_endpoint)
{
    auto target = this->target();
    if (auto pos = target.find('?'); pos == std::string_view::npos)
        this->decoded_path_ = util::url_decode(target);
    else
        this->decoded_path_ = util::url_decode(target.substr(0, pos));
}

request& request::operator=(request&& other) noexcept
{
    if (this == std::addressof(other))
        return *this;

    http::request<http::string_body>::operator=(std::move(other));
    decoded_path_    = std::move(other.decoded_path_);
    local_endpoint_  = std::move(other.local_endpoint_);
    remote_endpoint_ = std::move(other.remote_endpoint_);
    path_params_     = std::move(other.path_params_);
    return *this;
}

request::request(request&& other) noexcept
{
    request::operator=(std::move(other));
}

request::~request()
{
}

std::string_view request::path() const
{
    if (this->decoded_path_.empty())
        return this->target();

    return this->decoded_path_;
}

const tcp::endpoint& request::local_endpoint() const
{
    return this->local_endpoint_;
}

const tcp::endpoint& request::remote_endpoint() const
{
    return this->remote_endpoint_;
}

std::string_view request::path_param(const std::string& key) const
{
    return path_params_.at(key);
}

void request::add_path_param(const std::string& key, const std::string& val)
{
    path_params_[key] = val;
}

void request::set_path_param(std::unordered_map<std::string, std::string>&& params)
{
    path_params_ = std::move(params);
}

} // namespace mediaserv::server
