#include "mediaserv/body/any_body.hpp"

namespace mediaserv::body {

std::uint64_t any_body::size(const value_type& body)
{
    return std::visit(
        [](const auto& t) -> std::uint64_t {
            using value_type = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<value_type, http::empty_body::value_type>)
                return 0;
            else
                return t.size();
        },
        static_cast<const std::variant<http::empty_body::value_type,
                                       std::string,
                                       media_body::value_type>&>(body));
}

} // namespace mediaserv::body
