#pragma once
#include "mediaserv/body/media_body.hpp"
#include "mediaserv/config.hpp"
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/string_body.hpp>
#include <memory>
#include <type_traits>
#include <variant>

namespace mediaserv::body {

// Response body that can hold any of the body kinds the server produces.
struct any_body
{
    // 辅助模板：匹配 body_value_type 对应的 Body 类型
    template<typename T, typename... Bodies>
    struct match_body;

    template<typename T, typename Body, typename... Bodies>
    struct match_body<T, Body, Bodies...>
    {
        using type = std::conditional_t<std::is_same_v<T, typename Body::value_type>,
                                        Body,
                                        typename match_body<T, Bodies...>::type>;
    };

    template<typename T>
    struct match_body<T>
    {
        using type = void;
    };

    template<typename... Bodies>
    class variant_value : public std::variant<typename Bodies::value_type...>
    {
    public:
        using std::variant<typename Bodies::value_type...>::variant;
        using std::variant<typename Bodies::value_type...>::operator=;

    public:
        template<typename Body>
        bool is_body_type() const
        {
            return std::holds_alternative<typename Body::value_type>(*this);
        }

        template<class Body>
        typename Body::value_type& as() &
        {
            using body_type = typename match_body<typename Body::value_type, Bodies...>::type;
            static_assert(!std::is_void_v<body_type>, "No matching Body type found");
            return std::get<typename Body::value_type>(*this);
        }

        template<class Body>
        const typename Body::value_type& as() const&
        {
            using body_type = typename match_body<typename Body::value_type, Bodies...>::type;
            static_assert(!std::is_void_v<body_type>, "No matching Body type found");
            return std::get<typename Body::value_type>(*this);
        }

        template<typename Func>
        decltype(auto) visit_body(Func&& func)
        {
            return std::visit(
                [&](auto& t) -> decltype(auto) {
                    using value_type = std::decay_t<decltype(t)>;
                    using body_type  = typename match_body<value_type, Bodies...>::type;
                    static_assert(!std::is_void_v<body_type>, "No matching Body type found");
                    return func(std::type_identity<body_type> {}, t);
                },
                static_cast<std::variant<typename Bodies::value_type...>&>(*this));
        }
    };

    using value_type = variant_value<http::empty_body, http::string_body, media_body>;

    static std::uint64_t size(const value_type& body);

    class writer
    {
    public:
        using const_buffers_type = net::const_buffer;

        template<bool isRequest, class Fields>
        explicit writer(http::header<isRequest, Fields>& h, value_type& b)
        {
            proxy_ = b.visit_body([&](auto type, auto& t) -> std::unique_ptr<proxy_writer> {
                using body_type = typename decltype(type)::type;
                return std::make_unique<proxy_writer_impl<body_type, isRequest, Fields>>(h, t);
            });
        }

        void init(beast::error_code& ec) { proxy_->init(ec); }
        boost::optional<std::pair<const_buffers_type, bool>> get(beast::error_code& ec)
        {
            return proxy_->get(ec);
        }

    private:
        class proxy_writer
        {
        public:
            virtual ~proxy_writer()                   = default;
            virtual void init(beast::error_code& ec) = 0;
            virtual boost::optional<std::pair<const_buffers_type, bool>>
            get(beast::error_code& ec) = 0;
        };

        template<class Body, bool isRequest, class Fields>
        class proxy_writer_impl : public proxy_writer
        {
        public:
            proxy_writer_impl(http::header<isRequest, Fields>& h, typename Body::value_type& b)
                : writer_(h, b)
            {
            }
            void init(beast::error_code& ec) override { writer_.init(ec); }
            boost::optional<std::pair<const_buffers_type, bool>>
            get(beast::error_code& ec) override
            {
                auto result = writer_.get(ec);
                if (!result)
                    return boost::none;
                return std::make_pair(const_buffers_type(result->first), result->second);
            }

        private:
            typename Body::writer writer_;
        };

        std::unique_ptr<proxy_writer> proxy_;
    };
};

} // namespace mediaserv::body
