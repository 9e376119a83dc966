#pragma once
#include "mediaserv/body/media_file.hpp"
#include "mediaserv/config.hpp"
#include "mediaserv/html/http_ranges.hpp"
#include <boost/beast/http/message.hpp>
#include <boost/optional.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mediaserv::body {

/**
 * Body that streams byte intervals of an open media file.
 *
 * With no ranges the whole file is written. One range is written bare, as
 * the payload of a 206 response. Two or more ranges are framed as
 * multipart/byteranges using `boundary`, each part carrying its own
 * Content-Type and Content-Range, in the order of `ranges`.
 */
struct media_body
{
    struct value_type
    {
        media_file file;
        std::uint64_t file_size = 0;
        std::vector<html::byte_range> ranges;
        std::string content_type;
        std::string boundary;

        bool is_multipart() const { return ranges.size() > 1; }

        // Exact number of bytes the writer will produce, framing included.
        std::uint64_t size() const;
    };

    static std::uint64_t size(const value_type& body) { return body.size(); }

    static std::string part_header(const value_type& body, const html::byte_range& range);
    static std::string closing_delimiter(const value_type& body);

    class writer
    {
    public:
        using const_buffers_type = net::const_buffer;

        template<bool isRequest, class Fields>
        writer(http::header<isRequest, Fields>&, value_type& b)
            : body_(b)
        {
        }

        void init(beast::error_code& ec);
        boost::optional<std::pair<const_buffers_type, bool>> get(beast::error_code& ec);

    private:
        boost::optional<std::pair<const_buffers_type, bool>> get_single(beast::error_code& ec);
        boost::optional<std::pair<const_buffers_type, bool>> get_multipart(beast::error_code& ec);

        value_type& body_;

        std::size_t range_index_ = 0;
        std::optional<chunk_reader> reader_;
        enum class step
        {
            header,
            content,
            content_end,
            eof
        };
        step step_ = step::header;
        std::string framing_;
    };
};

} // namespace mediaserv::body
