#include "mediaserv/body/media_body.hpp"
#include <boost/beast/http/error.hpp>
#include <fmt/format.h>

namespace mediaserv::body {

std::string media_body::part_header(const value_type& body, const html::byte_range& range)
{
    return fmt::format("--{}\r\nContent-Type: {}\r\nContent-Range: bytes {}-{}/{}\r\n\r\n",
                       body.boundary,
                       body.content_type,
                       range.start,
                       range.end,
                       body.file_size);
}

std::string media_body::closing_delimiter(const value_type& body)
{
    return fmt::format("--{}--\r\n", body.boundary);
}

std::uint64_t media_body::value_type::size() const
{
    if (ranges.empty())
        return file_size;
    if (ranges.size() == 1)
        return ranges.front().size();

    std::uint64_t total = 0;
    for (const auto& range : ranges)
        total += part_header(*this, range).size() + range.size() + 2;
    return total + closing_delimiter(*this).size();
}

void media_body::writer::init(beast::error_code& ec)
{
    if (!body_.file.is_open()) {
        ec = beast::errc::make_error_code(beast::errc::bad_file_descriptor);
        return;
    }
    ec = {};
}

boost::optional<std::pair<media_body::writer::const_buffers_type, bool>>
media_body::writer::get(beast::error_code& ec)
{
    if (body_.is_multipart())
        return get_multipart(ec);
    return get_single(ec);
}

boost::optional<std::pair<media_body::writer::const_buffers_type, bool>>
media_body::writer::get_single(beast::error_code& ec)
{
    if (!reader_) {
        if (body_.ranges.empty()) {
            if (body_.file_size == 0) {
                ec = {};
                return boost::none;
            }
            reader_.emplace(body_.file, 0, body_.file_size - 1);
        }
        else {
            const auto& range = body_.ranges.front();
            reader_.emplace(body_.file, range.start, range.end);
        }
    }

    auto chunk = reader_->next(ec);
    if (!chunk)
        return boost::none;

    return {{*chunk,              // buffer to return.
             !reader_->done()}}; // `true` if there are more buffers.
}

boost::optional<std::pair<media_body::writer::const_buffers_type, bool>>
media_body::writer::get_multipart(beast::error_code& ec)
{
    ec = {};
    if (range_index_ >= body_.ranges.size())
        return boost::none;

    const auto& range = body_.ranges.at(range_index_);
    switch (step_) {
        case step::header: {
            framing_ = part_header(body_, range);
            reader_.emplace(body_.file, range.start, range.end);
            step_ = step::content;
            return {{net::buffer(framing_), true}};
        }
        case step::content: {
            if (reader_->done()) {
                step_ = step::content_end;
                return get_multipart(ec);
            }
            auto chunk = reader_->next(ec);
            if (!chunk)
                return boost::none;
            return {{*chunk, true}};
        }
        case step::content_end: {
            bool is_eof = range_index_ == body_.ranges.size() - 1;
            framing_    = "\r\n";
            if (is_eof) {
                framing_ += closing_delimiter(body_);
                step_ = step::eof;
            }
            else {
                step_ = step::header;
            }
            ++range_index_;
            reader_.reset();
            return {{net::buffer(framing_), !is_eof}};
        }
        case step::eof: break;
        default: break;
    }

    return boost::none;
}

} // namespace mediaserv::body
