#include "mediaserv/body/media_file.hpp"
#include <algorithm>
#include <boost/beast/core/detail/clamp.hpp>
#include <boost/beast/http/error.hpp>

namespace mediaserv::body {

void media_file::open(const fs::path& path, beast::error_code& ec)
{
    file_.open(path.string().c_str(), beast::file_mode::scan, ec);
}

bool media_file::is_open() const
{
    return file_.is_open();
}

void media_file::close()
{
    beast::error_code ec;
    file_.close(ec);
}

std::uint64_t media_file::size(beast::error_code& ec) const
{
    return file_.size(ec);
}

void media_file::seek(std::uint64_t offset, beast::error_code& ec)
{
    file_.seek(offset, ec);
}

std::size_t media_file::read(void* buffer, std::size_t n, beast::error_code& ec)
{
    return file_.read(buffer, n, ec);
}

chunk_reader::chunk_reader(media_file& file, std::uint64_t start, std::uint64_t end)
    : file_(file)
    , pos_(start)
    , remaining_(end >= start ? end - start + 1 : 0)
{
}

boost::optional<net::const_buffer> chunk_reader::next(beast::error_code& ec)
{
    ec = {};
    if (remaining_ == 0)
        return boost::none;

    if (!seeked_) {
        file_.seek(pos_, ec);
        if (ec)
            return boost::none;
        seeked_ = true;
        buf_.resize(static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size, remaining_)));
    }

    std::size_t const n = (std::min)(buf_.size(), beast::detail::clamp(remaining_));
    auto const nread    = file_.read(buf_.data(), n, ec);
    if (ec)
        return boost::none;
    if (nread == 0) {
        // the file got shorter than the interval we promised
        ec = http::error::short_read;
        return boost::none;
    }
    pos_ += nread;
    remaining_ -= nread;
    return net::const_buffer(buf_.data(), nread);
}

} // namespace mediaserv::body
