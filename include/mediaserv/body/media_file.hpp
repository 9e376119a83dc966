#pragma once
#include "mediaserv/config.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/file.hpp>
#include <boost/optional.hpp>
#include <cstdint>
#include <vector>

namespace mediaserv::body {

// Read-only handle on one media file. Closed on destruction.
class media_file
{
public:
    media_file() = default;
    media_file(media_file&&) = default;
    media_file& operator=(media_file&&) = default;
    ~media_file() = default;

    void open(const fs::path& path, beast::error_code& ec);
    bool is_open() const;
    void close();

    // Measured on the open descriptor, so it reflects the file as it is now.
    std::uint64_t size(beast::error_code& ec) const;

    void seek(std::uint64_t offset, beast::error_code& ec);
    std::size_t read(void* buffer, std::size_t n, beast::error_code& ec);

private:
    beast::file file_;
};

/**
 * Forward-only sequence of chunks covering [start, end] of a media_file.
 *
 * Each call to next() yields at most chunk_size bytes, in ascending offset
 * order, and boost::none once the interval is exhausted. If the file ends
 * before `end`, next() sets http::error::short_read and yields nothing; the
 * interval is never padded. The sequence cannot be rewound: reading the
 * interval again needs a new chunk_reader.
 */
class chunk_reader
{
public:
    static constexpr std::size_t chunk_size = 256 * 1024;

    chunk_reader(media_file& file, std::uint64_t start, std::uint64_t end);

    boost::optional<net::const_buffer> next(beast::error_code& ec);

    std::uint64_t remaining() const { return remaining_; }
    bool done() const { return remaining_ == 0; }

private:
    media_file& file_;
    std::uint64_t pos_;
    std::uint64_t remaining_;
    bool seeked_ = false;
    std::vector<char> buf_;
};

} // namespace mediaserv::body
