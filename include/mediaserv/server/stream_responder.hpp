#pragma once
#include "mediaserv/catalog/media_entry.hpp"
#include "mediaserv/config.hpp"
#include "mediaserv/html/http_ranges.hpp"
#include <boost/beast/http/fields.hpp>
#include <memory>
#include <string_view>

namespace mediaserv::catalog {
class catalog_index;
}

namespace mediaserv::server {

struct request;
struct response;

/**
 * Answers playback requests for catalog entries.
 *
 * Per request: resolve the key against the catalog (404 when it is gone),
 * open the file, interpret the Range header against the length of the open
 * file, then emit 200 with the whole file, 206 with one interval, 206 with a
 * multipart/byteranges body, or 416 with the current length. The response
 * body owns the open file, so the descriptor goes away with the response
 * whatever way the transfer ends.
 */
class stream_responder
{
public:
    stream_responder(const catalog::catalog_index& catalog,
                     std::shared_ptr<spdlog::logger> logger);

    // Route handler for "/media/*".
    void operator()(request& req, response& resp) const;

    void respond(std::string_view key, const http::fields& req_header, response& resp) const;

    static std::string make_etag(const catalog::media_entry& entry);

private:
    html::range_outcome interpret(const catalog::media_entry& entry,
                                  std::uint64_t length,
                                  const http::fields& req_header) const;

    const catalog::catalog_index& catalog_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mediaserv::server
