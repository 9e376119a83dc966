#include "mediaserv/server/stream_responder.hpp"
#include "mediaserv/body/media_body.hpp"
#include "mediaserv/catalog/catalog_index.hpp"
#include "mediaserv/html.hpp"
#include "mediaserv/server/request.hpp"
#include "mediaserv/server/response.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace mediaserv::server {

stream_responder::stream_responder(const catalog::catalog_index& catalog,
                                   std::shared_ptr<spdlog::logger> logger)
    : catalog_(catalog)
    , logger_(std::move(logger))
{
}

void stream_responder::operator()(request& req, response& resp) const
{
    respond(req.path_param("*"), req.base(), resp);
}

std::string stream_responder::make_etag(const catalog::media_entry& entry)
{
    return fmt::format("\"{}-{}\"", entry.size, static_cast<long long>(entry.last_write_time));
}

void stream_responder::respond(std::string_view key,
                               const http::fields& req_header,
                               response& resp) const
{
    if (key.empty()) {
        resp.set_error_content(http::status::not_found);
        return;
    }

    // resolve
    auto entry = catalog_.resolve(key);
    if (!entry) {
        logger_->debug("media {} not found", key);
        resp.set_error_content(http::status::not_found);
        return;
    }

    body::media_body::value_type media;
    beast::error_code ec;
    media.file.open(entry->path, ec);
    if (ec) {
        logger_->debug("media {} could not be opened: {}", key, ec.message());
        resp.set_error_content(http::status::not_found);
        return;
    }
    auto length = media.file.size(ec);
    if (ec) {
        logger_->warn("media {} size unavailable: {}", key, ec.message());
        resp.set_error_content(http::status::not_found);
        return;
    }

    // the open descriptor is the source of truth from here on
    entry->size = length;

    resp.set(http::field::accept_ranges, "bytes");

    // interpret
    auto outcome = interpret(*entry, length, req_header);

    // dispatch
    if (outcome.is_unsatisfiable()) {
        resp.set(http::field::content_range, fmt::format("bytes */{}", length));
        resp.set_empty_content(http::status::range_not_satisfiable);
        return;
    }

    resp.set(http::field::etag, make_etag(*entry));
    resp.set(http::field::last_modified, html::format_http_gmt_date(entry->last_write_time));

    media.file_size    = length;
    media.content_type = std::string(catalog::content_type(entry->kind));

    if (outcome.is_full_content()) {
        resp.set_media_content(std::move(media), http::status::ok);
        return;
    }

    media.ranges = outcome.ranges();
    if (media.ranges.size() == 1) {
        const auto& range = media.ranges.front();
        resp.set(http::field::content_range,
                 fmt::format("bytes {}-{}/{}", range.start, range.end, length));
    }
    else {
        media.boundary = html::generate_boundary();
    }
    resp.set_media_content(std::move(media), http::status::partial_content);
}

html::range_outcome stream_responder::interpret(const catalog::media_entry& entry,
                                                std::uint64_t length,
                                                const http::fields& req_header) const
{
    auto range_iter = req_header.find(http::field::range);
    if (range_iter == req_header.end())
        return html::range_outcome::full_content(length);

    // A stale validator means the client's idea of the file is out of date:
    // send the whole thing instead of pieces of something else.
    // Weak validators never match (RFC 7233 section 3.2).
    if (auto if_range = req_header.find(http::field::if_range); if_range != req_header.end()) {
        auto validator = if_range->value();
        if (validator.starts_with("W/") ||
            (validator != make_etag(entry) &&
             validator != html::format_http_gmt_date(entry.last_write_time)))
        {
            return html::range_outcome::full_content(length);
        }
    }

    return html::http_ranges::parse(range_iter->value(), length);
}

} // namespace mediaserv::server
