#include "mediaserv/catalog/media_entry.hpp"
#include <boost/algorithm/string/predicate.hpp>

namespace mediaserv::catalog {

std::string_view to_string(container_kind kind)
{
    switch (kind) {
        case container_kind::mp4: return "mp4";
        case container_kind::mkv: return "mkv";
    }
    return "mp4";
}

std::string_view content_type(container_kind kind)
{
    switch (kind) {
        case container_kind::mp4: return "video/mp4";
        case container_kind::mkv: return "video/x-matroska";
    }
    return "application/octet-stream";
}

std::optional<container_kind> container_from_extension(const fs::path& path)
{
    auto ext = path.extension().string();
    if (boost::algorithm::iequals(ext, ".mp4"))
        return container_kind::mp4;
    if (boost::algorithm::iequals(ext, ".mkv"))
        return container_kind::mkv;
    return std::nullopt;
}

std::string media_entry::display_name() const
{
    return path.stem().string();
}

} // namespace mediaserv::catalog
