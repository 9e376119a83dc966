#pragma once
#include "mediaserv/config.hpp"
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace mediaserv::catalog {

enum class container_kind
{
    mp4,
    mkv
};

std::string_view to_string(container_kind kind);
std::string_view content_type(container_kind kind);

// Case-insensitive match on ".mp4" / ".mkv".
std::optional<container_kind> container_from_extension(const fs::path& path);

struct media_entry
{
    std::string key;  // relative path from the scan root, '/' separated
    fs::path path;    // absolute
    std::uint64_t size = 0;
    std::time_t last_write_time = 0;
    container_kind kind = container_kind::mp4;

    std::string display_name() const;
};

// What listing collaborators get to see: no filesystem path.
struct catalog_item
{
    std::string key;
    std::string name;
    std::uint64_t size = 0;
    std::time_t last_write_time = 0;
    container_kind kind = container_kind::mp4;
};

} // namespace mediaserv::catalog
