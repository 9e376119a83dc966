#pragma once
#include "mediaserv/catalog/media_entry.hpp"
#include "mediaserv/config.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediaserv::catalog {

// Immutable result of one scan. Replaced wholesale, never edited.
struct catalog_snapshot
{
    std::map<std::string, media_entry> entries;
    std::chrono::system_clock::time_point scanned_at;
};

struct scan_report
{
    std::size_t entries  = 0;
    std::size_t added    = 0;
    std::size_t removed  = 0;
    std::size_t modified = 0;
    std::size_t renamed  = 0;
    std::size_t skipped  = 0; // unreadable paths
};

struct library_stats
{
    std::size_t total = 0;
    std::map<container_kind, std::size_t> by_kind;
};

enum class sort_field
{
    name,
    date,
    size
};

enum class sort_order
{
    asc,
    desc
};

class catalog_index
{
public:
    explicit catalog_index(fs::path root);
    ~catalog_index();

    catalog_index(const catalog_index&)            = delete;
    catalog_index& operator=(const catalog_index&) = delete;

public:
    const fs::path& root() const;

    /**
     * Walks the root and publishes a new snapshot.
     *
     * Unreadable paths are logged and skipped. Concurrent scans are serialized;
     * concurrent resolve() calls keep reading the previous snapshot until the
     * new one is published.
     */
    scan_report scan();

    // Re-stats the file behind key. nullopt when the key is unknown or the file is
    // gone or no longer a regular file.
    std::optional<media_entry> resolve(std::string_view key) const;

    std::shared_ptr<const catalog_snapshot> snapshot() const;

    std::vector<catalog_item> list(sort_field field = sort_field::name,
                                   sort_order order = sort_order::asc) const;
    library_stats stats() const;

    std::shared_ptr<spdlog::logger> get_logger() const;
    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    class walker;

    void log_changes(const catalog_snapshot& before,
                     const catalog_snapshot& after,
                     scan_report& report) const;

    fs::path root_;

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const catalog_snapshot> snapshot_;

    std::mutex scan_mutex_;

    std::shared_ptr<spdlog::logger> default_logger_;
    std::shared_ptr<spdlog::logger> custom_logger_;
};

} // namespace mediaserv::catalog
