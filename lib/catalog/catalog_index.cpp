#include "mediaserv/catalog/catalog_index.hpp"
#include "mediaserv/html.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <set>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mediaserv::catalog {

class catalog_index::walker
{
public:
    walker(const fs::path& root, spdlog::logger& logger)
        : root_(root)
        , logger_(logger)
    {
    }

    void run(std::map<std::string, media_entry>& entries)
    {
        std::error_code ec;
        if (!fs::is_directory(root_, ec)) {
            logger_.warn("media root {} is not a readable directory: {}",
                         root_.string(),
                         ec ? ec.message() : "not a directory");
            ++skipped_;
            return;
        }
        auto real_root = fs::canonical(root_, ec);
        if (ec) {
            logger_.warn("canonical({}) failed: {}", root_.string(), ec.message());
            ++skipped_;
            return;
        }
        visited_dirs_.insert(real_root);
        walk(root_, fs::path(), entries);
    }

    std::size_t skipped() const { return skipped_; }

private:
    void skip(const fs::path& path, const std::error_code& ec)
    {
        logger_.warn("scan skipped {}: {}", path.string(), ec.message());
        ++skipped_;
    }

    void walk(const fs::path& dir,
              const fs::path& relative,
              std::map<std::string, media_entry>& entries)
    {
        std::error_code ec;
        fs::directory_iterator iter(dir, ec);
        if (ec) {
            skip(dir, ec);
            return;
        }

        for (; iter != fs::directory_iterator(); iter.increment(ec)) {
            if (ec) {
                skip(dir, ec);
                return;
            }
            const auto& path = iter->path();
            auto name        = path.filename().string();
            if (name.empty() || name.front() == '.')
                continue;

            // status() follows symbolic links
            auto status = iter->status(ec);
            if (!ec && status.type() == fs::file_type::not_found)
                ec = std::make_error_code(std::errc::no_such_file_or_directory);
            if (ec) {
                skip(path, ec);
                continue;
            }

            if (fs::is_directory(status)) {
                auto real_path = fs::canonical(path, ec);
                if (ec) {
                    skip(path, ec);
                    continue;
                }
                if (!visited_dirs_.insert(real_path).second) {
                    logger_.debug("scan: {} already visited as {}", path.string(), real_path.string());
                    continue;
                }
                walk(path, relative / name, entries);
                continue;
            }

            if (!fs::is_regular_file(status))
                continue;

            auto kind = container_from_extension(path);
            if (!kind)
                continue;

            add_file(path, relative / name, *kind, entries);
        }
        if (ec)
            skip(dir, ec);
    }

    void add_file(const fs::path& path,
                  const fs::path& relative,
                  container_kind kind,
                  std::map<std::string, media_entry>& entries)
    {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec) {
            skip(path, ec);
            return;
        }
        if (size == 0)
            return;

        auto mtime = html::file_last_write_time(path, ec);
        if (ec) {
            skip(path, ec);
            return;
        }

        auto real_path = fs::canonical(path, ec);
        if (ec) {
            skip(path, ec);
            return;
        }
        if (!visited_files_.insert(real_path).second) {
            logger_.debug("scan: {} already listed as {}", path.string(), real_path.string());
            return;
        }

        media_entry entry;
        entry.key             = relative.generic_string();
        entry.path            = fs::absolute(path, ec);
        if (ec)
            entry.path = path;
        entry.size            = size;
        entry.last_write_time = mtime;
        entry.kind            = kind;
        entries.emplace(entry.key, std::move(entry));
    }

    const fs::path& root_;
    spdlog::logger& logger_;

    std::set<fs::path> visited_dirs_;
    std::set<fs::path> visited_files_;
    std::size_t skipped_ = 0;
};

catalog_index::catalog_index(fs::path root)
    : root_(std::move(root))
    , snapshot_(std::make_shared<const catalog_snapshot>())
{
    auto console_sink                 = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    spdlog::sinks_init_list sink_list = {console_sink};
    default_logger_ = std::make_shared<spdlog::logger>("mediaserv.catalog", sink_list);
    default_logger_->set_level(spdlog::level::info);
}

catalog_index::~catalog_index()
{
}

const fs::path& catalog_index::root() const
{
    return root_;
}

scan_report catalog_index::scan()
{
    std::lock_guard scan_lck(scan_mutex_);

    auto start_time = std::chrono::steady_clock::now();
    auto logger     = get_logger();

    auto next = std::make_shared<catalog_snapshot>();
    walker w(root_, *logger);
    w.run(next->entries);
    next->scanned_at = std::chrono::system_clock::now();

    scan_report report;
    report.entries = next->entries.size();
    report.skipped = w.skipped();

    auto previous = snapshot();
    log_changes(*previous, *next, report);

    {
        std::lock_guard lck(snapshot_mutex_);
        snapshot_ = std::move(next);
    }

    auto span_time = std::chrono::steady_clock::now() - start_time;
    logger->info("scanned {}: {} entries, {} added, {} removed, {} modified, {} renamed, "
                 "{} skipped ({}ms)",
                 root_.string(),
                 report.entries,
                 report.added,
                 report.removed,
                 report.modified,
                 report.renamed,
                 report.skipped,
                 std::chrono::duration_cast<std::chrono::milliseconds>(span_time).count());
    return report;
}

void catalog_index::log_changes(const catalog_snapshot& before,
                                const catalog_snapshot& after,
                                scan_report& report) const
{
    auto logger = get_logger();

    std::vector<const media_entry*> added;
    std::vector<const media_entry*> removed;

    for (const auto& [key, entry] : after.entries) {
        auto iter = before.entries.find(key);
        if (iter == before.entries.end()) {
            added.push_back(&entry);
            continue;
        }
        if (iter->second.size != entry.size ||
            iter->second.last_write_time != entry.last_write_time)
        {
            ++report.modified;
            logger->debug("catalog: {} modified", key);
        }
    }
    for (const auto& [key, entry] : before.entries) {
        if (after.entries.find(key) == after.entries.end())
            removed.push_back(&entry);
    }

    // A file that vanished under one key and appeared under another with the same
    // size and modification time has most likely been moved.
    for (auto& gone : removed) {
        auto iter = std::find_if(added.begin(), added.end(), [&](const media_entry* e) {
            return e && e->size == gone->size && e->last_write_time == gone->last_write_time &&
                   e->kind == gone->kind;
        });
        if (iter == added.end())
            continue;

        logger->info("catalog: {} renamed to {}", gone->key, (*iter)->key);
        ++report.renamed;
        *iter = nullptr;
        gone  = nullptr;
    }

    for (const auto* entry : added) {
        if (!entry)
            continue;
        ++report.added;
        logger->debug("catalog: {} added", entry->key);
    }
    for (const auto* entry : removed) {
        if (!entry)
            continue;
        ++report.removed;
        logger->debug("catalog: {} removed", entry->key);
    }
}

std::optional<media_entry> catalog_index::resolve(std::string_view key) const
{
    auto current = snapshot();
    auto iter    = current->entries.find(std::string(key));
    if (iter == current->entries.end())
        return std::nullopt;

    media_entry entry = iter->second;

    std::error_code ec;
    auto status = fs::status(entry.path, ec);
    if (ec || !fs::is_regular_file(status)) {
        get_logger()->debug("resolve {}: {} is gone", key, entry.path.string());
        return std::nullopt;
    }

    entry.size = fs::file_size(entry.path, ec);
    if (ec)
        return std::nullopt;

    entry.last_write_time = html::file_last_write_time(entry.path, ec);
    if (ec)
        return std::nullopt;

    return entry;
}

std::shared_ptr<const catalog_snapshot> catalog_index::snapshot() const
{
    std::lock_guard lck(snapshot_mutex_);
    return snapshot_;
}

std::vector<catalog_item> catalog_index::list(sort_field field, sort_order order) const
{
    auto current = snapshot();

    std::vector<catalog_item> items;
    items.reserve(current->entries.size());
    for (const auto& [key, entry] : current->entries) {
        items.push_back(
            catalog_item {key, entry.display_name(), entry.size, entry.last_write_time, entry.kind});
    }

    auto less = [field](const catalog_item& a, const catalog_item& b) {
        switch (field) {
            case sort_field::date: return a.last_write_time < b.last_write_time;
            case sort_field::size: return a.size < b.size;
            case sort_field::name:
            default: return boost::algorithm::ilexicographical_compare(a.name, b.name);
        }
    };
    if (order == sort_order::asc)
        std::stable_sort(items.begin(), items.end(), less);
    else
        std::stable_sort(items.begin(), items.end(), [&](const auto& a, const auto& b) {
            return less(b, a);
        });
    return items;
}

library_stats catalog_index::stats() const
{
    auto current = snapshot();

    library_stats stats;
    stats.total = current->entries.size();
    for (const auto& [key, entry] : current->entries)
        ++stats.by_kind[entry.kind];
    return stats;
}

std::shared_ptr<spdlog::logger> catalog_index::get_logger() const
{
    if (custom_logger_)
        return custom_logger_;
    return default_logger_;
}

void catalog_index::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    custom_logger_ = logger;
}

} // namespace mediaserv::catalog
