#include "FileScanner.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <optional>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

struct FileScanner::ScanContext {
    const ExtensionAllowList* allow_list{nullptr};
    bool uses_access_semantics{false};
    std::shared_ptr<spdlog::logger> logger;
};

FileScanner::FileScanner(FileTimesReader read_times)
    : read_times_(read_times ? std::move(read_times) : FileTimesReader(&Utils::read_file_times))
{
}

std::vector<TrackedItem>
FileScanner::get_root_entries(const WatchedRoot& root,
                              const ExtensionAllowList& allow_list,
                              std::size_t limit) const
{
    std::vector<TrackedItem> entries;
    auto logger = Logger::get_logger("core_logger");

    if (logger) {
        logger->debug("Scanning '{}' (limit {}, access time: {})",
                      root.path, limit, root.uses_access_semantics);
    }

    ScanContext context;
    context.allow_list = &allow_list;
    context.uses_access_semantics = root.uses_access_semantics;
    context.logger = logger;

    try {
        const fs::path scan_path = Utils::utf8_to_path(root.path);
        for (const auto &entry : fs::directory_iterator(scan_path)) {
            if (entries.size() >= limit) {
                if (logger) {
                    logger->warn("Hit the limit of {} files in '{}'", limit, root.path);
                }
                break;
            }
            if (auto entry_info = build_entry(entry, context)) {
                entries.push_back(std::move(*entry_info));
            }
        }
    } catch (const fs::filesystem_error& ex) {
        if (logger) {
            logger->warn("Error while scanning '{}': {}", root.path, ex.what());
        }
        throw;
    }

    if (logger) {
        logger->info("Scan complete for '{}': {} candidate(s)", root.path, entries.size());
    }

    return entries;
}


bool FileScanner::is_file_hidden(const std::string& file_name) const {
    return file_name.starts_with(".");
}


bool FileScanner::is_junk_file(const std::string& name) const {
    static const std::unordered_set<std::string> junk = {
        ".DS_Store", "Thumbs.db", "desktop.ini"
    };
    return junk.contains(name);
}


std::optional<TrackedItem> FileScanner::build_entry(const fs::directory_entry& entry,
                                                    const ScanContext& context) const
{
    const fs::path& entry_path = entry.path();
    std::string full_path = Utils::path_to_utf8(entry_path);
    std::string file_name = Utils::path_to_utf8(entry_path.filename());

    if (should_skip_entry(file_name, context, full_path)) {
        return std::nullopt;
    }

    const auto times = read_times_(full_path);
    if (!times) {
        if (context.logger) {
            context.logger->debug("Could not read attributes for '{}'", full_path);
        }
        return std::nullopt;
    }

    return make_tracked_item(full_path,
                             primary_timestamp(*times, context.uses_access_semantics),
                             *context.allow_list);
}

bool FileScanner::should_skip_entry(const std::string& file_name,
                                    const ScanContext& context,
                                    const std::string& full_path) const
{
    if (is_junk_file(file_name)) {
        return true;
    }

    if (is_file_hidden(file_name)) {
        if (context.logger) {
            context.logger->trace("Skipping hidden entry '{}'", full_path);
        }
        return true;
    }

    return !context.allow_list->accepts(full_path);
}
