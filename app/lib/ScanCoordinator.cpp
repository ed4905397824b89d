#include "ScanCoordinator.hpp"
#include "Logger.hpp"
#include "RecentSet.hpp"

#include <algorithm>
#include <filesystem>
#include <unordered_set>
#include <utility>

ScanCoordinator::ScanCoordinator(FileScanner& scanner,
                                 RecentSet& recent_set,
                                 ExtensionAllowList allow_list,
                                 std::size_t root_limit)
    : scanner(scanner),
      recent_set(recent_set),
      allow_list(std::move(allow_list)),
      root_limit(root_limit)
{
}

std::vector<TrackedItem> ScanCoordinator::collect_candidates(const std::vector<WatchedRoot>& roots,
                                                             ScanReport& report) const
{
    auto logger = Logger::get_logger("core_logger");
    std::vector<TrackedItem> candidates;

    for (const auto& root : roots) {
        try {
            auto entries = scanner.get_root_entries(root, allow_list, root_limit);
            candidates.insert(candidates.end(),
                              std::make_move_iterator(entries.begin()),
                              std::make_move_iterator(entries.end()));
            ++report.roots_scanned;
        } catch (const std::filesystem::filesystem_error& ex) {
            ++report.roots_skipped;
            if (logger) {
                logger->warn("Skipping root '{}' for this pass: {}", root.path, ex.code().message());
            }
        }
    }

    report.candidates = candidates.size();
    return candidates;
}

std::vector<TrackedItem> ScanCoordinator::select_top(std::vector<TrackedItem> candidates,
                                                     std::size_t limit) const
{
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const TrackedItem& a, const TrackedItem& b) {
                         return a.timestamp > b.timestamp;
                     });

    std::vector<TrackedItem> selected;
    selected.reserve(std::min(limit, candidates.size()));
    std::unordered_set<std::string> seen_names;

    for (auto& candidate : candidates) {
        if (selected.size() >= limit) {
            break;
        }
        if (seen_names.insert(candidate.display_name).second) {
            selected.push_back(std::move(candidate));
        }
    }
    return selected;
}

ScanReport ScanCoordinator::run_pass(const std::vector<WatchedRoot>& roots) const
{
    auto logger = Logger::get_logger("core_logger");
    ScanReport report;

    recent_set.prune_missing();

    auto selected = select_top(collect_candidates(roots, report), recent_set.capacity());

    // Oldest first, so each upsert lands at or above everything fed before it
    for (auto it = selected.rbegin(); it != selected.rend(); ++it) {
        recent_set.upsert(std::move(*it));
        ++report.items_fed;
    }

    if (logger) {
        logger->info("Scan pass finished: {} root(s) scanned, {} skipped, {} candidate(s), {} fed",
                     report.roots_scanned, report.roots_skipped, report.candidates, report.items_fed);
    }
    return report;
}
