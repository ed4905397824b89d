#ifndef SCAN_COORDINATOR_HPP
#define SCAN_COORDINATOR_HPP

#include "ExtensionAllowList.hpp"
#include "FileScanner.hpp"
#include "Types.hpp"

#include <cstddef>
#include <vector>

class RecentSet;

class ScanCoordinator {
public:
    ScanCoordinator(FileScanner& scanner,
                    RecentSet& recent_set,
                    ExtensionAllowList allow_list,
                    std::size_t root_limit = FileScanner::kDefaultRootLimit);

    /**
     * @brief One full reconciliation pass over roots.
     *
     * Prunes vanished entries, lists every root (skipping ones that fail),
     * and feeds the newest capacity() candidates into the recent set.
     * Safe to repeat; each pass has the same semantics.
     */
    ScanReport run_pass(const std::vector<WatchedRoot>& roots) const;

    /// Every candidate from every readable root, unranked.
    std::vector<TrackedItem> collect_candidates(const std::vector<WatchedRoot>& roots,
                                                ScanReport& report) const;

    /// Newest candidate per display name, best first, at most limit entries.
    std::vector<TrackedItem> select_top(std::vector<TrackedItem> candidates,
                                        std::size_t limit) const;

private:
    FileScanner& scanner;
    RecentSet& recent_set;
    ExtensionAllowList allow_list;
    std::size_t root_limit;
};

#endif
