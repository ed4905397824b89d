#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief One ranked entry of the recent set.
 *
 * Only built through make_tracked_item(), so display_name is never empty
 * and always carries an allow-listed extension.
 */
struct TrackedItem {
    std::string path;
    std::string display_name;
    TimePoint timestamp{};
};

inline bool operator==(const TrackedItem& a, const TrackedItem& b) {
    return a.path == b.path
        && a.display_name == b.display_name
        && a.timestamp == b.timestamp;
}

inline bool operator!=(const TrackedItem& a, const TrackedItem& b) {
    return !(a == b);
}

struct WatchedRoot {
    std::string path;
    bool uses_access_semantics{false};
    bool recursive{false};
};

enum class ChangeKind { Created, Modified, Removed };

inline std::string to_string(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Created: return "Created";
        case ChangeKind::Modified: return "Modified";
        case ChangeKind::Removed: return "Removed";
        default: return "Unknown";
    }
}

struct FileChange {
    std::string path;
    ChangeKind kind;
};

/**
 * @brief One decoded delivery from the change feed.
 *
 * reported_count is the number of records the feed found in its raw buffer,
 * changes holds the records it managed to decode.
 */
struct ChangeBatch {
    std::size_t reported_count{0};
    std::vector<FileChange> changes;
};

struct FileTimes {
    TimePoint modified{};
    TimePoint accessed{};
};

/// Ranking timestamp for a file under the given root policy.
inline TimePoint primary_timestamp(const FileTimes& times, bool uses_access_semantics) {
    if (uses_access_semantics && times.accessed > times.modified) {
        return times.accessed;
    }
    return times.modified;
}

struct ScanReport {
    std::size_t roots_scanned{0};
    std::size_t roots_skipped{0};
    std::size_t candidates{0};
    std::size_t items_fed{0};
};

#endif
