#ifndef CHANGE_EVENT_ADAPTER_HPP
#define CHANGE_EVENT_ADAPTER_HPP

#include "ExtensionAllowList.hpp"
#include "Types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class RecentSet;
namespace spdlog { class logger; }

/**
 * @brief Turns decoded change notifications into RecentSet mutations.
 *
 * Runs on the change feed's thread; stat calls happen here, never on the UI thread.
 */
class ChangeEventAdapter {
public:
    using FileTimesReader = std::function<std::optional<FileTimes>(const std::string&)>;

    // Batches reporting this many events or more are treated as garbage
    static constexpr std::size_t kMaxBatchEvents = 1000;

    ChangeEventAdapter(RecentSet& recent_set,
                       std::vector<WatchedRoot> roots,
                       ExtensionAllowList allow_list,
                       FileTimesReader read_times = {});

    /**
     * @brief Apply every change in batch, or none of them when the batch is implausible.
     * @return false when the batch was dropped.
     */
    bool handle_batch(const ChangeBatch& batch);

    void handle_change(const FileChange& change);

    /// Root with the longest prefix containing path, if any.
    const WatchedRoot* find_owning_root(const std::string& path) const;

private:
    bool is_plausible(const ChangeBatch& batch) const;
    void track(const std::string& path);

    RecentSet& recent_set_;
    std::vector<WatchedRoot> roots_;
    ExtensionAllowList allow_list_;
    FileTimesReader read_times_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
