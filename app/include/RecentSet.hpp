#ifndef RECENT_SET_HPP
#define RECENT_SET_HPP

#include "Types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spdlog { class logger; }

/**
 * @brief Bounded, name-deduplicated list of tracked files ranked by timestamp.
 *
 * Items are kept in descending timestamp order (ties keep insertion order),
 * no two items share a display name and the list never grows past capacity().
 * All entry points are safe to call from any thread.
 */
class RecentSet {
public:
    using ChangedCallback = std::function<void()>;
    using ExistencePredicate = std::function<bool(const std::string&)>;

    static constexpr std::size_t kDefaultCapacity = 15;

    /**
     * @param capacity Maximum number of items kept; values below 1 are raised to 1.
     * @param exists Existence check used by snapshot() and prune_missing();
     *               defaults to Utils::path_exists.
     */
    explicit RecentSet(std::size_t capacity = kDefaultCapacity,
                       ExistencePredicate exists = {});

    RecentSet(const RecentSet&) = delete;
    RecentSet& operator=(const RecentSet&) = delete;

    /**
     * @brief Insert item, replacing any item with the same display name.
     *
     * The new item always takes the rank its own timestamp gives it, even when
     * that is older than the entry it replaces.
     */
    void upsert(TrackedItem item);

    /// Remove the item whose path matches exactly. Absent paths are ignored.
    void remove(const std::string& path);

    /**
     * @brief Ranked items whose paths still exist.
     *
     * Existence is checked after the lock is released, so the result can lag
     * a concurrent mutation slightly. Stored state is not modified.
     */
    std::vector<TrackedItem> snapshot() const;

    /**
     * @brief Drop stored items whose paths no longer exist.
     * @return Number of items dropped.
     */
    std::size_t prune_missing();

    /// Register the observer invoked after every observable change; pass {} to clear.
    void set_changed_callback(ChangedCallback callback);

    /// Stored item count, including entries snapshot() would filter out.
    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }

private:
    void notify_changed() const;

    const std::size_t capacity_;
    ExistencePredicate exists_;

    mutable std::mutex mutex_;
    std::vector<TrackedItem> items_;

    mutable std::mutex callback_mutex_;
    ChangedCallback changed_callback_;

    std::shared_ptr<spdlog::logger> logger_;
};

#endif
