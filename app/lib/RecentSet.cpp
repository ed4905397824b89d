#include "RecentSet.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <utility>

RecentSet::RecentSet(std::size_t capacity, ExistencePredicate exists)
    : capacity_(std::max<std::size_t>(capacity, 1)),
      exists_(exists ? std::move(exists) : ExistencePredicate(&Utils::path_exists)),
      logger_(Logger::get_logger("core_logger"))
{
    items_.reserve(capacity_ + 1);
}


void RecentSet::upsert(TrackedItem item)
{
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto existing = std::find_if(items_.begin(), items_.end(),
            [&item](const TrackedItem& entry) { return entry.display_name == item.display_name; });
        if (existing != items_.end()) {
            if (*existing == item) {
                return;
            }
            items_.erase(existing);
            changed = true;
        }

        // First entry strictly older than the new one; equal timestamps stay ahead
        const auto position = std::upper_bound(items_.begin(), items_.end(), item.timestamp,
            [](const TimePoint& timestamp, const TrackedItem& entry) {
                return timestamp > entry.timestamp;
            });
        const auto rank = static_cast<std::size_t>(position - items_.begin());

        if (rank < capacity_) {
            if (logger_) {
                logger_->debug("Tracking '{}' at rank {} ({})", item.display_name, rank, item.path);
            }
            items_.insert(position, std::move(item));
            if (items_.size() > capacity_) {
                items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(capacity_), items_.end());
            }
            changed = true;
        } else if (logger_) {
            logger_->trace("'{}' ranks below the {} tracked items", item.display_name, capacity_);
        }
    }

    if (changed) {
        notify_changed();
    }
}


void RecentSet::remove(const std::string& path)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(items_.begin(), items_.end(),
            [&path](const TrackedItem& entry) { return entry.path == path; });
        if (it == items_.end()) {
            return;
        }
        if (logger_) {
            logger_->debug("No longer tracking '{}'", path);
        }
        items_.erase(it);
    }
    notify_changed();
}


std::vector<TrackedItem> RecentSet::snapshot() const
{
    std::vector<TrackedItem> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = items_;
    }

    copy.erase(std::remove_if(copy.begin(), copy.end(),
                              [this](const TrackedItem& entry) { return !exists_(entry.path); }),
               copy.end());
    return copy;
}


std::size_t RecentSet::prune_missing()
{
    std::vector<TrackedItem> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale = items_;
    }
    stale.erase(std::remove_if(stale.begin(), stale.end(),
                               [this](const TrackedItem& entry) { return exists_(entry.path); }),
                stale.end());
    if (stale.empty()) {
        return 0;
    }

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Entries replaced since the copy are left alone
        const auto new_end = std::remove_if(items_.begin(), items_.end(),
            [&stale](const TrackedItem& entry) {
                return std::find(stale.begin(), stale.end(), entry) != stale.end();
            });
        dropped = static_cast<std::size_t>(items_.end() - new_end);
        items_.erase(new_end, items_.end());
    }

    if (dropped > 0) {
        if (logger_) {
            logger_->info("Dropped {} tracked file(s) that no longer exist", dropped);
        }
        notify_changed();
    }
    return dropped;
}


void RecentSet::set_changed_callback(ChangedCallback callback)
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    changed_callback_ = std::move(callback);
}


std::size_t RecentSet::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}


void RecentSet::notify_changed() const
{
    ChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = changed_callback_;
    }
    if (callback) {
        callback();
    }
}
