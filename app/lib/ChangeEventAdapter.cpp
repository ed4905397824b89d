#include "ChangeEventAdapter.hpp"
#include "Logger.hpp"
#include "RecentSet.hpp"
#include "Utils.hpp"

#include <utility>

ChangeEventAdapter::ChangeEventAdapter(RecentSet& recent_set,
                                       std::vector<WatchedRoot> roots,
                                       ExtensionAllowList allow_list,
                                       FileTimesReader read_times)
    : recent_set_(recent_set),
      roots_(std::move(roots)),
      allow_list_(std::move(allow_list)),
      read_times_(read_times ? std::move(read_times) : FileTimesReader(&Utils::read_file_times)),
      logger_(Logger::get_logger("core_logger"))
{
}


bool ChangeEventAdapter::is_plausible(const ChangeBatch& batch) const
{
    if (batch.reported_count == 0) {
        return false;
    }
    if (batch.reported_count >= kMaxBatchEvents) {
        if (logger_) {
            logger_->warn("Dropping change batch reporting {} event(s)", batch.reported_count);
        }
        return false;
    }
    if (batch.changes.size() != batch.reported_count) {
        if (logger_) {
            logger_->warn("Dropping change batch: {} event(s) reported, {} decoded",
                          batch.reported_count, batch.changes.size());
        }
        return false;
    }
    return true;
}


bool ChangeEventAdapter::handle_batch(const ChangeBatch& batch)
{
    if (!is_plausible(batch)) {
        return false;
    }
    if (logger_) {
        logger_->debug("Processing {} change event(s)", batch.changes.size());
    }
    for (const auto& change : batch.changes) {
        handle_change(change);
    }
    return true;
}


void ChangeEventAdapter::handle_change(const FileChange& change)
{
    if (!allow_list_.accepts(change.path)) {
        return;
    }

    if (logger_) {
        logger_->trace("{}: {}", to_string(change.kind), change.path);
    }

    switch (change.kind) {
        case ChangeKind::Removed:
            recent_set_.remove(change.path);
            break;
        case ChangeKind::Created:
        case ChangeKind::Modified:
            track(change.path);
            break;
    }
}


void ChangeEventAdapter::track(const std::string& path)
{
    const auto times = read_times_(path);
    if (!times) {
        // Gone again before we got to it
        if (logger_) {
            logger_->trace("Skipping '{}': stat failed", path);
        }
        return;
    }

    const WatchedRoot* root = find_owning_root(path);
    const bool uses_access = root && root->uses_access_semantics;
    if (auto item = make_tracked_item(path, primary_timestamp(*times, uses_access), allow_list_)) {
        recent_set_.upsert(std::move(*item));
    }
}


const WatchedRoot* ChangeEventAdapter::find_owning_root(const std::string& path) const
{
    const WatchedRoot* best = nullptr;
    std::size_t best_length = 0;
    for (const auto& root : roots_) {
        if (Utils::is_within(root.path, path) && (best == nullptr || root.path.size() > best_length)) {
            best = &root;
            best_length = root.path.size();
        }
    }
    return best;
}
