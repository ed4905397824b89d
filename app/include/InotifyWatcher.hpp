#ifndef INOTIFY_WATCHER_HPP
#define INOTIFY_WATCHER_HPP

#include "Types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace spdlog { class logger; }

/**
 * @brief Change feed for the watched roots, backed by Linux inotify.
 *
 * A background thread blocks in poll() on the inotify descriptor, decodes each
 * read into a ChangeBatch and hands it to the batch callback on that thread.
 * Directory events never reach the callback; for recursive roots they only
 * extend the set of watched directories.
 */
class InotifyWatcher {
public:
    using BatchCallback = std::function<void(const ChangeBatch&)>;
    using OverflowCallback = std::function<void()>;

    // Upper bound on directories watched below a single recursive root
    static constexpr std::size_t kMaxWatchesPerRoot = 512;

    /**
     * @throws ErrorCodes::AppException (WATCHER_INIT_FAILED) when inotify or the
     *         wake-up pipe cannot be created.
     */
    InotifyWatcher();
    ~InotifyWatcher();

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    void set_batch_callback(BatchCallback callback);

    // Called when the kernel queue overflowed and events were lost
    void set_overflow_callback(OverflowCallback callback);

    /**
     * @brief Start watching root (and its subdirectories when root.recursive).
     * @return false when the root directory itself cannot be watched.
     */
    bool add_root(const WatchedRoot& root);

    /// Start the background thread. Does nothing if already running.
    void start();

    /// Stop and join the background thread. Safe to call repeatedly.
    void stop();

    bool is_running() const { return running_.load(); }
    std::size_t watch_count() const;

private:
    friend class InotifyWatcherTestAccess;

    struct WatchInfo {
        std::string path;
        std::size_t root_index{0};
    };

    struct DecodedBuffer {
        ChangeBatch batch;
        std::vector<std::pair<std::string, std::size_t>> new_directories;
        std::vector<int> dropped_watches;
        bool overflow{false};
    };

    void watch_loop();
    bool read_events();
    DecodedBuffer decode(const char* buffer, std::size_t length) const;
    void apply(const DecodedBuffer& decoded);

    bool add_single_watch(const std::string& path, std::size_t root_index);
    void add_watches_recursive(const std::string& path, std::size_t root_index);
    std::uint32_t mask_for(std::size_t root_index) const;

    static std::optional<ChangeKind> classify(std::uint32_t mask);

    int inotify_fd_{-1};
    int wake_pipe_[2]{-1, -1};

    std::atomic<bool> running_{false};
    std::thread watch_thread_;

    mutable std::mutex watch_mutex_;
    std::vector<WatchedRoot> roots_;
    std::unordered_map<int, WatchInfo> watches_;
    std::unordered_map<std::size_t, std::size_t> watches_per_root_;

    std::mutex callback_mutex_;
    BatchCallback batch_callback_;
    OverflowCallback overflow_callback_;

    std::shared_ptr<spdlog::logger> logger_;
};

#endif
