#include "InotifyWatcher.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <initializer_list>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
// Small enough that one read can never hold a thousand records
constexpr std::size_t kReadBufferSize = 16 * 1024;

constexpr std::uint32_t kBaseMask = IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO
                                  | IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF
                                  | IN_ONLYDIR | IN_MASK_ADD;
}

InotifyWatcher::InotifyWatcher()
    : logger_(Logger::get_logger("core_logger"))
{
    inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::WATCHER_INIT_FAILED,
                        std::string("inotify_init1: ") + std::strerror(errno));
    }
    if (::pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) != 0) {
        const int saved_errno = errno;
        ::close(inotify_fd_);
        inotify_fd_ = -1;
        THROW_APP_ERROR(ErrorCodes::Code::WATCHER_INIT_FAILED,
                        std::string("pipe2: ") + std::strerror(saved_errno));
    }
}


InotifyWatcher::~InotifyWatcher()
{
    stop();
    for (int fd : {inotify_fd_, wake_pipe_[0], wake_pipe_[1]}) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
}


void InotifyWatcher::set_batch_callback(BatchCallback callback)
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    batch_callback_ = std::move(callback);
}


void InotifyWatcher::set_overflow_callback(OverflowCallback callback)
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    overflow_callback_ = std::move(callback);
}


bool InotifyWatcher::add_root(const WatchedRoot& root)
{
    std::lock_guard<std::mutex> lock(watch_mutex_);
    const std::size_t root_index = roots_.size();
    roots_.push_back(root);

    if (!add_single_watch(root.path, root_index)) {
        return false;
    }
    if (root.recursive) {
        add_watches_recursive(root.path, root_index);
    }
    if (logger_) {
        logger_->info("Watching '{}' ({} director{})", root.path, watches_per_root_[root_index],
                      watches_per_root_[root_index] == 1 ? "y" : "ies");
    }
    return true;
}


std::uint32_t InotifyWatcher::mask_for(std::size_t root_index) const
{
    std::uint32_t mask = kBaseMask;
    if (roots_[root_index].uses_access_semantics) {
        // Opening a document for reading counts as activity in access-time roots
        mask |= IN_CLOSE_NOWRITE;
    }
    return mask;
}


bool InotifyWatcher::add_single_watch(const std::string& path, std::size_t root_index)
{
    auto& count = watches_per_root_[root_index];
    if (count >= kMaxWatchesPerRoot) {
        return false;
    }

    const int wd = ::inotify_add_watch(inotify_fd_, path.c_str(), mask_for(root_index));
    if (wd < 0) {
        if (logger_) {
            const ErrorCodes::ErrorInfo info = ErrorCodes::ErrorCatalog::get_error_info(
                ErrorCodes::Code::WATCHER_ADD_FAILED, path + ": " + std::strerror(errno));
            logger_->warn("{} ({})", info.message, info.context);
        }
        return false;
    }

    if (watches_.emplace(wd, WatchInfo{path, root_index}).second) {
        ++count;
    }
    return true;
}


void InotifyWatcher::add_watches_recursive(const std::string& path, std::size_t root_index)
{
    std::error_code ec;
    fs::recursive_directory_iterator it(Utils::utf8_to_path(path),
                                        fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec) || it->is_symlink(ec)) {
            ec.clear();
            continue;
        }
        if (watches_per_root_[root_index] >= kMaxWatchesPerRoot) {
            if (logger_) {
                logger_->warn("Watch limit of {} reached below '{}'", kMaxWatchesPerRoot,
                              roots_[root_index].path);
            }
            return;
        }
        add_single_watch(Utils::path_to_utf8(it->path()), root_index);
    }
    if (ec && logger_) {
        logger_->warn("Stopped walking '{}': {}", path, ec.message());
    }
}


void InotifyWatcher::start()
{
    if (running_.exchange(true)) {
        return;
    }
    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }
    // Discard a wake-up left over from an earlier stop()
    char discard[16];
    while (::read(wake_pipe_[0], discard, sizeof(discard)) > 0) {
    }
    watch_thread_ = std::thread(&InotifyWatcher::watch_loop, this);
}


void InotifyWatcher::stop()
{
    if (running_.exchange(false)) {
        const char wake = 1;
        if (::write(wake_pipe_[1], &wake, 1) < 0 && errno != EAGAIN && logger_) {
            logger_->error("Failed to wake the watcher thread: {}", std::strerror(errno));
        }
    }
    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }
}


std::size_t InotifyWatcher::watch_count() const
{
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return watches_.size();
}


void InotifyWatcher::watch_loop()
{
    pollfd fds[2] = {
        {inotify_fd_, POLLIN, 0},
        {wake_pipe_[0], POLLIN, 0},
    };

    while (running_.load()) {
        const int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (logger_) {
                logger_->error("poll on inotify descriptor failed: {}", std::strerror(errno));
            }
            break;
        }
        if (fds[1].revents & POLLIN) {
            break;
        }
        if ((fds[0].revents & POLLIN) && !read_events()) {
            break;
        }
    }

    if (logger_) {
        logger_->debug("Watcher thread exiting");
    }
}


bool InotifyWatcher::read_events()
{
    alignas(inotify_event) char buffer[kReadBufferSize];
    while (true) {
        const ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            if (errno == EINTR) {
                continue;
            }
            if (logger_) {
                const auto info = ErrorCodes::ErrorCatalog::get_error_info(
                    ErrorCodes::Code::WATCHER_READ_FAILED, std::strerror(errno));
                logger_->error("{} ({})", info.message, info.context);
            }
            return false;
        }
        if (length == 0) {
            return true;
        }
        apply(decode(buffer, static_cast<std::size_t>(length)));
    }
}


InotifyWatcher::DecodedBuffer InotifyWatcher::decode(const char* buffer, std::size_t length) const
{
    DecodedBuffer decoded;
    std::lock_guard<std::mutex> lock(watch_mutex_);

    std::size_t offset = 0;
    while (offset < length) {
        const std::size_t remaining = length - offset;
        if (remaining < sizeof(inotify_event)) {
            // Counted but not decodable, so the batch gets rejected downstream
            ++decoded.batch.reported_count;
            break;
        }

        inotify_event event{};
        std::memcpy(&event, buffer + offset, sizeof(inotify_event));
        const std::size_t record_size = sizeof(inotify_event) + event.len;
        if (record_size > remaining) {
            ++decoded.batch.reported_count;
            break;
        }

        std::string name;
        if (event.len > 0) {
            const char* raw_name = buffer + offset + sizeof(inotify_event);
            name.assign(raw_name, ::strnlen(raw_name, event.len));
        }
        offset += record_size;

        if (event.mask & IN_Q_OVERFLOW) {
            decoded.overflow = true;
            continue;
        }
        if (event.mask & IN_IGNORED) {
            decoded.dropped_watches.push_back(event.wd);
            continue;
        }

        const auto watch = watches_.find(event.wd);
        if (watch == watches_.end() || name.empty()) {
            continue;
        }
        std::string full_path = Utils::path_to_utf8(Utils::utf8_to_path(watch->second.path) / name);

        if (event.mask & IN_ISDIR) {
            const std::size_t root_index = watch->second.root_index;
            if ((event.mask & (IN_CREATE | IN_MOVED_TO)) && roots_[root_index].recursive) {
                decoded.new_directories.emplace_back(std::move(full_path), root_index);
            }
            continue;
        }

        const auto kind = classify(event.mask);
        if (!kind) {
            continue;
        }
        ++decoded.batch.reported_count;
        decoded.batch.changes.push_back(FileChange{std::move(full_path), *kind});
    }
    return decoded;
}


void InotifyWatcher::apply(const DecodedBuffer& decoded)
{
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        for (int wd : decoded.dropped_watches) {
            const auto it = watches_.find(wd);
            if (it != watches_.end()) {
                --watches_per_root_[it->second.root_index];
                watches_.erase(it);
            }
        }
        for (const auto& [path, root_index] : decoded.new_directories) {
            if (add_single_watch(path, root_index)) {
                add_watches_recursive(path, root_index);
            }
        }
    }

    BatchCallback batch_callback;
    OverflowCallback overflow_callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        batch_callback = batch_callback_;
        overflow_callback = overflow_callback_;
    }

    if (decoded.overflow) {
        if (logger_) {
            logger_->warn("inotify queue overflowed; change events were lost");
        }
        if (overflow_callback) {
            overflow_callback();
        }
    }
    if (batch_callback && decoded.batch.reported_count > 0) {
        batch_callback(decoded.batch);
    }
}


std::optional<ChangeKind> InotifyWatcher::classify(std::uint32_t mask)
{
    if (mask & (IN_DELETE | IN_MOVED_FROM)) {
        return ChangeKind::Removed;
    }
    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        return ChangeKind::Created;
    }
    if (mask & (IN_CLOSE_WRITE | IN_CLOSE_NOWRITE)) {
        return ChangeKind::Modified;
    }
    return std::nullopt;
}
