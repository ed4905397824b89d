#ifndef READBAR_APP_HPP
#define READBAR_APP_HPP

#include "ChangeEventAdapter.hpp"
#include "ExtensionAllowList.hpp"
#include "FileScanner.hpp"
#include "RecentSet.hpp"
#include "ScanCoordinator.hpp"
#include "Types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class InotifyWatcher;
class QTimer;
class Settings;
class TrayMenu;
namespace spdlog { class logger; }

class ReadBarApp
{
public:
    explicit ReadBarApp(Settings& settings);
    ~ReadBarApp();

    ReadBarApp(const ReadBarApp&) = delete;
    ReadBarApp& operator=(const ReadBarApp&) = delete;

    void run();
    void shutdown();

    /// Start a background scan pass unless one is already running.
    bool request_rescan();

    bool has_live_updates() const { return watcher != nullptr; }

private:
    void start_watcher();
    void start_rescan_timer();
    void run_scan_pass();

    Settings& settings;
    std::vector<WatchedRoot> roots;
    ExtensionAllowList allow_list;
    RecentSet recent_set;
    FileScanner scanner;
    ScanCoordinator coordinator;
    ChangeEventAdapter adapter;

    std::unique_ptr<InotifyWatcher> watcher;
    std::unique_ptr<TrayMenu> tray_menu;
    std::unique_ptr<QTimer> rescan_timer;

    std::mutex scan_mutex;
    std::thread scan_thread;
    std::atomic<bool> scan_running{false};
    std::atomic<bool> shutting_down{false};

    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
