#include "ReadBarApp.hpp"
#include "AppException.hpp"
#include "InotifyWatcher.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "TrayMenu.hpp"
#include "Utils.hpp"

#include <QString>
#include <QTimer>

#include <chrono>
#include <exception>


ReadBarApp::ReadBarApp(Settings& settings)
    : settings(settings),
      roots(settings.get_watched_roots()),
      allow_list(settings.get_allowed_extensions()),
      recent_set(settings.get_capacity()),
      coordinator(scanner, recent_set, allow_list, settings.get_scan_limit_per_root()),
      adapter(recent_set, roots, allow_list),
      core_logger(Logger::get_logger("core_logger"))
{
}


ReadBarApp::~ReadBarApp()
{
    shutdown();
}


void ReadBarApp::run()
{
    tray_menu = std::make_unique<TrayMenu>(recent_set);
    tray_menu->set_rescan_handler([this]() {
        request_rescan();
    });
    recent_set.set_changed_callback([this]() {
        if (tray_menu) {
            tray_menu->request_refresh();
        }
    });
    tray_menu->show();

    for (const auto& root : roots) {
        if (!Utils::is_valid_directory(root.path) && core_logger) {
            const auto info = ErrorCodes::ErrorCatalog::get_error_info(
                ErrorCodes::Code::DIRECTORY_NOT_FOUND, root.path);
            core_logger->warn("{} {} ({})", info.message, info.resolution, info.context);
        }
    }

    start_watcher();
    request_rescan();
    start_rescan_timer();
}


void ReadBarApp::start_watcher()
{
    try {
        watcher = std::make_unique<InotifyWatcher>();
    } catch (const ErrorCodes::AppException& ex) {
        if (core_logger) {
            core_logger->error("{} Continuing without live updates.", ex.get_full_details());
        }
        tray_menu->show_message(QStringLiteral("ReadBar"),
                                QString::fromStdString(ex.get_error_info().get_user_message()));
        return;
    }

    watcher->set_batch_callback([this](const ChangeBatch& batch) {
        adapter.handle_batch(batch);
    });
    watcher->set_overflow_callback([this]() {
        // Lost events can only be recovered by looking again
        request_rescan();
    });

    std::size_t watched = 0;
    for (const auto& root : roots) {
        if (watcher->add_root(root)) {
            ++watched;
        }
    }
    if (core_logger) {
        core_logger->info("Live updates enabled for {}/{} root(s), {} watch(es)",
                          watched, roots.size(), watcher->watch_count());
    }
    watcher->start();
}


void ReadBarApp::start_rescan_timer()
{
    const int minutes = settings.get_rescan_interval_minutes();
    if (minutes <= 0) {
        return;
    }
    rescan_timer = std::make_unique<QTimer>();
    rescan_timer->setInterval(std::chrono::minutes(minutes));
    QObject::connect(rescan_timer.get(), &QTimer::timeout, [this]() {
        request_rescan();
    });
    rescan_timer->start();
    if (core_logger) {
        core_logger->info("Periodic rescan every {} minute(s)", minutes);
    }
}


bool ReadBarApp::request_rescan()
{
    std::lock_guard<std::mutex> lock(scan_mutex);
    if (shutting_down.load() || scan_running.exchange(true)) {
        return false;
    }
    if (scan_thread.joinable()) {
        scan_thread.join();
    }
    scan_thread = std::thread([this]() {
        run_scan_pass();
        scan_running = false;
    });
    return true;
}


void ReadBarApp::run_scan_pass()
{
    try {
        const ScanReport report = coordinator.run_pass(roots);
        if (report.roots_scanned == 0 && core_logger) {
            core_logger->warn("None of the {} watched root(s) could be scanned", roots.size());
        }
    } catch (const std::exception& ex) {
        if (core_logger) {
            core_logger->error("Scan pass failed: {}", ex.what());
        }
    }
}


void ReadBarApp::shutdown()
{
    if (shutting_down.exchange(true)) {
        return;
    }
    if (rescan_timer) {
        rescan_timer->stop();
    }
    if (watcher) {
        watcher->stop();
    }
    {
        std::lock_guard<std::mutex> lock(scan_mutex);
        if (scan_thread.joinable()) {
            scan_thread.join();
        }
    }
    recent_set.set_changed_callback({});
    if (core_logger) {
        core_logger->info("ReadBar shut down with {} tracked item(s)", recent_set.size());
    }
}
