#ifndef TRAY_MENU_HPP
#define TRAY_MENU_HPP

#include "Types.hpp"

#include <QObject>
#include <QString>

#include <atomic>
#include <functional>
#include <memory>
#include <string>

class QMenu;
class QSystemTrayIcon;
class RecentSet;
namespace spdlog { class logger; }

/**
 * @brief System tray icon whose menu lists the recent set.
 *
 * Lives on the Qt thread. Other threads only call request_refresh(), which
 * queues a rebuild onto the event loop.
 */
class TrayMenu : public QObject
{
public:
    explicit TrayMenu(RecentSet& recent_set, QObject* parent = nullptr);
    ~TrayMenu() override;

    void show();

    /// Thread-safe; coalesces bursts into one rebuild.
    void request_refresh();

    void set_rescan_handler(std::function<void()> handler);
    void show_message(const QString& title, const QString& text);

    /// Menu label for item: the display name with '&' escaped.
    static QString entry_label(const TrackedItem& item);

private:
    void setup_icon();
    void rebuild_menu();
    void add_recent_entry(const TrackedItem& item);
    void add_static_actions();
    void open_item(const std::string& path);
    void run_on_ui(std::function<void()> func);

    RecentSet& recent_set;
    std::unique_ptr<QMenu> menu;
    QSystemTrayIcon* tray_icon{nullptr};
    std::function<void()> rescan_handler;
    std::atomic<bool> refresh_pending{false};
    std::shared_ptr<spdlog::logger> ui_logger;
};

#endif
