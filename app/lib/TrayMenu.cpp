#include "TrayMenu.hpp"
#include "Logger.hpp"
#include "RecentSet.hpp"
#include "Utils.hpp"

#include <QAction>
#include <QApplication>
#include <QDesktopServices>
#include <QIcon>
#include <QMenu>
#include <QMetaObject>
#include <QStyle>
#include <QSystemTrayIcon>
#include <QUrl>

#include <utility>


TrayMenu::TrayMenu(RecentSet& recent_set, QObject* parent)
    : QObject(parent),
      recent_set(recent_set),
      menu(std::make_unique<QMenu>()),
      ui_logger(Logger::get_logger("ui_logger"))
{
    menu->setToolTipsVisible(true);
    tray_icon = new QSystemTrayIcon(this);
    setup_icon();
    tray_icon->setToolTip(QStringLiteral("ReadBar"));
    tray_icon->setContextMenu(menu.get());

    // The set can change between refreshes (files deleted behind our back)
    connect(menu.get(), &QMenu::aboutToShow, this, [this]() {
        rebuild_menu();
    });

    rebuild_menu();
}


TrayMenu::~TrayMenu()
{
    if (tray_icon) {
        tray_icon->setContextMenu(nullptr);
    }
}


void TrayMenu::setup_icon()
{
    QIcon icon = QIcon::fromTheme(QStringLiteral("document-open-recent"));
    if (icon.isNull()) {
        icon = QApplication::style()->standardIcon(QStyle::SP_FileDialogDetailedView);
    }
    tray_icon->setIcon(icon);
}


void TrayMenu::show()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable() && ui_logger) {
        ui_logger->warn("No system tray available; the ReadBar icon may not be visible");
    }
    tray_icon->show();
}


void TrayMenu::request_refresh()
{
    if (refresh_pending.exchange(true)) {
        return;
    }
    run_on_ui([this]() {
        refresh_pending = false;
        rebuild_menu();
    });
}


void TrayMenu::set_rescan_handler(std::function<void()> handler)
{
    rescan_handler = std::move(handler);
}


void TrayMenu::show_message(const QString& title, const QString& text)
{
    if (tray_icon && QSystemTrayIcon::supportsMessages()) {
        tray_icon->showMessage(title, text, QSystemTrayIcon::Warning);
    }
}


QString TrayMenu::entry_label(const TrackedItem& item)
{
    QString label = QString::fromStdString(item.display_name);
    label.replace(QLatin1Char('&'), QStringLiteral("&&"));
    return label;
}


void TrayMenu::rebuild_menu()
{
    const auto items = recent_set.snapshot();

    menu->clear();
    if (items.empty()) {
        QAction* placeholder = menu->addAction(tr("No recent files"));
        placeholder->setEnabled(false);
    } else {
        for (const auto& item : items) {
            add_recent_entry(item);
        }
    }
    add_static_actions();

    if (ui_logger) {
        ui_logger->debug("Tray menu rebuilt with {} item(s)", items.size());
    }
}


void TrayMenu::add_recent_entry(const TrackedItem& item)
{
    QAction* action = menu->addAction(entry_label(item));
    action->setToolTip(QStringLiteral("%1\n%2").arg(
        QString::fromStdString(Utils::abbreviate_user_path(item.path)),
        QString::fromStdString(Utils::format_timestamp(item.timestamp))));

    const std::string path = item.path;
    connect(action, &QAction::triggered, this, [this, path]() {
        open_item(path);
    });
}


void TrayMenu::add_static_actions()
{
    menu->addSeparator();

    QAction* rescan_action = menu->addAction(tr("Rescan now"));
    connect(rescan_action, &QAction::triggered, this, [this]() {
        if (rescan_handler) {
            rescan_handler();
        }
    });

    menu->addSeparator();
    QAction* quit_action = menu->addAction(tr("Quit"));
    connect(quit_action, &QAction::triggered, qApp, &QCoreApplication::quit);
}


void TrayMenu::open_item(const std::string& path)
{
    if (!Utils::path_exists(path)) {
        if (ui_logger) {
            ui_logger->info("'{}' no longer exists; removing it", path);
        }
        recent_set.remove(path);
        return;
    }

    const QUrl url = QUrl::fromLocalFile(QString::fromStdString(path));
    if (!QDesktopServices::openUrl(url)) {
        if (ui_logger) {
            ui_logger->error("Failed to open '{}'", path);
        }
        show_message(tr("Could not open file"), QString::fromStdString(Utils::abbreviate_user_path(path)));
        return;
    }
    if (ui_logger) {
        ui_logger->info("Opened '{}'", path);
    }
}


void TrayMenu::run_on_ui(std::function<void()> func)
{
    QMetaObject::invokeMethod(
        this,
        [fn = std::move(func)]() mutable {
            if (fn) {
                fn();
            }
        },
        Qt::QueuedConnection);
}
