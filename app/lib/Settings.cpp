#include "Settings.hpp"
#include "AppException.hpp"
#include "ExtensionAllowList.hpp"
#include "FileScanner.hpp"
#include "Logger.hpp"
#include "RecentSet.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

template <typename T>
T clamp_setting(const char* key, T value, T min_value, T max_value) {
    if (value < min_value || value > max_value) {
        const T clamped = std::clamp(value, min_value, max_value);
        settings_log(spdlog::level::warn, "{} = {} is out of range, using {}", key, value, clamped);
        return clamped;
    }
    return value;
}

constexpr const char* kSettingsSection = "Settings";
constexpr const char* kRootsSection = "Roots";
constexpr const char* kRootSectionPrefix = "Root_";
}


Settings::Settings()
    : capacity(RecentSet::kDefaultCapacity),
      scan_limit_per_root(FileScanner::kDefaultRootLimit),
      allowed_extensions(ExtensionAllowList::default_extensions()),
      watched_roots(default_roots())
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();
}


std::string Settings::define_config_path()
{
    std::string AppName = "ReadBar";
    if (const char* override_root = std::getenv("READBAR_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / AppName / "config.ini").string();
    }
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config && *xdg_config) {
        return (std::filesystem::path(xdg_config) / AppName / "config.ini").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/" + AppName + "/config.ini";
    }
    return "config.ini";
}


std::string Settings::get_config_dir()
{
    return config_dir.string();
}


std::string Settings::get_config_path() const
{
    return config_path;
}


std::vector<WatchedRoot> Settings::default_roots()
{
    return {
        WatchedRoot{"~/Downloads", false, false},
        WatchedRoot{"~/Desktop", false, false},
        WatchedRoot{"~/Documents/reading", true, true},
    };
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    const int stored_capacity = config.getInt(kSettingsSection, "Capacity", static_cast<int>(capacity));
    capacity = static_cast<std::size_t>(
        clamp_setting<int>("Capacity", stored_capacity, 1, static_cast<int>(kMaxCapacity)));

    const int stored_limit = config.getInt(kSettingsSection, "ScanLimitPerRoot",
                                           static_cast<int>(scan_limit_per_root));
    scan_limit_per_root = static_cast<std::size_t>(
        clamp_setting<int>("ScanLimitPerRoot", stored_limit, 1, static_cast<int>(kMaxScanLimitPerRoot)));

    rescan_interval_minutes = clamp_setting<int>(
        "RescanIntervalMinutes",
        config.getInt(kSettingsSection, "RescanIntervalMinutes", rescan_interval_minutes),
        0, kMaxRescanIntervalMinutes);

    if (config.hasValue(kSettingsSection, "AllowedExtensions")) {
        allowed_extensions = config.getList(kSettingsSection, "AllowedExtensions");
    }
    debug_logging = config.getBool(kSettingsSection, "DebugLogging", debug_logging);

    load_roots();
    return true;
}


void Settings::load_roots()
{
    if (!config.hasValue(kRootsSection, "Ids")) {
        return;
    }

    watched_roots.clear();
    for (const auto& id : config.getList(kRootsSection, "Ids")) {
        const std::string section = kRootSectionPrefix + id;
        WatchedRoot root;
        root.path = config.getValue(section, "Path", "");
        root.uses_access_semantics = config.getBool(section, "UseAccessTime", false);
        root.recursive = config.getBool(section, "Recursive", false);
        if (root.path.empty()) {
            settings_log(spdlog::level::warn, "Root '{}' has no Path, ignoring it", id);
            continue;
        }
        watched_roots.push_back(std::move(root));
    }
}


std::string Settings::make_root_id(const WatchedRoot& root, const std::vector<std::string>& taken)
{
    std::string base;
    for (unsigned char ch : std::filesystem::path(root.path).filename().string()) {
        if (std::isalnum(ch)) {
            base.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    if (base.empty()) {
        base = "root";
    }

    std::string id = base;
    for (int suffix = 2; std::find(taken.begin(), taken.end(), id) != taken.end(); ++suffix) {
        id = base + std::to_string(suffix);
    }
    return id;
}


void Settings::store_roots()
{
    for (const auto& id : config.getList(kRootsSection, "Ids")) {
        config.removeSection(kRootSectionPrefix + id);
    }

    std::vector<std::string> ids;
    for (const auto& root : watched_roots) {
        const std::string id = make_root_id(root, ids);
        const std::string section = kRootSectionPrefix + id;
        config.setValue(section, "Path", root.path);
        config.setBool(section, "UseAccessTime", root.uses_access_semantics);
        config.setBool(section, "Recursive", root.recursive);
        ids.push_back(id);
    }
    config.setList(kRootsSection, "Ids", ids);
}


bool Settings::save()
{
    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_DIRECTORY_FAILED,
                        config_dir.string() + ": " + ec.message());
    }

    config.setInt(kSettingsSection, "Capacity", static_cast<int>(capacity));
    config.setInt(kSettingsSection, "ScanLimitPerRoot", static_cast<int>(scan_limit_per_root));
    config.setInt(kSettingsSection, "RescanIntervalMinutes", rescan_interval_minutes);
    config.setList(kSettingsSection, "AllowedExtensions", allowed_extensions);
    config.setBool(kSettingsSection, "DebugLogging", debug_logging);
    store_roots();

    if (!config.save(config_path)) {
        const auto info = ErrorCodes::ErrorCatalog::get_error_info(
            ErrorCodes::Code::CONFIG_SAVE_FAILED, config_path);
        settings_log(spdlog::level::err, "{} {} ({})", info.message, info.resolution, info.context);
        return false;
    }
    return true;
}


void Settings::validate() const
{
    if (watched_roots.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "No watched directories are configured.",
                            "Config file: " + config_path);
    }
    if (ExtensionAllowList(allowed_extensions).empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "No file extensions are allowed.",
                            "AllowedExtensions in " + config_path);
    }
}


std::size_t Settings::get_capacity() const
{
    return capacity;
}


void Settings::set_capacity(std::size_t value)
{
    capacity = std::clamp<std::size_t>(value, 1, kMaxCapacity);
}


std::size_t Settings::get_scan_limit_per_root() const
{
    return scan_limit_per_root;
}


void Settings::set_scan_limit_per_root(std::size_t value)
{
    scan_limit_per_root = std::clamp<std::size_t>(value, 1, kMaxScanLimitPerRoot);
}


int Settings::get_rescan_interval_minutes() const
{
    return rescan_interval_minutes;
}


void Settings::set_rescan_interval_minutes(int value)
{
    rescan_interval_minutes = std::clamp(value, 0, kMaxRescanIntervalMinutes);
}


std::vector<std::string> Settings::get_allowed_extensions() const
{
    return allowed_extensions;
}


void Settings::set_allowed_extensions(std::vector<std::string> values)
{
    allowed_extensions = std::move(values);
}


bool Settings::get_debug_logging() const
{
    return debug_logging;
}


void Settings::set_debug_logging(bool value)
{
    debug_logging = value;
}


std::vector<WatchedRoot> Settings::get_watched_roots() const
{
    std::vector<WatchedRoot> roots = watched_roots;
    for (auto& root : roots) {
        root.path = Utils::expand_user_path(root.path);
    }
    return roots;
}


void Settings::set_watched_roots(std::vector<WatchedRoot> roots)
{
    watched_roots = std::move(roots);
}
