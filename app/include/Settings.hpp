#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <cstddef>
#include <string>
#include <filesystem>
#include <vector>


class Settings
{
public:
    static constexpr std::size_t kMaxCapacity = 100;
    static constexpr std::size_t kMaxScanLimitPerRoot = 10000;
    static constexpr int kMaxRescanIntervalMinutes = 24 * 60;

    Settings();

    /**
     * @brief Read config.ini. Missing keys keep their defaults; out-of-range values are clamped.
     * @return false when the file does not exist or cannot be read.
     */
    bool load();

    /**
     * @brief Write config.ini.
     * @throws ErrorCodes::AppException (CONFIG_DIRECTORY_FAILED) when the directory cannot be created.
     */
    bool save();

    /// @throws ErrorCodes::AppException (CONFIG_INVALID_VALUE) when nothing could ever be tracked.
    void validate() const;

    std::string define_config_path();
    std::string get_config_dir();
    std::string get_config_path() const;

    std::size_t get_capacity() const;
    void set_capacity(std::size_t value);

    std::size_t get_scan_limit_per_root() const;
    void set_scan_limit_per_root(std::size_t value);

    int get_rescan_interval_minutes() const;
    void set_rescan_interval_minutes(int value);

    std::vector<std::string> get_allowed_extensions() const;
    void set_allowed_extensions(std::vector<std::string> values);

    bool get_debug_logging() const;
    void set_debug_logging(bool value);

    /// Watched roots with "~" expanded.
    std::vector<WatchedRoot> get_watched_roots() const;
    void set_watched_roots(std::vector<WatchedRoot> roots);

    static std::vector<WatchedRoot> default_roots();

private:
    void load_roots();
    void store_roots();
    static std::string make_root_id(const WatchedRoot& root, const std::vector<std::string>& taken);

    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    std::size_t capacity;
    std::size_t scan_limit_per_root;
    int rescan_interval_minutes{0};
    std::vector<std::string> allowed_extensions;
    bool debug_logging{false};
    std::vector<WatchedRoot> watched_roots;
};

#endif
