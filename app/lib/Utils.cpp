#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <system_error>
#include <sys/stat.h>
#include <fmt/format.h>

namespace {
TimePoint to_time_point(const struct timespec& ts)
{
    const auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

std::string home_directory()
{
    const char* home = std::getenv("HOME");
    return (home && *home) ? std::string(home) : std::string();
}
}

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path)
{
    return path.string();
}


std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(value);
}


std::string expand_user_path(const std::string& path)
{
    if (path.empty() || path.front() != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~otheruser is not supported
        return path;
    }
    const std::string home = home_directory();
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}


std::string abbreviate_user_path(const std::string& path)
{
    const std::string home = home_directory();
    if (home.empty() || !is_within(home, path)) {
        return path;
    }
    const auto relative = std::filesystem::path(path).lexically_relative(home);
    if (relative.empty() || relative == ".") {
        return path;
    }
    return path_to_utf8(relative);
}


std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}


std::string trim_copy(const std::string& value)
{
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}


bool is_valid_directory(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && std::filesystem::is_directory(utf8_to_path(path), ec);
}


bool path_exists(const std::string& path)
{
    std::error_code ec;
    return std::filesystem::exists(utf8_to_path(path), ec);
}


bool is_within(const std::string& root, const std::string& path)
{
    const auto root_path = utf8_to_path(root).lexically_normal();
    const auto candidate = utf8_to_path(path).lexically_normal();

    auto root_it = root_path.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root_path.end(); ++root_it) {
        // "/a/b/" normalizes to a trailing empty component
        if (root_it->empty()) {
            continue;
        }
        if (cand_it == candidate.end() || *cand_it != *root_it) {
            return false;
        }
        ++cand_it;
    }
    return true;
}


std::optional<FileTimes> read_file_times(const std::string& path)
{
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return std::nullopt;
    }
    if (!S_ISREG(info.st_mode)) {
        return std::nullopt;
    }
    FileTimes times;
    times.modified = to_time_point(info.st_mtim);
    times.accessed = to_time_point(info.st_atim);
    return times;
}


std::string format_timestamp(TimePoint time)
{
    const std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&raw, &local);
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}",
                       local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
                       local.tm_hour, local.tm_min);
}

} // namespace Utils
