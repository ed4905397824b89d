#ifndef UTILS_HPP
#define UTILS_HPP

#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

/// Replace a leading "~" with $HOME. Other paths are returned unchanged.
std::string expand_user_path(const std::string& path);

/// Strip the $HOME prefix for display, e.g. "/home/me/Downloads/a.pdf" -> "Downloads/a.pdf".
std::string abbreviate_user_path(const std::string& path);

std::string to_lower_copy(std::string value);
std::string trim_copy(const std::string& value);

bool is_valid_directory(const std::string& path);
bool path_exists(const std::string& path);

/// True when path equals root or lies below it (compared on path components).
bool is_within(const std::string& root, const std::string& path);

/**
 * @brief stat() a file and return its modification and access times.
 * @return std::nullopt when the file cannot be stat'ed or is not a regular file.
 */
std::optional<FileTimes> read_file_times(const std::string& path);

std::string format_timestamp(TimePoint time);

} // namespace Utils

#endif
