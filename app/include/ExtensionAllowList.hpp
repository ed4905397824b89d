#ifndef EXTENSION_ALLOW_LIST_HPP
#define EXTENSION_ALLOW_LIST_HPP

#include "Types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Set of file extensions eligible for tracking.
 *
 * Extensions are stored lower-case without the leading dot and matched
 * case-insensitively.
 */
class ExtensionAllowList {
public:
    ExtensionAllowList();
    explicit ExtensionAllowList(const std::vector<std::string>& extensions);

    static std::vector<std::string> default_extensions();

    bool accepts(const std::string& path) const;
    bool empty() const { return extensions_.empty(); }
    std::vector<std::string> extensions() const;

private:
    static std::string normalize(const std::string& extension);

    std::unordered_set<std::string> extensions_;
};

/**
 * @brief Build a TrackedItem for path, or std::nullopt when the allow-list rejects it.
 */
std::optional<TrackedItem> make_tracked_item(const std::string& path,
                                             TimePoint timestamp,
                                             const ExtensionAllowList& allow_list);

#endif
