#include "ExtensionAllowList.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <filesystem>

ExtensionAllowList::ExtensionAllowList()
    : ExtensionAllowList(default_extensions())
{
}


ExtensionAllowList::ExtensionAllowList(const std::vector<std::string>& extensions)
{
    for (const auto& extension : extensions) {
        std::string normalized = normalize(extension);
        if (!normalized.empty()) {
            extensions_.insert(std::move(normalized));
        }
    }
}


std::vector<std::string> ExtensionAllowList::default_extensions()
{
    return {"pdf", "epub"};
}


std::string ExtensionAllowList::normalize(const std::string& extension)
{
    std::string value = Utils::to_lower_copy(Utils::trim_copy(extension));
    if (!value.empty() && value.front() == '.') {
        value.erase(0, 1);
    }
    return value;
}


bool ExtensionAllowList::accepts(const std::string& path) const
{
    const std::filesystem::path fs_path = Utils::utf8_to_path(path);
    if (!fs_path.has_filename()) {
        return false;
    }
    // ".pdf" is a dotfile with no extension
    const std::string extension = Utils::path_to_utf8(fs_path.extension());
    if (extension.size() < 2) {
        return false;
    }
    return extensions_.contains(Utils::to_lower_copy(extension.substr(1)));
}


std::vector<std::string> ExtensionAllowList::extensions() const
{
    std::vector<std::string> result(extensions_.begin(), extensions_.end());
    std::sort(result.begin(), result.end());
    return result;
}


std::optional<TrackedItem> make_tracked_item(const std::string& path,
                                             TimePoint timestamp,
                                             const ExtensionAllowList& allow_list)
{
    if (!allow_list.accepts(path)) {
        return std::nullopt;
    }
    std::string name = Utils::path_to_utf8(Utils::utf8_to_path(path).filename());
    if (name.empty()) {
        return std::nullopt;
    }
    return TrackedItem{path, std::move(name), timestamp};
}
