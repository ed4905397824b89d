#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "ExtensionAllowList.hpp"
#include "Types.hpp"

namespace fs = std::filesystem;

class FileScanner {
public:
    using FileTimesReader = std::function<std::optional<FileTimes>(const std::string&)>;

    static constexpr std::size_t kDefaultRootLimit = 200;

    explicit FileScanner(FileTimesReader read_times = {});

    /**
     * @brief List allow-listed files directly inside root, stamped per the root's policy.
     *
     * Hidden and junk files are skipped, as are files whose stat fails. Listing
     * stops after limit accepted files.
     * @throws fs::filesystem_error when root cannot be opened or listing fails midway.
     */
    std::vector<TrackedItem>
        get_root_entries(const WatchedRoot& root,
                         const ExtensionAllowList& allow_list,
                         std::size_t limit = kDefaultRootLimit) const;

private:
    struct ScanContext;
    std::optional<TrackedItem> build_entry(const fs::directory_entry& entry,
                                           const ScanContext& context) const;
    bool should_skip_entry(const std::string& file_name,
                           const ScanContext& context,
                           const std::string& full_path) const;
    bool is_file_hidden(const std::string& file_name) const;
    bool is_junk_file(const std::string& name) const;

    FileTimesReader read_times_;
};

#endif
