#pragma once

#ifdef READBAR_TEST_BUILD

#include "InotifyWatcher.hpp"

#include <string>
#include <vector>

class InotifyWatcherTestAccess {
public:
    static ChangeBatch decode(const InotifyWatcher& watcher, const std::vector<char>& buffer) {
        return watcher.decode(buffer.data(), buffer.size()).batch;
    }

    static int watch_descriptor_for(const InotifyWatcher& watcher, const std::string& path) {
        std::lock_guard<std::mutex> lock(watcher.watch_mutex_);
        for (const auto& [wd, info] : watcher.watches_) {
            if (info.path == path) {
                return wd;
            }
        }
        return -1;
    }
};

#endif // READBAR_TEST_BUILD
