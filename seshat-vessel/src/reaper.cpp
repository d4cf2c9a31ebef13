#include "seshat/reaper.hpp"
#include "seshat/constants.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/ingest_filter.hpp"
#include "seshat/log.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace seshat {

DirectoryReaper::DirectoryReaper(std::string watch_root, Metrics& metrics)
    : watch_root_(std::move(watch_root)), metrics_(metrics) {
    while (watch_root_.size() > 1 && watch_root_.back() == '/') watch_root_.pop_back();
}

bool DirectoryReaper::remove_if_empty(const std::string& dir) noexcept {
    if (dir == watch_root_ || !path_within(watch_root_, dir)) return false;

    if (rmdir(dir.c_str()) == 0) {
        ++metrics_.dirs_pruned;
        SESHAT_LOG_DEBUG("reaper", "Removed empty directory: %s", dir.c_str());
        return true;
    }

    if (errno != ENOTEMPTY && errno != EEXIST && errno != ENOENT) {
        SESHAT_LOG_DEBUG("reaper", "rmdir failed %s: %s", dir.c_str(), strerror(errno));
    }
    return false;
}

static std::vector<std::string> list_subdirs(const std::string& path) {
    std::vector<std::string> dirs;

    DIR* d = opendir(path.c_str());
    if (!d) {
        SESHAT_LOG_DEBUG("reaper", "Cannot open %s: %s", path.c_str(), strerror(errno));
        return dirs;
    }

    struct dirent* de;
    while ((de = readdir(d)) != nullptr) {
        if (de->d_name[0] == '.' &&
           (de->d_name[1] == '\0' ||
           (de->d_name[1] == '.' && de->d_name[2] == '\0'))) {
            continue;
        }
        if (IngestFilter::is_ignored_dir_name(de->d_name)) continue;

        std::string full = join_path(path, de->d_name);
        struct stat st{};
        if (lstat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            dirs.push_back(std::move(full));
        }
    }

    closedir(d);
    return dirs;
}

size_t DirectoryReaper::prune_empty_ancestors(const std::string& start_dir) {
    std::string start = start_dir;
    while (start.size() > 1 && start.back() == '/') start.pop_back();

    if (!path_within(watch_root_, start)) {
        SESHAT_LOG_DEBUG("reaper", "Refusing to prune outside watch root: %s", start.c_str());
        return 0;
    }

    size_t removed = 0;

    struct Frame {
        std::string path;
        size_t depth;
        bool expanded;
    };

    // Post-order walk: a directory is visited again after all its children
    std::vector<Frame> stack;
    stack.push_back({start, 0, false});

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (!top.expanded) {
            top.expanded = true;
            if (top.depth >= constants::MAX_DIRECTORY_DEPTH) {
                SESHAT_LOG_WARN("reaper", "Directory depth exceeds limit (%zu) at %s",
                                constants::MAX_DIRECTORY_DEPTH, top.path.c_str());
                continue;
            }
            const size_t child_depth = top.depth + 1;
            for (auto& child : list_subdirs(top.path)) {
                stack.push_back({std::move(child), child_depth, false});
            }
            continue;
        }

        Frame done = std::move(stack.back());
        stack.pop_back();
        if (done.path != start && remove_if_empty(done.path)) {
            ++removed;
        }
    }

    // Upward toward the watch root; a non-empty level ends the walk
    std::string cur = start;
    while (cur != watch_root_ && path_within(watch_root_, cur)) {
        if (!remove_if_empty(cur)) break;
        ++removed;
        cur = parent_dir(cur);
    }

    return removed;
}

}
