#include "seshat/janitor.hpp"
#include "seshat/constants.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"

#include <cerrno>
#include <cstring>
#include <deque>
#include <utility>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace seshat {

size_t collect_stale_temps(const std::string& archive_root, int max_age_sec,
                           Metrics& metrics, const StopSource& stop, std::time_t now) {
    SESHAT_LOG_DEBUG("seshat", "Collecting stale temps under %s (age > %ds)",
                     archive_root.c_str(), max_age_sec);

    const size_t prefix_len = strlen(constants::TEMP_PREFIX);
    size_t removed = 0;

    std::deque<std::pair<std::string, size_t>> queue;
    queue.emplace_back(archive_root, 0);

    while (!queue.empty() && !stop.stop_requested()) {
        auto [path, depth] = queue.front();
        queue.pop_front();

        if (depth > constants::MAX_DIRECTORY_DEPTH) {
            SESHAT_LOG_WARN("seshat", "Directory depth exceeds limit (%zu), skipping %s",
                            constants::MAX_DIRECTORY_DEPTH, path.c_str());
            continue;
        }

        DIR* d = opendir(path.c_str());
        if (!d) {
            SESHAT_LOG_WARN("seshat", "Failed to open directory for temp GC: %s: %s",
                            path.c_str(), strerror(errno));
            continue;
        }

        struct dirent* de;
        while ((de = readdir(d)) != nullptr) {
            if (de->d_name[0] == '.' &&
               (de->d_name[1] == '\0' ||
               (de->d_name[1] == '.' && de->d_name[2] == '\0'))) {
                continue;
            }

            std::string full = join_path(path, de->d_name);
            if (!validate_path_length(full)) continue;

            struct stat st{};
            if (lstat(full.c_str(), &st) != 0) {
                SESHAT_LOG_DEBUG("seshat", "lstat failed in temp GC: %s", full.c_str());
                continue;
            }

            if (S_ISDIR(st.st_mode)) {
                queue.emplace_back(std::move(full), depth + 1);
            } else if (S_ISREG(st.st_mode) &&
                       strncmp(de->d_name, constants::TEMP_PREFIX, prefix_len) == 0 &&
                       now - st.st_mtime > max_age_sec) {
                SESHAT_LOG_DEBUG("seshat", "Removing old temp file: %s (age: %llds)",
                                 full.c_str(), static_cast<long long>(now - st.st_mtime));
                if (unlink(full.c_str()) == 0) {
                    ++metrics.temp_gc_removed;
                    ++removed;
                } else {
                    SESHAT_LOG_WARN("seshat", "temp unlink failed %s: %s", full.c_str(), strerror(errno));
                }
            }
        }

        closedir(d);
    }

    if (removed > 0) {
        SESHAT_LOG_INFO("seshat", "Removed %zu stale temp files under %s", removed, archive_root.c_str());
    }
    return removed;
}

}
