#include "seshat/watcher.hpp"
#include "seshat/constants.hpp"
#include "seshat/ingest_filter.hpp"
#include "seshat/log.hpp"
#include "seshat/worker_pool.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <utility>
#include <vector>

#include <dirent.h>
#include <poll.h>
#include <sys/inotify.h>
#include <sys/stat.h>
#include <unistd.h>

namespace seshat {

// No IN_CLOSE_WRITE: the stability check's own append-open would re-arm the
// debounce on every poll. Writes after IN_CREATE are covered by the stability wait.
static constexpr uint32_t WATCH_MASK = IN_CREATE | IN_MOVED_TO | IN_ONLYDIR;

DirectoryWatcher::DirectoryWatcher(std::string root, const StopSource& stop, Metrics& metrics,
                                   EventCallback on_event, OverflowCallback on_overflow)
    : root_(std::move(root)), stop_(stop), metrics_(metrics),
      on_event_(std::move(on_event)), on_overflow_(std::move(on_overflow)) {}

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

bool DirectoryWatcher::add_watch(const std::string& dir) {
    int wd = inotify_add_watch(inotify_fd_.get(), dir.c_str(), WATCH_MASK);
    if (wd < 0) {
        SESHAT_LOG_WARN("watch", "Cannot watch %s: %s", dir.c_str(), strerror(errno));
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    wd_to_path_[wd] = dir;
    return true;
}

void DirectoryWatcher::add_watch_recursive(const std::string& dir, bool emit) {
    std::vector<std::pair<std::string, size_t>> stack;
    stack.emplace_back(dir, 0);

    while (!stack.empty() && !stop_.stop_requested()) {
        auto [path, depth] = std::move(stack.back());
        stack.pop_back();

        if (!add_watch(path)) continue;

        if (depth >= constants::MAX_DIRECTORY_DEPTH) {
            SESHAT_LOG_WARN("watch", "Directory depth exceeds limit (%zu) at %s",
                            constants::MAX_DIRECTORY_DEPTH, path.c_str());
            continue;
        }

        DIR* d = opendir(path.c_str());
        if (!d) {
            SESHAT_LOG_DEBUG("watch", "Cannot list %s: %s", path.c_str(), strerror(errno));
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
            struct stat st{};
            if (lstat(full.c_str(), &st) != 0) continue;

            if (S_ISDIR(st.st_mode)) {
                if (!IngestFilter::is_ignored_dir_name(de->d_name)) {
                    stack.emplace_back(std::move(full), depth + 1);
                }
            } else if (emit && S_ISREG(st.st_mode) && on_event_) {
                on_event_(WatchEvent{std::move(full), WatchEventKind::Created});
            }
        }

        closedir(d);
    }
}

bool DirectoryWatcher::start() {
    if (running_.load()) return true;

    inotify_fd_.reset(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
    if (!inotify_fd_) {
        SESHAT_LOG_ERROR("watch", "inotify_init1 failed: %s", strerror(errno));
        return false;
    }

    add_watch_recursive(root_, false);
    if (watch_count() == 0) {
        SESHAT_LOG_ERROR("watch", "No watches could be placed under %s", root_.c_str());
        inotify_fd_.reset();
        return false;
    }

    running_.store(true);
    watcher_thread_ = std::thread(&DirectoryWatcher::watch_loop, this);

    SESHAT_LOG_INFO("watch", "Watching %s (%zu directories)", root_.c_str(), watch_count());
    return true;
}

void DirectoryWatcher::stop() noexcept {
    if (!running_.exchange(false)) return;

    if (watcher_thread_.joinable()) watcher_thread_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    wd_to_path_.clear();
    inotify_fd_.reset();
    SESHAT_LOG_DEBUG("watch", "Watcher stopped");
}

size_t DirectoryWatcher::watch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wd_to_path_.size();
}

void DirectoryWatcher::handle_event(int wd, uint32_t mask, const char* name) {
    if (mask & IN_Q_OVERFLOW) {
        ++metrics_.watch_overflows;
        SESHAT_LOG_WARN("watch", "inotify queue overflow, rescanning %s", root_.c_str());
        if (on_overflow_) on_overflow_();
        return;
    }

    std::string dir;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = wd_to_path_.find(wd);
        if (it == wd_to_path_.end()) return;
        if (mask & IN_IGNORED) {
            wd_to_path_.erase(it);
            return;
        }
        dir = it->second;
    }

    if (!name || name[0] == '\0') return;
    std::string full = join_path(dir, name);

    if (mask & IN_ISDIR) {
        if ((mask & (IN_CREATE | IN_MOVED_TO)) && !IngestFilter::is_ignored_dir_name(name)) {
            SESHAT_LOG_DEBUG("watch", "New directory %s", full.c_str());
            add_watch_recursive(full, true);
        }
        return;
    }

    ++metrics_.watch_events;
    if (!on_event_) return;

    if (mask & IN_MOVED_TO) {
        on_event_(WatchEvent{std::move(full), WatchEventKind::Moved});
    } else if (mask & IN_CREATE) {
        on_event_(WatchEvent{std::move(full), WatchEventKind::Created});
    }
}

void DirectoryWatcher::watch_loop() noexcept {
    block_signals_in_worker_threads();

    alignas(struct inotify_event) char buffer[64 * 1024];

    while (running_.load() && !stop_.stop_requested()) {
        struct pollfd pfd{};
        pfd.fd = inotify_fd_.get();
        pfd.events = POLLIN;

        int rc = poll(&pfd, 1, static_cast<int>(constants::WATCH_POLL_INTERVAL.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            SESHAT_LOG_ERROR("watch", "poll failed: %s", strerror(errno));
            break;
        }
        if (rc == 0) continue;

        ssize_t len = read(inotify_fd_.get(), buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            SESHAT_LOG_ERROR("watch", "inotify read failed: %s", strerror(errno));
            break;
        }

        for (char* p = buffer; p < buffer + len; ) {
            auto* ev = reinterpret_cast<struct inotify_event*>(p);
            try {
                handle_event(ev->wd, ev->mask, ev->len ? ev->name : nullptr);
            } catch (const std::exception& e) {
                SESHAT_LOG_ERROR("watch", "Event handling failed: %s", e.what());
            }
            p += sizeof(struct inotify_event) + ev->len;
        }
    }

    SESHAT_LOG_DEBUG("watch", "Watch loop exiting");
}

}
