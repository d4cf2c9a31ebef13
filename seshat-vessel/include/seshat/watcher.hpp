// -----------------------------------------------------------------------------
// Seshat Vessel - Recursive inotify watch source
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/fs_util.hpp"
#include "seshat/metrics.hpp"
#include "seshat/stop_source.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace seshat {

enum class WatchEventKind { Created, Moved };

struct WatchEvent {
    std::string path;
    WatchEventKind kind;
};

class DirectoryWatcher {
public:
    using EventCallback = std::function<void(const WatchEvent&)>;
    using OverflowCallback = std::function<void()>;

private:
    std::string root_;
    const StopSource& stop_;
    Metrics& metrics_;
    EventCallback on_event_;
    OverflowCallback on_overflow_;

    unique_fd inotify_fd_;
    std::unordered_map<int, std::string> wd_to_path_;
    mutable std::mutex mutex_;
    std::thread watcher_thread_;
    std::atomic<bool> running_{false};

    bool add_watch(const std::string& dir);
    // Watches dir and every non-ignored directory below it. When emit is set,
    // regular files found on the way are reported as Created.
    void add_watch_recursive(const std::string& dir, bool emit);
    void handle_event(int wd, uint32_t mask, const char* name);
    void watch_loop() noexcept;

public:
    DirectoryWatcher(std::string root, const StopSource& stop, Metrics& metrics,
                     EventCallback on_event, OverflowCallback on_overflow = {});
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    bool start();
    void stop() noexcept;

    bool is_running() const noexcept { return running_.load(); }
    size_t watch_count() const;
};

}
