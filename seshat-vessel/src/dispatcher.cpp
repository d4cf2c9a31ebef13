#include "seshat/dispatcher.hpp"
#include "seshat/constants.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <future>
#include <utility>

#include <dirent.h>
#include <sys/stat.h>

namespace seshat {

Dispatcher::Dispatcher(WorkerPool& pool, IngestFilter filter, const StopSource& stop,
                       Metrics& metrics, std::chrono::milliseconds debounce)
    : pool_(pool), filter_(std::move(filter)), stop_(stop), metrics_(metrics), debounce_(debounce) {}

Dispatcher::~Dispatcher() {
    stop();
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Initial scan
// -----------------------------------------------------------------------------
std::vector<std::string> Dispatcher::enumerate(const std::string& root) {
    std::vector<std::string> files;
    std::vector<std::pair<std::string, size_t>> stack;
    stack.emplace_back(root, 0);

    while (!stack.empty() && !stop_.stop_requested()) {
        auto [path, depth] = std::move(stack.back());
        stack.pop_back();

        DIR* d = opendir(path.c_str());
        if (!d) {
            SESHAT_LOG_WARN("dispatch", "Failed to open directory: %s: %s", path.c_str(), strerror(errno));
            continue;
        }

        struct dirent* de;
        while ((de = readdir(d)) != nullptr && !stop_.stop_requested()) {
            if (de->d_name[0] == '.' &&
               (de->d_name[1] == '\0' ||
               (de->d_name[1] == '.' && de->d_name[2] == '\0'))) {
                continue;
            }

            std::string full = join_path(path, de->d_name);
            if (!validate_path_length(full)) continue;

            struct stat st{};
            if (lstat(full.c_str(), &st) != 0) continue;

            if (S_ISDIR(st.st_mode)) {
                if (IngestFilter::is_ignored_dir_name(de->d_name)) continue;
                if (depth + 1 > constants::MAX_DIRECTORY_DEPTH) {
                    SESHAT_LOG_WARN("dispatch", "Directory depth exceeds limit (%zu), skipping %s",
                                    constants::MAX_DIRECTORY_DEPTH, full.c_str());
                    continue;
                }
                stack.emplace_back(std::move(full), depth + 1);
            } else if (S_ISREG(st.st_mode)) {
                ++metrics_.files_scanned;
                if (filter_.accepts_path(full)) {
                    files.push_back(std::move(full));
                }
            }
        }

        closedir(d);
    }

    return files;
}

ScanSummary Dispatcher::initial_scan(const std::string& root) {
    ScanSummary summary;

    SESHAT_LOG_INFO("dispatch", "Initial scan of %s", root.c_str());
    std::vector<std::string> files = enumerate(root);
    summary.discovered = files.size();

    if (files.empty()) {
        SESHAT_LOG_INFO("dispatch", "Initial scan found nothing to ingest");
        return summary;
    }
    SESHAT_LOG_INFO("dispatch", "Initial scan found %zu files", files.size());

    std::vector<std::future<TaskResult>> futures;
    futures.reserve(files.size());
    // Scan results are never dropped for lack of queue space
    for (auto& f : files) {
        if (stop_.stop_requested()) break;
        futures.push_back(pool_.submit_blocking(std::move(f)));
    }

    const size_t total = futures.size();
    const size_t step = total >= 10 ? total / 10 : 1;
    size_t done = 0;

    for (auto& fut : futures) {
        while (fut.wait_for(constants::WORKER_SHUTDOWN_POLL_INTERVAL) != std::future_status::ready) {
            if (stop_.stop_requested()) {
                SESHAT_LOG_INFO("dispatch", "Initial scan interrupted after %zu/%zu files", done, total);
                return summary;
            }
        }

        try {
            TaskResult r = fut.get();
            if (!r) {
                ++summary.skipped;
            } else if (r->kind == OutcomeKind::Moved) {
                ++summary.moved;
            } else if (r->kind == OutcomeKind::DuplicateSkipped) {
                ++summary.duplicates;
            } else {
                ++summary.failed;
            }
        } catch (const std::exception& e) {
            ++summary.failed;
            SESHAT_LOG_ERROR("dispatch", "Scan task failed: %s", e.what());
        }

        ++done;
        if (done % step == 0 || done == total) {
            SESHAT_LOG_INFO("dispatch", "Initial scan progress: %zu/%zu (%zu%%)",
                            done, total, done * 100 / total);
        }
    }

    SESHAT_LOG_INFO("dispatch", "Initial scan complete: moved=%zu duplicates=%zu failed=%zu skipped=%zu",
                    summary.moved, summary.duplicates, summary.failed, summary.skipped);
    return summary;
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Debounced live events
// -----------------------------------------------------------------------------
void Dispatcher::on_watch_event(const WatchEvent& event) {
    if (!filter_.accepts_path(event.path)) {
        SESHAT_LOG_DEBUG("dispatch", "Ignoring event for %s", event.path.c_str());
        return;
    }
    schedule(event.path);
}

void Dispatcher::schedule(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        pending_[path] = std::chrono::steady_clock::now() + debounce_;
    }
    cv_.notify_one();
}

size_t Dispatcher::pending_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
}

void Dispatcher::start() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_) return;
    running_ = true;
    debounce_thread_ = std::thread(&Dispatcher::debounce_loop, this);
}

void Dispatcher::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (debounce_thread_.joinable()) debounce_thread_.join();
}

void Dispatcher::debounce_loop() noexcept {
    block_signals_in_worker_threads();

    std::unique_lock<std::mutex> lock(mtx_);
    while (running_ && !stop_.stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        auto next_check = now + constants::WATCH_POLL_INTERVAL;

        std::vector<std::string> due;
        for (auto it = pending_.begin(); it != pending_.end(); ) {
            if (it->second <= now) {
                due.push_back(it->first);
                it = pending_.erase(it);
            } else {
                if (it->second < next_check) next_check = it->second;
                ++it;
            }
        }

        if (!due.empty()) {
            lock.unlock();
            for (auto& path : due) {
                SESHAT_LOG_DEBUG("dispatch", "Quiet period over, submitting %s", path.c_str());
                // Live submissions are fire-and-forget; outcomes are logged by workers
                pool_.submit(std::move(path));
            }
            lock.lock();
            continue;
        }

        cv_.wait_until(lock, next_check);
    }
}

}
