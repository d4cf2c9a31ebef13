// -----------------------------------------------------------------------------
// Seshat Vessel - Fixed-size worker pool for ingest tasks
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/constants.hpp"
#include "seshat/coordinator.hpp"
#include "seshat/metrics.hpp"
#include "seshat/stop_source.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace seshat {

using TaskResult = std::optional<MoveOutcome>;

struct IngestTask {
    std::string path;
    std::chrono::system_clock::time_point discovered_at;
    std::promise<TaskResult> result;
};

using TaskHandler = std::function<TaskResult(const std::string&)>;

// SIGINT, SIGTERM, SIGHUP and SIGPIPE are handled by the main thread only.
void block_signals_in_worker_threads() noexcept;

class WorkerPool {
    std::vector<std::thread> workers_;
    std::deque<IngestTask> queue_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable space_cv_;
    std::atomic<bool> stop_{false};
    TaskHandler handler_;
    const StopSource& shutdown_;
    Metrics& metrics_;
    size_t capacity_;

    void worker() noexcept;

public:
    WorkerPool(int threads, TaskHandler handler, const StopSource& shutdown,
               Metrics& metrics, size_t capacity = constants::MAX_QUEUED_TASKS);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // The future resolves to no outcome when the task is rejected (queue full
    // or pool stopping) or abandoned at shutdown.
    std::future<TaskResult> submit(std::string path);

    // Like submit(), but waits for queue space instead of rejecting. Resolves
    // to no outcome only if the pool stops while waiting.
    std::future<TaskResult> submit_blocking(std::string path);

    // Joins all workers. Tasks still queued resolve to no outcome.
    void stop() noexcept;

    size_t queue_size() const noexcept;
    int thread_count() const noexcept { return static_cast<int>(workers_.size()); }
};

}
