#include "seshat/worker_pool.hpp"
#include "seshat/log.hpp"

#include <csignal>
#include <exception>

#include <pthread.h>

namespace seshat {

void block_signals_in_worker_threads() noexcept {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

WorkerPool::WorkerPool(int threads, TaskHandler handler, const StopSource& shutdown,
                       Metrics& metrics, size_t capacity)
    : handler_(std::move(handler)), shutdown_(shutdown), metrics_(metrics), capacity_(capacity) {
    if (threads < constants::MIN_WORKERS) threads = constants::MIN_WORKERS;
    if (threads > constants::MAX_WORKERS) threads = constants::MAX_WORKERS;

    std::lock_guard<std::mutex> lk(mtx_);
    for (int i = 0; i < threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker, this);
    }

    SESHAT_LOG_INFO("seshat", "Worker pool created with %d threads", threads);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::worker() noexcept {
    SESHAT_LOG_DEBUG("seshat", "Worker thread started");
    block_signals_in_worker_threads();

    for (;;) {
        IngestTask task;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            while (queue_.empty()) {
                if (stop_.load(std::memory_order_acquire) || shutdown_.stop_requested()) {
                    SESHAT_LOG_DEBUG("seshat", "Worker thread stopping");
                    return;
                }
                cv_.wait_for(lk, constants::WORKER_SHUTDOWN_POLL_INTERVAL);
            }
            if (stop_.load(std::memory_order_acquire) || shutdown_.stop_requested()) {
                SESHAT_LOG_DEBUG("seshat", "Worker thread stopping");
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            metrics_.queued_tasks.fetch_sub(1, std::memory_order_relaxed);
        }
        space_cv_.notify_one();

        try {
            task.result.set_value(handler_(task.path));
        } catch (const std::exception& e) {
            SESHAT_LOG_ERROR("seshat", "Task for %s threw: %s", task.path.c_str(), e.what());
            task.result.set_exception(std::current_exception());
        } catch (...) {
            SESHAT_LOG_ERROR("seshat", "Task for %s threw a non-standard exception", task.path.c_str());
            task.result.set_exception(std::current_exception());
        }
    }
}

std::future<TaskResult> WorkerPool::submit(std::string path) {
    IngestTask task;
    task.path = std::move(path);
    task.discovered_at = std::chrono::system_clock::now();
    std::future<TaskResult> fut = task.result.get_future();

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stop_.load(std::memory_order_acquire) || shutdown_.stop_requested()) {
            task.result.set_value(std::nullopt);
            return fut;
        }

        if (queue_.size() >= capacity_) {
            ++metrics_.queue_full_rejections;
            SESHAT_LOG_WARN("dispatch", "Ingest queue full (%zu items), rejecting %s",
                            queue_.size(), task.path.c_str());
            task.result.set_value(std::nullopt);
            return fut;
        }

        queue_.push_back(std::move(task));
        metrics_.queued_tasks.fetch_add(1, std::memory_order_relaxed);
    }

    cv_.notify_one();
    return fut;
}

std::future<TaskResult> WorkerPool::submit_blocking(std::string path) {
    IngestTask task;
    task.path = std::move(path);
    task.discovered_at = std::chrono::system_clock::now();
    std::future<TaskResult> fut = task.result.get_future();

    {
        std::unique_lock<std::mutex> lk(mtx_);
        for (;;) {
            if (stop_.load(std::memory_order_acquire) || shutdown_.stop_requested()) {
                task.result.set_value(std::nullopt);
                return fut;
            }
            if (queue_.size() < capacity_) break;
            space_cv_.wait_for(lk, constants::WORKER_SHUTDOWN_POLL_INTERVAL);
        }

        queue_.push_back(std::move(task));
        metrics_.queued_tasks.fetch_add(1, std::memory_order_relaxed);
    }

    cv_.notify_one();
    return fut;
}

void WorkerPool::stop() noexcept {
    if (stop_.exchange(true, std::memory_order_acq_rel)) return;

    SESHAT_LOG_INFO("seshat", "Stopping worker pool");
    cv_.notify_all();
    space_cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    std::deque<IngestTask> abandoned;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        abandoned.swap(queue_);
        metrics_.queued_tasks.store(0, std::memory_order_relaxed);
    }
    for (auto& task : abandoned) {
        task.result.set_value(std::nullopt);
    }
    if (!abandoned.empty()) {
        SESHAT_LOG_INFO("seshat", "Abandoned %zu queued tasks", abandoned.size());
    }

    SESHAT_LOG_INFO("seshat", "Worker pool stopped");
}

size_t WorkerPool::queue_size() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

}
