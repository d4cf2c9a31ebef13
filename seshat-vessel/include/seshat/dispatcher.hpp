// -----------------------------------------------------------------------------
// Seshat Vessel - Task dispatch: initial scan and debounced live events
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/ingest_filter.hpp"
#include "seshat/metrics.hpp"
#include "seshat/stop_source.hpp"
#include "seshat/watcher.hpp"
#include "seshat/worker_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace seshat {

struct ScanSummary {
    size_t discovered = 0;
    size_t moved = 0;
    size_t duplicates = 0;
    size_t failed = 0;
    size_t skipped = 0;
};

class Dispatcher {
    WorkerPool& pool_;
    IngestFilter filter_;
    const StopSource& stop_;
    Metrics& metrics_;
    std::chrono::milliseconds debounce_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> pending_;
    std::thread debounce_thread_;
    bool running_ = false;

    void debounce_loop() noexcept;

public:
    Dispatcher(WorkerPool& pool, IngestFilter filter, const StopSource& stop,
               Metrics& metrics, std::chrono::milliseconds debounce);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Every candidate file below root, fully enumerated before anything is
    // dispatched. Ignored directories are not descended.
    std::vector<std::string> enumerate(const std::string& root);

    // Enumerates, submits everything and waits for the outcomes, logging
    // progress roughly every 10%. Returns early on stop.
    ScanSummary initial_scan(const std::string& root);

    // Live event entry point; restarts the quiet delay for the path.
    void on_watch_event(const WatchEvent& event);
    void schedule(const std::string& path);

    void start();
    void stop() noexcept;

    size_t pending_count();
};

}
