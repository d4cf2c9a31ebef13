// -----------------------------------------------------------------------------
// Seshat Vessel - Cancellable waits for graceful shutdown
// -----------------------------------------------------------------------------
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace seshat {

// Every sleep in the pipeline goes through one of these so that a stop
// request wakes it immediately.
class StopSource {
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::atomic<bool> stopped_{false};

public:
    StopSource() = default;
    StopSource(const StopSource&) = delete;
    StopSource& operator=(const StopSource&) = delete;

    void request_stop() noexcept;
    bool stop_requested() const noexcept { return stopped_.load(std::memory_order_acquire); }

    // Sleeps for d. Returns false if stop was requested before or during the wait.
    bool wait_for(std::chrono::milliseconds d) const;

    // Waits until stop is requested or the deadline passes.
    bool wait_until(std::chrono::steady_clock::time_point deadline) const;
};

}
