#include "seshat/stop_source.hpp"

namespace seshat {

void StopSource::request_stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopped_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool StopSource::wait_for(std::chrono::milliseconds d) const {
    return wait_until(std::chrono::steady_clock::now() + d);
}

bool StopSource::wait_until(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mtx_);
    return !cv_.wait_until(lock, deadline, [this] {
        return stopped_.load(std::memory_order_acquire);
    });
}

}
