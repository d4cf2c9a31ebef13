// -----------------------------------------------------------------------------
// Seshat Vessel - Write-completion detection
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/stop_source.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace seshat {

struct Config;

struct StabilityOptions {
    std::chrono::milliseconds min_window{2000};
    std::chrono::milliseconds max_wait_budget{1800 * 1000};
    std::chrono::milliseconds poll_interval{500};

    static StabilityOptions from_config(const Config& cfg);
};

// Quiet period required for a file of size_bytes: 0.2 s per MiB, never less
// than min_window, capped at one minute.
std::chrono::milliseconds adaptive_window(uint64_t size_bytes,
                                          std::chrono::milliseconds min_window) noexcept;

// Total time allowed: 2 s per MiB with a one minute floor, capped by max_wait.
std::chrono::milliseconds adaptive_budget(uint64_t size_bytes,
                                          std::chrono::milliseconds max_wait) noexcept;

class StabilityMonitor {
    StabilityOptions opts_;
    const StopSource& stop_;

public:
    StabilityMonitor(StabilityOptions opts, const StopSource& stop)
        : opts_(opts), stop_(stop) {}

    // True once the file is non-empty, writable-openable, unlocked and its size
    // has not changed for the adaptive window. False on timeout, disappearance,
    // stat failure, empty file or stop request.
    bool is_stable(const std::string& path) const;
    bool is_stable(const std::string& path,
                   std::chrono::milliseconds min_window,
                   std::chrono::milliseconds max_wait_budget) const;
};

}
