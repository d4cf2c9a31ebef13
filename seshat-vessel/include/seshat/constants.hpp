// -----------------------------------------------------------------------------
// Seshat Vessel - System constants and configuration boundaries
// -----------------------------------------------------------------------------
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace seshat {
namespace constants {
    constexpr int MIN_WORKERS = 1;
    constexpr int MAX_WORKERS = 32;
    constexpr uint64_t MIN_COPY_BUFFER_MB = 1;
    constexpr uint64_t MAX_COPY_BUFFER_MB = 256;
    constexpr size_t MAX_QUEUED_TASKS = 30000;
    constexpr size_t MAX_DIRECTORY_DEPTH = 64;
    constexpr size_t HISTORY_EVICT_BATCH = 100;
    constexpr int MAX_UNIQUE_NAME_COUNTER = 100;
    constexpr size_t MAX_JOURNAL_ENTRIES = 20000;
    constexpr size_t HASH_BLOCK_SIZE = 64 * 1024;

    // Stability window scaling: 0.2 s per MiB, capped at one minute.
    constexpr double STABLE_SEC_PER_MB = 0.2;
    constexpr std::chrono::milliseconds MAX_STABLE_WINDOW(60000);
    // Stability budget scaling: 2 s per MiB, at least one minute.
    constexpr double BUDGET_SEC_PER_MB = 2.0;
    constexpr std::chrono::milliseconds MIN_STABILITY_BUDGET(60000);

    constexpr std::chrono::milliseconds WORKER_SHUTDOWN_POLL_INTERVAL(100);
    constexpr std::chrono::milliseconds WATCH_POLL_INTERVAL(250);

    constexpr const char* TEMP_PREFIX = ".seshat.tmp.";
    constexpr const char* QUARANTINE_DIR = "._failed_locked";
}
}
