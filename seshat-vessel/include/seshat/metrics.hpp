// -----------------------------------------------------------------------------
// Seshat Vessel - Performance monitoring across all modules
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/ingest_filter.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace seshat {

struct Metrics {
    std::atomic<uint64_t> processed{0};
    std::atomic<uint64_t> moved{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> ignored{0};
    std::atomic<uint64_t> claims_rejected{0};
    std::atomic<uint64_t> transient_retries{0};
    std::atomic<uint64_t> quarantined{0};
    std::atomic<uint64_t> fallback_copies{0};
    std::atomic<uint64_t> copy_file_range_calls{0};
    std::atomic<uint64_t> buffered_copy_calls{0};
    std::atomic<uint64_t> copy_bytes_total{0};
    std::atomic<uint64_t> copy_operations_time_ms{0};
    std::atomic<uint64_t> temp_gc_removed{0};
    std::atomic<uint64_t> dirs_pruned{0};
    std::atomic<uint64_t> out_of_space{0};
    std::atomic<uint64_t> queue_full_rejections{0};
    std::atomic<uint64_t> stability_timeouts{0};
    std::atomic<uint64_t> unexpected_errors{0};
    std::atomic<uint64_t> watch_events{0};
    std::atomic<uint64_t> watch_overflows{0};
    std::atomic<uint64_t> files_scanned{0};
    std::atomic<int>      active_tasks{0};
    std::atomic<int>      queued_tasks{0};

    std::atomic<uint64_t> image_processed{0};
    std::atomic<uint64_t> raw_processed{0};
    std::atomic<uint64_t> video_processed{0};
    std::atomic<uint64_t> other_processed{0};

    void count_category(MediaCategory c) noexcept {
        switch (c) {
            case MediaCategory::Image: ++image_processed; break;
            case MediaCategory::Raw:   ++raw_processed; break;
            case MediaCategory::Video: ++video_processed; break;
            case MediaCategory::Other: ++other_processed; break;
        }
    }
};

// Renders "name value" lines. Returns the length written, or -1 if truncated.
int format_metrics(const Metrics& m, char* buf, size_t sz) noexcept;

}
