#include "seshat/metrics.hpp"

#include <cinttypes>
#include <cstdio>

namespace seshat {

int format_metrics(const Metrics& m, char* buf, size_t sz) noexcept {
    int n = snprintf(buf, sz,
        "processed %" PRIu64 "\n"
        "moved %" PRIu64 "\n"
        "duplicates %" PRIu64 "\n"
        "failed %" PRIu64 "\n"
        "ignored %" PRIu64 "\n"
        "claims_rejected %" PRIu64 "\n"
        "transient_retries %" PRIu64 "\n"
        "quarantined %" PRIu64 "\n"
        "fallback_copies %" PRIu64 "\n"
        "copy_file_range_calls %" PRIu64 "\n"
        "buffered_copy_calls %" PRIu64 "\n"
        "copy_bytes_total %" PRIu64 "\n"
        "copy_operations_time_ms %" PRIu64 "\n"
        "temp_gc_removed %" PRIu64 "\n"
        "dirs_pruned %" PRIu64 "\n"
        "out_of_space %" PRIu64 "\n"
        "queue_full_rejections %" PRIu64 "\n"
        "stability_timeouts %" PRIu64 "\n"
        "unexpected_errors %" PRIu64 "\n"
        "watch_events %" PRIu64 "\n"
        "watch_overflows %" PRIu64 "\n"
        "files_scanned %" PRIu64 "\n"
        "active_tasks %d\n"
        "queued_tasks %d\n"
        "image_processed %" PRIu64 "\n"
        "raw_processed %" PRIu64 "\n"
        "video_processed %" PRIu64 "\n"
        "other_processed %" PRIu64 "\n",
        m.processed.load(),
        m.moved.load(),
        m.duplicates.load(),
        m.failed.load(),
        m.ignored.load(),
        m.claims_rejected.load(),
        m.transient_retries.load(),
        m.quarantined.load(),
        m.fallback_copies.load(),
        m.copy_file_range_calls.load(),
        m.buffered_copy_calls.load(),
        m.copy_bytes_total.load(),
        m.copy_operations_time_ms.load(),
        m.temp_gc_removed.load(),
        m.dirs_pruned.load(),
        m.out_of_space.load(),
        m.queue_full_rejections.load(),
        m.stability_timeouts.load(),
        m.unexpected_errors.load(),
        m.watch_events.load(),
        m.watch_overflows.load(),
        m.files_scanned.load(),
        m.active_tasks.load(),
        m.queued_tasks.load(),
        m.image_processed.load(),
        m.raw_processed.load(),
        m.video_processed.load(),
        m.other_processed.load()
    );

    return (n < 0 || static_cast<size_t>(n) >= sz) ? -1 : n;
}

}
