// -----------------------------------------------------------------------------
// Seshat Vessel - Crash-safe relocation into the archive
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/config.hpp"
#include "seshat/file_ops.hpp"
#include "seshat/journal.hpp"
#include "seshat/metrics.hpp"
#include "seshat/retry.hpp"
#include "seshat/stop_source.hpp"

#include <cstdint>
#include <ctime>
#include <functional>
#include <string>

namespace seshat {

enum class PlaceResult { Placed, DuplicateOfExisting, Failed };

// True when the file that already holds a destination name has the same
// content as source.
using SameContentCheck =
    std::function<bool(const std::string& source, const std::string& existing)>;

// Copy to a temp sibling, fsync, rename into place, then unlink the source.
// Copy, rename and unlink are each retried on transient errors. A source that
// cannot be unlinked after the destination is in place is quarantined under
// the watch root. When the atomic protocol fails, a second temp copy is
// published with link(2) before giving up. Nothing is ever written under the
// final destination name except by rename or link of a complete copy.
class AtomicMover {
    const Config& cfg_;
    FileOps& ops_;
    const StopSource& stop_;
    Metrics& metrics_;
    OperationJournal& journal_;
    RetryPolicy policy_;

    bool copy_to_temp(const std::string& source, const std::string& temp, bool& cancelled);
    // Gives temp the destination name without replacing anything. A name
    // taken in the meantime is compared with source: a match is a duplicate,
    // anything else moves on to the next collision name.
    PlaceResult publish(const std::string& source, const std::string& temp,
                        std::string& destination, bool by_link,
                        const SameContentCheck& same_content, bool& cancelled);
    PlaceResult move_atomic(const std::string& source, std::string& destination,
                            const SameContentCheck& same_content,
                            bool& cancelled, bool& no_space);
    PlaceResult move_fallback(const std::string& source, std::string& destination,
                              const SameContentCheck& same_content);
    void discard_temp(const std::string& temp) noexcept;

public:
    AtomicMover(const Config& cfg, FileOps& ops, const StopSource& stop,
                Metrics& metrics, OperationJournal& journal);

    // On success the file exists only at destination, or at a collision name
    // if destination was taken meanwhile (and, if the source could not be
    // removed, also in quarantine). On failure the source is untouched
    // and no partial destination or temp file remains.
    bool move(const std::string& source, const std::string& destination, bool dry_run);

    // As move(), but destination is updated to the name actually used. When
    // same_content matches the file found at a taken name, the copy is
    // dropped, the source is left for the caller and DuplicateOfExisting is
    // returned with destination naming that file.
    PlaceResult place(const std::string& source, std::string& destination, bool dry_run,
                      const SameContentCheck& same_content = {});

    // Unlinks source with retries; quarantines it when that ultimately fails.
    // True when the source is gone from its original location.
    bool remove_source(const std::string& source);

    bool quarantine(const std::string& source);

    // <watch>/._failed_locked/<stem>_locked_<now><ext>
    std::string quarantine_path_for(const std::string& source, std::time_t now) const;

    // ".seshat.tmp.<pid>.<ms>.<seq>.<filename>" beside destination
    static std::string temp_path_for(const std::string& destination);

    // Free space in dir covers size plus the configured margin.
    bool has_free_space(const std::string& dir, uint64_t size) noexcept;
};

}
