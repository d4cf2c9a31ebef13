#include "seshat/mover.hpp"
#include "seshat/constants.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"
#include "seshat/router.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <cstring>
#include <limits>

#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace seshat {

AtomicMover::AtomicMover(const Config& cfg, FileOps& ops, const StopSource& stop,
                         Metrics& metrics, OperationJournal& journal)
    : cfg_(cfg), ops_(ops), stop_(stop), metrics_(metrics), journal_(journal),
      policy_(RetryPolicy::from_config(cfg)) {}

static std::atomic<uint64_t> g_temp_sequence{0};

std::string AtomicMover::temp_path_for(const std::string& destination) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string name = constants::TEMP_PREFIX;
    name += std::to_string(getpid());
    name += '.';
    name += std::to_string(static_cast<long long>(ms));
    name += '.';
    name += std::to_string(g_temp_sequence.fetch_add(1, std::memory_order_relaxed));
    name += '.';
    name += base_name(destination);
    return join_path(parent_dir(destination), name);
}

std::string AtomicMover::quarantine_path_for(const std::string& source, std::time_t now) const {
    std::string stem, ext;
    split_name(base_name(source), stem, ext);
    std::string dir = join_path(cfg_.watch_dir, constants::QUARANTINE_DIR);
    return join_path(dir, stem + "_locked_" + std::to_string(static_cast<long long>(now)) + ext);
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Disk space checks
// -----------------------------------------------------------------------------
bool AtomicMover::has_free_space(const std::string& dir, uint64_t size) noexcept {
    const uint64_t margin = cfg_.min_free_bytes();
    if (size > std::numeric_limits<uint64_t>::max() - margin) {
        SESHAT_LOG_ERROR("mover", "File size too large for safe calculation: %" PRIu64, size);
        return false;
    }

    uint64_t need = size + margin;

    struct statvfs sv{};
    if (statvfs(dir.c_str(), &sv) != 0) {
        SESHAT_LOG_WARN("mover", "statvfs failed for %s: %s", dir.c_str(), strerror(errno));
        return true;
    }

    uint64_t avail = static_cast<uint64_t>(sv.f_bavail) * sv.f_frsize;
    if (avail < need) {
        ++metrics_.out_of_space;
        SESHAT_LOG_ERROR("mover", "OUT OF SPACE on %s: need=%" PRIu64 " avail=%" PRIu64,
                         dir.c_str(), need, avail);
        return false;
    }

    return true;
}

void AtomicMover::discard_temp(const std::string& temp) noexcept {
    int saved = errno;
    if (unlink(temp.c_str()) != 0 && errno != ENOENT) {
        SESHAT_LOG_WARN("mover", "Cannot remove temp file %s: %s", temp.c_str(), strerror(errno));
    }
    errno = saved;
}

// -----------------------------------------------------------------------------
// Quarantine for sources that refuse to go away
// -----------------------------------------------------------------------------
bool AtomicMover::quarantine(const std::string& source) {
    const std::string qdir = join_path(cfg_.watch_dir, constants::QUARANTINE_DIR);
    if (mkdir_p_safe(qdir, 0750) != 0) {
        SESHAT_LOG_ERROR("mover", "Cannot create quarantine %s: %s", qdir.c_str(), strerror(errno));
        journal_.record("QUARANTINE", source, qdir, false, strerror(errno));
        return false;
    }

    std::string target = quarantine_path_for(source, time(nullptr));
    bool ok = ops_.rename_file(source, target);
    std::string stem, ext;
    split_name(base_name(target), stem, ext);
    for (int n = 1; !ok && errno == EEXIST && n <= constants::MAX_UNIQUE_NAME_COUNTER; ++n) {
        std::string alt = join_path(qdir, stem + "_" + std::to_string(n) + ext);
        ok = ops_.rename_file(source, alt);
        if (ok) target = alt;
    }

    if (!ok) {
        int err = errno;
        SESHAT_LOG_ERROR("mover", "Cannot quarantine %s: %s", source.c_str(), strerror(err));
        journal_.record("QUARANTINE", source, target, false, strerror(err));
        return false;
    }

    ++metrics_.quarantined;
    SESHAT_LOG_WARN("mover", "Quarantined locked source %s -> %s", source.c_str(), target.c_str());
    journal_.record("QUARANTINE", source, target, true);
    return true;
}

bool AtomicMover::remove_source(const std::string& source) {
    RetryReport report;
    bool removed = with_retries("delete", source, policy_, stop_, metrics_,
                                [&] { return ops_.remove_file(source) || errno == ENOENT; },
                                &report);
    if (removed) return true;

    if (report.cancelled) {
        SESHAT_LOG_WARN("mover", "Shutdown during delete, %s left in place", source.c_str());
        return false;
    }

    SESHAT_LOG_ERROR("mover", "Cannot delete %s after %d attempts: %s",
                     source.c_str(), report.attempts, strerror(report.last_errno));
    return quarantine(source);
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Atomic protocol: temp copy, rename, unlink
// -----------------------------------------------------------------------------
bool AtomicMover::copy_to_temp(const std::string& source, const std::string& temp,
                               bool& cancelled) {
    RetryReport report;
    bool copied = with_retries("copy", source, policy_, stop_, metrics_, [&] {
        discard_temp(temp);
        return ops_.copy_file(source, temp);
    }, &report);
    if (!copied) {
        discard_temp(temp);
        cancelled = report.cancelled;
        SESHAT_LOG_ERROR("mover", "Copy %s -> %s failed: %s",
                         source.c_str(), temp.c_str(), strerror(report.last_errno));
        errno = report.last_errno;
    }
    return copied;
}

PlaceResult AtomicMover::publish(const std::string& source, const std::string& temp,
                                 std::string& destination, bool by_link,
                                 const SameContentCheck& same_content, bool& cancelled) {
    const std::string dest_dir = parent_dir(destination);
    const std::string name = base_name(source);

    for (int clash = 0; ; ++clash) {
        RetryReport report;
        bool published = with_retries(by_link ? "link" : "rename", temp, policy_, stop_, metrics_, [&] {
            return by_link ? ops_.link_file(temp, destination) : ops_.rename_file(temp, destination);
        }, &report);

        if (published) {
            if (by_link) discard_temp(temp);
            return PlaceResult::Placed;
        }

        if (report.last_errno != EEXIST) {
            discard_temp(temp);
            cancelled = report.cancelled;
            SESHAT_LOG_ERROR("mover", "%s %s -> %s failed: %s", by_link ? "Link" : "Rename",
                             temp.c_str(), destination.c_str(), strerror(report.last_errno));
            errno = report.last_errno;
            return PlaceResult::Failed;
        }

        // Another file took the name while we were copying
        if (same_content && same_content(source, destination)) {
            SESHAT_LOG_INFO("dedup", "%s appeared during copy with the same content as %s",
                            destination.c_str(), source.c_str());
            discard_temp(temp);
            return PlaceResult::DuplicateOfExisting;
        }

        if (clash >= constants::MAX_UNIQUE_NAME_COUNTER) {
            discard_temp(temp);
            SESHAT_LOG_ERROR("mover", "No free name for %s in %s", name.c_str(), dest_dir.c_str());
            errno = EEXIST;
            return PlaceResult::Failed;
        }

        std::string next = make_unique_destination(dest_dir, name, time(nullptr));
        SESHAT_LOG_WARN("mover", "%s was taken during copy, using %s",
                        destination.c_str(), next.c_str());
        destination = std::move(next);
    }
}

PlaceResult AtomicMover::move_atomic(const std::string& source, std::string& destination,
                                     const SameContentCheck& same_content,
                                     bool& cancelled, bool& no_space) {
    struct stat st{};
    if (stat(source.c_str(), &st) != 0) {
        SESHAT_LOG_ERROR("mover", "Cannot stat source %s: %s", source.c_str(), strerror(errno));
        return PlaceResult::Failed;
    }

    const std::string dest_dir = parent_dir(destination);
    const std::string temp = temp_path_for(destination);

    if (!has_free_space(dest_dir, static_cast<uint64_t>(st.st_size))) {
        no_space = true;
        errno = ENOSPC;
        return PlaceResult::Failed;
    }

    if (!copy_to_temp(source, temp, cancelled)) return PlaceResult::Failed;

    PlaceResult r = publish(source, temp, destination, false, same_content, cancelled);
    if (r != PlaceResult::Placed) return r;

    if (fsync_dir(dest_dir) != 0) {
        SESHAT_LOG_DEBUG("mover", "Directory fsync skipped for %s", dest_dir.c_str());
    }

    // The destination is now authoritative
    if (!remove_source(source)) {
        SESHAT_LOG_WARN("mover", "Source %s still present after move", source.c_str());
    }

    journal_.record("MOVE", source, destination, true);
    return PlaceResult::Placed;
}

// -----------------------------------------------------------------------------
// Second temp copy published by hard link
// -----------------------------------------------------------------------------
PlaceResult AtomicMover::move_fallback(const std::string& source, std::string& destination,
                                       const SameContentCheck& same_content) {
    ++metrics_.fallback_copies;
    SESHAT_LOG_WARN("mover", "Atomic move failed, trying linked copy %s -> %s",
                    source.c_str(), destination.c_str());

    const std::string temp = temp_path_for(destination);
    bool cancelled = false;
    PlaceResult r = PlaceResult::Failed;
    if (copy_to_temp(source, temp, cancelled)) {
        r = publish(source, temp, destination, true, same_content, cancelled);
    }

    if (r == PlaceResult::Failed) {
        int err = errno;
        SESHAT_LOG_ERROR("mover", "Linked copy %s -> %s failed: %s",
                         source.c_str(), destination.c_str(), strerror(err));
        journal_.record("FALLBACK_COPY", source, destination, false, strerror(err));
        return r;
    }
    if (r == PlaceResult::DuplicateOfExisting) return r;

    if (fsync_dir(parent_dir(destination)) != 0) {
        SESHAT_LOG_DEBUG("mover", "Directory fsync skipped for %s", destination.c_str());
    }

    if (!remove_source(source)) {
        SESHAT_LOG_WARN("mover", "Source %s still present after linked copy", source.c_str());
    }

    journal_.record("FALLBACK_COPY", source, destination, true);
    return PlaceResult::Placed;
}

bool AtomicMover::move(const std::string& source, const std::string& destination, bool dry_run) {
    std::string dest = destination;
    return place(source, dest, dry_run) == PlaceResult::Placed;
}

PlaceResult AtomicMover::place(const std::string& source, std::string& destination, bool dry_run,
                               const SameContentCheck& same_content) {
    if (dry_run) {
        SESHAT_LOG_INFO("mover", "[DRY RUN] Would move %s -> %s", source.c_str(), destination.c_str());
        return PlaceResult::Placed;
    }

    const std::string dest_dir = parent_dir(destination);
    if (mkdir_p_safe(dest_dir) != 0) {
        int err = errno;
        SESHAT_LOG_ERROR("mover", "Cannot create %s: %s", dest_dir.c_str(), strerror(err));
        journal_.record("MOVE_FAILED", source, destination, false, strerror(err));
        return PlaceResult::Failed;
    }

    bool cancelled = false;
    bool no_space = false;
    PlaceResult r = move_atomic(source, destination, same_content, cancelled, no_space);
    if (r != PlaceResult::Failed) return r;

    if (!cancelled && !no_space) {
        r = move_fallback(source, destination, same_content);
        if (r != PlaceResult::Failed) return r;
    }

    journal_.record("MOVE_FAILED", source, destination, false,
                    cancelled ? "cancelled" : (no_space ? "out of space" : nullptr));
    return PlaceResult::Failed;
}

}
