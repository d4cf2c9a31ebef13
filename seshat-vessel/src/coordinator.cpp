#include "seshat/coordinator.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"
#include "seshat/metadata.hpp"
#include "seshat/router.hpp"

#include <cerrno>
#include <cstring>
#include <exception>

namespace seshat {

const char* outcome_name(OutcomeKind k) noexcept {
    switch (k) {
        case OutcomeKind::Moved:            return "moved";
        case OutcomeKind::DuplicateSkipped: return "duplicate";
        case OutcomeKind::Failed:           return "failed";
    }
    return "unknown";
}

static std::string canonical_or_self(const std::string& path) {
    std::string c = canonical_path(path);
    return c.empty() ? path : c;
}

IngestionCoordinator::IngestionCoordinator(const Config& cfg, ProcessingRegistry& registry,
                                           AtomicMover& mover, DirectoryReaper& reaper,
                                           const StopSource& stop, Metrics& metrics,
                                           OperationJournal& journal, TimestampResolver resolver)
    : cfg_(cfg), registry_(registry), mover_(mover), reaper_(reaper), stop_(stop),
      metrics_(metrics), journal_(journal),
      archive_root_(canonical_or_self(cfg.archive_root)),
      filter_(canonical_or_self(cfg.watch_dir)),
      stability_(StabilityOptions::from_config(cfg), stop),
      dedup_(cfg.checksum_on_dup),
      resolve_timestamp_(std::move(resolver)) {
    if (!resolve_timestamp_) {
        resolve_timestamp_ = [](const std::string& p) { return MetadataResolver{}.resolve(p); };
    }
}

MoveOutcome IngestionCoordinator::fail(const std::string& path, std::string reason) {
    ++metrics_.failed;
    SESHAT_LOG_ERROR("seshat", "Failed %s: %s", path.c_str(), reason.c_str());
    MoveOutcome out;
    out.kind = OutcomeKind::Failed;
    out.reason = std::move(reason);
    return out;
}

std::optional<MoveOutcome> IngestionCoordinator::process(const std::string& path) {
    // Symlinks are never followed into the pipeline
    if (!is_regular_file(path)) {
        ++metrics_.ignored;
        SESHAT_LOG_DEBUG("seshat", "Ignoring %s: not a regular file", path.c_str());
        return std::nullopt;
    }

    const std::string key = canonical_path(path);
    if (key.empty() || !filter_.accepts(key)) {
        ++metrics_.ignored;
        SESHAT_LOG_DEBUG("seshat", "Ignoring %s", path.c_str());
        return std::nullopt;
    }

    ClaimResult claim = registry_.try_claim(key);
    if (claim != ClaimResult::Claimed) {
        ++metrics_.claims_rejected;
        SESHAT_LOG_DEBUG("registry", "Skipping %s: %s", key.c_str(), claim_result_name(claim));
        return std::nullopt;
    }

    ClaimGuard guard(registry_, key);
    ++metrics_.active_tasks;

    std::optional<MoveOutcome> outcome;
    try {
        outcome = run_claimed(key);
    } catch (const std::exception& e) {
        ++metrics_.unexpected_errors;
        outcome = fail(key, e.what());
    } catch (...) {
        ++metrics_.unexpected_errors;
        outcome = fail(key, "unknown exception");
    }

    --metrics_.active_tasks;
    return outcome;
}

std::optional<MoveOutcome> IngestionCoordinator::run_claimed(const std::string& path) {
    ++metrics_.processed;
    metrics_.count_category(category_for_extension(lower_ext(path)).value_or(MediaCategory::Other));

    const std::string name = base_name(path);
    SESHAT_LOG_INFO("seshat", "Processing: %s", name.c_str());

    // Stabilizing
    const int attempts = cfg_.stability_attempts;
    for (int attempt = 1; ; ++attempt) {
        if (stop_.stop_requested()) return std::nullopt;
        if (stability_.is_stable(path)) break;
        if (stop_.stop_requested()) return std::nullopt;

        if (!is_regular_file(path)) {
            return fail(path, "source vanished before it became stable");
        }
        if (attempt >= attempts) {
            ++metrics_.stability_timeouts;
            return fail(path, "file not stable after " + std::to_string(attempts) + " attempts");
        }
        if (!stop_.wait_for(std::chrono::milliseconds(cfg_.stability_retry_ms))) {
            return std::nullopt;
        }
    }

    // Classified
    std::optional<std::time_t> taken = resolve_timestamp_(path);
    DestinationBucket bucket = resolve_destination_bucket(path, taken);

    std::string dest_dir;
    if (!archive_directory_for(archive_root_, bucket, dest_dir)) {
        return fail(path, "destination outside archive root");
    }

    if (dedup_.is_duplicate(path, dest_dir)) {
        return handle_duplicate(path, join_path(dest_dir, name));
    }

    // May be renamed again if another file takes it while we copy
    std::string destination = make_unique_destination(dest_dir, name, time(nullptr));
    const PlaceResult placed = mover_.place(path, destination, cfg_.dry_run,
        [this](const std::string& source, const std::string& existing) {
            return dedup_.same_content(source, existing);
        });

    if (placed == PlaceResult::DuplicateOfExisting) {
        return handle_duplicate(path, destination);
    }

    if (!cfg_.dry_run) {
        reaper_.prune_empty_ancestors(parent_dir(path));
    }

    if (placed != PlaceResult::Placed) {
        return fail(path, "move to " + destination + " failed");
    }

    ++metrics_.moved;
    SESHAT_LOG_INFO("seshat", "%s: %s -> %s", cfg_.dry_run ? "Would move" : "Moved",
                    name.c_str(), destination.c_str());

    MoveOutcome out;
    out.kind = OutcomeKind::Moved;
    out.destination = destination;
    return out;
}

std::optional<MoveOutcome> IngestionCoordinator::handle_duplicate(const std::string& path,
                                                                  const std::string& existing) {
    ++metrics_.duplicates;

    MoveOutcome out;
    out.kind = OutcomeKind::DuplicateSkipped;
    out.destination = existing;

    if (cfg_.dry_run) {
        SESHAT_LOG_INFO("dedup", "[DRY RUN] Would delete duplicate %s (matches %s)",
                        path.c_str(), existing.c_str());
        return out;
    }

    SESHAT_LOG_INFO("dedup", "Duplicate found, deleting source: %s", path.c_str());
    bool removed = mover_.remove_source(path);
    journal_.record("DUPLICATE_REMOVED", path, existing, removed,
                    removed ? nullptr : "source left in place");
    if (!removed) {
        out.reason = "duplicate source could not be removed";
    }

    reaper_.prune_empty_ancestors(parent_dir(path));
    return out;
}

}
