// -----------------------------------------------------------------------------
// Seshat Vessel - Per-file pipeline orchestration
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/config.hpp"
#include "seshat/duplicate.hpp"
#include "seshat/ingest_filter.hpp"
#include "seshat/journal.hpp"
#include "seshat/metrics.hpp"
#include "seshat/mover.hpp"
#include "seshat/reaper.hpp"
#include "seshat/registry.hpp"
#include "seshat/stability.hpp"
#include "seshat/stop_source.hpp"

#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace seshat {

enum class OutcomeKind { Moved, DuplicateSkipped, Failed };

const char* outcome_name(OutcomeKind k) noexcept;

struct MoveOutcome {
    OutcomeKind kind = OutcomeKind::Failed;
    std::string reason;
    std::string destination;
};

using TimestampResolver = std::function<std::optional<std::time_t>(const std::string&)>;

// Claim, wait for stability, classify, de-duplicate, move, prune, release.
class IngestionCoordinator {
    const Config& cfg_;
    ProcessingRegistry& registry_;
    AtomicMover& mover_;
    DirectoryReaper& reaper_;
    const StopSource& stop_;
    Metrics& metrics_;
    OperationJournal& journal_;

    std::string archive_root_;
    IngestFilter filter_;
    StabilityMonitor stability_;
    DuplicateResolver dedup_;
    TimestampResolver resolve_timestamp_;

    std::optional<MoveOutcome> run_claimed(const std::string& path);
    std::optional<MoveOutcome> handle_duplicate(const std::string& path, const std::string& existing);
    MoveOutcome fail(const std::string& path, std::string reason);

public:
    // An empty resolver selects the built-in metadata readers.
    IngestionCoordinator(const Config& cfg, ProcessingRegistry& registry, AtomicMover& mover,
                         DirectoryReaper& reaper, const StopSource& stop, Metrics& metrics,
                         OperationJournal& journal, TimestampResolver resolver = {});

    // No outcome when the path is ignored, the claim is rejected, or shutdown
    // interrupts the stability wait. Otherwise exactly one outcome, and the
    // claim is released before returning.
    std::optional<MoveOutcome> process(const std::string& path);

    const IngestFilter& filter() const noexcept { return filter_; }
};

}
