// -----------------------------------------------------------------------------
// Seshat Vessel - Service assembly and CLI commands
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/config.hpp"

#include <memory>

namespace seshat {

// Checks that the watch root is a directory and creates the archive root.
// Returns a copy with both roots canonicalized, or nullptr (fatal).
std::shared_ptr<const Config> prepare_roots(const Config& cfg);

// Foreground service; daemonizes first when `daemon` is set.
int cmd_run(std::shared_ptr<const Config> cfg, bool daemon);
int cmd_stop(const Config& cfg);
int cmd_status(const Config& cfg);
// One pass over the watch root, then drain and exit.
int cmd_scan(std::shared_ptr<const Config> cfg);
// Stale temp collection in the archive and empty-directory pruning of the
// watch root.
int cmd_gc(std::shared_ptr<const Config> cfg);

}
