// -----------------------------------------------------------------------------
// Seshat Vessel - Stale temporary artifact collection
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/metrics.hpp"
#include "seshat/stop_source.hpp"

#include <ctime>
#include <string>

namespace seshat {

// Walks archive_root and unlinks ".seshat.tmp.*" files whose mtime is more
// than max_age_sec in the past. Empty directories are left alone.
// Returns the number of files removed.
size_t collect_stale_temps(const std::string& archive_root, int max_age_sec,
                           Metrics& metrics, const StopSource& stop,
                           std::time_t now = std::time(nullptr));

}
