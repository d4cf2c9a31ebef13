// -----------------------------------------------------------------------------
// Seshat Vessel - Directory cleanup and reclamation
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/metrics.hpp"

#include <string>

namespace seshat {

class DirectoryReaper {
    std::string watch_root_;
    Metrics& metrics_;

    bool remove_if_empty(const std::string& dir) noexcept;

public:
    DirectoryReaper(std::string watch_root, Metrics& metrics);

    // Removes empty directories below start_dir (depth-first, bounded depth,
    // ignored names skipped), then start_dir and each ancestor that became
    // empty. The watch root and anything outside it are never touched.
    // Returns the number of directories removed.
    size_t prune_empty_ancestors(const std::string& start_dir);
};

}
