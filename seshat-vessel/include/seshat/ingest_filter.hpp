// -----------------------------------------------------------------------------
// Seshat Vessel - Ingest filter: which discovered paths enter the pipeline
// -----------------------------------------------------------------------------
#pragma once

#include <optional>
#include <string>

namespace seshat {

enum class MediaCategory { Image, Raw, Video, Other };

const char* category_name(MediaCategory c) noexcept;

// Category by lowercase extension (".jpg"); nullopt for unsupported types.
std::optional<MediaCategory> category_for_extension(const std::string& ext);

class IngestFilter {
    std::string watch_root_;

public:
    explicit IngestFilter(std::string watch_root);

    const std::string& watch_root() const noexcept { return watch_root_; }

    // Names such as ".part", "~lock", "Thumbs.db".
    static bool is_ignored_name(const std::string& name);
    // Directory names skipped during scans, watches and pruning.
    static bool is_ignored_dir_name(const std::string& name);

    // Pure string check: extension, name prefix, and every directory component
    // between the watch root and the file. Paths outside the root are rejected.
    bool accepts_path(const std::string& path) const;

    // accepts_path() plus an lstat that requires a regular file.
    bool accepts(const std::string& path) const;
};

}
