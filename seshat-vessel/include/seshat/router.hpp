// -----------------------------------------------------------------------------
// Seshat Vessel - Classification into the dated archive layout
// -----------------------------------------------------------------------------
#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace seshat {

struct DestinationBucket {
    int year = 1970;
    int month = 1;
    int day = 1;

    // "YYYY/MM/DD", zero padded
    std::string render() const;

    bool operator==(const DestinationBucket& o) const noexcept {
        return year == o.year && month == o.month && day == o.day;
    }
};

// Local-time calendar day of t.
DestinationBucket bucket_for_time(std::time_t t) noexcept;

// Earlier of mtime and ctime; the current time when stat fails.
std::time_t file_timestamp_fallback(const std::string& path) noexcept;

// Metadata timestamp when present, otherwise the filesystem fallback. Never fails.
DestinationBucket resolve_destination_bucket(const std::string& path,
                                             std::optional<std::time_t> metadata_timestamp) noexcept;

// <archive_root>/YYYY/MM/DD. Returns false when the result would not resolve
// inside archive_root.
bool archive_directory_for(const std::string& archive_root, const DestinationBucket& bucket,
                           std::string& out);

// dir/filename if free, then <stem>_<YYYYMMDD_HHMMSS><ext>, then
// <stem>_<YYYYMMDD_HHMMSS>_<n><ext> for n in 1..100, then <stem>_<unix><ext>.
std::string make_unique_destination(const std::string& dir, const std::string& filename,
                                    std::time_t now);

}
