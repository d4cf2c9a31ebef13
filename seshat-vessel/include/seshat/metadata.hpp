// -----------------------------------------------------------------------------
// Seshat Vessel - Capture timestamp extraction
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/ingest_filter.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <variant>

namespace seshat {

namespace date_utils {
    inline bool is_leap_year(int year) noexcept {
        return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    }

    inline int days_in_month(int year, int month) noexcept {
        static const int month_days[] = {31, 28, 31, 30, 31, 30,
                                         31, 31, 30, 31, 30, 31};

        if (month < 1 || month > 12) return 0;

        int days = month_days[month - 1];
        if (month == 2 && is_leap_year(year)) {
            days = 29;
        }

        return days;
    }
}

// "YYYY:MM:DD HH:MM:SS" (or with '-' date separators), interpreted as local time.
std::optional<std::time_t> parse_exif_datetime(const std::string& value);

// "YYYY-MM-DDTHH:MM:SS[.frac][Z|+HH:MM|-HH:MM]"; no zone means local time.
std::optional<std::time_t> parse_iso8601(const std::string& value);

// Every reader has the same contract: nullopt when the file carries no usable
// timestamp or cannot be read. Readers never throw.
struct ExifImageReader {
    std::optional<std::time_t> resolve(const std::string& path) const noexcept;
};

struct RawImageReader {
    std::optional<std::time_t> resolve(const std::string& path) const noexcept;
};

struct VideoReader {
    std::optional<std::time_t> resolve(const std::string& path) const noexcept;
};

struct NoMetadata {
    std::optional<std::time_t> resolve(const std::string&) const noexcept { return std::nullopt; }
};

using MetadataReader = std::variant<ExifImageReader, RawImageReader, VideoReader, NoMetadata>;

MetadataReader reader_for(MediaCategory category) noexcept;

class MetadataResolver {
public:
    std::optional<std::time_t> resolve(const std::string& path) const noexcept;
};

}
