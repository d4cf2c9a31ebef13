// -----------------------------------------------------------------------------
// Seshat Vessel - Duplicate detection at the destination
// -----------------------------------------------------------------------------
#pragma once

#include <string>

namespace seshat {

// Hex MD5 of the whole file. Returns false with errno set on I/O failure.
bool file_md5(const std::string& path, std::string& hex_out) noexcept;

class DuplicateResolver {
    bool verify_checksum_;

public:
    explicit DuplicateResolver(bool verify_checksum) noexcept : verify_checksum_(verify_checksum) {}

    // A same-named regular file in destination_dir with equal size (and equal
    // MD5 when verification is on). Any error while comparing means "no".
    bool is_duplicate(const std::string& source_path, const std::string& destination_dir) const;

    // Same comparison against a specific existing file.
    bool same_content(const std::string& source_path, const std::string& existing_path) const;
};

}
