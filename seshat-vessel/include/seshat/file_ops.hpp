// -----------------------------------------------------------------------------
// Seshat Vessel - Primitive file operations used by the mover
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/metrics.hpp"

#include <cstdint>
#include <string>

namespace seshat {

// Each operation returns false with errno describing the failure.
class FileOps {
public:
    virtual ~FileOps() = default;

    // Creates dst exclusively and fills it with src's bytes, fsynced, with
    // src's times, mode and (best effort) owner. A partial dst is removed.
    virtual bool copy_file(const std::string& src, const std::string& dst) = 0;

    // Renames without replacing an existing target (EEXIST).
    virtual bool rename_file(const std::string& from, const std::string& to) = 0;

    // Hard link; fails with EEXIST rather than replace an existing target.
    virtual bool link_file(const std::string& from, const std::string& to) = 0;

    virtual bool remove_file(const std::string& path) = 0;
};

// Streams src_fd into dst_fd: copy_file_range first, bounded buffer fallback.
bool copy_fd_fast(int src_fd, int dst_fd, uint64_t file_size, size_t buffer_bytes,
                  Metrics& metrics) noexcept;

class PosixFileOps : public FileOps {
    size_t buffer_bytes_;
    Metrics& metrics_;

public:
    PosixFileOps(size_t buffer_bytes, Metrics& metrics) noexcept
        : buffer_bytes_(buffer_bytes), metrics_(metrics) {}

    bool copy_file(const std::string& src, const std::string& dst) override;
    bool rename_file(const std::string& from, const std::string& to) override;
    bool link_file(const std::string& from, const std::string& to) override;
    bool remove_file(const std::string& path) override;
};

}
