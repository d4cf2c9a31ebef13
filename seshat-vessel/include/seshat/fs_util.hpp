// -----------------------------------------------------------------------------
// Seshat Vessel - Filesystem primitives shared by every stage
// -----------------------------------------------------------------------------
#pragma once

#include <string>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace seshat {

// RAII wrapper for file descriptors
class unique_fd {
    int fd_ = -1;
public:
    explicit unique_fd(int fd = -1) noexcept : fd_(fd) {}
    ~unique_fd() { if (fd_ >= 0) ::close(fd_); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    unique_fd& operator=(unique_fd&& o) noexcept {
        if (this != &o) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

    int get() const noexcept { return fd_; }
    int release() noexcept { int t = fd_; fd_ = -1; return t; }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

// Reliable I/O: restarts on EINTR and short transfers.
ssize_t safe_read(int fd, void* buf, size_t count) noexcept;
ssize_t safe_write(int fd, const void* buf, size_t count) noexcept;

// Path helpers. Paths are plain '/'-separated strings.
std::string join_path(const std::string& dir, const std::string& name);
std::string parent_dir(const std::string& path);
std::string base_name(const std::string& path);
// "photo.tar.jpg" -> ("photo.tar", ".jpg"); "README" -> ("README", "")
void split_name(const std::string& name, std::string& stem, std::string& ext);
std::string lower_ext(const std::string& path);

// Returns the resolved absolute path, or empty with errno set.
std::string canonical_path(const std::string& path);
// True when path equals root or lies below it (string-wise, both canonical).
bool path_within(const std::string& root, const std::string& path) noexcept;

bool contains_path_traversal(const std::string& path) noexcept;
bool validate_path_length(const std::string& path) noexcept;

// mkdir -p that refuses traversal and non-directory components.
int mkdir_p_safe(const std::string& path, mode_t mode = 0755) noexcept;
int fsync_dir(const std::string& path) noexcept;

bool is_regular_file(const std::string& path) noexcept;
bool is_directory(const std::string& path) noexcept;

}
