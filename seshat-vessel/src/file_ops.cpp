#include "seshat/file_ops.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/syscall.h>
#include <linux/fs.h>
#endif

namespace seshat {

// -----------------------------------------------------------------------------
// Seshat Vessel - High-performance copying with fallbacks
// -----------------------------------------------------------------------------
static thread_local std::vector<char> g_copy_buffer;

bool copy_fd_fast(int src_fd, int dst_fd, uint64_t file_size, size_t buffer_bytes,
                  Metrics& metrics) noexcept {
    if (file_size == 0) return true;

    auto copy_start = std::chrono::steady_clock::now();
    auto record_time = [&]() {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - copy_start);
        metrics.copy_operations_time_ms += duration.count();
        return static_cast<long>(duration.count());
    };

#if defined(__linux__) && defined(SYS_copy_file_range)
    off_t offset = 0;
    uint64_t total_copied = 0;

    while (offset < static_cast<off_t>(file_size)) {
        size_t to_copy = file_size - offset;
        if (to_copy > SSIZE_MAX) to_copy = SSIZE_MAX;

        ssize_t n = syscall(SYS_copy_file_range,
                            src_fd, &offset,
                            dst_fd, nullptr,
                            to_copy, 0);

        if (n > 0) {
            total_copied += n;
            ++metrics.copy_file_range_calls;
            metrics.copy_bytes_total += n;

            if (offset >= static_cast<off_t>(file_size)) {
                long ms = record_time();
                SESHAT_LOG_DEBUG("mover", "copy_file_range completed: %llu bytes in %ld ms",
                                 static_cast<unsigned long long>(total_copied), ms);
                return true;
            }
            continue;
        }

        if (n == 0 || errno == EXDEV || errno == EINVAL || errno == ENOSYS || errno == EOPNOTSUPP) {
            SESHAT_LOG_DEBUG("mover", "copy_file_range not usable, falling back: %s",
                             n == 0 ? "short source" : strerror(errno));
            break;
        }

        if (errno == EINTR) continue;

        // Permission and I/O errors are the caller's to retry
        return false;
    }
#endif

    SESHAT_LOG_DEBUG("mover", "Using buffered copy for %llu bytes",
                     static_cast<unsigned long long>(file_size));
    ++metrics.buffered_copy_calls;

    try {
        size_t want = static_cast<size_t>(std::min<uint64_t>(file_size, buffer_bytes));
        want = std::max<size_t>(want, 4096);
        if (g_copy_buffer.size() < want) g_copy_buffer.resize(want);
    } catch (const std::bad_alloc&) {
        errno = ENOMEM;
        return false;
    }

    if (lseek(src_fd, 0, SEEK_SET) == static_cast<off_t>(-1) ||
        lseek(dst_fd, 0, SEEK_SET) == static_cast<off_t>(-1) ||
        ftruncate(dst_fd, 0) != 0) {
        SESHAT_LOG_ERROR("mover", "lseek failed in buffered copy: %s", strerror(errno));
        return false;
    }

    uint64_t remaining = file_size;
    const size_t chunk = std::min(g_copy_buffer.size(), buffer_bytes > 0 ? buffer_bytes : g_copy_buffer.size());

    while (remaining > 0) {
        size_t toread = std::min(chunk, static_cast<size_t>(std::min<uint64_t>(remaining, SIZE_MAX)));
        ssize_t r = safe_read(src_fd, g_copy_buffer.data(), toread);

        if (r < 0) {
            SESHAT_LOG_ERROR("mover", "read failed during buffered copy: %s", strerror(errno));
            return false;
        } else if (r == 0) {
            SESHAT_LOG_ERROR("mover", "Unexpected EOF during buffered copy: expected %llu, got %llu bytes",
                             static_cast<unsigned long long>(file_size),
                             static_cast<unsigned long long>(file_size - remaining));
            errno = EIO;
            return false;
        }

        ssize_t w = safe_write(dst_fd, g_copy_buffer.data(), r);
        if (w != r) {
            SESHAT_LOG_ERROR("mover", "write failed during buffered copy: wrote %zd/%zd bytes: %s",
                             w, r, strerror(errno));
            if (w >= 0) errno = EIO;
            return false;
        }

        remaining -= r;
        metrics.copy_bytes_total += r;
    }

    long ms = record_time();
    SESHAT_LOG_DEBUG("mover", "Buffered copy completed: %llu bytes in %ld ms",
                     static_cast<unsigned long long>(file_size), ms);
    return true;
}

// -----------------------------------------------------------------------------
// Copy operation with metadata preservation
// -----------------------------------------------------------------------------
bool PosixFileOps::copy_file(const std::string& src, const std::string& dst) {
    unique_fd src_fd(open(src.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!src_fd) return false;

    struct stat st{};
    if (fstat(src_fd.get(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) {
        errno = EINVAL;
        return false;
    }

    unique_fd dst_fd(open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600));
    if (!dst_fd) return false;

    auto abandon = [&]() {
        int saved = errno;
        dst_fd.reset();
        if (unlink(dst.c_str()) != 0 && errno != ENOENT) {
            SESHAT_LOG_WARN("mover", "Cannot remove partial copy %s: %s", dst.c_str(), strerror(errno));
        }
        errno = saved;
        return false;
    };

    if (!copy_fd_fast(src_fd.get(), dst_fd.get(), static_cast<uint64_t>(st.st_size),
                      buffer_bytes_, metrics_)) {
        return abandon();
    }

    if (fsync(dst_fd.get()) != 0) {
        SESHAT_LOG_ERROR("mover", "fsync of %s failed: %s", dst.c_str(), strerror(errno));
        return abandon();
    }

    const struct timespec times[2] = { st.st_atim, st.st_mtim };
    if (futimens(dst_fd.get(), times) != 0) {
        SESHAT_LOG_WARN("mover", "futimens failed: %s", strerror(errno));
    }

    if (fchmod(dst_fd.get(), st.st_mode & 07777) != 0) {
        SESHAT_LOG_WARN("mover", "fchmod failed: %s", strerror(errno));
    }

    // Only root may give files away
    if (fchown(dst_fd.get(), st.st_uid, st.st_gid) != 0) {
        if (errno != EPERM && errno != EINVAL) {
            SESHAT_LOG_WARN("mover", "fchown failed: %s", strerror(errno));
        }
    }

    return true;
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Atomic renames with kernel features
// -----------------------------------------------------------------------------
bool PosixFileOps::rename_file(const std::string& from, const std::string& to) {
#if defined(__linux__) && defined(SYS_renameat2) && defined(RENAME_NOREPLACE)
    if (syscall(SYS_renameat2, AT_FDCWD, from.c_str(),
                AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return true;
    }
    if (errno != ENOSYS && errno != EINVAL) {
        return false;
    }
#endif

    struct stat st{};
    if (lstat(to.c_str(), &st) == 0) {
        errno = EEXIST;
        return false;
    }
    return rename(from.c_str(), to.c_str()) == 0;
}

bool PosixFileOps::link_file(const std::string& from, const std::string& to) {
    return link(from.c_str(), to.c_str()) == 0;
}

bool PosixFileOps::remove_file(const std::string& path) {
    return unlink(path.c_str()) == 0;
}

}
