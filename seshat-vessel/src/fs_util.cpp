#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

namespace seshat {

// -----------------------------------------------------------------------------
// Seshat Vessel - Reliable I/O with retries
// -----------------------------------------------------------------------------
ssize_t safe_read(int fd, void* buf, size_t count) noexcept {
    ssize_t total = 0;

    while (total < static_cast<ssize_t>(count)) {
        ssize_t res = read(fd, static_cast<char*>(buf) + total, count - total);

        if (res > 0) {
            total += res;
        } else if (res == 0) {
            break;
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            return -1;
        }
    }

    return total;
}

ssize_t safe_write(int fd, const void* buf, size_t count) noexcept {
    ssize_t total = 0;

    while (total < static_cast<ssize_t>(count)) {
        ssize_t res = write(fd, static_cast<const char*>(buf) + total, count - total);

        if (res > 0) {
            total += res;
        } else if (res < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            return -1;
        } else {
            if (count > 0) {
                errno = EPIPE;
                return -1;
            }
            break;
        }
    }

    return total;
}

// -----------------------------------------------------------------------------
// Path helpers
// -----------------------------------------------------------------------------
std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string parent_dir(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string base_name(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

void split_name(const std::string& name, std::string& stem, std::string& ext) {
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        stem = name;
        ext.clear();
        return;
    }
    stem = name.substr(0, dot);
    ext = name.substr(dot);
}

std::string lower_ext(const std::string& path) {
    std::string stem, ext;
    split_name(base_name(path), stem, ext);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string canonical_path(const std::string& path) {
    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) == nullptr) {
        return {};
    }
    return resolved;
}

bool path_within(const std::string& root, const std::string& path) noexcept {
    if (root.empty() || path.size() < root.size()) return false;
    if (path.compare(0, root.size(), root) != 0) return false;
    if (path.size() == root.size()) return true;
    return root.back() == '/' || path[root.size()] == '/';
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Security: Path validation
// -----------------------------------------------------------------------------
bool contains_path_traversal(const std::string& path) noexcept {
    size_t slash_count = std::count(path.begin(), path.end(), '/');
    if (slash_count > 64) {
        return true;
    }

    if (path.find("//") != std::string::npos) {
        return true;
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        size_t len = end - start;
        if ((len == 1 && path[start] == '.') ||
            (len == 2 && path[start] == '.' && path[start + 1] == '.')) {
            return true;
        }
        start = end + 1;
    }

    return false;
}

bool validate_path_length(const std::string& path) noexcept {
    if (path.length() >= PATH_MAX - 100) {
        SESHAT_LOG_ERROR("security", "Path length exceeds safe limit: %zu bytes", path.length());
        return false;
    }

    if (path.find('\0') != std::string::npos) {
        SESHAT_LOG_ERROR("security", "Null byte in path (possible injection)");
        return false;
    }

    return true;
}

// -----------------------------------------------------------------------------
// Secure directory creation with symlink protection
// -----------------------------------------------------------------------------
int mkdir_p_safe(const std::string& path, mode_t mode) noexcept {
    if (path.empty() || path == "/" || path == ".") {
        errno = EINVAL;
        return -1;
    }

    if (!validate_path_length(path) || contains_path_traversal(path)) {
        errno = EINVAL;
        return -1;
    }

    std::string current;
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '/' && i > 0) {
            current = path.substr(0, i);
            struct stat st;
            if (stat(current.c_str(), &st) == 0) {
                if (!S_ISDIR(st.st_mode)) {
                    errno = ENOTDIR;
                    return -1;
                }
            } else if (errno == ENOENT) {
                if (mkdir(current.c_str(), mode) != 0 && errno != EEXIST) {
                    return -1;
                }
            } else {
                return -1;
            }
        }
    }

    // Final directory
    if (mkdir(path.c_str(), mode) != 0) {
        if (errno != EEXIST) return -1;
        if (!is_directory(path)) {
            errno = ENOTDIR;
            return -1;
        }
    }

    return 0;
}

int fsync_dir(const std::string& path) noexcept {
    unique_fd fd(open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd) {
        if (errno != ENOENT && errno != EACCES) {
            SESHAT_LOG_WARN("seshat", "open directory failed for fsync %s: %s", path.c_str(), strerror(errno));
        }
        return -1;
    }

    if (fsync(fd.get()) != 0) {
        SESHAT_LOG_WARN("seshat", "fsync directory failed %s: %s", path.c_str(), strerror(errno));
        return -1;
    }

    return 0;
}

bool is_regular_file(const std::string& path) noexcept {
    struct stat st{};
    return lstat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool is_directory(const std::string& path) noexcept {
    struct stat st{};
    return lstat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

}
