#include "seshat/stability.hpp"
#include "seshat/config.hpp"
#include "seshat/constants.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>

namespace seshat {

using std::chrono::milliseconds;

StabilityOptions StabilityOptions::from_config(const Config& cfg) {
    StabilityOptions o;
    o.min_window = milliseconds(cfg.stable_min_ms);
    o.max_wait_budget = milliseconds(static_cast<int64_t>(cfg.stable_max_wait_sec) * 1000);
    o.poll_interval = milliseconds(cfg.stable_poll_ms);
    return o;
}

static double size_in_mib(uint64_t size_bytes) noexcept {
    double mib = static_cast<double>(size_bytes) / (1024.0 * 1024.0);
    return std::max(mib, 1.0);
}

milliseconds adaptive_window(uint64_t size_bytes, milliseconds min_window) noexcept {
    auto scaled = milliseconds(static_cast<int64_t>(
        size_in_mib(size_bytes) * constants::STABLE_SEC_PER_MB * 1000.0));
    return std::min(std::max(min_window, scaled), constants::MAX_STABLE_WINDOW);
}

milliseconds adaptive_budget(uint64_t size_bytes, milliseconds max_wait) noexcept {
    auto scaled = milliseconds(static_cast<int64_t>(
        size_in_mib(size_bytes) * constants::BUDGET_SEC_PER_MB * 1000.0));
    return std::min(max_wait, std::max(constants::MIN_STABILITY_BUDGET, scaled));
}

// A writer still holding the file shows up as a failed open or a held lock
static bool writer_released(const std::string& path, int& err) noexcept {
    unique_fd fd(open(path.c_str(), O_WRONLY | O_APPEND | O_NONBLOCK | O_NOFOLLOW | O_CLOEXEC));
    if (!fd) {
        err = errno;
        return false;
    }

    if (flock(fd.get(), LOCK_SH | LOCK_NB) != 0) {
        err = errno;
        return false;
    }

    err = 0;
    return true;
}

bool StabilityMonitor::is_stable(const std::string& path) const {
    return is_stable(path, opts_.min_window, opts_.max_wait_budget);
}

bool StabilityMonitor::is_stable(const std::string& path,
                                 milliseconds min_window,
                                 milliseconds max_wait_budget) const {
    const auto start = std::chrono::steady_clock::now();
    auto quiet_since = start;
    bool have_size = false;
    uint64_t last_size = 0;
    uint64_t max_size = 0;

    while (!stop_.stop_requested()) {
        const auto now = std::chrono::steady_clock::now();
        const auto budget = adaptive_budget(max_size, max_wait_budget);
        if (now - start > budget) {
            SESHAT_LOG_WARN("stability", "%s still changing after %lld ms",
                            path.c_str(), static_cast<long long>(budget.count()));
            return false;
        }

        int open_err = 0;
        bool released = writer_released(path, open_err);
        if (!released) {
            if (open_err == ENOENT) {
                SESHAT_LOG_DEBUG("stability", "%s disappeared", path.c_str());
                return false;
            }
            SESHAT_LOG_DEBUG("stability", "%s busy: %s", path.c_str(), strerror(open_err));
            quiet_since = now;
        }

        struct stat st{};
        if (lstat(path.c_str(), &st) != 0) {
            SESHAT_LOG_DEBUG("stability", "stat failed for %s: %s", path.c_str(), strerror(errno));
            return false;
        }
        if (!S_ISREG(st.st_mode)) {
            return false;
        }

        const uint64_t size = static_cast<uint64_t>(st.st_size);
        max_size = std::max(max_size, size);

        if (!have_size || size != last_size) {
            have_size = true;
            last_size = size;
            quiet_since = now;
        } else if (released && now - quiet_since >= adaptive_window(size, min_window)) {
            if (size == 0) {
                SESHAT_LOG_DEBUG("stability", "%s is empty", path.c_str());
                return false;
            }
            return true;
        }

        if (!stop_.wait_for(opts_.poll_interval)) break;
    }

    return false;
}

}
