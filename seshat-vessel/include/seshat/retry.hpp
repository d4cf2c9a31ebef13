// -----------------------------------------------------------------------------
// Seshat Vessel - Bounded retries for transient lock and permission errors
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/log.hpp"
#include "seshat/metrics.hpp"
#include "seshat/stop_source.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

namespace seshat {

struct Config;

struct RetryPolicy {
    int max_attempts = 8;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{5000};
    std::chrono::milliseconds jitter{250};

    static RetryPolicy from_config(const Config& cfg);
};

struct RetryReport {
    int attempts = 0;
    int retries = 0;
    int last_errno = 0;
    bool cancelled = false;
};

// EACCES, EPERM, EBUSY, ETXTBSY, EAGAIN/EWOULDBLOCK
bool is_retryable_errno(int err) noexcept;

// Delay before retry number `retry` (0-based): base * 2^retry plus up to
// `jitter` of random noise, capped at max_delay.
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int retry);

// Runs op() until it returns true, a non-retryable errno is seen, attempts run
// out or stop is requested during a backoff. op reports failures via errno,
// which is preserved on return.
template <typename Op>
bool with_retries(const char* what, const std::string& path,
                  const RetryPolicy& policy, const StopSource& stop,
                  Metrics& metrics, Op&& op, RetryReport* report = nullptr) {
    RetryReport local;
    RetryReport& r = report ? *report : local;
    r = RetryReport{};

    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        r.attempts = attempt;
        errno = 0;
        if (op()) {
            r.last_errno = 0;
            return true;
        }

        const int err = errno ? errno : EIO;
        r.last_errno = err;

        if (!is_retryable_errno(err)) {
            errno = err;
            return false;
        }
        if (attempt == policy.max_attempts) {
            SESHAT_LOG_WARN("mover", "%s %s: giving up after %d attempts: %s",
                            what, path.c_str(), attempt, strerror(err));
            errno = err;
            return false;
        }

        auto delay = backoff_delay(policy, attempt - 1);
        SESHAT_LOG_WARN("mover", "%s %s failed (%s), retry %d/%d in %lld ms",
                        what, path.c_str(), strerror(err), attempt, policy.max_attempts - 1,
                        static_cast<long long>(delay.count()));
        ++r.retries;
        ++metrics.transient_retries;

        if (!stop.wait_for(delay)) {
            r.cancelled = true;
            errno = err;
            return false;
        }
    }

    errno = r.last_errno;
    return false;
}

}
