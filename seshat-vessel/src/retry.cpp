#include "seshat/retry.hpp"
#include "seshat/config.hpp"

#include <algorithm>
#include <random>

namespace seshat {

RetryPolicy RetryPolicy::from_config(const Config& cfg) {
    RetryPolicy p;
    p.max_attempts = cfg.retry_attempts;
    p.base_delay = std::chrono::milliseconds(cfg.retry_base_ms);
    p.max_delay = std::chrono::milliseconds(cfg.retry_max_ms);
    p.jitter = std::chrono::milliseconds(cfg.retry_jitter_ms);
    return p;
}

bool is_retryable_errno(int err) noexcept {
    switch (err) {
        case EACCES:
        case EPERM:
        case EBUSY:
        case ETXTBSY:
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
            return true;
        default:
            return false;
    }
}

static std::mt19937& retry_rng() {
    thread_local std::mt19937 rng{std::random_device{}()};
    return rng;
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int retry) {
    int64_t delay = policy.base_delay.count();
    for (int i = 0; i < retry && delay < policy.max_delay.count(); ++i) {
        delay *= 2;
    }

    if (policy.jitter.count() > 0) {
        std::uniform_int_distribution<int64_t> dist(0, policy.jitter.count());
        delay += dist(retry_rng());
    }

    return std::chrono::milliseconds(std::min<int64_t>(delay, policy.max_delay.count()));
}

}
