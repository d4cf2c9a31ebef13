// -----------------------------------------------------------------------------
// Seshat Vessel - Environment-based configuration
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/log.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace seshat {

struct Config {
    std::string watch_dir = "/srv/uploads";
    std::string archive_root = "/srv/photos";
    int workers = 4;
    bool dry_run = false;
    bool checksum_on_dup = true;
    uint64_t copy_buffer_mb = 8;
    uint64_t min_free_mb = 64;

    int stable_min_ms = 2000;
    int stable_max_wait_sec = 1800;
    int stable_poll_ms = 500;
    int stability_attempts = 10;
    int stability_retry_ms = 1000;

    int retry_attempts = 8;
    int retry_base_ms = 500;
    int retry_max_ms = 5000;
    int retry_jitter_ms = 250;

    int cooldown_sec = 300;
    size_t history_limit = 1000;
    int watch_debounce_ms = 5000;
    int shutdown_drain_sec = 10;
    int stats_interval_sec = 300;
    int temp_gc_age_sec = 600;

    std::string log_file;
    std::string journal_file;
    bool verbose_logging = false;
    bool use_syslog = true;
    std::string run_as_user;
    std::string pid_file = "/var/run/seshat/seshat.pid";

    uint64_t copy_buffer_bytes() const noexcept { return copy_buffer_mb * 1024ULL * 1024; }
    uint64_t min_free_bytes() const noexcept { return min_free_mb * 1024ULL * 1024; }

    std::chrono::milliseconds cooldown() const noexcept {
        return std::chrono::milliseconds(static_cast<int64_t>(cooldown_sec) * 1000);
    }
};

// Reads the process environment. Returns nullptr when the roots are unusable.
std::shared_ptr<const Config> load_config_from_env() noexcept;

// Range clamping applied by the loader; exposed for configs built in code.
void clamp_config(Config& cfg) noexcept;

LogOptions to_log_options(const Config& cfg);

}
