#include "seshat/config.hpp"
#include "seshat/constants.hpp"
#include "seshat/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace seshat {

namespace {

uint64_t safe_stoull(const char* v, uint64_t default_val) {
    if (!v) return default_val;
    try { return std::stoull(v); } catch (const std::exception&) { return default_val; }
}

int safe_stoi(const char* v, int default_val) {
    if (!v) return default_val;
    try { return std::stoi(v); } catch (const std::exception&) { return default_val; }
}

bool parse_bool(const char* v, bool default_val) {
    if (!v) return default_val;
    return strcmp(v, "0") != 0 && strcmp(v, "false") != 0 && strcmp(v, "no") != 0;
}

}

void clamp_config(Config& cfg) noexcept {
    cfg.workers = std::clamp(cfg.workers, constants::MIN_WORKERS, constants::MAX_WORKERS);
    cfg.copy_buffer_mb = std::clamp(cfg.copy_buffer_mb, constants::MIN_COPY_BUFFER_MB,
                                    constants::MAX_COPY_BUFFER_MB);
    if (cfg.stable_min_ms < 0) cfg.stable_min_ms = 0;
    if (cfg.stable_max_wait_sec < 1) cfg.stable_max_wait_sec = 1;
    if (cfg.stable_poll_ms < 1) cfg.stable_poll_ms = 1;
    if (cfg.stability_attempts < 1) cfg.stability_attempts = 1;
    if (cfg.stability_retry_ms < 0) cfg.stability_retry_ms = 0;
    if (cfg.retry_attempts < 1) cfg.retry_attempts = 1;
    if (cfg.retry_base_ms < 0) cfg.retry_base_ms = 0;
    if (cfg.retry_max_ms < cfg.retry_base_ms) cfg.retry_max_ms = cfg.retry_base_ms;
    if (cfg.retry_jitter_ms < 0) cfg.retry_jitter_ms = 0;
    if (cfg.cooldown_sec < 0) cfg.cooldown_sec = 0;
    if (cfg.history_limit < constants::HISTORY_EVICT_BATCH) cfg.history_limit = constants::HISTORY_EVICT_BATCH;
    if (cfg.watch_debounce_ms < 0) cfg.watch_debounce_ms = 0;
    if (cfg.shutdown_drain_sec < 0) cfg.shutdown_drain_sec = 0;
    if (cfg.stats_interval_sec < 1) cfg.stats_interval_sec = 1;
    if (cfg.temp_gc_age_sec < 0) cfg.temp_gc_age_sec = 0;
}

std::shared_ptr<const Config> load_config_from_env() noexcept {
    std::shared_ptr<Config> cfg;
    try {
        cfg = std::make_shared<Config>();
    } catch (const std::bad_alloc&) {
        return nullptr;
    }

    if (const char* v = getenv("WATCH_DIR")) cfg->watch_dir = v;
    if (const char* v = getenv("ARCHIVE_ROOT")) cfg->archive_root = v;
    if (const char* v = getenv("LOG_FILE")) cfg->log_file = v;
    if (const char* v = getenv("JOURNAL_FILE")) cfg->journal_file = v;
    if (const char* v = getenv("RUN_AS_USER")) cfg->run_as_user = v;
    if (const char* v = getenv("PID_FILE")) cfg->pid_file = v;

    cfg->workers = safe_stoi(getenv("WORKERS"), cfg->workers);
    cfg->copy_buffer_mb = safe_stoull(getenv("COPY_BUFFER_MB"), cfg->copy_buffer_mb);
    cfg->min_free_mb = safe_stoull(getenv("MIN_FREE_MB"), cfg->min_free_mb);
    cfg->stable_min_ms = safe_stoi(getenv("STABLE_MIN_MS"), cfg->stable_min_ms);
    cfg->stable_max_wait_sec = safe_stoi(getenv("STABLE_MAX_WAIT_SEC"), cfg->stable_max_wait_sec);
    cfg->stable_poll_ms = safe_stoi(getenv("STABLE_POLL_MS"), cfg->stable_poll_ms);
    cfg->stability_attempts = safe_stoi(getenv("STABILITY_ATTEMPTS"), cfg->stability_attempts);
    cfg->stability_retry_ms = safe_stoi(getenv("STABILITY_RETRY_MS"), cfg->stability_retry_ms);
    cfg->retry_attempts = safe_stoi(getenv("RETRY_ATTEMPTS"), cfg->retry_attempts);
    cfg->retry_base_ms = safe_stoi(getenv("RETRY_BASE_MS"), cfg->retry_base_ms);
    cfg->retry_max_ms = safe_stoi(getenv("RETRY_MAX_MS"), cfg->retry_max_ms);
    cfg->retry_jitter_ms = safe_stoi(getenv("RETRY_JITTER_MS"), cfg->retry_jitter_ms);
    cfg->cooldown_sec = safe_stoi(getenv("COOLDOWN_SEC"), cfg->cooldown_sec);
    cfg->history_limit = safe_stoull(getenv("HISTORY_LIMIT"), cfg->history_limit);
    cfg->watch_debounce_ms = safe_stoi(getenv("WATCH_DEBOUNCE_MS"), cfg->watch_debounce_ms);
    cfg->shutdown_drain_sec = safe_stoi(getenv("SHUTDOWN_DRAIN_SEC"), cfg->shutdown_drain_sec);
    cfg->stats_interval_sec = safe_stoi(getenv("STATS_INTERVAL_SEC"), cfg->stats_interval_sec);
    cfg->temp_gc_age_sec = safe_stoi(getenv("TEMP_GC_AGE_SEC"), cfg->temp_gc_age_sec);

    cfg->dry_run = parse_bool(getenv("DRY_RUN"), cfg->dry_run);
    cfg->checksum_on_dup = parse_bool(getenv("CHECKSUM_ON_DUP"), cfg->checksum_on_dup);
    cfg->verbose_logging = parse_bool(getenv("VERBOSE_LOGGING"), cfg->verbose_logging);
    cfg->use_syslog = parse_bool(getenv("USE_SYSLOG"), cfg->use_syslog);

    // Validation
    if (cfg->watch_dir.empty() || cfg->archive_root.empty()) {
        SESHAT_LOG_ERROR("seshat", "Configuration error: paths cannot be empty");
        return nullptr;
    }

    if (cfg->watch_dir[0] != '/' || cfg->archive_root[0] != '/') {
        SESHAT_LOG_ERROR("seshat", "Configuration error: paths must be absolute");
        return nullptr;
    }

    while (cfg->watch_dir.size() > 1 && cfg->watch_dir.back() == '/') cfg->watch_dir.pop_back();
    while (cfg->archive_root.size() > 1 && cfg->archive_root.back() == '/') cfg->archive_root.pop_back();

    if (cfg->watch_dir == cfg->archive_root) {
        SESHAT_LOG_ERROR("seshat", "Configuration error: watch and archive roots must differ");
        return nullptr;
    }

    clamp_config(*cfg);

    return cfg;
}

LogOptions to_log_options(const Config& cfg) {
    LogOptions opts;
    opts.use_syslog = cfg.use_syslog;
    opts.verbose = cfg.verbose_logging;
    opts.log_file = cfg.log_file;
    return opts;
}

}
