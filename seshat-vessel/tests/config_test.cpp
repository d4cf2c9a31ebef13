#include "seshat/config.hpp"
#include "seshat/constants.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

namespace seshat {
namespace {

const char* const CONFIG_VARS[] = {
    "WATCH_DIR", "ARCHIVE_ROOT", "LOG_FILE", "JOURNAL_FILE", "RUN_AS_USER", "PID_FILE",
    "WORKERS", "COPY_BUFFER_MB", "MIN_FREE_MB", "STABLE_MIN_MS", "STABLE_MAX_WAIT_SEC",
    "STABLE_POLL_MS", "STABILITY_ATTEMPTS", "STABILITY_RETRY_MS", "RETRY_ATTEMPTS",
    "RETRY_BASE_MS", "RETRY_MAX_MS", "RETRY_JITTER_MS", "COOLDOWN_SEC", "HISTORY_LIMIT",
    "WATCH_DEBOUNCE_MS", "SHUTDOWN_DRAIN_SEC", "STATS_INTERVAL_SEC", "TEMP_GC_AGE_SEC",
    "DRY_RUN", "CHECKSUM_ON_DUP", "VERBOSE_LOGGING", "USE_SYSLOG",
};

class EnvConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : CONFIG_VARS) unsetenv(name);
    }

    static void set(const char* name, const char* value) { setenv(name, value, 1); }
};

TEST_F(EnvConfigTest, DefaultsWithoutEnvironment) {
    auto cfg = load_config_from_env();
    ASSERT_NE(cfg, nullptr);

    EXPECT_EQ(cfg->watch_dir, "/srv/uploads");
    EXPECT_EQ(cfg->archive_root, "/srv/photos");
    EXPECT_EQ(cfg->workers, 4);
    EXPECT_FALSE(cfg->dry_run);
    EXPECT_TRUE(cfg->checksum_on_dup);
    EXPECT_EQ(cfg->stable_min_ms, 2000);
    EXPECT_EQ(cfg->cooldown_sec, 300);
    EXPECT_EQ(cfg->history_limit, 1000u);
    EXPECT_EQ(cfg->watch_debounce_ms, 5000);
    EXPECT_EQ(cfg->retry_attempts, 8);
    EXPECT_EQ(cfg->cooldown().count(), 300000);
}

TEST_F(EnvConfigTest, ReadsValuesFromEnvironment) {
    set("WATCH_DIR", "/data/in");
    set("ARCHIVE_ROOT", "/data/out");
    set("WORKERS", "8");
    set("DRY_RUN", "1");
    set("CHECKSUM_ON_DUP", "false");
    set("COOLDOWN_SEC", "60");
    set("STABLE_MIN_MS", "250");
    set("LOG_FILE", "/var/log/seshat.log");

    auto cfg = load_config_from_env();
    ASSERT_NE(cfg, nullptr);

    EXPECT_EQ(cfg->watch_dir, "/data/in");
    EXPECT_EQ(cfg->archive_root, "/data/out");
    EXPECT_EQ(cfg->workers, 8);
    EXPECT_TRUE(cfg->dry_run);
    EXPECT_FALSE(cfg->checksum_on_dup);
    EXPECT_EQ(cfg->cooldown_sec, 60);
    EXPECT_EQ(cfg->stable_min_ms, 250);
    EXPECT_EQ(cfg->log_file, "/var/log/seshat.log");
}

TEST_F(EnvConfigTest, MalformedNumbersKeepDefaults) {
    set("WORKERS", "lots");
    set("COPY_BUFFER_MB", "");
    set("COOLDOWN_SEC", "soon");

    auto cfg = load_config_from_env();
    ASSERT_NE(cfg, nullptr);

    EXPECT_EQ(cfg->workers, 4);
    EXPECT_EQ(cfg->copy_buffer_mb, 8u);
    EXPECT_EQ(cfg->cooldown_sec, 300);
}

TEST_F(EnvConfigTest, OutOfRangeValuesAreClamped) {
    set("WORKERS", "100");
    set("COPY_BUFFER_MB", "0");
    set("HISTORY_LIMIT", "5");
    set("RETRY_ATTEMPTS", "-3");
    set("STATS_INTERVAL_SEC", "0");

    auto cfg = load_config_from_env();
    ASSERT_NE(cfg, nullptr);

    EXPECT_EQ(cfg->workers, constants::MAX_WORKERS);
    EXPECT_EQ(cfg->copy_buffer_mb, constants::MIN_COPY_BUFFER_MB);
    EXPECT_EQ(cfg->history_limit, constants::HISTORY_EVICT_BATCH);
    EXPECT_EQ(cfg->retry_attempts, 1);
    EXPECT_EQ(cfg->stats_interval_sec, 1);
}

TEST_F(EnvConfigTest, TrailingSlashesAreStripped) {
    set("WATCH_DIR", "/data/in///");
    set("ARCHIVE_ROOT", "/data/out/");

    auto cfg = load_config_from_env();
    ASSERT_NE(cfg, nullptr);
    EXPECT_EQ(cfg->watch_dir, "/data/in");
    EXPECT_EQ(cfg->archive_root, "/data/out");
}

TEST_F(EnvConfigTest, UnusableRootsAreRejected) {
    set("WATCH_DIR", "relative/in");
    EXPECT_EQ(load_config_from_env(), nullptr);

    set("WATCH_DIR", "");
    EXPECT_EQ(load_config_from_env(), nullptr);

    set("WATCH_DIR", "/data/same/");
    set("ARCHIVE_ROOT", "/data/same");
    EXPECT_EQ(load_config_from_env(), nullptr);
}

TEST(ClampConfigTest, RetryCeilingNeverBelowBase) {
    Config cfg;
    cfg.retry_base_ms = 800;
    cfg.retry_max_ms = 100;
    cfg.stable_poll_ms = 0;
    cfg.workers = -2;
    clamp_config(cfg);

    EXPECT_EQ(cfg.retry_max_ms, 800);
    EXPECT_EQ(cfg.stable_poll_ms, 1);
    EXPECT_EQ(cfg.workers, constants::MIN_WORKERS);
}

TEST(LogOptionsTest, MirrorsConfig) {
    Config cfg;
    cfg.use_syslog = false;
    cfg.verbose_logging = true;
    cfg.log_file = "/tmp/seshat.log";

    LogOptions opts = to_log_options(cfg);
    EXPECT_FALSE(opts.use_syslog);
    EXPECT_TRUE(opts.verbose);
    EXPECT_EQ(opts.log_file, "/tmp/seshat.log");
}

}
}
