#include "seshat/log.hpp"
#include "seshat/fs_util.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <fcntl.h>
#include <syslog.h>
#include <unistd.h>

namespace seshat {

static std::mutex g_log_mutex;
static std::atomic<bool> g_is_daemon{false};
static std::atomic<bool> g_verbose{false};
static bool g_use_syslog = false;
static bool g_syslog_open = false;
static unique_fd g_log_file;

void log_configure(const LogOptions& opts) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    g_verbose.store(opts.verbose, std::memory_order_relaxed);
    g_use_syslog = opts.use_syslog;

    if (g_use_syslog && !g_syslog_open) {
        openlog("seshat", LOG_PID | LOG_NDELAY, LOG_DAEMON);
        g_syslog_open = true;
    }

    g_log_file.reset();
    if (!opts.log_file.empty()) {
        g_log_file.reset(open(opts.log_file.c_str(),
                              O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640));
        if (!g_log_file) {
            fprintf(stderr, "WARNING: Cannot open log file %s: %s\n",
                    opts.log_file.c_str(), strerror(errno));
        }
    }
}

void log_set_daemon(bool daemon) noexcept {
    g_is_daemon.store(daemon, std::memory_order_relaxed);
}

void log_close() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file.reset();
    if (g_syslog_open) {
        closelog();
        g_syslog_open = false;
    }
}

void log_output(const char* module, const char* level, const char* fmt, ...) noexcept {
    bool is_debug = strcmp(level, "DEBUG") == 0;
    if (is_debug && !g_verbose.load(std::memory_order_relaxed)) return;

    std::lock_guard<std::mutex> lock(g_log_mutex);

    char buffer[2048];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (len <= 0) return;

    if (g_use_syslog && g_syslog_open) {
        int syslog_level;
        if (strcmp(level, "ERROR") == 0) syslog_level = LOG_ERR;
        else if (strcmp(level, "WARN") == 0) syslog_level = LOG_WARNING;
        else if (strcmp(level, "INFO") == 0) syslog_level = LOG_INFO;
        else syslog_level = LOG_DEBUG;

        syslog(syslog_level, "[%s] [%s] %s", level, module, buffer);
    }

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_time{};
    localtime_r(&t, &tm_time);

    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_time);

    char line[2200];
    int n = snprintf(line, sizeof(line), "[%s][%s][%s] %s\n", level, timestamp, module, buffer);
    if (n <= 0) return;
    size_t line_len = std::min(static_cast<size_t>(n), sizeof(line) - 1);

    if (!g_is_daemon.load(std::memory_order_relaxed)) {
        fwrite(line, 1, line_len, stderr);
        fflush(stderr);
    }

    if (g_log_file) {
        safe_write(g_log_file.get(), line, line_len);
    }
}

}
