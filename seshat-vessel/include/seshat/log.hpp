// -----------------------------------------------------------------------------
// Seshat Vessel - Unified logging with daemon support
// -----------------------------------------------------------------------------
#pragma once

#include <string>

namespace seshat {

struct LogOptions {
    bool use_syslog = true;
    bool verbose = false;
    std::string log_file;
};

// Opens syslog and the optional log file. Safe to call again on reload.
void log_configure(const LogOptions& opts) noexcept;

// Once daemonized, records go to syslog and the log file only.
void log_set_daemon(bool daemon) noexcept;

void log_close() noexcept;

void log_output(const char* module, const char* level, const char* fmt, ...) noexcept
    __attribute__((format(printf, 3, 4)));

}

#define SESHAT_LOG_INFO(module, ...)   ::seshat::log_output(module, "INFO",  __VA_ARGS__)
#define SESHAT_LOG_ERROR(module, ...)  ::seshat::log_output(module, "ERROR", __VA_ARGS__)
#define SESHAT_LOG_WARN(module, ...)   ::seshat::log_output(module, "WARN",  __VA_ARGS__)
#define SESHAT_LOG_DEBUG(module, ...)  ::seshat::log_output(module, "DEBUG", __VA_ARGS__)
