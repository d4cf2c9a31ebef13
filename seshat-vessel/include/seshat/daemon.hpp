// -----------------------------------------------------------------------------
// Seshat Vessel - Process lifecycle: signals, pid file, systemd, privileges
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/config.hpp"
#include "seshat/fs_util.hpp"

#include <string>

#include <sys/types.h>

namespace seshat {

// Handlers only flip flags; the main loop turns them into a stop request or
// a metrics dump. SIGPIPE is ignored.
void install_signal_handlers() noexcept;
bool shutdown_signalled() noexcept;
int last_shutdown_signal() noexcept;
// True once per received SIGHUP.
bool take_stats_request() noexcept;

// Ensures single instance
class PidFileLock {
    unique_fd fd_;
    std::string path_;

public:
    // Throws std::runtime_error when the file cannot be opened or another
    // instance holds the lock.
    explicit PidFileLock(const std::string& path);
    ~PidFileLock();

    PidFileLock(const PidFileLock&) = delete;
    PidFileLock& operator=(const PidFileLock&) = delete;
};

// PID recorded in path, or -1 when missing or unreadable.
pid_t read_pid_file(const std::string& path) noexcept;

// Double fork, new session, stdio to /dev/null. Only the grandchild returns.
void daemonize() noexcept;

class SystemdNotifier {
    bool ready_ = false;
    unsigned long long watchdog_usec_ = 0;

public:
    void notify_ready() noexcept;
    void notify_stopping() noexcept;
    void update_status(const char* status) noexcept;
    void ping_watchdog() noexcept;

    // Half the interval systemd asked for; zero when no watchdog is set.
    unsigned long long watchdog_interval_usec() const noexcept { return watchdog_usec_ / 2; }
};

// Switches to cfg.run_as_user when running as root, then drops the
// capabilities the service never needs and sets PR_SET_NO_NEW_PRIVS.
bool drop_privileges(const Config& cfg) noexcept;

// No core dumps, not dumpable.
void set_resource_limits() noexcept;

}
