#include "seshat/daemon.hpp"
#include "seshat/log.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/file.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

#ifndef HAS_SYSTEMD
#define HAS_SYSTEMD 0
#endif
#ifndef HAS_LIBCAP
#define HAS_LIBCAP 0
#endif

#if HAS_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

#if HAS_LIBCAP
#include <sys/capability.h>
#endif

namespace seshat {

// -----------------------------------------------------------------------------
// Seshat Vessel - Signal handling for graceful shutdown
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown{false};
static std::atomic<int> g_shutdown_signal{0};
static std::atomic<bool> g_stats_requested{false};

static void safe_signal_handler(int sig, siginfo_t* info, void* context) noexcept {
    (void)info;
    (void)context;

    if (sig == SIGHUP) {
        g_stats_requested.store(true, std::memory_order_release);
        return;
    }

    // SIGTERM / SIGINT
    if (!g_shutdown.exchange(true, std::memory_order_acq_rel)) {
        g_shutdown_signal.store(sig, std::memory_order_release);
    }
}

void install_signal_handlers() noexcept {
    struct sigaction sa{};
    sa.sa_sigaction = safe_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_SIGINFO | SA_RESTART;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    signal(SIGPIPE, SIG_IGN);
}

bool shutdown_signalled() noexcept {
    return g_shutdown.load(std::memory_order_acquire);
}

int last_shutdown_signal() noexcept {
    return g_shutdown_signal.load(std::memory_order_acquire);
}

bool take_stats_request() noexcept {
    return g_stats_requested.exchange(false, std::memory_order_acq_rel);
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Pid file
// -----------------------------------------------------------------------------
PidFileLock::PidFileLock(const std::string& path) : path_(path) {
    fd_.reset(open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    if (!fd_) {
        throw std::runtime_error("cannot open pidfile " + path + ": " + strerror(errno));
    }

    if (flock(fd_.get(), LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            char buf[32];
            ssize_t n = safe_read(fd_.get(), buf, sizeof(buf) - 1);
            std::string holder = n > 0 ? std::string(buf, static_cast<size_t>(n)) : std::string("?");
            while (!holder.empty() && (holder.back() == '\n' || holder.back() == ' ')) holder.pop_back();
            fd_.reset();
            throw std::runtime_error("another instance already running (PID " + holder + ")");
        }
        int err = errno;
        fd_.reset();
        throw std::runtime_error(std::string("flock failed on pidfile: ") + strerror(err));
    }

    if (ftruncate(fd_.get(), 0) != 0) {
        SESHAT_LOG_WARN("seshat", "Failed to truncate pidfile %s: %s", path_.c_str(), strerror(errno));
    }
    lseek(fd_.get(), 0, SEEK_SET);

    char pid_str[32];
    int len = snprintf(pid_str, sizeof(pid_str), "%d\n", static_cast<int>(getpid()));
    if (safe_write(fd_.get(), pid_str, static_cast<size_t>(len)) != len) {
        SESHAT_LOG_WARN("seshat", "Failed to write pidfile %s: %s", path_.c_str(), strerror(errno));
    }
    fsync(fd_.get());

    SESHAT_LOG_DEBUG("seshat", "Acquired pidfile lock: %s", path_.c_str());
}

PidFileLock::~PidFileLock() {
    if (fd_) {
        if (ftruncate(fd_.get(), 0) != 0) {
            SESHAT_LOG_WARN("seshat", "Failed to truncate pidfile %s on cleanup: %s",
                            path_.c_str(), strerror(errno));
        }
        unlink(path_.c_str());
    }
}

pid_t read_pid_file(const std::string& path) noexcept {
    FILE* f = fopen(path.c_str(), "r");
    if (!f) return -1;

    int pid = -1;
    if (fscanf(f, "%d", &pid) != 1 || pid <= 0) pid = -1;
    fclose(f);
    return static_cast<pid_t>(pid);
}

// Double fork daemonization (classic Unix daemon)
void daemonize() noexcept {
    pid_t pid = fork();
    if (pid < 0) {
        fprintf(stderr, "ERROR: fork failed: %s\n", strerror(errno));
        std::exit(1);
    }
    if (pid > 0) {
        std::exit(0);
    }

    if (setsid() < 0) {
        std::exit(1);
    }

    pid = fork();
    if (pid < 0) {
        std::exit(1);
    }
    if (pid > 0) {
        std::exit(0);
    }

    umask(027);
    if (chdir("/") != 0) {
        std::exit(1);
    }

    int fd = open("/dev/null", O_RDWR);
    if (fd >= 0) {
        dup2(fd, STDIN_FILENO);
        dup2(fd, STDOUT_FILENO);
        dup2(fd, STDERR_FILENO);
        if (fd > 2) close(fd);
    }
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Integration with systemd for status notifications
// -----------------------------------------------------------------------------
void SystemdNotifier::notify_ready() noexcept {
    if (ready_) return;
    ready_ = true;

#if HAS_SYSTEMD
    char buf[256];
    snprintf(buf, sizeof(buf),
             "READY=1\n"
             "STATUS=Seshat ingesting\n"
             "MAINPID=%lu",
             static_cast<unsigned long>(getpid()));
    sd_notify(0, buf);

    uint64_t usec = 0;
    if (sd_watchdog_enabled(0, &usec) > 0) {
        watchdog_usec_ = usec;
        SESHAT_LOG_DEBUG("seshat", "systemd watchdog every %llu us", watchdog_usec_);
    }
#endif
}

void SystemdNotifier::notify_stopping() noexcept {
#if HAS_SYSTEMD
    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down");
#endif
}

void SystemdNotifier::update_status(const char* status) noexcept {
#if HAS_SYSTEMD
    char buf[256];
    snprintf(buf, sizeof(buf), "STATUS=%s", status);
    sd_notify(0, buf);
#else
    (void)status;
#endif
}

void SystemdNotifier::ping_watchdog() noexcept {
#if HAS_SYSTEMD
    if (watchdog_usec_ > 0) sd_notify(0, "WATCHDOG=1");
#endif
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Security: Privilege dropping and isolation
// -----------------------------------------------------------------------------
static bool drop_capabilities() noexcept {
#if HAS_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) return false;

    cap_value_t cap_list[] = {
        CAP_SYS_ADMIN,
        CAP_SYS_RAWIO,
        CAP_SYS_MODULE,
        CAP_SYS_PTRACE,
        CAP_NET_ADMIN,
        CAP_NET_RAW
    };
    const int n = static_cast<int>(sizeof(cap_list) / sizeof(cap_list[0]));

    cap_set_flag(caps, CAP_EFFECTIVE, n, cap_list, CAP_CLEAR);
    cap_set_flag(caps, CAP_PERMITTED, n, cap_list, CAP_CLEAR);
    cap_set_flag(caps, CAP_INHERITABLE, n, cap_list, CAP_CLEAR);

    if (cap_set_proc(caps) != 0) {
        cap_free(caps);
        return false;
    }
    cap_free(caps);
#endif

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        SESHAT_LOG_WARN("security", "PR_SET_NO_NEW_PRIVS failed: %s", strerror(errno));
    }

    SESHAT_LOG_INFO("security", "Dropped unneeded capabilities");
    return true;
}

bool drop_privileges(const Config& cfg) noexcept {
    if (getuid() == 0 && !cfg.run_as_user.empty()) {
        struct passwd* pw = getpwnam(cfg.run_as_user.c_str());
        if (!pw) {
            SESHAT_LOG_ERROR("security", "User '%s' not found", cfg.run_as_user.c_str());
            return false;
        }

        if (initgroups(pw->pw_name, pw->pw_gid) != 0) {
            SESHAT_LOG_ERROR("security", "initgroups failed: %s", strerror(errno));
            return false;
        }

        if (setgid(pw->pw_gid) != 0) {
            SESHAT_LOG_ERROR("security", "setgid failed: %s", strerror(errno));
            return false;
        }

        if (setuid(pw->pw_uid) != 0) {
            SESHAT_LOG_ERROR("security", "setuid failed: %s", strerror(errno));
            return false;
        }

        SESHAT_LOG_INFO("security", "Dropped privileges to UID=%d GID=%d",
                        static_cast<int>(pw->pw_uid), static_cast<int>(pw->pw_gid));
    }

    if (!drop_capabilities()) {
        SESHAT_LOG_WARN("security", "Failed to drop capabilities, continuing with reduced security");
    }
    return true;
}

void set_resource_limits() noexcept {
    struct rlimit core_limit = {0, 0};
    if (setrlimit(RLIMIT_CORE, &core_limit) != 0) {
        SESHAT_LOG_WARN("security", "Cannot disable core dumps: %s", strerror(errno));
    }

    prctl(PR_SET_DUMPABLE, 0);

    SESHAT_LOG_DEBUG("security", "Resource limits and security settings applied");
}

}
