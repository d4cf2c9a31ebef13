#include "seshat/service.hpp"
#include "seshat/coordinator.hpp"
#include "seshat/daemon.hpp"
#include "seshat/dispatcher.hpp"
#include "seshat/file_ops.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/janitor.hpp"
#include "seshat/journal.hpp"
#include "seshat/log.hpp"
#include "seshat/metrics.hpp"
#include "seshat/mover.hpp"
#include "seshat/reaper.hpp"
#include "seshat/registry.hpp"
#include "seshat/stop_source.hpp"
#include "seshat/watcher.hpp"
#include "seshat/worker_pool.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <thread>

#include <signal.h>
#include <unistd.h>

namespace seshat {

namespace {

// Everything one ingestion run needs, wired in dependency order.
struct Pipeline {
    const Config& cfg;
    Metrics metrics;
    StopSource stop;
    OperationJournal journal;
    PosixFileOps ops;
    AtomicMover mover;
    DirectoryReaper reaper;
    ProcessingRegistry registry;
    IngestionCoordinator coordinator;
    WorkerPool pool;
    Dispatcher dispatcher;

    explicit Pipeline(const Config& c)
        : cfg(c),
          journal(c.journal_file),
          ops(static_cast<size_t>(c.copy_buffer_bytes()), metrics),
          mover(c, ops, stop, metrics, journal),
          reaper(c.watch_dir, metrics),
          registry(c.cooldown(), c.history_limit),
          coordinator(c, registry, mover, reaper, stop, metrics, journal),
          pool(c.workers, [this](const std::string& path) { return coordinator.process(path); },
               stop, metrics),
          dispatcher(pool, IngestFilter(c.watch_dir), stop, metrics,
                     std::chrono::milliseconds(c.watch_debounce_ms)) {}

    // Stops producers, interrupts stability waits and backoffs, then gives
    // in-flight copies up to shutdown_drain_sec to finish.
    void drain() noexcept {
        stop.request_stop();
        dispatcher.stop();

        if (!registry.wait_until_idle(std::chrono::seconds(cfg.shutdown_drain_sec))) {
            SESHAT_LOG_WARN("seshat", "%zu tasks still in flight after %d s drain",
                            registry.in_flight_count(), cfg.shutdown_drain_sec);
        }
        pool.stop();
    }
};

void log_metrics(const Metrics& m, const char* reason) noexcept {
    char buf[4096];
    if (format_metrics(m, buf, sizeof(buf)) < 0) {
        SESHAT_LOG_WARN("seshat", "Metrics output truncated");
    }
    for (char* p = buf; *p; ++p) {
        if (*p == '\n') *p = ' ';
    }
    SESHAT_LOG_INFO("seshat", "Stats (%s): %s", reason, buf);
}

ScanSummary run_scan(Dispatcher& dispatcher, const std::string& root) noexcept {
    try {
        return dispatcher.initial_scan(root);
    } catch (const std::exception& e) {
        SESHAT_LOG_ERROR("dispatch", "Scan of %s failed: %s", root.c_str(), e.what());
        return ScanSummary{};
    }
}

size_t collect_temps_at_startup(Pipeline& p) {
    size_t removed = collect_stale_temps(p.cfg.archive_root, p.cfg.temp_gc_age_sec,
                                         p.metrics, p.stop);
    if (removed > 0) {
        SESHAT_LOG_INFO("seshat", "Removed %zu stale temporary files from %s",
                        removed, p.cfg.archive_root.c_str());
    }
    return removed;
}

}

std::shared_ptr<const Config> prepare_roots(const Config& cfg) {
    if (!is_directory(cfg.watch_dir)) {
        SESHAT_LOG_ERROR("seshat", "Watch root %s does not exist or is not a directory",
                         cfg.watch_dir.c_str());
        return nullptr;
    }

    if (mkdir_p_safe(cfg.archive_root, 0755) != 0) {
        SESHAT_LOG_ERROR("seshat", "Cannot create archive root %s: %s",
                         cfg.archive_root.c_str(), strerror(errno));
        return nullptr;
    }

    auto out = std::make_shared<Config>(cfg);
    out->watch_dir = canonical_path(cfg.watch_dir);
    out->archive_root = canonical_path(cfg.archive_root);
    if (out->watch_dir.empty() || out->archive_root.empty()) {
        SESHAT_LOG_ERROR("seshat", "Cannot resolve roots %s and %s: %s",
                         cfg.watch_dir.c_str(), cfg.archive_root.c_str(), strerror(errno));
        return nullptr;
    }

    // Files moved into the archive would be rediscovered by the watch
    if (path_within(out->watch_dir, out->archive_root)) {
        SESHAT_LOG_ERROR("seshat", "Archive root %s must not lie inside watch root %s",
                         out->archive_root.c_str(), out->watch_dir.c_str());
        return nullptr;
    }

    return out;
}

// -----------------------------------------------------------------------------
// Command: run / start
// -----------------------------------------------------------------------------
int cmd_run(std::shared_ptr<const Config> cfg, bool daemon) {
    if (daemon) {
        pid_t existing = read_pid_file(cfg->pid_file);
        if (existing > 0 && kill(existing, 0) == 0) {
            fprintf(stderr, "ERROR: Seshat already running (PID %d)\n", static_cast<int>(existing));
            return 1;
        }
    }

    std::shared_ptr<const Config> prepared = prepare_roots(*cfg);
    if (!prepared) return 1;
    const Config& c = *prepared;

    if (daemon) {
        daemonize();
        log_set_daemon(true);
    }

    set_resource_limits();
    install_signal_handlers();

    std::unique_ptr<PidFileLock> pid_lock;
    if (daemon) {
        if (mkdir_p_safe(parent_dir(c.pid_file), 0755) != 0) {
            SESHAT_LOG_ERROR("seshat", "Cannot create %s: %s",
                             parent_dir(c.pid_file).c_str(), strerror(errno));
            return 1;
        }
        try {
            pid_lock = std::make_unique<PidFileLock>(c.pid_file);
        } catch (const std::exception& e) {
            SESHAT_LOG_ERROR("seshat", "Failed to acquire pidfile lock: %s", e.what());
            return 1;
        }
    }

    if (!drop_privileges(c)) return 1;

    Pipeline p(c);
    collect_temps_at_startup(p);

    std::atomic<bool> rescan_requested{false};
    DirectoryWatcher watcher(c.watch_dir, p.stop, p.metrics,
        [&p](const WatchEvent& e) { p.dispatcher.on_watch_event(e); },
        [&rescan_requested] { rescan_requested.store(true, std::memory_order_release); });

    p.dispatcher.start();
    if (!watcher.start()) {
        SESHAT_LOG_ERROR("seshat", "Cannot watch %s", c.watch_dir.c_str());
        p.drain();
        return 1;
    }

    // The scan runs beside the main loop so signals are still serviced
    std::atomic<bool> scan_running{true};
    std::thread scan_thread([&p, &c, &scan_running] {
        block_signals_in_worker_threads();
        run_scan(p.dispatcher, c.watch_dir);
        scan_running.store(false, std::memory_order_release);
    });

    SystemdNotifier notifier;
    notifier.notify_ready();

    SESHAT_LOG_INFO("seshat", "Seshat started: watch=%s archive=%s workers=%d%s",
                    c.watch_dir.c_str(), c.archive_root.c_str(), c.workers,
                    c.dry_run ? " (dry run)" : "");

    using clock = std::chrono::steady_clock;
    const auto stats_every = std::chrono::seconds(c.stats_interval_sec);
    const auto ping_every = std::chrono::microseconds(notifier.watchdog_interval_usec());
    auto next_stats = clock::now() + stats_every;
    auto next_ping = clock::now() + ping_every;

    while (!shutdown_signalled()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        const auto now = clock::now();

        if (take_stats_request()) {
            log_metrics(p.metrics, "SIGHUP");
        }
        if (now >= next_stats) {
            log_metrics(p.metrics, "periodic");
            char status[128];
            snprintf(status, sizeof(status), "moved %llu, failed %llu, in flight %zu",
                     static_cast<unsigned long long>(p.metrics.moved.load()),
                     static_cast<unsigned long long>(p.metrics.failed.load()),
                     p.registry.in_flight_count());
            notifier.update_status(status);
            next_stats = now + stats_every;
        }
        if (ping_every.count() > 0 && now >= next_ping) {
            notifier.ping_watchdog();
            next_ping = now + ping_every;
        }
        if (rescan_requested.load(std::memory_order_acquire) &&
            !scan_running.load(std::memory_order_acquire)) {
            rescan_requested.store(false, std::memory_order_release);
            if (scan_thread.joinable()) scan_thread.join();
            scan_running.store(true, std::memory_order_release);
            scan_thread = std::thread([&p, &c, &scan_running] {
                block_signals_in_worker_threads();
                run_scan(p.dispatcher, c.watch_dir);
                scan_running.store(false, std::memory_order_release);
            });
        }
    }

    SESHAT_LOG_INFO("seshat", "Received signal %d, initiating shutdown", last_shutdown_signal());
    notifier.notify_stopping();

    watcher.stop();
    p.drain();
    if (scan_thread.joinable()) scan_thread.join();

    log_metrics(p.metrics, "shutdown");
    pid_lock.reset();

    SESHAT_LOG_INFO("seshat", "Seshat exited successfully");
    return 0;
}

// -----------------------------------------------------------------------------
// Command: stop
// -----------------------------------------------------------------------------
int cmd_stop(const Config& cfg) {
    pid_t pid = read_pid_file(cfg.pid_file);
    if (pid <= 0) {
        fprintf(stderr, "INFO: Seshat not running (no pidfile)\n");
        return 0;
    }

    if (kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) {
            unlink(cfg.pid_file.c_str());
            printf("INFO: Process not found, stale pidfile removed\n");
            return 0;
        }
        perror("kill(SIGTERM)");
        return 1;
    }

    // Drain time plus a margin for the final copy and metrics flush
    const int polls = (cfg.shutdown_drain_sec + 5) * 10;
    for (int i = 0; i < polls; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (kill(pid, 0) != 0 && errno == ESRCH) {
            printf("Seshat stopped gracefully\n");
            return 0;
        }
    }

    fprintf(stderr, "WARNING: Process %d not responding, sending SIGKILL\n", static_cast<int>(pid));
    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        perror("kill(SIGKILL)");
        return 1;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    unlink(cfg.pid_file.c_str());

    printf("Seshat force stopped\n");
    return 0;
}

// -----------------------------------------------------------------------------
// Command: status
// -----------------------------------------------------------------------------
int cmd_status(const Config& cfg) {
    pid_t pid = read_pid_file(cfg.pid_file);
    if (pid <= 0) {
        printf("Service status: STOPPED\n");
        return 3;
    }

    if (kill(pid, 0) == 0 || errno == EPERM) {
        printf("Service status: RUNNING (PID %d)\n", static_cast<int>(pid));
        printf("Send SIGHUP to log current metrics\n");
        return 0;
    }

    printf("Service status: STOPPED (stale pidfile %s)\n", cfg.pid_file.c_str());
    return 3;
}

// -----------------------------------------------------------------------------
// Command: scan
// -----------------------------------------------------------------------------
int cmd_scan(std::shared_ptr<const Config> cfg) {
    std::shared_ptr<const Config> prepared = prepare_roots(*cfg);
    if (!prepared) return 1;
    const Config& c = *prepared;

    install_signal_handlers();

    Pipeline p(c);
    collect_temps_at_startup(p);

    ScanSummary summary;
    std::atomic<bool> done{false};
    std::thread scan_thread([&p, &c, &summary, &done] {
        block_signals_in_worker_threads();
        summary = run_scan(p.dispatcher, c.watch_dir);
        done.store(true, std::memory_order_release);
    });

    while (!done.load(std::memory_order_acquire) && !shutdown_signalled()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    p.drain();
    scan_thread.join();
    log_metrics(p.metrics, "scan");

    printf("scan: discovered=%zu moved=%zu duplicates=%zu failed=%zu skipped=%zu\n",
           summary.discovered, summary.moved, summary.duplicates, summary.failed, summary.skipped);
    return summary.failed > 0 ? 2 : 0;
}

// -----------------------------------------------------------------------------
// Command: gc
// -----------------------------------------------------------------------------
int cmd_gc(std::shared_ptr<const Config> cfg) {
    std::shared_ptr<const Config> prepared = prepare_roots(*cfg);
    if (!prepared) return 1;
    const Config& c = *prepared;

    Metrics metrics;
    StopSource stop;

    size_t temps = collect_stale_temps(c.archive_root, c.temp_gc_age_sec, metrics, stop);

    DirectoryReaper reaper(c.watch_dir, metrics);
    size_t dirs = reaper.prune_empty_ancestors(c.watch_dir);

    printf("gc: removed %zu stale temporary files, %zu empty directories\n", temps, dirs);
    return 0;
}

}
