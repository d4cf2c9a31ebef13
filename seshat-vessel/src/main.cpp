// -----------------------------------------------------------------------------
// Seshat Vessel - Media ingestion into a date-bucketed archive
// Stable-file detection, atomic moves and duplicate elimination
// -----------------------------------------------------------------------------
#include "seshat/config.hpp"
#include "seshat/log.hpp"
#include "seshat/service.hpp"

#include <cstdio>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s {run|start|stop|status|scan|gc}\n", argv[0]);
        return 1;
    }

    const std::string cmd = argv[1];

    std::shared_ptr<const seshat::Config> cfg = seshat::load_config_from_env();
    if (!cfg) {
        fprintf(stderr, "ERROR: Invalid configuration: WATCH_DIR and ARCHIVE_ROOT must be "
                        "distinct absolute paths\n");
        return 1;
    }

    if (cmd == "stop") {
        return seshat::cmd_stop(*cfg);
    } else if (cmd == "status") {
        return seshat::cmd_status(*cfg);
    }

    seshat::log_configure(seshat::to_log_options(*cfg));

    int rc = 1;
    if (cmd == "run") {
        rc = seshat::cmd_run(cfg, false);
    } else if (cmd == "start") {
        rc = seshat::cmd_run(cfg, true);
    } else if (cmd == "scan") {
        rc = seshat::cmd_scan(cfg);
    } else if (cmd == "gc") {
        rc = seshat::cmd_gc(cfg);
    } else {
        fprintf(stderr, "ERROR: Unknown command: %s\n", cmd.c_str());
    }

    seshat::log_close();
    return rc;
}
