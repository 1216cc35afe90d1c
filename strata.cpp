#include <cstdio>
#include <ctime>
#include <string>
#include <thread>

#include "command.h"
#include "config.h"
#include "daemon.h"
#include "paths.h"

static const char *DEFAULT_CONFIG = "/etc/strata.yaml";
static const char *STRATA_VERSION = "0.1.0";
static const char *STRATA_LICENSE = "GNU GPL v3 or later";

static void print_banner() {
    std::printf("strata %s\n", STRATA_VERSION);
}

static void print_usage() {
    std::printf("usage: strata [--config PATH] [--foreground] [--verbose] [--print-config] [--version]\n");
}

int main(int argc, char **argv) {
    // Must precede the first write to stdout.
    std::setvbuf(stdout, nullptr, _IOLBF, 0);
    RunMode mode;
    std::string config_path = DEFAULT_CONFIG;
    bool foreground = false;
    bool print_only = false;
    bool show_version = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            mode.verbose = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::printf("--config requires a path\n");
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "--foreground") {
            foreground = true;
        } else if (arg == "--print-config") {
            print_only = true;
        } else if (arg == "--version") {
            show_version = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::printf("unknown option %s\n", arg.c_str());
            print_usage();
            return 2;
        }
    }

    print_banner();
    if (show_version) {
        std::printf("License: %s\n", STRATA_LICENSE);
        return 0;
    }

    Config cfg;
    std::string err;
    if (!parse_config(config_path, &cfg, &err)) {
        std::printf("failed to load config %s: %s\n", config_path.c_str(), err.c_str());
        return 2;
    }
    if (print_only) {
        print_config(cfg);
        return 0;
    }
    if (mode.verbose) {
        std::printf("loaded config %s with %zu source(s)\n", config_path.c_str(), cfg.sources.size());
    }

    Daemon daemon(cfg, mode);
    RunHandle handle;
    switch (daemon.start(!foreground, &handle, &err)) {
        case StartStatus::AlreadyRunning:
            return 0;
        case StartStatus::Detached:
            return 0;
        case StartStatus::Failed:
            std::printf("failed to start: %s\n", err.c_str());
            return 2;
        case StartStatus::Running:
            break;
    }

    char timebuf[64];
    format_time(timebuf, sizeof(timebuf), std::time(nullptr));
    std::printf("%s backup loop running as pid %d, lock %s\n", timebuf, static_cast<int>(handle.pid),
                handle.lock_path.c_str());

    if (!block_stop_signals(&err)) {
        std::printf("failed to install signal handling: %s\n", err.c_str());
        return 2;
    }
    static StopSignal stop;
    std::thread signals(stop_signal_loop, &stop);
    signals.detach();

    return daemon.run(stop);
}
