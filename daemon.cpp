#include "daemon.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <pthread.h>
#include <unistd.h>

#include "paths.h"
#include "retention.h"

bool StopSignal::request_stop() {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (requested_) return false;
        requested_ = true;
    }
    cv_.notify_all();
    return true;
}

bool StopSignal::stop_requested() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return requested_;
}

bool StopSignal::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return requested_; });
}

CompressFn tar_compress(const RunMode &mode) {
    return [mode](const std::string &dir, const std::string &archive, bool gzip) {
        std::vector<std::string> args = {"tar", gzip ? "-czf" : "-cf", archive, "-C", dir, "."};
        return run_nice_ionice(args, mode);
    };
}

Collaborators default_collaborators(const RunMode &mode) {
    Collaborators collab;
    collab.copy = rsync_copy(mode);
    collab.compress = tar_compress(mode);
    collab.free_space = statvfs_free_kb;
    collab.clock = []() { return std::time(nullptr); };
    return collab;
}

const char *daemon_state_label(DaemonState state) {
    switch (state) {
        case DaemonState::Idle:
            return "idle";
        case DaemonState::Running:
            return "running";
        case DaemonState::ShuttingDown:
            return "shutting down";
        default:
            return "unknown";
    }
}

Daemon::Daemon(const Config &cfg, const RunMode &mode)
    : Daemon(cfg, mode, default_collaborators(mode), make_archive_store(cfg, mode)) {}

Daemon::Daemon(const Config &cfg, const RunMode &mode, const Collaborators &collab,
               std::unique_ptr<ArchiveStore> store)
    : cfg_(cfg),
      mode_(mode),
      collab_(collab),
      store_(std::move(store)),
      lock_(cfg.dest + "/" + LOCK_NAME) {}

StartStatus Daemon::start(bool detach, RunHandle *handle, std::string *err) {
    if (!ensure_dir(cfg_.dest, err)) {
        *err = "cannot create destination " + cfg_.dest + ": " + *err;
        return StartStatus::Failed;
    }
    handle->lock_path = lock_.path();
    LockResult locked = lock_.acquire(err);
    if (locked == LockResult::Held) {
        pid_t owner = lock_.recorded_pid();
        if (owner > 0) {
            std::printf("Backup process already running (pid %d).\n", static_cast<int>(owner));
        } else {
            std::printf("Backup process already running.\n");
        }
        handle->pid = owner;
        return StartStatus::AlreadyRunning;
    }
    if (locked == LockResult::Error) {
        return StartStatus::Failed;
    }

    if (detach) {
        std::fflush(stdout);
        std::fflush(stderr);
        pid_t pid = fork();
        if (pid < 0) {
            *err = std::string("fork: ") + std::strerror(errno);
            lock_.release();
            return StartStatus::Failed;
        }
        if (pid > 0) {
            lock_.abandon();
            handle->pid = pid;
            std::printf("Backup process started (pid %d).\n", static_cast<int>(pid));
            return StartStatus::Detached;
        }
        if (!detach_process(err)) {
            std::printf("detach failed: %s\n", err->c_str());
            std::fflush(stdout);
            _exit(2);
        }
    }

    handle->pid = getpid();
    if (!lock_.write_pid(handle->pid, err)) {
        std::printf("warning: %s\n", err->c_str());
        err->clear();
    }
    return StartStatus::Running;
}

bool Daemon::detach_process(std::string *err) {
    if (setsid() < 0) {
        *err = std::string("setsid: ") + std::strerror(errno);
        return false;
    }
    std::string log_path = cfg_.dest + "/" + LOG_NAME;
    int log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (log_fd < 0) {
        *err = "open " + log_path + ": " + std::strerror(errno);
        return false;
    }
    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        if (null_fd > 2) ::close(null_fd);
    }
    dup2(log_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    if (log_fd > 2) ::close(log_fd);
    if (chdir("/") != 0) {
        *err = std::string("chdir /: ") + std::strerror(errno);
        return false;
    }
    return true;
}

int Daemon::run(StopSignal &stop) {
    state_ = DaemonState::Running;
    if (mode_.verbose) std::printf("daemon %s\n", daemon_state_label(state_));
    while (!stop.stop_requested()) {
        run_cycle();
        if (stop.wait_for(std::chrono::seconds(cfg_.interval_seconds))) break;
    }

    state_ = DaemonState::ShuttingDown;
    if (mode_.verbose) std::printf("daemon %s\n", daemon_state_label(state_));
    std::printf("stop requested, running final backup\n");
    run_cycle();
    std::printf("Backup process stopped.\n");
    std::fflush(stdout);
    lock_.release();
    return 0;
}

bool Daemon::run_cycle() {
    cycles_++;
    time_t now = collab_.clock();
    char timebuf[64];
    format_time(timebuf, sizeof(timebuf), now);
    std::printf("%s\n", timebuf);

    std::string err;
    if (!ensure_dir(cfg_.dest, &err)) {
        std::printf("skip cycle: %s\n", err.c_str());
        return false;
    }

    std::string staging_root = cfg_.dest + "/" + STAGING_NAME;
    if (access(staging_root.c_str(), F_OK) == 0) {
        std::printf("removing leftover staging area %s\n", staging_root.c_str());
        if (remove_dir_recursive(staging_root) != 0) {
            std::printf("failed to remove staging area %s: %s\n", staging_root.c_str(), std::strerror(errno));
        }
    }

    bool archived = false;
    if (check_space(cfg_.dest, cfg_.min_free_kb, collab_.free_space) == SpaceCheck::Ok) {
        archived = backup(staging_root, now);
    } else {
        std::printf("Insufficient free space. Skipping this backup.\n");
    }

    prune(collab_.clock());
    std::fflush(stdout);
    return archived;
}

bool Daemon::backup(const std::string &staging_root, time_t now) {
    std::string stamp = format_stamp(now);
    std::string capture_dir = staging_root + "/" + stamp;
    std::string err;
    if (!ensure_dir(capture_dir, &err)) {
        std::printf("skip backup: %s\n", err.c_str());
        return false;
    }

    size_t failed = capture_sources(cfg_.sources, capture_dir, collab_.copy);
    if (failed > 0) {
        std::printf("%zu of %zu source(s) copied incompletely\n", failed, cfg_.sources.size());
    }

    std::string archive = staging_root + "/" + stamp + store_->archive_suffix();
    std::printf("Creating: %s%s\n", stamp.c_str(), store_->archive_suffix().c_str());
    bool stored = false;
    int rc = collab_.compress(capture_dir, archive, store_->gzip_archives());
    if (rc != 0) {
        std::printf("archive %s failed with exit code %d; backup %s lost\n", archive.c_str(), rc, stamp.c_str());
    } else if (!store_->add(archive, stamp, &err)) {
        std::printf("failed to store backup %s: %s\n", stamp.c_str(), err.c_str());
    } else {
        stored = true;
    }

    if (remove_dir_recursive(staging_root) != 0) {
        std::printf("failed to remove staging area %s: %s\n", staging_root.c_str(), std::strerror(errno));
    }
    return stored;
}

void Daemon::prune(time_t now) {
    std::vector<BackupEntry> entries;
    std::string err;
    if (!store_->list(&entries, &err)) {
        std::printf("cannot list %s store: %s\n", store_->kind(), err.c_str());
        return;
    }
    std::set<std::string> doomed = select_expired(now, entries, cfg_.retention, mode_.verbose);
    if (doomed.empty()) return;
    if (mode_.verbose) {
        std::printf("retention: removing %zu of %zu backup(s)\n", doomed.size(), entries.size());
    }
    if (!store_->remove(doomed, &err)) {
        std::printf("failed to remove old backups: %s\n", err.c_str());
    }
}

static void fill_stop_set(sigset_t *set) {
    sigemptyset(set);
    sigaddset(set, SIGTERM);
    sigaddset(set, SIGHUP);
    sigaddset(set, SIGINT);
}

bool block_stop_signals(std::string *err) {
    sigset_t set;
    fill_stop_set(&set);
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        *err = std::string("pthread_sigmask: ") + std::strerror(rc);
        return false;
    }
    return true;
}

void stop_signal_loop(StopSignal *stop) {
    sigset_t set;
    fill_stop_set(&set);
    for (;;) {
        int signum = 0;
        if (sigwait(&set, &signum) != 0) continue;
        if (stop->request_stop()) {
            std::printf("received %s, shutting down after one more backup\n", strsignal(signum));
        } else {
            std::printf("received %s, shutdown already in progress\n", strsignal(signum));
        }
        std::fflush(stdout);
    }
}
