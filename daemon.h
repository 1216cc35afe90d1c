#ifndef STRATA_DAEMON_H
#define STRATA_DAEMON_H

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

#include "archive_store.h"
#include "capture.h"
#include "command.h"
#include "config.h"
#include "instance_lock.h"
#include "space_guard.h"

static const char LOG_NAME[] = "logs.txt";
static const char STAGING_NAME[] = ".staging";

// Stop flag shared between the signal thread and the loop. The loop only
// looks at it while waiting between cycles.
class StopSignal {
public:
    // Returns true for the first request only.
    bool request_stop();
    bool stop_requested() const;
    // Sleeps up to timeout. Returns true when a stop has been requested.
    bool wait_for(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool requested_ = false;
};

// Archives the contents of dir into archive. Returns the tool's exit status.
typedef std::function<int(const std::string &dir, const std::string &archive, bool gzip)> CompressFn;

CompressFn tar_compress(const RunMode &mode);

struct Collaborators {
    CopyFn copy;
    CompressFn compress;
    FreeSpaceFn free_space;
    std::function<time_t()> clock;
};

Collaborators default_collaborators(const RunMode &mode);

enum class DaemonState {
    Idle,
    Running,
    ShuttingDown
};

enum class StartStatus {
    // This process owns the loop and should call run().
    Running,
    // A detached child owns the loop; this process should exit.
    Detached,
    AlreadyRunning,
    Failed
};

struct RunHandle {
    pid_t pid = 0;
    std::string lock_path;
};

const char *daemon_state_label(DaemonState state);

class Daemon {
public:
    Daemon(const Config &cfg, const RunMode &mode);
    Daemon(const Config &cfg, const RunMode &mode, const Collaborators &collab,
           std::unique_ptr<ArchiveStore> store);

    Daemon(const Daemon &) = delete;
    Daemon &operator=(const Daemon &) = delete;

    // Creates the destination, takes the instance lock and, when detach is
    // set, forks into a new session with output appended to <dest>/logs.txt.
    StartStatus start(bool detach, RunHandle *handle, std::string *err);

    // Cycles until stop is requested, then runs one final cycle. Returns the
    // process exit status.
    int run(StopSignal &stop);

    // One capture/archive/retention pass. Returns true when a new archive
    // was stored.
    bool run_cycle();

    DaemonState state() const { return state_; }
    size_t cycles() const { return cycles_; }
    const Config &config() const { return cfg_; }

private:
    bool detach_process(std::string *err);
    bool backup(const std::string &staging_root, time_t now);
    void prune(time_t now);

    const Config cfg_;
    RunMode mode_;
    Collaborators collab_;
    std::unique_ptr<ArchiveStore> store_;
    InstanceLock lock_;
    DaemonState state_ = DaemonState::Idle;
    size_t cycles_ = 0;
};

// Blocks SIGTERM, SIGHUP and SIGINT in the calling thread. Threads created
// afterwards inherit the mask, leaving the signals to the signal thread.
bool block_stop_signals(std::string *err);

// Waits for the blocked stop signals and forwards them to stop. Runs until
// the process exits.
void stop_signal_loop(StopSignal *stop);

#endif
