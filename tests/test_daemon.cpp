#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include "daemon.h"
#include "test_util.h"

namespace {

bool wait_until(const std::function<bool()> &done) {
    for (int i = 0; i < 200; i++) {
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return done();
}

class DaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::time(nullptr);
        std::string err;
        ASSERT_TRUE(ensure_dir(tmp_.sub("src"), &err)) << err;
        ASSERT_TRUE(write_file(tmp_.sub("src/notes.txt"), "notes"));

        cfg_.dest = tmp_.sub("dest");
        SourceSpec src;
        src.path = tmp_.sub("src");
        src.max_file_size = cfg_.max_file_size;
        cfg_.sources.push_back(src);
        cfg_.min_free_kb = 1000;

        collab_.copy = [this](const std::string &, const std::string &dest, uint64_t) {
            copies_++;
            if (on_copy_) on_copy_();
            return write_file(dest + "/notes.txt", "notes") ? 0 : 1;
        };
        collab_.compress = [this](const std::string &, const std::string &archive, bool) {
            if (compress_rc_ != 0) return compress_rc_;
            return write_file(archive, "archive") ? 0 : 1;
        };
        collab_.free_space = [this](const std::string &, uint64_t *free_kb, std::string *) {
            *free_kb = free_kb_;
            return true;
        };
        time_t now = now_;
        collab_.clock = [now]() { return now; };
    }

    std::unique_ptr<Daemon> make_daemon() {
        std::unique_ptr<ArchiveStore> store(new DirectoryStore(cfg_.dest));
        return std::unique_ptr<Daemon>(new Daemon(cfg_, RunMode(), collab_, std::move(store)));
    }

    // Body of a forked child: the same start/signal/run sequence as main.
    // Each clock reading is a minute later so every cycle gets its own stamp.
    int run_until_signalled(bool detach) {
        time_t start = now_;
        std::shared_ptr<long> ticks = std::make_shared<long>(0);
        collab_.clock = [start, ticks]() { return start + 60 * (*ticks)++; };
        std::unique_ptr<Daemon> daemon = make_daemon();
        RunHandle handle;
        std::string err;
        StartStatus status = daemon->start(detach, &handle, &err);
        if (status == StartStatus::Detached) return 0;
        if (status != StartStatus::Running) return 3;
        if (!block_stop_signals(&err)) return 4;
        StopSignal *stop = new StopSignal();
        std::thread(stop_signal_loop, stop).detach();
        return daemon->run(*stop);
    }

    std::vector<std::string> archives() {
        DirectoryStore store(cfg_.dest);
        std::vector<BackupEntry> entries;
        std::string err;
        EXPECT_TRUE(store.list(&entries, &err)) << err;
        std::vector<std::string> names;
        for (const auto &e : entries) names.push_back(e.name);
        std::sort(names.begin(), names.end());
        return names;
    }

    std::string old_archive(long age_minutes) {
        std::string name = format_stamp(now_ - age_minutes * 60) + ".tgz";
        EXPECT_TRUE(write_file(cfg_.dest + "/" + name, "old"));
        EXPECT_TRUE(set_mtime(cfg_.dest + "/" + name, now_ - age_minutes * 60));
        return name;
    }

    TempDir tmp_;
    Config cfg_;
    Collaborators collab_;
    time_t now_ = 0;
    std::atomic<int> copies_{0};
    std::function<void()> on_copy_;
    int compress_rc_ = 0;
    uint64_t free_kb_ = 1000000;
};

}  // namespace

TEST_F(DaemonTest, SecondStartSeesRunningInstance) {
    std::unique_ptr<Daemon> first = make_daemon();
    std::unique_ptr<Daemon> second = make_daemon();
    RunHandle handle;
    std::string err;
    ASSERT_EQ(StartStatus::Running, first->start(false, &handle, &err)) << err;
    EXPECT_EQ(getpid(), handle.pid);
    EXPECT_EQ(cfg_.dest + "/" + LOCK_NAME, handle.lock_path);

    RunHandle other;
    EXPECT_EQ(StartStatus::AlreadyRunning, second->start(false, &other, &err));
    EXPECT_EQ(getpid(), other.pid);
}

TEST_F(DaemonTest, StartFailsWhenDestinationCannotBeCreated) {
    ASSERT_TRUE(write_file(tmp_.sub("blocker"), "file"));
    cfg_.dest = tmp_.sub("blocker/dest");
    std::unique_ptr<Daemon> daemon = make_daemon();
    RunHandle handle;
    std::string err;
    EXPECT_EQ(StartStatus::Failed, daemon->start(false, &handle, &err));
    EXPECT_FALSE(err.empty());
}

TEST_F(DaemonTest, StopBeforeRunStillTakesFinalBackup) {
    std::unique_ptr<Daemon> daemon = make_daemon();
    RunHandle handle;
    std::string err;
    ASSERT_EQ(StartStatus::Running, daemon->start(false, &handle, &err)) << err;

    StopSignal stop;
    ASSERT_TRUE(stop.request_stop());
    EXPECT_EQ(0, daemon->run(stop));
    EXPECT_EQ(1U, daemon->cycles());
    EXPECT_EQ(DaemonState::ShuttingDown, daemon->state());
    EXPECT_EQ(1, copies_.load());
    EXPECT_EQ(std::vector<std::string>({format_stamp(now_) + ".tgz"}), archives());
    EXPECT_FALSE(path_exists(cfg_.dest + "/" + STAGING_NAME));
    EXPECT_EQ(0, InstanceLock(cfg_.dest + "/" + LOCK_NAME).recorded_pid());
}

TEST_F(DaemonTest, StopDuringCycleRunsExactlyOneMore) {
    cfg_.interval_seconds = 1;
    StopSignal stop;
    on_copy_ = [&stop]() { stop.request_stop(); };
    std::unique_ptr<Daemon> daemon = make_daemon();
    RunHandle handle;
    std::string err;
    ASSERT_EQ(StartStatus::Running, daemon->start(false, &handle, &err)) << err;

    EXPECT_EQ(0, daemon->run(stop));
    EXPECT_EQ(2U, daemon->cycles());
    EXPECT_EQ(2, copies_.load());
    EXPECT_FALSE(stop.request_stop());
}

TEST_F(DaemonTest, LowSpaceSkipsBackupButStillPrunes) {
    free_kb_ = 10;
    std::string err;
    ASSERT_TRUE(ensure_dir(cfg_.dest, &err)) << err;
    old_archive(cfg_.retention.max_age_minutes + 100);
    std::string kept = old_archive(30);

    std::unique_ptr<Daemon> daemon = make_daemon();
    EXPECT_FALSE(daemon->run_cycle());
    EXPECT_EQ(0, copies_.load());
    EXPECT_EQ(std::vector<std::string>({kept}), archives());
}

TEST_F(DaemonTest, FailedCompressLeavesNoStaging) {
    compress_rc_ = 2;
    std::unique_ptr<Daemon> daemon = make_daemon();
    EXPECT_FALSE(daemon->run_cycle());
    EXPECT_EQ(1, copies_.load());
    EXPECT_TRUE(archives().empty());
    EXPECT_FALSE(path_exists(cfg_.dest + "/" + STAGING_NAME));
}

TEST_F(DaemonTest, LeftoverStagingIsCleared) {
    std::string err;
    ASSERT_TRUE(ensure_dir(cfg_.dest + "/" + STAGING_NAME + "/20200101_000000/src", &err)) << err;
    std::unique_ptr<Daemon> daemon = make_daemon();
    EXPECT_TRUE(daemon->run_cycle());
    EXPECT_FALSE(path_exists(cfg_.dest + "/" + STAGING_NAME));
    EXPECT_EQ(std::vector<std::string>({format_stamp(now_) + ".tgz"}), archives());
}

TEST_F(DaemonTest, CycleThinsOlderBackups) {
    std::string err;
    ASSERT_TRUE(ensure_dir(cfg_.dest, &err)) << err;
    std::string younger = old_archive(1450);
    std::string older = old_archive(1500);
    std::string fresh = old_archive(60);

    std::unique_ptr<Daemon> daemon = make_daemon();
    ASSERT_TRUE(daemon->run_cycle());
    std::vector<std::string> names = archives();
    EXPECT_EQ(std::find(names.begin(), names.end(), younger), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), older), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), fresh), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), format_stamp(now_) + ".tgz"), names.end());
    EXPECT_EQ(3U, names.size());
}

TEST_F(DaemonTest, LeftoverStagingFailureIsLogged) {
    if (geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";
    std::string stuck = cfg_.dest + "/" + STAGING_NAME + "/20200101_000000";
    std::string err;
    ASSERT_TRUE(ensure_dir(stuck, &err)) << err;
    ASSERT_TRUE(write_file(stuck + "/file", "x"));
    ASSERT_EQ(0, chmod(stuck.c_str(), 0500));

    std::unique_ptr<Daemon> daemon = make_daemon();
    testing::internal::CaptureStdout();
    daemon->run_cycle();
    std::string log = testing::internal::GetCapturedStdout();
    chmod(stuck.c_str(), 0700);
    EXPECT_NE(std::string::npos, log.find("failed to remove staging area " + cfg_.dest + "/" + STAGING_NAME))
        << log;
}

TEST_F(DaemonTest, SigtermStopsAfterOneFinalCycle) {
    cfg_.interval_seconds = 3600;
    std::fflush(stdout);
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) _exit(run_until_signalled(false));

    bool first_cycle = wait_until([this]() { return archives().size() == 1; });
    if (!first_cycle) kill(child, SIGKILL);
    kill(child, SIGTERM);
    kill(child, SIGTERM);
    int status = 0;
    ASSERT_EQ(child, waitpid(child, &status, 0));
    ASSERT_TRUE(first_cycle);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(0, WEXITSTATUS(status));
    EXPECT_EQ(2U, archives().size());
    EXPECT_FALSE(path_exists(cfg_.dest + "/" + STAGING_NAME));
    EXPECT_EQ(0, InstanceLock(cfg_.dest + "/" + LOCK_NAME).recorded_pid());
}

TEST_F(DaemonTest, DetachedDaemonLogsAndStopsOnSighup) {
    cfg_.interval_seconds = 3600;
    std::fflush(stdout);
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) _exit(run_until_signalled(true));

    int status = 0;
    ASSERT_EQ(child, waitpid(child, &status, 0));
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(0, WEXITSTATUS(status));

    std::string lock_path = cfg_.dest + "/" + LOCK_NAME;
    pid_t daemon_pid = 0;
    ASSERT_TRUE(wait_until([&]() {
        daemon_pid = InstanceLock(lock_path).recorded_pid();
        return daemon_pid > 0;
    }));
    EXPECT_NE(child, daemon_pid);
    bool first_cycle = wait_until([this]() { return archives().size() == 1; });
    if (!first_cycle) kill(daemon_pid, SIGKILL);
    ASSERT_TRUE(first_cycle);

    ASSERT_EQ(0, kill(daemon_pid, SIGHUP));
    ASSERT_TRUE(wait_until([&]() {
        InstanceLock probe(lock_path);
        std::string err;
        return probe.acquire(&err) == LockResult::Acquired;
    }));
    EXPECT_EQ(2U, archives().size());
    std::string log = read_file(cfg_.dest + "/" + LOG_NAME);
    EXPECT_NE(std::string::npos, log.find("Creating: ")) << log;
    EXPECT_NE(std::string::npos, log.find("shutting down after one more backup")) << log;
    EXPECT_NE(std::string::npos, log.find("Backup process stopped.")) << log;
}

TEST(TarCompressTest, ArchivesDirectoryContents) {
    if (!command_available("tar") || !command_available("nice") || !command_available("ionice")) {
        GTEST_SKIP() << "tar/nice/ionice not installed";
    }
    TempDir tmp;
    std::string err;
    ASSERT_TRUE(ensure_dir(tmp.sub("stage/docs"), &err)) << err;
    ASSERT_TRUE(write_file(tmp.sub("stage/docs/notes.txt"), "notes"));
    CompressFn compress = tar_compress(RunMode());

    ASSERT_EQ(0, compress(tmp.sub("stage"), tmp.sub("20240101_000000.tgz"), true));
    std::string listing;
    ASSERT_EQ(0, run_command_output({"tar", "-tzf", tmp.sub("20240101_000000.tgz")}, RunMode(), &listing));
    EXPECT_NE(std::string::npos, listing.find("./docs/notes.txt")) << listing;

    ASSERT_EQ(0, compress(tmp.sub("stage"), tmp.sub("20240101_000000.tar"), false));
    ASSERT_EQ(0, run_command_output({"tar", "-tf", tmp.sub("20240101_000000.tar")}, RunMode(), &listing));
    EXPECT_NE(std::string::npos, listing.find("./docs/notes.txt")) << listing;

    EXPECT_NE(0, compress(tmp.sub("absent"), tmp.sub("absent.tgz"), true));
}

TEST(StopSignalTest, WaitTimesOutWithoutRequest) {
    StopSignal stop;
    EXPECT_FALSE(stop.stop_requested());
    EXPECT_FALSE(stop.wait_for(std::chrono::milliseconds(20)));
}

TEST(StopSignalTest, RequestFromAnotherThreadWakesWaiter) {
    StopSignal stop;
    std::thread requester([&stop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.request_stop();
    });
    EXPECT_TRUE(stop.wait_for(std::chrono::seconds(10)));
    requester.join();
    EXPECT_TRUE(stop.stop_requested());
    EXPECT_FALSE(stop.request_stop());
}

TEST(DaemonStateTest, Labels) {
    EXPECT_STREQ("idle", daemon_state_label(DaemonState::Idle));
    EXPECT_STREQ("running", daemon_state_label(DaemonState::Running));
    EXPECT_STREQ("shutting down", daemon_state_label(DaemonState::ShuttingDown));
}
