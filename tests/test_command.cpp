#include <gtest/gtest.h>

#include <csignal>
#include <cstdlib>
#include <pthread.h>
#include <sstream>
#include <string>

#include "command.h"
#include "daemon.h"
#include "test_util.h"

namespace {

// Restores the calling thread's signal mask on scope exit.
class MaskGuard {
public:
    MaskGuard() { pthread_sigmask(SIG_SETMASK, nullptr, &saved_); }
    ~MaskGuard() { pthread_sigmask(SIG_SETMASK, &saved_, nullptr); }

private:
    sigset_t saved_;
};

bool blocked_mask(const std::string &status, unsigned long long *mask) {
    std::istringstream in(status);
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, 7, "SigBlk:") != 0) continue;
        *mask = std::strtoull(line.c_str() + 7, nullptr, 16);
        return true;
    }
    return false;
}

}  // namespace

TEST(CommandTest, ExitStatus) {
    EXPECT_EQ(0, run_command({"true"}, RunMode()));
    EXPECT_EQ(3, run_command({"sh", "-c", "exit 3"}, RunMode()));
    EXPECT_EQ(127, run_command({"strata-no-such-tool"}, RunMode()));
    EXPECT_EQ(1, run_command({}, RunMode()));
}

TEST(CommandTest, CollectsOutput) {
    std::string out;
    ASSERT_EQ(0, run_command_output({"echo", "hello"}, RunMode(), &out));
    EXPECT_EQ("hello\n", out);
    EXPECT_EQ(2, run_command_output({"sh", "-c", "echo partial; exit 2"}, RunMode(), &out));
    EXPECT_EQ("partial\n", out);
}

TEST(CommandTest, FindsProgramsOnPath) {
    EXPECT_TRUE(command_available("sh"));
    EXPECT_FALSE(command_available("strata-no-such-tool"));
}

TEST(CommandTest, ChildrenStartWithNoBlockedSignals) {
    if (!path_exists("/proc/self/status")) GTEST_SKIP() << "no /proc";
    MaskGuard guard;
    std::string err;
    ASSERT_TRUE(block_stop_signals(&err)) << err;

    std::string out;
    ASSERT_EQ(0, run_command_output({"cat", "/proc/self/status"}, RunMode(), &out));
    unsigned long long mask = ~0ULL;
    ASSERT_TRUE(blocked_mask(out, &mask)) << out;
    EXPECT_EQ(0ULL, mask);

    EXPECT_EQ(0, run_command({"sh", "-c", "grep -q '^SigBlk:[[:space:]]*0*$' /proc/self/status"}, RunMode()));
}

TEST(CommandTest, NiceWrapperPassesExitStatusThrough) {
    if (!command_available("nice") || !command_available("ionice")) GTEST_SKIP() << "nice/ionice not installed";
    EXPECT_EQ(0, run_nice_ionice({"true"}, RunMode()));
    EXPECT_EQ(4, run_nice_ionice({"sh", "-c", "exit 4"}, RunMode()));
}
