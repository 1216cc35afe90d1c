#include "command.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

void print_command(const std::vector<std::string> &argv, const RunMode &mode) {
    if (!mode.verbose) return;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i == 0) {
            std::printf("%s", argv[i].c_str());
        } else {
            std::printf(" %s", argv[i].c_str());
        }
    }
    std::printf("\n");
}

static std::vector<char *> make_args(const std::vector<std::string> &argv) {
    std::vector<char *> args;
    for (const auto &s : argv) {
        args.push_back(const_cast<char *>(s.c_str()));
    }
    args.push_back(nullptr);
    return args;
}

// Exec'd tools start with an empty signal mask, not the daemon's.
static void reset_child_signals() {
    sigset_t none;
    sigemptyset(&none);
    pthread_sigmask(SIG_SETMASK, &none, nullptr);
}

static int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return 1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return 1;
}

int run_command(const std::vector<std::string> &argv, const RunMode &mode) {
    if (argv.empty()) return 1;
    print_command(argv, mode);
    std::vector<char *> args = make_args(argv);

    std::fflush(stdout);
    std::fflush(stderr);
    pid_t pid = fork();
    if (pid < 0) return 1;
    if (pid == 0) {
        reset_child_signals();
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            if (null_fd > 2) ::close(null_fd);
        }
        execvp(args[0], args.data());
        _exit(127);
    }
    return wait_child(pid);
}

int run_command_output(const std::vector<std::string> &argv, const RunMode &mode, std::string *out) {
    if (argv.empty()) return 1;
    print_command(argv, mode);
    std::vector<char *> args = make_args(argv);

    int fds[2];
    if (pipe(fds) != 0) return 1;
    std::fflush(stdout);
    std::fflush(stderr);
    pid_t pid = fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        return 1;
    }
    if (pid == 0) {
        reset_child_signals();
        ::close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        if (fds[1] != STDOUT_FILENO) ::close(fds[1]);
        execvp(args[0], args.data());
        _exit(127);
    }
    ::close(fds[1]);
    out->clear();
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            out->append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    ::close(fds[0]);
    return wait_child(pid);
}

int run_nice_ionice(const std::vector<std::string> &args, const RunMode &mode) {
    std::vector<std::string> argv = {"nice", "-n", "19", "ionice", "-c", "3", "-n7"};
    argv.insert(argv.end(), args.begin(), args.end());
    return run_command(argv, mode);
}

bool command_available(const std::string &name) {
    const char *path = std::getenv("PATH");
    if (!path) return false;
    std::string dirs = path;
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) return true;
        start = end + 1;
    }
    return false;
}
