#include "instance_lock.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

InstanceLock::InstanceLock(const std::string &path) : path_(path) {}

InstanceLock::~InstanceLock() {
    release();
}

LockResult InstanceLock::acquire(std::string *err) {
    if (fd_ >= 0) return LockResult::Acquired;
    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        *err = "open " + path_ + ": " + std::strerror(errno);
        return LockResult::Error;
    }
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int saved = errno;
        ::close(fd);
        if (saved == EWOULDBLOCK) return LockResult::Held;
        *err = "flock " + path_ + ": " + std::strerror(saved);
        return LockResult::Error;
    }
    fd_ = fd;
    return LockResult::Acquired;
}

bool InstanceLock::write_pid(pid_t pid, std::string *err) {
    if (fd_ < 0) {
        *err = "lock not held: " + path_;
        return false;
    }
    char buf[32];
    int len = std::snprintf(buf, sizeof(buf), "%d\n", static_cast<int>(pid));
    if (ftruncate(fd_, 0) != 0 || lseek(fd_, 0, SEEK_SET) != 0 ||
        len <= 0 || ::write(fd_, buf, static_cast<size_t>(len)) != len) {
        *err = "write " + path_ + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

pid_t InstanceLock::recorded_pid() const {
    FILE *f = std::fopen(path_.c_str(), "r");
    if (!f) return 0;
    char buf[64] = {0};
    pid_t pid = 0;
    if (std::fgets(buf, sizeof(buf), f)) {
        pid = static_cast<pid_t>(std::atoi(buf));
    }
    std::fclose(f);
    return pid > 0 ? pid : 0;
}

void InstanceLock::release() {
    if (fd_ < 0) return;
    // The file itself stays: unlinking it would let a process that already
    // opened the old inode lock it alongside a newcomer.
    if (ftruncate(fd_, 0) != 0) {
        std::printf("failed to clear %s: %s\n", path_.c_str(), std::strerror(errno));
    }
    flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

void InstanceLock::abandon() {
    if (fd_ < 0) return;
    ::close(fd_);
    fd_ = -1;
}
