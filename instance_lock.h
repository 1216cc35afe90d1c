#ifndef STRATA_INSTANCE_LOCK_H
#define STRATA_INSTANCE_LOCK_H

#include <string>
#include <sys/types.h>

static const char LOCK_NAME[] = ".strata.lock";

enum class LockResult {
    Acquired,
    Held,
    Error
};

// Exclusive flock on a lock file that records the owner's pid. The lock lives
// as long as the open file description, so it survives fork() into the child
// that keeps the descriptor.
class InstanceLock {
public:
    explicit InstanceLock(const std::string &path);
    ~InstanceLock();

    InstanceLock(const InstanceLock &) = delete;
    InstanceLock &operator=(const InstanceLock &) = delete;

    LockResult acquire(std::string *err);
    bool write_pid(pid_t pid, std::string *err);
    // Pid recorded in the file, 0 when empty or unreadable.
    pid_t recorded_pid() const;

    // Clears the pid and drops the lock.
    void release();
    // Closes this process's descriptor without touching the file, leaving
    // the lock to whoever else shares it.
    void abandon();

    bool held() const { return fd_ >= 0; }
    const std::string &path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

#endif
