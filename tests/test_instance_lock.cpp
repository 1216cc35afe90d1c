#include <gtest/gtest.h>

#include <string>
#include <unistd.h>

#include "instance_lock.h"
#include "test_util.h"

TEST(InstanceLockTest, SecondLockIsHeld) {
    TempDir tmp;
    std::string path = tmp.sub(LOCK_NAME);
    InstanceLock first(path);
    InstanceLock second(path);
    std::string err;
    ASSERT_EQ(LockResult::Acquired, first.acquire(&err)) << err;
    EXPECT_TRUE(first.held());
    EXPECT_EQ(LockResult::Held, second.acquire(&err));
    EXPECT_FALSE(second.held());
}

TEST(InstanceLockTest, RecordsOwnerPid) {
    TempDir tmp;
    InstanceLock lock(tmp.sub(LOCK_NAME));
    std::string err;
    EXPECT_FALSE(lock.write_pid(getpid(), &err));
    ASSERT_EQ(LockResult::Acquired, lock.acquire(&err)) << err;
    ASSERT_TRUE(lock.write_pid(getpid(), &err)) << err;
    EXPECT_EQ(getpid(), lock.recorded_pid());

    InstanceLock other(tmp.sub(LOCK_NAME));
    EXPECT_EQ(LockResult::Held, other.acquire(&err));
    EXPECT_EQ(getpid(), other.recorded_pid());
}

TEST(InstanceLockTest, ReleaseLetsAnotherOwnerIn) {
    TempDir tmp;
    std::string path = tmp.sub(LOCK_NAME);
    std::string err;
    {
        InstanceLock lock(path);
        ASSERT_EQ(LockResult::Acquired, lock.acquire(&err)) << err;
        ASSERT_TRUE(lock.write_pid(getpid(), &err)) << err;
        lock.release();
        EXPECT_FALSE(lock.held());
    }
    EXPECT_TRUE(path_exists(path));

    InstanceLock next(path);
    EXPECT_EQ(0, next.recorded_pid());
    EXPECT_EQ(LockResult::Acquired, next.acquire(&err)) << err;
}

TEST(InstanceLockTest, MissingDirectoryIsAnError) {
    TempDir tmp;
    InstanceLock lock(tmp.sub("absent/") + LOCK_NAME);
    std::string err;
    EXPECT_EQ(LockResult::Error, lock.acquire(&err));
    EXPECT_FALSE(err.empty());
}
