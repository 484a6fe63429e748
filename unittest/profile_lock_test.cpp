#include <gtest/gtest.h>
#include "common/profile_lock.hpp"
#include "test_utils.hpp"

TEST(ProfileLockTest, SameOwnerMayRegisterTwice) {
    TempDirectory temp;
    ProfileLock lock(temp.str());

    EXPECT_TRUE(lock.registerRun("Nightly Docs", "pid:1").success);
    EXPECT_TRUE(lock.registerRun("Nightly Docs", "pid:1").success);
    EXPECT_TRUE(lock.isRunning("Nightly Docs"));

    EXPECT_TRUE(lock.unregisterRun("Nightly Docs"));
    EXPECT_FALSE(lock.isRunning("Nightly Docs"));
    EXPECT_FALSE(lock.unregisterRun("Nightly Docs"));
}

TEST(ProfileLockTest, OtherOwnerIsRefused) {
    TempDirectory temp;
    ProfileLock lock(temp.str());

    ASSERT_TRUE(lock.registerRun("docs", "pid:1").success);
    OperationResult second = lock.registerRun("docs", "pid:2");
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.kind, ErrorKind::LockContentionError);
}

TEST(ProfileLockTest, SecondLockHolderIsRefused) {
    TempDirectory temp;
    ProfileLock first(temp.str());
    ProfileLock second(temp.str());

    ASSERT_TRUE(first.registerRun("docs", "a").success);
    EXPECT_TRUE(second.isRunning("docs"));

    OperationResult contended = second.registerRun("docs", "b");
    EXPECT_FALSE(contended.success);
    EXPECT_EQ(contended.kind, ErrorKind::LockContentionError);

    first.releaseAll();
    EXPECT_FALSE(second.isRunning("docs"));
    EXPECT_TRUE(second.registerRun("docs", "b").success);
}

TEST(ProfileLockTest, LockFileNameIsSanitizedWithDigest) {
    ProfileLock lock("/var/lock");
    std::string path = lock.lockPathFor("My Docs/2024");
    std::string sanitized = "My_Docs_2024";
    std::string expected = "/var/lock/robocurse-" + sanitized + "-" + utils::sha256Hex(sanitized).substr(0, 8) + ".lock";
    EXPECT_EQ(path, expected);
    EXPECT_NE(lock.lockPathFor("a"), lock.lockPathFor("b"));
}
