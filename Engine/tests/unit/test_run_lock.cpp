/**
 * @file test_run_lock.cpp
 * @brief Unit tests for the process-local run lock
 */

#include <gtest/gtest.h>
#include <storage/run_lock.hpp>
#include <atomic>
#include <chrono>
#include <thread>

using namespace Cerebrum;

TEST(RunLockTest, KeyCombinesTenantAndProject) {
    EXPECT_EQ(RunLock::key_for("t1", "p1"), "cerebrum:clusters:t1:p1");
}

TEST(RunLockTest, TryAcquireIsExclusivePerKey) {
    LocalRunLock lock;
    EXPECT_TRUE(lock.try_acquire("a"));
    EXPECT_FALSE(lock.try_acquire("a"));
    EXPECT_TRUE(lock.try_acquire("b"));

    lock.release("a");
    EXPECT_FALSE(lock.is_held("a"));
    EXPECT_TRUE(lock.is_held("b"));
}

TEST(RunLockTest, GuardReleasesOnScopeExit) {
    LocalRunLock lock;
    {
        RunLockGuard guard(lock, "k");
        EXPECT_TRUE(lock.is_held("k"));
    }
    EXPECT_FALSE(lock.is_held("k"));
}

TEST(RunLockTest, AcquireWaitsForRelease) {
    LocalRunLock lock;
    lock.acquire("k");

    std::atomic<bool> entered{false};
    std::thread waiter([&] {
        RunLockGuard guard(lock, "k");
        entered = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(entered.load());

    lock.release("k");
    waiter.join();
    EXPECT_TRUE(entered.load());
    EXPECT_FALSE(lock.is_held("k"));
}
