/**
 * @file test_platform_core.cpp
 * @brief Layer 0 tests for process/thread identity and version information.
 */
#include "nj_platform.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <string>
#include <thread>

using namespace nestjar::platform;
using namespace ::testing;

TEST(PlatformCoreTest, GetPID_ReturnsValidID)
{
    EXPECT_GT(get_pid(), 0u) << "PID should be greater than zero";
    EXPECT_EQ(get_pid(), get_pid()) << "PID should be stable within the same process";
}

TEST(PlatformCoreTest, GetThreadID_IsStableForSameThread)
{
    const uint64_t tid1 = get_native_thread_id();
    const uint64_t tid2 = get_native_thread_id();
    EXPECT_GT(tid1, 0u);
    EXPECT_EQ(tid1, tid2);
}

TEST(PlatformCoreTest, GetThreadID_DifferentForDifferentThreads)
{
    const uint64_t main_tid = get_native_thread_id();
    std::atomic<uint64_t> worker_tid{0};
    std::thread t([&] { worker_tid = get_native_thread_id(); });
    t.join();
    EXPECT_NE(main_tid, worker_tid.load());
}

TEST(PlatformCoreTest, VersionString_MatchesComponents)
{
    const std::string expected = std::to_string(get_version_major()) + "." +
                                 std::to_string(get_version_minor()) + "." +
                                 std::to_string(get_version_rolling());
    EXPECT_EQ(std::string(get_version_string()), expected);
    EXPECT_GE(get_version_major(), 0);
}
