// ============================================================
// stop_watcher_test.cpp -- Flag-to-action bridge for signal handlers
// ============================================================

#include "../common/stop_watcher.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace {

bool wait_until(const std::atomic<int>& value, int expected) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (value.load() != expected) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

TEST(StopWatcher, RunsActionOnceAfterFlagIsSet) {
    std::atomic<bool> flag{false};
    std::atomic<int>  calls{0};
    {
        StopWatcher watcher(flag, [&calls] { ++calls; }, std::chrono::milliseconds(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        EXPECT_EQ(calls.load(), 0);
        EXPECT_FALSE(watcher.fired());

        flag.store(true);
        ASSERT_TRUE(wait_until(calls, 1));
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        EXPECT_TRUE(watcher.fired());
    }
    EXPECT_EQ(calls.load(), 1);
}

TEST(StopWatcher, DestroyedWithoutFlagNeverRuns) {
    std::atomic<bool> flag{false};
    std::atomic<int>  calls{0};
    auto t0 = std::chrono::steady_clock::now();
    {
        // Long poll interval: destruction must not wait it out
        StopWatcher watcher(flag, [&calls] { ++calls; }, std::chrono::seconds(30));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(5));
    EXPECT_EQ(calls.load(), 0);
}

TEST(StopWatcher, ActionRunsOffTheSettingThread) {
    std::atomic<bool> flag{false};
    std::atomic<int>  calls{0};
    std::thread::id   action_thread;
    StopWatcher watcher(flag, [&] {
        action_thread = std::this_thread::get_id();
        ++calls;
    }, std::chrono::milliseconds(5));

    flag.store(true);
    ASSERT_TRUE(wait_until(calls, 1));
    EXPECT_NE(action_thread, std::this_thread::get_id());
}
