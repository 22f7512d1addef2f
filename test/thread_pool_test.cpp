#include "thread_pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace optipack;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsEverySubmittedTask) {
    ThreadPool pool(3);
    std::atomic<int> ran{0};
    for (int i = 0; i < 50; ++i) {
        pool.submit([&ran](std::stop_token) { ++ran; });
    }
    pool.wait_idle();
    EXPECT_EQ(ran.load(), 50);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, StopDiscardsQueuedAndSignalsRunning) {
    ThreadPool pool(1);
    std::atomic<bool> started{false};
    std::atomic<bool> saw_stop{false};
    std::atomic<int> later{0};

    pool.submit([&](const std::stop_token st) {
        started = true;
        while (!st.stop_requested()) {
            std::this_thread::sleep_for(1ms);
        }
        saw_stop = true;
    });
    for (int i = 0; i < 5; ++i) {
        pool.submit([&later](std::stop_token) { ++later; });
    }
    while (!started) {
        std::this_thread::sleep_for(1ms);
    }

    pool.request_stop();
    pool.wait_idle();
    EXPECT_TRUE(saw_stop.load());
    EXPECT_EQ(later.load(), 0);
    EXPECT_TRUE(pool.stopped());
    EXPECT_THROW(pool.submit([](std::stop_token) {}), std::runtime_error);
}
