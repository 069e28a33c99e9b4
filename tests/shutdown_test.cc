#include <gtest/gtest.h>
#include "shutdown.hpp"

#include <thread>

using namespace std::chrono_literals;

TEST(ShutdownSignalTest, StartsClearAndStaysSet) {
    ShutdownSignal signal;
    EXPECT_FALSE(signal.IsSet());
    signal.Set();
    EXPECT_TRUE(signal.IsSet());
    signal.Set();
    EXPECT_TRUE(signal.IsSet());
}

TEST(ShutdownSignalTest, WaitForTimesOutWhenClear) {
    ShutdownSignal signal;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(signal.WaitFor(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(ShutdownSignalTest, SetWakesWaiter) {
    ShutdownSignal signal;
    std::thread setter([&signal]() {
        std::this_thread::sleep_for(20ms);
        signal.Set();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(signal.WaitFor(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    setter.join();
}

TEST(DeadlineTest, ExpiresAfterDuration) {
    Deadline past(Deadline::Clock::now() - 2s, 1s);
    EXPECT_TRUE(past.Expired());

    Deadline future = Deadline::FromNow(60s);
    EXPECT_FALSE(future.Expired());
    EXPECT_EQ(future.end() - future.start(), 60s);
}

TEST(DeadlineTest, ZeroDurationIsImmediatelyExpired) {
    Deadline d = Deadline::FromNow(0s);
    EXPECT_TRUE(d.Expired());
}
