#include "ingest/core/wake_signal.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using ingest::WakeSignal;
using namespace std::chrono_literals;

TEST(WakeSignalTest, TimesOutWithoutEvents) {
    WakeSignal signal;

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(signal.wait_for(50ms), WakeSignal::Reason::Timeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST(WakeSignalTest, WakeInterruptsWait) {
    WakeSignal signal;

    std::thread waker([&signal]() {
        std::this_thread::sleep_for(20ms);
        signal.wake();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(signal.wait_for(10s), WakeSignal::Reason::Woken);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    waker.join();
}

TEST(WakeSignalTest, EarlyWakeIsRememberedOnce) {
    WakeSignal signal;
    signal.wake();
    signal.wake();

    EXPECT_EQ(signal.wait_for(10s), WakeSignal::Reason::Woken);
    // Both pending wake-ups were consumed by the first wait
    EXPECT_EQ(signal.wait_for(10ms), WakeSignal::Reason::Timeout);
}

TEST(WakeSignalTest, StopIsSticky) {
    WakeSignal signal;
    signal.stop();

    EXPECT_TRUE(signal.stopped());
    EXPECT_EQ(signal.wait_for(10s), WakeSignal::Reason::Stopped);
    EXPECT_EQ(signal.wait_for(10s), WakeSignal::Reason::Stopped);

    signal.reset();
    EXPECT_FALSE(signal.stopped());
    EXPECT_EQ(signal.wait_for(10ms), WakeSignal::Reason::Timeout);
}

TEST(WakeSignalTest, StopWinsOverPendingWake) {
    WakeSignal signal;
    signal.wake();
    signal.stop();

    EXPECT_EQ(signal.wait_for(10s), WakeSignal::Reason::Stopped);
}
