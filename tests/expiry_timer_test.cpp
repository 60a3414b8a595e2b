#include "expiry_timer.h"
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

using namespace std::chrono_literals;

TEST(ExpiryTimerTest, FiresOnceAfterDelay) {
    std::atomic<int> runs{0};
    ExpiryTimer timer([&runs]() { runs++; });

    auto start = ExpiryTimer::clock::now();
    timer.arm(50ms);
    EXPECT_TRUE(timer.armed());

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(runs.load(), 0); // Not before the deadline

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(runs.load(), 1);
    EXPECT_FALSE(timer.armed()); // One-shot
    EXPECT_GE(ExpiryTimer::clock::now() - start, 50ms);
}

TEST(ExpiryTimerTest, CancelPreventsFiring) {
    std::atomic<int> runs{0};
    ExpiryTimer timer([&runs]() { runs++; });

    timer.arm(50ms);
    timer.cancel();
    EXPECT_FALSE(timer.armed());

    std::this_thread::sleep_for(120ms);
    EXPECT_EQ(runs.load(), 0);
}

TEST(ExpiryTimerTest, RearmMovesDeadlineEarlier) {
    std::atomic<int> runs{0};
    ExpiryTimer timer([&runs]() { runs++; });

    timer.arm(10s);
    timer.arm(30ms);

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(runs.load(), 1);
}

TEST(ExpiryTimerTest, RearmMovesDeadlineLater) {
    std::atomic<int> runs{0};
    ExpiryTimer timer([&runs]() { runs++; });

    timer.arm(30ms);
    timer.arm(300ms);

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(runs.load(), 0);
    std::this_thread::sleep_for(350ms);
    EXPECT_EQ(runs.load(), 1);
}

TEST(ExpiryTimerTest, TaskCanRearmItself) {
    std::atomic<int> runs{0};
    ExpiryTimer* self = nullptr;
    ExpiryTimer timer([&]() {
        if (++runs < 3) self->arm(10ms);
    });
    self = &timer;

    timer.arm(10ms);
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(runs.load(), 3);
    EXPECT_EQ(timer.fired(), 3u);
}

TEST(ExpiryTimerTest, StopIgnoresFurtherArms) {
    std::atomic<int> runs{0};
    ExpiryTimer timer([&runs]() { runs++; });

    timer.stop();
    timer.arm(1ms);
    EXPECT_FALSE(timer.armed());

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(runs.load(), 0);
}

TEST(ExpiryTimerTest, TaskMayDestroyItsOwnTimer) {
    std::atomic<bool> done{false};
    std::unique_ptr<ExpiryTimer> timer;
    timer = std::make_unique<ExpiryTimer>([&timer, &done]() {
        timer.reset(); // Stops and frees the timer from its own worker
        done = true;
    });

    timer->arm(10ms);
    std::this_thread::sleep_for(100ms);
    ASSERT_TRUE(done.load());
    EXPECT_EQ(timer, nullptr);
}
