#include <gtest/gtest.h>
#include "slot_semaphore.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace llmgate;

TEST(SlotSemaphoreTest, Capacity) {
    SlotSemaphore slots(2);
    EXPECT_EQ(slots.capacity(), 2u);
    EXPECT_TRUE(slots.try_acquire());
    EXPECT_TRUE(slots.try_acquire());
    EXPECT_FALSE(slots.try_acquire());
    EXPECT_EQ(slots.available(), 0u);

    slots.release();
    EXPECT_EQ(slots.available(), 1u);
}

TEST(SlotSemaphoreTest, ReleaseNeverExceedsCapacity) {
    SlotSemaphore slots(1);
    slots.release();
    slots.release();
    EXPECT_EQ(slots.available(), 1u);
}

TEST(SlotSemaphoreTest, TimedAcquire) {
    SlotSemaphore slots(1);
    slots.acquire();
    EXPECT_FALSE(slots.try_acquire_for(std::chrono::milliseconds(10)));
    slots.release();
    EXPECT_TRUE(slots.try_acquire_for(std::chrono::milliseconds(10)));
}

TEST(SlotSemaphoreTest, BlockedAcquireWakesOnRelease) {
    SlotSemaphore slots(1);
    slots.acquire();

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        slots.acquire();
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(acquired.load());
    slots.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}
