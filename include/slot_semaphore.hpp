#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace llmgate {

// Counting semaphore guarding the number of in-flight governed calls.
// No FIFO fairness: whichever waiter wakes first takes the slot.
class SlotSemaphore {
public:
    explicit SlotSemaphore(size_t slots) : available_(slots), capacity_(slots) {}

    SlotSemaphore(const SlotSemaphore&) = delete;
    SlotSemaphore& operator=(const SlotSemaphore&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return available_ > 0; });
        --available_;
    }

    // Returns false if no slot became free before the timeout.
    template <class Rep, class Period>
    bool try_acquire_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return available_ > 0; })) {
            return false;
        }
        --available_;
        return true;
    }

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ == 0) return false;
        --available_;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // A surplus release would silently raise the concurrency bound.
            if (available_ < capacity_) ++available_;
        }
        cv_.notify_one();
    }

    size_t available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t available_;
    const size_t capacity_;
};

}
