#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace mdexpand {

// Counting semaphore used for admission control of sibling resolutions.
class Semaphore {
public:
    explicit Semaphore(size_t permits) : permits_(permits == 0 ? 1 : permits) {}

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return permits_ > 0; });
        --permits_;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++permits_;
        }
        cv_.notify_one();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t permits_;
};

// Holds one permit for the lifetime of the guard
class SemaphoreGuard {
public:
    explicit SemaphoreGuard(Semaphore& sem) : sem_(sem) { sem_.acquire(); }
    ~SemaphoreGuard() { sem_.release(); }

    SemaphoreGuard(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

private:
    Semaphore& sem_;
};

} // namespace mdexpand
