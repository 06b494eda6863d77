#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

class SemaphorePermit;

// Bounds how many workers may be past acquire() at the same time.
class CountingSemaphore {
public:
    explicit CountingSemaphore(size_t permits);

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    // Blocks until a permit is available. The permit returns itself when destroyed.
    SemaphorePermit acquire();
    void release();

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    size_t available_;
};

class SemaphorePermit {
public:
    SemaphorePermit() = default;
    explicit SemaphorePermit(CountingSemaphore* semaphore) : semaphore_(semaphore) {}
    ~SemaphorePermit() { release(); }

    SemaphorePermit(SemaphorePermit&& other) noexcept : semaphore_(other.semaphore_) {
        other.semaphore_ = nullptr;
    }
    SemaphorePermit& operator=(SemaphorePermit&& other) noexcept {
        if (this != &other) {
            release();
            semaphore_ = other.semaphore_;
            other.semaphore_ = nullptr;
        }
        return *this;
    }

    SemaphorePermit(const SemaphorePermit&) = delete;
    SemaphorePermit& operator=(const SemaphorePermit&) = delete;

    void release() {
        if (semaphore_) {
            semaphore_->release();
            semaphore_ = nullptr;
        }
    }

private:
    CountingSemaphore* semaphore_{nullptr};
};
