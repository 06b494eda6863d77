#include "common/counting_semaphore.hpp"

CountingSemaphore::CountingSemaphore(size_t permits)
    : available_(permits == 0 ? 1 : permits) {
}

SemaphorePermit CountingSemaphore::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return available_ > 0; });
    --available_;
    return SemaphorePermit(this);
}

void CountingSemaphore::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    condition_.notify_one();
}
