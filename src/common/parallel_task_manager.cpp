#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

ParallelTaskManager::ParallelTaskManager(size_t numThreads)
    : stop_(false) {
    if (numThreads == 0) {
        numThreads = std::max(1u, std::thread::hardware_concurrency());
    }

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
}

ParallelTaskManager::~ParallelTaskManager() {
    waitForAll();
    stop();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ParallelTaskManager::waitForAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

void ParallelTaskManager::stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

void ParallelTaskManager::workerThread() {
    while (true) {
        std::function<void()> taskFunc;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            taskFunc = std::move(tasks_.front());
            tasks_.pop();
            ++activeTasks_;
        }

        // packaged_task stores the task's own exceptions in its future; anything caught
        // here escaped the wrapper itself.
        try {
            if (taskFunc) {
                taskFunc();
            }
        } catch (const std::exception& e) {
            Logger::error("Task wrapper failed: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            if (tasks_.empty() && activeTasks_ == 0) {
                idleCondition_.notify_all();
            }
        }
    }
}
