#include "backup/backup_scheduler.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

BackupScheduler::BackupScheduler(std::vector<std::shared_ptr<MonitoringService>> monitors, std::string hostname)
    : monitors_(std::move(monitors))
    , hostname_(std::move(hostname))
    , running_(false)
    , stopRequested_(false) {
}

BackupScheduler::~BackupScheduler() {
    stop();
}

void BackupScheduler::addJob(std::shared_ptr<Job> job) {
    if (!job) {
        throw std::invalid_argument("Cannot schedule a null job");
    }

    CronSchedule schedule = CronSchedule::parse(job->getSchedule());
    std::chrono::system_clock::time_point nextRun;
    try {
        nextRun = schedule.next(std::chrono::system_clock::now());
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument(e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : jobs_) {
        if (entry.job->getName() == job->getName()) {
            throw std::invalid_argument("Job '" + job->getName() + "' is already scheduled");
        }
    }

    Logger::info("Adding job '" + job->getName() + "' [" + job->getSchedule() + "] to scheduler");
    jobs_.push_back(ScheduledJob{job, schedule, nextRun, std::make_shared<std::atomic<bool>>(false)});
    condition_.notify_all();
}

JobRunResult BackupScheduler::runJob(const std::string& name) {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : jobs_) {
            if (entry.job->getName() == name) {
                job = entry.job;
                break;
            }
        }
    }
    if (!job) {
        throw std::invalid_argument("Unknown job '" + name + "'");
    }
    return runJob(*job);
}

JobRunResult BackupScheduler::runJob(Job& job) {
    MonitorKey key{hostname_, job.getName()};

    for (const auto& monitor : monitors_) {
        try {
            monitor->notifyStart(key);
        } catch (const std::exception& e) {
            Logger::warning("Failed to send start notification via " + monitor->getName() + ": " + e.what());
        }
    }

    JobRunResult result;
    try {
        result = job.run();
    } catch (const std::exception& e) {
        Logger::error("Job '" + job.getName() + "' failed: " + e.what());
        result.success = false;
        result.error = e.what();
        result.stats.jobName = job.getName();
        result.stats.hostname = hostname_;
        result.stats.schedule = job.getSchedule();
        result.stats.errors.push_back(e.what());
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        lastStats_[job.getName()] = result.stats;
    }

    for (const auto& monitor : monitors_) {
        try {
            if (result.success) {
                monitor->notifySuccess(key, result.stats);
            } else {
                monitor->notifyFailure(key, result.stats);
            }
        } catch (const std::exception& e) {
            Logger::warning("Failed to send " + std::string(result.success ? "success" : "failure") +
                            " notification via " + monitor->getName() + ": " + e.what());
        }
    }
    return result;
}

void BackupScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }

    taskManager_ = std::make_unique<ParallelTaskManager>(std::max<size_t>(1, jobs_.size()));
    running_ = true;
    stopRequested_ = false;
    schedulerThread_ = std::thread(&BackupScheduler::checkSchedules, this);
}

void BackupScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stopRequested_ = true;
    }
    condition_.notify_all();

    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
    // Waits for runs that are still in progress
    taskManager_.reset();
    running_ = false;
}

void BackupScheduler::dispatch(ScheduledJob& entry) {
    if (entry.busy->load()) {
        Logger::warning("Job '" + entry.job->getName() + "' is still running, skipping this run");
        return;
    }

    entry.busy->store(true);
    std::shared_ptr<Job> job = entry.job;
    std::shared_ptr<std::atomic<bool>> busy = entry.busy;
    // runJob reports its own failures through the monitors
    taskManager_->addTask([this, job, busy]() {
        try {
            runJob(*job);
        } catch (const std::exception& e) {
            Logger::error("Scheduled run of job '" + job->getName() + "' failed: " + e.what());
        }
        busy->store(false);
    });
}

void BackupScheduler::checkSchedules() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_) {
        auto now = std::chrono::system_clock::now();
        auto wakeUp = now + std::chrono::minutes(1);

        for (auto& entry : jobs_) {
            if (entry.nextRun <= now) {
                dispatch(entry);
                try {
                    entry.nextRun = entry.schedule.next(now);
                } catch (const std::runtime_error& e) {
                    Logger::error("Job '" + entry.job->getName() + "' has no further runs: " + e.what());
                    entry.nextRun = std::chrono::system_clock::time_point::max();
                }
            }
            wakeUp = std::min(wakeUp, entry.nextRun);
        }

        condition_.wait_until(lock, wakeUp, [this] { return stopRequested_; });
    }
}

std::vector<std::string> BackupScheduler::getJobNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : jobs_) {
        names.push_back(entry.job->getName());
    }
    return names;
}

std::optional<JobStats> BackupScheduler::getLastStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    auto it = lastStats_.find(name);
    if (it == lastStats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::chrono::system_clock::time_point> BackupScheduler::getNextRunTime(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : jobs_) {
        if (entry.job->getName() == name) {
            return entry.nextRun;
        }
    }
    return std::nullopt;
}
