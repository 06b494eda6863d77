#pragma once

#include "common/cron_schedule.hpp"
#include "common/job.hpp"
#include "common/parallel_task_manager.hpp"
#include "monitoring/monitoring_service.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Runs jobs on their cron schedule (or once, on demand) and reports every run to the
// monitoring services: start before the run, success or failure after it. Notification
// errors are logged and never affect the run.
//
// A job is never started by the schedule while its previous run is still in progress.
// Direct runJob() calls do not check this; callers must not run one job concurrently.
class BackupScheduler {
public:
    BackupScheduler(std::vector<std::shared_ptr<MonitoringService>> monitors, std::string hostname);
    ~BackupScheduler();

    // Throws std::invalid_argument on duplicate names or unusable schedules
    void addJob(std::shared_ptr<Job> job);

    JobRunResult runJob(Job& job);
    // Throws std::invalid_argument for unknown job names
    JobRunResult runJob(const std::string& name);

    // Thread control
    void start();
    void stop();
    bool isRunning() const { return running_; }

    std::vector<std::string> getJobNames() const;
    std::optional<JobStats> getLastStats(const std::string& name) const;
    std::optional<std::chrono::system_clock::time_point> getNextRunTime(const std::string& name) const;

private:
    struct ScheduledJob {
        std::shared_ptr<Job> job;
        CronSchedule schedule;
        std::chrono::system_clock::time_point nextRun;
        std::shared_ptr<std::atomic<bool>> busy;
    };

    void checkSchedules();
    void dispatch(ScheduledJob& entry);

    std::vector<std::shared_ptr<MonitoringService>> monitors_;
    std::string hostname_;

    std::vector<ScheduledJob> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::thread schedulerThread_;
    std::unique_ptr<ParallelTaskManager> taskManager_;
    std::atomic<bool> running_;
    bool stopRequested_;

    mutable std::mutex statsMutex_;
    std::map<std::string, JobStats> lastStats_;
};
