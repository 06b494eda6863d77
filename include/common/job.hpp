#pragma once

#include "common/job_stats.hpp"
#include <string>
#include <mutex>

struct JobRunResult {
    JobStats stats;
    bool success{false};
    // Set when the run aborted before or during fan-out
    std::string error;
};

class Job {
public:
    enum class State {
        PENDING,
        RESOLVING_TARGETS,
        INITIALIZING_BACKENDS,
        RUNNING,
        AGGREGATING,
        COMPLETED,
        FAILED
    };

    Job();
    virtual ~Job() = default;

    // Executes the job once. A job instance must not run concurrently with itself.
    virtual JobRunResult run() = 0;

    virtual std::string getName() const = 0;
    virtual std::string getSchedule() const = 0;

    // Status queries
    State getState() const;
    std::string getId() const;

    static std::string stateToString(State state);

protected:
    void setState(State state);
    void setId(const std::string& id);
    std::string generateId() const;

    std::string id_;
    State state_{State::PENDING};
    mutable std::mutex mutex_;
};
