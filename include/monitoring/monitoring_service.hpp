#pragma once

#include "common/job_stats.hpp"
#include <string>

// Identifies one job on one machine towards the monitoring endpoints
struct MonitorKey {
    std::string hostname;
    std::string jobName;

    // "<job>_<host>"; every character outside [A-Za-z0-9-] becomes '-' so '_' only
    // ever appears as the separator
    std::string render() const;

    static std::string sanitize(const std::string& part);
};

// Every call may throw MonitoringError. Callers treat notifications as best-effort.
class MonitoringService {
public:
    virtual ~MonitoringService() = default;

    virtual std::string getName() const = 0;
    virtual void notifyStart(const MonitorKey& key) = 0;
    virtual void notifySuccess(const MonitorKey& key, const JobStats& stats) = 0;
    virtual void notifyFailure(const MonitorKey& key, const JobStats& stats) = 0;
};
