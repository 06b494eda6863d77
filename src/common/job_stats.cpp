#include "common/job_stats.hpp"

nlohmann::json JobStats::toJson() const {
    return nlohmann::json{
        {"job_name", jobName},
        {"job_type", jobType},
        {"hostname", hostname},
        {"schedule", schedule},
        {"total_objects", totalObjects},
        {"successful_objects", successfulObjects},
        {"failed_objects", failedObjects},
        {"duration", durationSeconds},
        {"errors", errors}
    };
}
