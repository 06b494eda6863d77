#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

// Outcome of one job run, also the payload of every notification
struct JobStats {
    std::string jobName;
    std::string jobType{"vm"};
    std::string hostname;
    std::string schedule;
    size_t totalObjects{0};
    size_t successfulObjects{0};
    size_t failedObjects{0};
    double durationSeconds{0.0};
    std::vector<std::string> errors;

    nlohmann::json toJson() const;
};
