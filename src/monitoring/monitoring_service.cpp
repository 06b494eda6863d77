#include "monitoring/monitoring_service.hpp"
#include <cctype>

std::string MonitorKey::sanitize(const std::string& part) {
    std::string result = part;
    for (auto& c : result) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            c = '-';
        }
    }
    return result;
}

std::string MonitorKey::render() const {
    return sanitize(jobName) + "_" + sanitize(hostname);
}
