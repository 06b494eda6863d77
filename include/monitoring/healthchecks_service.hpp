#pragma once

#include "backup/backup_config.hpp"
#include "common/http_client.hpp"
#include "monitoring/monitoring_service.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

// Pings a healthchecks.io compatible server. One check per job is created (or updated)
// through the management API when the service is initialized.
class HealthchecksService : public MonitoringService {
public:
    explicit HealthchecksService(const HealthchecksConfig& config,
                                 std::shared_ptr<HttpClient> client = std::make_shared<CurlHttpClient>(),
                                 std::chrono::milliseconds retryDelay = std::chrono::milliseconds(500));

    std::string getName() const override { return "healthchecks"; }

    // Throws MonitoringError
    void initialize(const std::vector<JobConfig>& jobs, const std::string& hostname);

    void notifyStart(const MonitorKey& key) override;
    void notifySuccess(const MonitorKey& key, const JobStats& stats) override;
    void notifyFailure(const MonitorKey& key, const JobStats& stats) override;

    // Request body for the management API
    nlohmann::json checkRequest(const JobConfig& job, const std::string& hostname) const;

private:
    std::string pingUrl(const MonitorKey& key) const;
    HttpResponse postWithRetry(const std::string& url, const std::string& body,
                               const std::vector<std::string>& headers);

    HealthchecksConfig config_;
    std::shared_ptr<HttpClient> client_;
    std::chrono::milliseconds retryDelay_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> pingUrls_;
};
