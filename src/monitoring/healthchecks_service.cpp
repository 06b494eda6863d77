#include "monitoring/healthchecks_service.hpp"
#include "common/cron_schedule.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <thread>

namespace {

bool isTransient(long status) {
    return status >= 500 || status == 429;
}

} // namespace

HealthchecksService::HealthchecksService(const HealthchecksConfig& config,
                                         std::shared_ptr<HttpClient> client,
                                         std::chrono::milliseconds retryDelay)
    : config_(config)
    , client_(std::move(client))
    , retryDelay_(retryDelay) {
    while (!config_.server.empty() && config_.server.back() == '/') {
        config_.server.pop_back();
    }
}

HttpResponse HealthchecksService::postWithRetry(const std::string& url, const std::string& body,
                                                const std::vector<std::string>& headers) {
    std::chrono::milliseconds delay = retryDelay_;
    int attempts = std::max(0, config_.maxRetries) + 1;
    std::string lastError;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            HttpResponse response = client_->post(url, body, headers);
            if (!isTransient(response.status)) {
                return response;
            }
            lastError = "HTTP " + std::to_string(response.status);
        } catch (const MonitoringError& e) {
            lastError = e.what();
        }

        if (attempt < attempts) {
            Logger::debug("Healthchecks request failed (" + lastError + "), retrying in " +
                          std::to_string(delay.count()) + "ms");
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }
    throw MonitoringError("Healthchecks request to " + url + " failed after " +
                          std::to_string(attempts) + " attempts: " + lastError);
}

nlohmann::json HealthchecksService::checkRequest(const JobConfig& job, const std::string& hostname) const {
    MonitorKey key{hostname, job.name};
    std::string name = key.render();
    return nlohmann::json{
        {"name", name},
        {"slug", name},
        {"tags", hostname},
        {"schedule", CronSchedule::parse(job.schedule).withoutSeconds()},
        {"tz", "UTC"},
        {"grace", config_.grace},
        {"timeout", 86400},
        {"unique", nlohmann::json::array({"name"})}
    };
}

void HealthchecksService::initialize(const std::vector<JobConfig>& jobs, const std::string& hostname) {
    const std::string url = config_.server + "/api/v3/checks/";
    const std::vector<std::string> headers{"X-Api-Key: " + config_.apiKey,
                                           "Content-Type: application/json"};

    std::map<std::string, std::string> keys;
    for (const auto& job : jobs) {
        if (!job.enabled) {
            continue;
        }
        std::string key = MonitorKey{hostname, job.name}.render();
        auto inserted = keys.emplace(key, job.name);
        if (!inserted.second) {
            throw MonitoringError("Jobs '" + inserted.first->second + "' and '" + job.name +
                                  "' would share the check '" + key + "'");
        }
    }

    for (const auto& job : jobs) {
        if (!job.enabled) {
            continue;
        }

        nlohmann::json request;
        try {
            request = checkRequest(job, hostname);
        } catch (const std::invalid_argument& e) {
            throw MonitoringError("Cannot create check for job '" + job.name + "': " + e.what());
        }

        HttpResponse response = postWithRetry(url, request.dump(), headers);
        if (!response.ok()) {
            throw MonitoringError("Creating check for job '" + job.name + "' failed with HTTP " +
                                  std::to_string(response.status) + ": " + response.body);
        }

        std::string pingUrl;
        try {
            pingUrl = nlohmann::json::parse(response.body).at("ping_url").get<std::string>();
        } catch (const nlohmann::json::exception& e) {
            throw MonitoringError("Unexpected response creating check for job '" + job.name + "': " + e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        pingUrls_[request["name"].get<std::string>()] = pingUrl;
        Logger::info("Healthchecks check ready for job '" + job.name + "'");
    }
}

std::string HealthchecksService::pingUrl(const MonitorKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pingUrls_.find(key.render());
    if (it == pingUrls_.end()) {
        throw MonitoringError("No healthchecks check for '" + key.render() + "'");
    }
    return it->second;
}

void HealthchecksService::notifyStart(const MonitorKey& key) {
    Logger::debug("Sending start notification for job '" + key.jobName + "' on host '" + key.hostname + "'");
    HttpResponse response = postWithRetry(pingUrl(key) + "/start", "", {});
    if (!response.ok()) {
        throw MonitoringError("Start ping failed with HTTP " + std::to_string(response.status));
    }
}

void HealthchecksService::notifySuccess(const MonitorKey& key, const JobStats& stats) {
    Logger::debug("Sending success notification for job '" + key.jobName + "' on host '" + key.hostname + "'");
    HttpResponse response = postWithRetry(pingUrl(key), stats.toJson().dump(),
                                          {"Content-Type: application/json"});
    if (!response.ok()) {
        throw MonitoringError("Success ping failed with HTTP " + std::to_string(response.status));
    }
}

void HealthchecksService::notifyFailure(const MonitorKey& key, const JobStats& stats) {
    Logger::debug("Sending failure notification for job '" + key.jobName + "' on host '" + key.hostname + "'");
    HttpResponse response = postWithRetry(pingUrl(key) + "/fail", stats.toJson().dump(),
                                          {"Content-Type: application/json"});
    if (!response.ok()) {
        throw MonitoringError("Failure ping failed with HTTP " + std::to_string(response.status));
    }
}
