#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "monitoring/healthchecks_service.hpp"
#include "monitoring/mail_service.hpp"
#include <algorithm>
#include <deque>

namespace {

struct RecordedRequest {
    std::string url;
    std::string body;
    std::vector<std::string> headers;
};

// Replays queued responses; an empty queue answers 200
class FakeHttpClient : public HttpClient {
public:
    void respond(long status, const std::string& body = "") {
        HttpResponse response;
        response.status = status;
        response.body = body;
        responses_.push_back(response);
    }
    // Status 0 stands for a transport failure
    void failTransport() { respond(0); }

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers) override {
        requests.push_back(RecordedRequest{url, body, headers});
        HttpResponse response;
        response.status = 200;
        if (!responses_.empty()) {
            response = responses_.front();
            responses_.pop_front();
        }
        if (response.status == 0) {
            throw MonitoringError("Could not resolve host");
        }
        return response;
    }

    std::vector<RecordedRequest> requests;

private:
    std::deque<HttpResponse> responses_;
};

JobConfig job(const std::string& name, const std::string& schedule = "0 0 2 * * *") {
    JobConfig config;
    config.name = name;
    config.schedule = schedule;
    return config;
}

JobStats sampleStats() {
    JobStats stats;
    stats.jobName = "nightly";
    stats.hostname = "backup01";
    stats.schedule = "0 0 2 * * *";
    stats.totalObjects = 3;
    stats.successfulObjects = 2;
    stats.failedObjects = 1;
    stats.durationSeconds = 12.5;
    stats.errors.push_back("Failed to backup VM 'web-2'");
    return stats;
}

} // namespace

TEST(MonitorKeyTest, RendersJobThenHost) {
    EXPECT_EQ((MonitorKey{"backup01", "nightly"}.render()), "nightly_backup01");
}

TEST(MonitorKeyTest, SeparatorNeverAppearsInsideComponents) {
    MonitorKey key{"backup_01.example.org", "nightly vm_backup"};
    EXPECT_EQ(key.render(), "nightly-vm-backup_backup-01-example-org");
    EXPECT_EQ(MonitorKey::sanitize("a_b/c d-e9"), "a-b-c-d-e9");
}

TEST(JobStatsTest, SerializesWithSnakeCaseKeys) {
    nlohmann::json json = sampleStats().toJson();
    EXPECT_EQ(json["job_name"], "nightly");
    EXPECT_EQ(json["job_type"], "vm");
    EXPECT_EQ(json["hostname"], "backup01");
    EXPECT_EQ(json["total_objects"], 3);
    EXPECT_EQ(json["successful_objects"], 2);
    EXPECT_EQ(json["failed_objects"], 1);
    EXPECT_DOUBLE_EQ(json["duration"].get<double>(), 12.5);
    ASSERT_EQ(json["errors"].size(), 1u);
}

class HealthchecksServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.enabled = true;
        config_.server = "https://hc.example.org/";
        config_.apiKey = "secret-key";
        config_.grace = 600;
        config_.maxRetries = 2;
        http_ = std::make_shared<FakeHttpClient>();
    }

    std::unique_ptr<HealthchecksService> makeService() {
        return std::make_unique<HealthchecksService>(config_, http_, std::chrono::milliseconds(1));
    }

    HealthchecksConfig config_;
    std::shared_ptr<FakeHttpClient> http_;
};

TEST_F(HealthchecksServiceTest, CheckRequestDescribesJob) {
    nlohmann::json request = makeService()->checkRequest(job("nightly"), "backup01");

    EXPECT_EQ(request["name"], "nightly_backup01");
    EXPECT_EQ(request["slug"], "nightly_backup01");
    EXPECT_EQ(request["tags"], "backup01");
    EXPECT_EQ(request["schedule"], "0 2 * * *");
    EXPECT_EQ(request["tz"], "UTC");
    EXPECT_EQ(request["grace"], 600);
    EXPECT_EQ(request["unique"], nlohmann::json::array({"name"}));
}

TEST_F(HealthchecksServiceTest, InitializeCreatesChecksForEnabledJobs) {
    JobConfig disabled = job("disabled");
    disabled.enabled = false;
    http_->respond(201, R"({"ping_url": "https://hc.example.org/ping/1111"})");

    auto service = makeService();
    service->initialize({job("nightly"), disabled}, "backup01");

    ASSERT_EQ(http_->requests.size(), 1u);
    const RecordedRequest& request = http_->requests[0];
    EXPECT_EQ(request.url, "https://hc.example.org/api/v3/checks/");
    EXPECT_NE(std::find(request.headers.begin(), request.headers.end(), "X-Api-Key: secret-key"),
              request.headers.end());
    EXPECT_EQ(nlohmann::json::parse(request.body)["name"], "nightly_backup01");
}

TEST_F(HealthchecksServiceTest, InitializeRejectsJobsSharingACheck) {
    auto service = makeService();

    EXPECT_THROW(service->initialize({job("db.nightly"), job("db-nightly")}, "backup01"), MonitoringError);
    EXPECT_TRUE(http_->requests.empty());
}

TEST_F(HealthchecksServiceTest, PingsUseCachedUrl) {
    http_->respond(200, R"({"ping_url": "https://hc.example.org/ping/1111"})");
    auto service = makeService();
    service->initialize({job("nightly")}, "backup01");

    MonitorKey key{"backup01", "nightly"};
    service->notifyStart(key);
    service->notifySuccess(key, sampleStats());
    service->notifyFailure(key, sampleStats());

    ASSERT_EQ(http_->requests.size(), 4u);
    EXPECT_EQ(http_->requests[1].url, "https://hc.example.org/ping/1111/start");
    EXPECT_TRUE(http_->requests[1].body.empty());
    EXPECT_EQ(http_->requests[2].url, "https://hc.example.org/ping/1111");
    EXPECT_EQ(nlohmann::json::parse(http_->requests[2].body)["failed_objects"], 1);
    EXPECT_EQ(http_->requests[3].url, "https://hc.example.org/ping/1111/fail");
}

TEST_F(HealthchecksServiceTest, RetriesTransientFailures) {
    http_->respond(200, R"({"ping_url": "https://hc.example.org/ping/1111"})");
    auto service = makeService();
    service->initialize({job("nightly")}, "backup01");

    http_->failTransport();
    http_->respond(503);
    http_->respond(200);
    EXPECT_NO_THROW(service->notifyStart(MonitorKey{"backup01", "nightly"}));
    EXPECT_EQ(http_->requests.size(), 4u);
}

TEST_F(HealthchecksServiceTest, GivesUpAfterMaxRetries) {
    http_->respond(200, R"({"ping_url": "https://hc.example.org/ping/1111"})");
    auto service = makeService();
    service->initialize({job("nightly")}, "backup01");

    http_->respond(500);
    http_->respond(429);
    http_->respond(502);
    EXPECT_THROW(service->notifyStart(MonitorKey{"backup01", "nightly"}), MonitoringError);
    // One attempt plus two retries
    EXPECT_EQ(http_->requests.size(), 4u);
}

TEST_F(HealthchecksServiceTest, ClientErrorsAreNotRetried) {
    http_->respond(401, R"({"error": "wrong api key"})");
    auto service = makeService();

    EXPECT_THROW(service->initialize({job("nightly")}, "backup01"), MonitoringError);
    EXPECT_EQ(http_->requests.size(), 1u);
}

TEST_F(HealthchecksServiceTest, UnknownJobCannotBePinged) {
    auto service = makeService();
    EXPECT_THROW(service->notifyStart(MonitorKey{"backup01", "never-registered"}), MonitoringError);
    EXPECT_TRUE(http_->requests.empty());
}

TEST(MailServiceTest, SubjectNamesOutcomeJobAndHost) {
    MonitorKey key{"backup01", "nightly"};
    EXPECT_EQ(MailService::subject(true, key), "Success: Backup Job 'nightly' on host 'backup01'");
    EXPECT_EQ(MailService::subject(false, key), "Failure: Backup Job 'nightly' on host 'backup01'");
}

TEST(MailServiceTest, BodyContainsStats) {
    std::string body = MailService::body(false, MonitorKey{"backup01", "nightly"}, sampleStats());
    EXPECT_NE(body.find("has failed"), std::string::npos);
    EXPECT_NE(body.find("\"failed_objects\": 1"), std::string::npos);
}

TEST(MailServiceTest, ComposesMessageWithCrlf) {
    MailConfig config;
    config.enabled = true;
    config.smtpServer = "mail.example.org";
    config.smtpFrom = "xen@example.org";
    config.smtpTo = {"ops@example.org", "oncall@example.org"};
    MailService service(config);

    std::string message = service.composeMessage("Success: x", "line one\nline two\n");
    EXPECT_NE(message.find("From: xen@example.org\r\n"), std::string::npos);
    EXPECT_NE(message.find("To: ops@example.org, oncall@example.org\r\n"), std::string::npos);
    EXPECT_NE(message.find("Subject: Success: x\r\n"), std::string::npos);
    EXPECT_NE(message.find("\r\n\r\nline one\r\nline two\r\n"), std::string::npos);
    EXPECT_EQ(service.getName(), "mail");

    // Start notifications are not mailed
    EXPECT_NO_THROW(service.notifyStart(MonitorKey{"backup01", "nightly"}));
}
