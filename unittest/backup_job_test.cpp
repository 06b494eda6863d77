#include <gtest/gtest.h>
#include "backup/backup_job.hpp"
#include "test_fakes.hpp"
#include <algorithm>
#include <map>
#include <memory>

class BackupJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        host_ = std::make_shared<FakeHypervisorClient>("xen01");
        backend_ = std::make_shared<FakeStorageBackend>("primary", RetentionPolicy::flatCount(7));
        backends_["primary"] = backend_;

        config_.name = "nightly";
        config_.schedule = "0 0 2 * * *";
        config_.storages = {"primary"};
        config_.concurrency = 1;
    }

    std::unique_ptr<BackupJob> makeJob() {
        auto backends = backends_;
        BackendResolver resolver = [backends](const std::string& name) -> std::shared_ptr<StorageBackend> {
            auto it = backends.find(name);
            return it == backends.end() ? nullptr : it->second;
        };
        return std::make_unique<BackupJob>(config_, "backup01",
                                           std::vector<std::shared_ptr<HypervisorClient>>{host_}, resolver);
    }

    std::shared_ptr<FakeHypervisorClient> host_;
    std::shared_ptr<FakeStorageBackend> backend_;
    std::map<std::string, std::shared_ptr<StorageBackend>> backends_;
    JobConfig config_;
};

TEST_F(BackupJobTest, BacksUpEveryVm) {
    host_->addVm("vm-1", "web-1");
    host_->addVm("vm-2", "db-1");

    auto job = makeJob();
    JobRunResult result = job->run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stats.totalObjects, 2u);
    EXPECT_EQ(result.stats.successfulObjects, 2u);
    EXPECT_EQ(result.stats.failedObjects, 0u);
    EXPECT_TRUE(result.stats.errors.empty());
    EXPECT_EQ(result.stats.jobName, "nightly");
    EXPECT_EQ(result.stats.jobType, "vm");
    EXPECT_EQ(result.stats.hostname, "backup01");
    EXPECT_EQ(job->getState(), Job::State::COMPLETED);

    std::vector<BackupArtifact> stored = backend_->stored();
    ASSERT_EQ(stored.size(), 2u);
    for (const auto& artifact : stored) {
        EXPECT_EQ(artifact.hostId, "xen01");
        EXPECT_EQ(artifact.jobKind, JobKind::VmBackup);
    }
}

// Three VMs, the second export fails
TEST_F(BackupJobTest, PartialFailureIsCountedPerVm) {
    host_->addVm("vm-1", "web-1");
    host_->addVm("vm-2", "web-2");
    host_->addVm("vm-3", "web-3");
    host_->failExportOf("vm-2");

    auto job = makeJob();
    JobRunResult result = job->run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.stats.totalObjects, 3u);
    EXPECT_EQ(result.stats.successfulObjects, 2u);
    EXPECT_EQ(result.stats.failedObjects, 1u);
    ASSERT_EQ(result.stats.errors.size(), 1u);
    EXPECT_NE(result.stats.errors[0].find("web-2"), std::string::npos);
    EXPECT_NE(result.stats.errors[0].find("vm-2"), std::string::npos);
    EXPECT_EQ(job->getState(), Job::State::FAILED);

    // The failed consumer stops the exporter
    EXPECT_EQ(host_->terminated(), 1);

    std::vector<BackupArtifact> stored = backend_->stored();
    ASSERT_EQ(stored.size(), 2u);
    for (const auto& artifact : stored) {
        EXPECT_NE(artifact.objectName, "web-2");
    }
}

TEST_F(BackupJobTest, CreatedSnapshotsAreDeletedExactlyOnce) {
    host_->addVm("vm-1", "web-1");
    host_->addVm("vm-2", "web-2");
    host_->addVm("vm-3", "web-3");
    host_->failExportOf("vm-2");

    makeJob()->run();

    std::vector<std::string> created = host_->created();
    std::vector<std::string> deleted = host_->deleted();
    std::sort(created.begin(), created.end());
    std::sort(deleted.begin(), deleted.end());
    EXPECT_EQ(created.size(), 3u);
    EXPECT_EQ(created, deleted);
}

TEST_F(BackupJobTest, NonZeroExportExitRemovesStoredArtifact) {
    host_->addVm("vm-1", "web-1");
    host_->failExitOf("vm-1");

    JobRunResult result = makeJob()->run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.stats.failedObjects, 1u);
    EXPECT_TRUE(backend_->stored().empty());
    EXPECT_EQ(host_->deleted().size(), 1u);
}

TEST_F(BackupJobTest, CreatedSnapshotIsRenamedAfterArtifact) {
    host_->addVm("vm-1", "web-1");

    makeJob()->run();

    std::map<std::string, std::string> renamed = host_->renamed();
    ASSERT_EQ(renamed.size(), 1u);
    EXPECT_EQ(renamed.begin()->first, "snap-vm-1");
    EXPECT_EQ(renamed.begin()->second, "xen01__vm__web-1__2024-02-09T10:19:02+00:00");
}

TEST_F(BackupJobTest, ReusedSnapshotIsKept) {
    config_.useExistingSnapshot = true;
    config_.snapshotMaxAgeSeconds = 3600;
    host_->addVm("vm-1", "web-1");
    Timestamp recent = Timestamp::fromUnixSeconds(Timestamp::now().unixSeconds() - 60);
    host_->addExistingSnapshot("vm-1", recent);

    JobRunResult result = makeJob()->run();

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(host_->created().empty());
    EXPECT_TRUE(host_->deleted().empty());
    EXPECT_TRUE(host_->renamed().empty());

    std::vector<BackupArtifact> stored = backend_->stored();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].timestamp, recent);
}

TEST_F(BackupJobTest, StaleSnapshotIsReplaced) {
    config_.useExistingSnapshot = true;
    config_.snapshotMaxAgeSeconds = 3600;
    host_->addVm("vm-1", "web-1");
    host_->addExistingSnapshot("vm-1", Timestamp::fromUnixSeconds(Timestamp::now().unixSeconds() - 7200));

    JobRunResult result = makeJob()->run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(host_->created().size(), 1u);
    EXPECT_EQ(host_->deleted(), host_->created());
}

TEST_F(BackupJobTest, MissingSnapshotFallsBackToNewOne) {
    config_.useExistingSnapshot = true;
    host_->addVm("vm-1", "web-1");

    JobRunResult result = makeJob()->run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(host_->created().size(), 1u);
    EXPECT_EQ(host_->deleted().size(), 1u);
}

TEST_F(BackupJobTest, BackendInitFailureAbortsBeforeSnapshots) {
    host_->addVm("vm-1", "web-1");
    host_->addVm("vm-2", "web-2");
    backend_->failInitialize();

    auto job = makeJob();
    JobRunResult result = job->run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.stats.totalObjects, 2u);
    EXPECT_EQ(result.stats.successfulObjects, 0u);
    ASSERT_EQ(result.stats.errors.size(), 1u);
    EXPECT_NE(result.error.find("Failed to initialize storage 'primary'"), std::string::npos);
    EXPECT_TRUE(host_->created().empty());
    EXPECT_EQ(job->getState(), Job::State::FAILED);
}

TEST_F(BackupJobTest, UnknownStorageAbortsRun) {
    host_->addVm("vm-1", "web-1");
    config_.storages = {"missing"};

    JobRunResult result = makeJob()->run();

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("missing"), std::string::npos);
    EXPECT_TRUE(host_->created().empty());
}

TEST_F(BackupJobTest, UnreachableHostFailsRun) {
    host_->failListing();

    JobRunResult result = makeJob()->run();

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("unreachable"), std::string::npos);
    EXPECT_EQ(backend_->initializeCalls(), 0);
}

TEST_F(BackupJobTest, NoTargetsIsASuccessfulRun) {
    JobRunResult result = makeJob()->run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stats.totalObjects, 0u);
    EXPECT_EQ(backend_->initializeCalls(), 1);
}

TEST_F(BackupJobTest, EveryBackendReceivesEachVm) {
    auto secondary = std::make_shared<FakeStorageBackend>("secondary", RetentionPolicy::flatCount(7));
    backends_["secondary"] = secondary;
    config_.storages = {"primary", "secondary"};
    host_->addVm("vm-1", "web-1");

    JobRunResult result = makeJob()->run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(backend_->stored().size(), 1u);
    EXPECT_EQ(secondary->stored().size(), 1u);
    // One export per backend
    EXPECT_EQ(host_->exported().size(), 2u);
}

TEST_F(BackupJobTest, RetentionIsAppliedAfterStore) {
    auto backend = std::make_shared<FakeStorageBackend>("primary", RetentionPolicy::flatCount(2));
    backends_["primary"] = backend;
    host_->addVm("vm-1", "web-1");

    BackupArtifact oldest = BackupArtifact::create("xen01", JobKind::VmBackup, "web-1",
                                                   Timestamp::fromUnixSeconds(1707000000));
    BackupArtifact older = BackupArtifact::create("xen01", JobKind::VmBackup, "web-1",
                                                  Timestamp::fromUnixSeconds(1707100000));
    BackupArtifact otherVm = BackupArtifact::create("xen01", JobKind::VmBackup, "db-1",
                                                    Timestamp::fromUnixSeconds(1706000000));
    backend->seed(oldest);
    backend->seed(older);
    backend->seed(otherVm);

    JobRunResult result = makeJob()->run();

    EXPECT_TRUE(result.success);
    std::vector<BackupArtifact> removed = backend->removed();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], oldest);
    EXPECT_EQ(backend->stored().size(), 3u);
}

TEST_F(BackupJobTest, ConcurrencyIsBounded) {
    auto slowBackend = std::make_shared<FakeStorageBackend>("primary", RetentionPolicy::flatCount(7),
                                                            std::chrono::milliseconds(50));
    backends_["primary"] = slowBackend;
    config_.concurrency = 2;
    for (int i = 1; i <= 5; ++i) {
        host_->addVm("vm-" + std::to_string(i), "web-" + std::to_string(i));
    }

    JobRunResult result = makeJob()->run();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stats.successfulObjects, 5u);
    EXPECT_LE(slowBackend->maxActive(), 2);
    EXPECT_GE(slowBackend->maxActive(), 1);
}
