#pragma once

#include "backup/storage_backend.hpp"
#include "backup/xen/hypervisor_client.hpp"
#include "common/errors.hpp"
#include "monitoring/monitoring_service.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// Export that serves fixed stdout/stderr data and reports a fixed exit code
class FakeExportProcess : public ExportProcess {
public:
    FakeExportProcess(const std::string& data, const std::string& errors, int exitCode,
                      std::atomic<int>* terminated)
        : out_(data, 4096)
        , err_(errors)
        , exitCode_(exitCode)
        , terminated_(terminated) {}

    ByteStream& stdoutStream() override { return out_; }
    ByteStream& stderrStream() override { return err_; }
    int wait() override { return exitCode_; }
    void terminate() override { ++*terminated_; }

private:
    MemoryByteStream out_;
    MemoryByteStream err_;
    int exitCode_;
    std::atomic<int>* terminated_;
};

class FakeHypervisorClient : public HypervisorClient {
public:
    explicit FakeHypervisorClient(const std::string& hostId)
        : hostId_(hostId) {}

    const std::string& hostId() const override { return hostId_; }

    void addVm(const std::string& uuid, const std::string& name) {
        VmHandle vm;
        vm.uuid = uuid;
        vm.displayName = name;
        vms_.push_back(vm);
    }

    void addExistingSnapshot(const std::string& vmUuid, const Timestamp& snapshotTime) {
        std::lock_guard<std::mutex> lock(mutex_);
        VmHandle snapshot;
        snapshot.uuid = "existing-" + vmUuid + "-" + std::to_string(existing_[vmUuid].size());
        snapshot.displayName = "existing";
        snapshot.isSnapshot = true;
        snapshot.snapshotTime = snapshotTime;
        existing_[vmUuid].push_back(snapshot);
        snapshotOwner_[snapshot.uuid] = vmUuid;
    }

    // Export of this VM writes to stderr, which every backend treats as failure
    void failExportOf(const std::string& vmUuid) { failingExports_.insert(vmUuid); }
    // Export of this VM streams fine but exits non-zero
    void failExitOf(const std::string& vmUuid) { failingExits_.insert(vmUuid); }
    void failListing() { failListing_ = true; }

    std::vector<VmHandle> listVms(const std::vector<std::string>&, const std::vector<std::string>&) override {
        if (failListing_) {
            throw CollaboratorError("host " + hostId_ + " unreachable");
        }
        return vms_;
    }

    VmHandle createSnapshot(const VmHandle& vm) override {
        std::lock_guard<std::mutex> lock(mutex_);
        VmHandle snapshot;
        snapshot.uuid = "snap-" + vm.uuid;
        snapshot.displayName = "xenkeeper-snapshot";
        snapshot.isSnapshot = true;
        snapshot.isTemplate = true;
        snapshot.snapshotTime = Timestamp::fromUnixSeconds(1707473942 + static_cast<int64_t>(created_.size()));
        created_.push_back(snapshot.uuid);
        snapshotOwner_[snapshot.uuid] = vm.uuid;
        return snapshot;
    }

    std::vector<VmHandle> listSnapshots(const VmHandle& vm) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = existing_.find(vm.uuid);
        if (it == existing_.end() || it->second.empty()) {
            throw NoSnapshotsError(vm.uuid);
        }
        return it->second;
    }

    void markNotTemplate(const VmHandle& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        unmarked_.push_back(snapshot.uuid);
    }

    void rename(const VmHandle& snapshot, const std::string& label) override {
        std::lock_guard<std::mutex> lock(mutex_);
        renamed_[snapshot.uuid] = label;
    }

    void deleteSnapshot(const std::string& snapshotUuid) override {
        std::lock_guard<std::mutex> lock(mutex_);
        deleted_.push_back(snapshotUuid);
    }

    std::unique_ptr<ExportProcess> exportStream(const VmHandle& snapshot) override {
        std::string vmUuid;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            vmUuid = snapshotOwner_[snapshot.uuid];
            exported_.push_back(snapshot.uuid);
        }
        std::string errors = failingExports_.count(vmUuid) ? "export failed: VDI is busy" : "";
        int exitCode = failingExits_.count(vmUuid) ? 1 : 0;
        return std::make_unique<FakeExportProcess>("XVA image of " + vmUuid, errors, exitCode, &terminated_);
    }

    std::vector<std::string> created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }
    std::vector<std::string> deleted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deleted_;
    }
    std::vector<std::string> exported() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exported_;
    }
    std::map<std::string, std::string> renamed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return renamed_;
    }
    int terminated() const { return terminated_; }

private:
    std::string hostId_;
    std::vector<VmHandle> vms_;
    std::set<std::string> failingExports_;
    std::set<std::string> failingExits_;
    bool failListing_{false};

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<VmHandle>> existing_;
    std::map<std::string, std::string> snapshotOwner_;
    std::vector<std::string> created_;
    std::vector<std::string> deleted_;
    std::vector<std::string> exported_;
    std::vector<std::string> unmarked_;
    std::map<std::string, std::string> renamed_;
    std::atomic<int> terminated_{0};
};

// In-memory backend that also records how many exports it consumes at once
class FakeStorageBackend : public StorageBackend {
public:
    FakeStorageBackend(const std::string& name, RetentionPolicy retention,
                       std::chrono::milliseconds consumeDelay = std::chrono::milliseconds(0))
        : StorageBackend(name, retention)
        , consumeDelay_(consumeDelay) {}

    StorageBackendType getType() const override { return StorageBackendType::LOCAL; }
    std::optional<Compression> artifactCompression() const override { return std::nullopt; }

    void failInitialize() { failInitialize_ = true; }

    void initialize() override {
        ++initializeCalls_;
        if (failInitialize_) {
            throw BackendInitError(name_, "repository is locked");
        }
    }

    void seed(const BackupArtifact& artifact) {
        std::lock_guard<std::mutex> lock(mutex_);
        stored_.push_back(artifact);
    }

    std::vector<BackupArtifact> list(const ArtifactFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<BackupArtifact> result;
        for (const auto& artifact : stored_) {
            if (filter.matches(artifact)) {
                result.push_back(artifact);
            }
        }
        return result;
    }

    void remove(const BackupArtifact& artifact) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stored_.erase(std::remove(stored_.begin(), stored_.end(), artifact), stored_.end());
        removed_.push_back(artifact);
    }

    void consumeExportStream(const BackupArtifact& artifact, ByteStream& out, ByteStream& err) override {
        int active = ++active_;
        int seen = maxActive_.load();
        while (active > seen && !maxActive_.compare_exchange_weak(seen, active)) {
        }
        std::this_thread::sleep_for(consumeDelay_);

        std::string data;
        std::string errors;
        ByteStream::drain(out, &data);
        ByteStream::drain(err, &errors);
        --active_;

        if (!errors.empty()) {
            throw StreamConsumptionError("Failed to store " + artifact.encode() + " on storage '" + name_ +
                                         "': export reported errors: " + errors);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        BackupArtifact stored = artifact;
        stored.size = data.size();
        stored_.push_back(stored);
    }

    std::vector<BackupArtifact> stored() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_;
    }
    std::vector<BackupArtifact> removed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }
    int initializeCalls() const { return initializeCalls_; }
    int maxActive() const { return maxActive_; }

private:
    std::chrono::milliseconds consumeDelay_;
    bool failInitialize_{false};
    std::atomic<int> initializeCalls_{0};
    std::atomic<int> active_{0};
    std::atomic<int> maxActive_{0};

    mutable std::mutex mutex_;
    std::vector<BackupArtifact> stored_;
    std::vector<BackupArtifact> removed_;
};

class FakeMonitor : public MonitoringService {
public:
    explicit FakeMonitor(std::string name, bool failing = false)
        : name_(std::move(name))
        , failing_(failing) {}

    std::string getName() const override { return name_; }

    void notifyStart(const MonitorKey& key) override { record("start:" + key.render()); }
    void notifySuccess(const MonitorKey& key, const JobStats& stats) override {
        record("success:" + key.render());
        std::lock_guard<std::mutex> lock(mutex_);
        lastStats_ = stats;
    }
    void notifyFailure(const MonitorKey& key, const JobStats& stats) override {
        record("failure:" + key.render());
        std::lock_guard<std::mutex> lock(mutex_);
        lastStats_ = stats;
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    JobStats lastStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastStats_;
    }

private:
    void record(const std::string& event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        if (failing_) {
            throw MonitoringError(name_ + " endpoint unreachable");
        }
    }

    std::string name_;
    bool failing_;
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
    JobStats lastStats_;
};
