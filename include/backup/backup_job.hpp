#pragma once

#include "common/job.hpp"
#include "backup/backup_config.hpp"
#include "backup/storage_backend.hpp"
#include "backup/xen/hypervisor_client.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

using BackendResolver = std::function<std::shared_ptr<StorageBackend>(const std::string& name)>;

struct BackupTarget {
    std::shared_ptr<HypervisorClient> host;
    VmHandle vm;
};

// Snapshots every VM matching the job's tag filter on every linked host, streams each
// snapshot into every configured storage and applies retention afterwards. Per-VM
// failures are collected; only backend initialization aborts the run.
class BackupJob : public Job {
public:
    BackupJob(const JobConfig& config,
              const std::string& hostname,
              std::vector<std::shared_ptr<HypervisorClient>> hosts,
              BackendResolver resolver);

    JobRunResult run() override;
    std::string getName() const override { return config_.name; }
    std::string getSchedule() const override { return config_.schedule; }

    const JobConfig& getConfig() const { return config_; }

    // Throws CollaboratorError when a host cannot be queried
    std::vector<BackupTarget> resolveTargets();

private:
    std::vector<std::shared_ptr<StorageBackend>> initializeBackends();
    void backupVm(const BackupTarget& target, const std::vector<std::shared_ptr<StorageBackend>>& backends);
    VmHandle obtainSnapshot(HypervisorClient& host, const VmHandle& vm, bool& created);
    void storeToBackend(HypervisorClient& host, const VmHandle& snapshot,
                        const BackupArtifact& artifact, StorageBackend& backend);

    JobConfig config_;
    std::string hostname_;
    std::vector<std::shared_ptr<HypervisorClient>> hosts_;
    BackendResolver resolver_;
};
