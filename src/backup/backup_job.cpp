#include "backup/backup_job.hpp"
#include "common/counting_semaphore.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/parallel_task_manager.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <sstream>

namespace {

std::string describeVm(const VmHandle& vm, const std::string& hostId) {
    return "'" + vm.displayName + "' [" + vm.uuid + "] on host '" + hostId + "'";
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

BackupJob::BackupJob(const JobConfig& config,
                     const std::string& hostname,
                     std::vector<std::shared_ptr<HypervisorClient>> hosts,
                     BackendResolver resolver)
    : config_(config)
    , hostname_(hostname)
    , hosts_(std::move(hosts))
    , resolver_(std::move(resolver)) {
    setId(generateId());
}

std::vector<BackupTarget> BackupJob::resolveTargets() {
    std::vector<BackupTarget> targets;
    for (const auto& host : hosts_) {
        std::vector<VmHandle> vms = host->listVms(config_.tagFilter, config_.tagFilterExclude);
        Logger::debug("Host '" + host->hostId() + "': " + std::to_string(vms.size()) +
                      " VMs affected by job '" + config_.name + "'");
        for (auto& vm : vms) {
            targets.push_back(BackupTarget{host, std::move(vm)});
        }
    }
    return targets;
}

std::vector<std::shared_ptr<StorageBackend>> BackupJob::initializeBackends() {
    if (config_.storages.empty()) {
        throw BackendInitError("<none>", "job '" + config_.name + "' has no storage configured");
    }

    std::vector<std::shared_ptr<StorageBackend>> backends;
    for (const auto& name : config_.storages) {
        std::shared_ptr<StorageBackend> backend;
        try {
            backend = resolver_(name);
        } catch (const BackendInitError&) {
            throw;
        } catch (const std::exception& e) {
            throw BackendInitError(name, e.what());
        }
        if (!backend) {
            throw BackendInitError(name, "unknown storage");
        }

        backend->initialize();
        backends.push_back(backend);
    }
    return backends;
}

JobRunResult BackupJob::run() {
    auto start = std::chrono::steady_clock::now();
    setId(generateId());

    JobRunResult result;
    result.stats.jobName = config_.name;
    result.stats.jobType = jobKindToString(JobKind::VmBackup);
    result.stats.hostname = hostname_;
    result.stats.schedule = config_.schedule;

    Logger::info("Running VM backup job '" + config_.name + "' (run " + getId() + ")");

    std::vector<BackupTarget> targets;
    std::vector<std::shared_ptr<StorageBackend>> backends;
    try {
        setState(State::RESOLVING_TARGETS);
        targets = resolveTargets();
        result.stats.totalObjects = targets.size();
        if (targets.empty()) {
            Logger::warning("No VMs found for backup job '" + config_.name + "'");
        }

        setState(State::INITIALIZING_BACKENDS);
        backends = initializeBackends();
    } catch (const std::exception& e) {
        Logger::error("Backup job '" + config_.name + "' aborted: " + e.what());
        result.error = e.what();
        result.stats.errors.push_back(e.what());
        result.stats.durationSeconds = secondsSince(start);
        result.success = false;
        setState(State::FAILED);
        return result;
    }

    setState(State::RUNNING);
    std::vector<std::future<void>> futures;
    {
        size_t concurrency = static_cast<size_t>(std::max(1, config_.concurrency));
        // The permits bound the running VMs, the pool only has to be large enough
        size_t workers = std::max<size_t>({concurrency, targets.size(), 1});
        ParallelTaskManager taskManager(workers);
        CountingSemaphore permits(concurrency);

        for (const auto& target : targets) {
            // Blocks until one of the running VMs finishes
            SemaphorePermit permit = permits.acquire();
            futures.push_back(taskManager.addTask(
                [this, target, &backends, permit = std::move(permit)]() mutable {
                    SemaphorePermit held = std::move(permit);
                    backupVm(target, backends);
                }));
        }

        setState(State::AGGREGATING);
        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                futures[i].get();
                result.stats.successfulObjects++;
            } catch (const std::exception& e) {
                Logger::error(std::string("Error during backup job: ") + e.what());
                result.stats.failedObjects++;
                result.stats.errors.push_back(e.what());
            }
        }
    }

    result.stats.durationSeconds = secondsSince(start);
    result.success = result.stats.failedObjects == 0;

    std::stringstream summary;
    summary << "Finished VM backup job '" << config_.name << "' in " << result.stats.durationSeconds
            << " seconds: " << result.stats.successfulObjects << "/" << result.stats.totalObjects
            << " succeeded";
    if (result.success) {
        Logger::info(summary.str());
        setState(State::COMPLETED);
    } else {
        Logger::error(summary.str());
        setState(State::FAILED);
    }
    return result;
}

VmHandle BackupJob::obtainSnapshot(HypervisorClient& host, const VmHandle& vm, bool& created) {
    if (config_.useExistingSnapshot) {
        try {
            std::vector<VmHandle> snapshots = host.listSnapshots(vm);
            if (snapshots.empty()) {
                throw NoSnapshotsError(vm.uuid);
            }
            auto latest = std::max_element(snapshots.begin(), snapshots.end(),
                                           [](const VmHandle& a, const VmHandle& b) {
                                               return a.snapshotTime < b.snapshotTime;
                                           });
            int64_t age = Timestamp::now().unixSeconds() - latest->snapshotTime.unixSeconds();
            if (age <= config_.snapshotMaxAgeSeconds) {
                Logger::debug("Reusing snapshot " + latest->uuid + " (" + std::to_string(age) + "s old)");
                created = false;
                return *latest;
            }
            Logger::info("Newest snapshot of " + describeVm(vm, host.hostId()) + " is " +
                         std::to_string(age) + "s old, creating a new one");
        } catch (const NoSnapshotsError&) {
            Logger::info("No existing snapshot for " + describeVm(vm, host.hostId()) + ", creating one");
        }
    }

    Logger::debug("Creating snapshot of " + describeVm(vm, host.hostId()));
    VmHandle snapshot = host.createSnapshot(vm);
    created = true;
    return snapshot;
}

void BackupJob::storeToBackend(HypervisorClient& host, const VmHandle& snapshot,
                               const BackupArtifact& artifact, StorageBackend& backend) {
    std::unique_ptr<ExportProcess> exporter = host.exportStream(snapshot);
    try {
        backend.consumeExportStream(artifact, exporter->stdoutStream(), exporter->stderrStream());
    } catch (const std::exception&) {
        exporter->terminate();
        throw;
    }

    int exitCode = exporter->wait();
    if (exitCode != 0) {
        try {
            backend.remove(artifact);
        } catch (const std::exception& e) {
            Logger::error("Failed to remove artifact of failed export: " + std::string(e.what()));
        }
        throw CollaboratorError("export of snapshot " + snapshot.uuid + " exited with " +
                                std::to_string(exitCode));
    }
}

void BackupJob::backupVm(const BackupTarget& target,
                         const std::vector<std::shared_ptr<StorageBackend>>& backends) {
    HypervisorClient& host = *target.host;
    const VmHandle& vm = target.vm;
    const std::string vmLabel = describeVm(vm, host.hostId());
    auto start = std::chrono::steady_clock::now();

    Logger::info("Starting backup of VM " + vmLabel);

    bool created = false;
    VmHandle snapshot;
    try {
        snapshot = obtainSnapshot(host, vm, created);
    } catch (const std::exception& e) {
        throw XenKeeperError("Failed to backup VM " + vmLabel + ": " + e.what());
    }

    std::string backupError;
    try {
        host.markNotTemplate(snapshot);

        BackupArtifact artifact = BackupArtifact::create(host.hostId(), JobKind::VmBackup,
                                                         vm.displayName, snapshot.snapshotTime);
        if (created) {
            host.rename(snapshot, artifact.encode(false));
        }

        for (const auto& backend : backends) {
            artifact.compression = backend->artifactCompression();
            Logger::debug("Exporting " + vmLabel + " to storage '" + backend->getName() + "'");
            storeToBackend(host, snapshot, artifact, *backend);

            Logger::debug("Rotating backups of '" + artifact.objectName + "' on storage '" +
                          backend->getName() + "'");
            backend->rotate(ArtifactFilter::forIdentity(artifact));
        }
    } catch (const std::exception& e) {
        backupError = e.what();
    }

    if (created) {
        try {
            host.deleteSnapshot(snapshot.uuid);
        } catch (const std::exception& e) {
            if (backupError.empty()) {
                backupError = std::string("failed to delete snapshot ") + snapshot.uuid + ": " + e.what();
            } else {
                Logger::error("Failed to delete snapshot " + snapshot.uuid + ": " + e.what());
            }
        }
    }

    if (!backupError.empty()) {
        throw XenKeeperError("Failed to backup VM " + vmLabel + ": " + backupError);
    }

    std::stringstream ss;
    ss << "Finished backup of VM " << vmLabel << " in " << secondsSince(start) << " seconds";
    Logger::info(ss.str());
}
