#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_job.hpp"
#include "backup/storage_backend.hpp"
#include "backup/xen/hypervisor_client.hpp"
#include "monitoring/monitoring_service.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Command line front end: loads the configuration, wires hypervisor clients, storage
// backends and monitors together and dispatches to one of the commands.
class BackupCLI {
public:
    static constexpr const char* kVersion = "1.0.0";
    static constexpr const char* kDefaultConfigPath = "/etc/xenkeeper/config.json";

    struct Options {
        std::string configPath{kDefaultConfigPath};
        std::string command{"daemon"};
        std::vector<std::string> jobs;
        std::vector<std::string> storages;
        bool help{false};
        bool version{false};
    };

    BackupCLI();

    // Returns the process exit code
    int run(int argc, char* argv[]);
    void printUsage() const;

    // Throws std::invalid_argument on unknown commands or flags
    static Options parseArguments(int argc, char* argv[]);

private:
    int handleDaemonCommand();
    int handleRunCommand(const std::vector<std::string>& jobNames);
    int handleDryRunCommand(const std::vector<std::string>& jobNames);
    int handleInitStorageCommand(const std::vector<std::string>& storageNames);
    int handleListCommand(const std::vector<std::string>& storageNames);

    void initializeLogging() const;
    std::vector<const JobConfig*> selectJobs(const std::vector<std::string>& names) const;
    std::vector<std::string> selectStorages(const std::vector<std::string>& names) const;
    std::vector<std::shared_ptr<MonitoringService>> createMonitors() const;
    std::shared_ptr<BackupJob> createJob(const JobConfig& job);
    std::shared_ptr<HypervisorClient> hostClient(const XenHostConfig& host);
    std::shared_ptr<StorageBackend> backendFor(const std::string& name);

    AppConfig config_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<HypervisorClient>> hostClients_;
    std::map<std::string, std::shared_ptr<StorageBackend>> backends_;
};
