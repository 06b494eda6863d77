#include "backup/backup_cli.hpp"
#include "backup/backup_scheduler.hpp"
#include "backup/storage_backend_factory.hpp"
#include "backup/xen/xe_cli_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "monitoring/healthchecks_service.hpp"
#include "monitoring/mail_service.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

std::atomic<bool> g_stopRequested{false};

void handleStopSignal(int) {
    g_stopRequested = true;
}

const std::set<std::string> kCommands{"daemon", "run", "dry-run", "init-storage", "list"};

std::string formatSize(const std::optional<uint64_t>& size) {
    if (!size) {
        return "-";
    }
    std::stringstream ss;
    if (*size >= 1024ULL * 1024 * 1024) {
        ss << std::fixed << std::setprecision(1) << (*size / (1024.0 * 1024 * 1024)) << " GiB";
    } else if (*size >= 1024ULL * 1024) {
        ss << std::fixed << std::setprecision(1) << (*size / (1024.0 * 1024)) << " MiB";
    } else {
        ss << *size << " B";
    }
    return ss.str();
}

} // namespace

BackupCLI::BackupCLI() = default;

BackupCLI::Options BackupCLI::parseArguments(int argc, char* argv[]) {
    Options options;
    bool commandSeen = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Option " + flag + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-v" || arg == "--version") {
            options.version = true;
        } else if (arg == "-c" || arg == "--config") {
            options.configPath = value(arg);
        } else if (arg == "-j" || arg == "--job") {
            options.jobs.push_back(value(arg));
        } else if (arg == "-s" || arg == "--storage") {
            options.storages.push_back(value(arg));
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (!commandSeen && kCommands.count(arg) != 0) {
            options.command = arg;
            commandSeen = true;
        } else {
            throw std::invalid_argument("Unknown command: " + arg);
        }
    }

    if (!options.jobs.empty() && options.command != "run" && options.command != "dry-run") {
        throw std::invalid_argument("-j is only accepted by run and dry-run");
    }
    if (!options.storages.empty() && options.command != "init-storage" && options.command != "list") {
        throw std::invalid_argument("-s is only accepted by init-storage and list");
    }
    return options;
}

void BackupCLI::printUsage() const {
    std::cout << "Usage: xenkeeper [-c config.json] [command] [options]\n"
              << "Commands:\n"
              << "  daemon                    Run all enabled jobs on their schedule (default)\n"
              << "  run [-j job]...           Run the named (or all enabled) jobs once\n"
              << "  dry-run [-j job]...       Show the VMs each job would back up\n"
              << "  init-storage [-s name]... Initialize the named (or all enabled) storages\n"
              << "  list [-s name]...         List stored backups\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <path>  Configuration file (default " << kDefaultConfigPath << ")\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n";
}

int BackupCLI::run(int argc, char* argv[]) {
    Options options;
    try {
        options = parseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage();
        return 2;
    }

    if (options.help) {
        printUsage();
        return 0;
    }
    if (options.version) {
        std::cout << "XenKeeper version " << kVersion << std::endl;
        return 0;
    }

    try {
        config_ = AppConfig::loadFromFile(options.configPath);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    initializeLogging();

    try {
        if (options.command == "run") {
            return handleRunCommand(options.jobs);
        } else if (options.command == "dry-run") {
            return handleDryRunCommand(options.jobs);
        } else if (options.command == "init-storage") {
            return handleInitStorageCommand(options.storages);
        } else if (options.command == "list") {
            return handleListCommand(options.storages);
        }
        return handleDaemonCommand();
    } catch (const std::exception& e) {
        Logger::error("Command '" + options.command + "' failed: " + e.what());
        return 1;
    }
}

void BackupCLI::initializeLogging() const {
    LogLevel level = Logger::parseLevel(config_.general.logLevel);
    if (!Logger::initialize(config_.general.logPath, level)) {
        // Console output still works without the log file
        Logger::setLogLevel(level);
        Logger::warning("Logging to console only, cannot write " + config_.general.logPath);
    }
}

std::vector<const JobConfig*> BackupCLI::selectJobs(const std::vector<std::string>& names) const {
    std::vector<const JobConfig*> selected;
    if (names.empty()) {
        for (const auto& job : config_.jobs) {
            if (job.enabled) {
                selected.push_back(&job);
            }
        }
        return selected;
    }

    for (const auto& name : names) {
        const JobConfig* job = config_.findJob(name);
        if (!job) {
            throw std::invalid_argument("Unknown job '" + name + "'");
        }
        if (!job->enabled) {
            Logger::info("Job '" + name + "' is disabled but was requested explicitly");
        }
        selected.push_back(job);
    }
    return selected;
}

std::vector<std::string> BackupCLI::selectStorages(const std::vector<std::string>& names) const {
    std::vector<std::string> selected;
    if (names.empty()) {
        for (const auto& storage : config_.storages) {
            if (storage.enabled) {
                selected.push_back(storage.name);
            }
        }
        return selected;
    }

    for (const auto& name : names) {
        if (!config_.findStorage(name)) {
            throw std::invalid_argument("Unknown storage '" + name + "'");
        }
        selected.push_back(name);
    }
    return selected;
}

std::vector<std::shared_ptr<MonitoringService>> BackupCLI::createMonitors() const {
    std::vector<std::shared_ptr<MonitoringService>> monitors;

    if (config_.mail.enabled) {
        monitors.push_back(std::make_shared<MailService>(config_.mail));
    }

    if (config_.healthchecks.enabled) {
        auto healthchecks = std::make_shared<HealthchecksService>(config_.healthchecks);
        try {
            healthchecks->initialize(config_.jobs, config_.general.hostname);
            monitors.push_back(healthchecks);
        } catch (const MonitoringError& e) {
            Logger::warning("Disabling healthchecks monitoring: " + std::string(e.what()));
        }
    }
    return monitors;
}

std::shared_ptr<HypervisorClient> BackupCLI::hostClient(const XenHostConfig& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hostClients_.find(host.name);
    if (it != hostClients_.end()) {
        return it->second;
    }

    XeConnection connection;
    connection.server = host.server;
    connection.username = host.username;
    connection.password = host.password;
    auto client = std::make_shared<XeCliClient>(host.name, connection);
    hostClients_[host.name] = client;
    return client;
}

std::shared_ptr<StorageBackend> BackupCLI::backendFor(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(name);
    if (it != backends_.end()) {
        return it->second;
    }

    const StorageConfig* storage = config_.findStorage(name);
    if (!storage) {
        return nullptr;
    }
    auto backend = createStorageBackend(*storage);
    backends_[name] = backend;
    return backend;
}

std::shared_ptr<BackupJob> BackupCLI::createJob(const JobConfig& job) {
    std::vector<std::shared_ptr<HypervisorClient>> hosts;
    for (const auto& host : config_.hostsForJob(job)) {
        hosts.push_back(hostClient(host));
    }

    JobConfig resolved = job;
    resolved.storages = config_.storagesForJob(job);
    return std::make_shared<BackupJob>(resolved, config_.general.hostname, hosts,
                                       [this](const std::string& name) { return backendFor(name); });
}

int BackupCLI::handleDaemonCommand() {
    std::vector<const JobConfig*> jobs = selectJobs({});
    if (jobs.empty()) {
        Logger::error("No enabled jobs configured, nothing to schedule");
        return 1;
    }

    BackupScheduler scheduler(createMonitors(), config_.general.hostname);
    for (const JobConfig* job : jobs) {
        scheduler.addJob(createJob(*job));
    }

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    Logger::info("XenKeeper " + std::string(kVersion) + " started with " + std::to_string(jobs.size()) + " jobs");
    scheduler.start();
    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    Logger::info("Stop requested, waiting for running jobs to finish");
    scheduler.stop();
    Logger::info("XenKeeper stopped");
    return 0;
}

int BackupCLI::handleRunCommand(const std::vector<std::string>& jobNames) {
    std::vector<const JobConfig*> jobs = selectJobs(jobNames);
    if (jobs.empty()) {
        Logger::warning("No jobs to run");
        return 0;
    }

    BackupScheduler scheduler(createMonitors(), config_.general.hostname);
    int failed = 0;
    for (const JobConfig* job : jobs) {
        std::shared_ptr<BackupJob> backupJob = createJob(*job);
        JobRunResult result = scheduler.runJob(*backupJob);
        if (!result.success) {
            failed++;
        }
        std::cout << job->name << ": " << (result.success ? "succeeded" : "failed") << " ("
                  << result.stats.successfulObjects << "/" << result.stats.totalObjects << " VMs)"
                  << std::endl;
        for (const auto& error : result.stats.errors) {
            std::cout << "  " << error << std::endl;
        }
    }
    return failed == 0 ? 0 : 1;
}

int BackupCLI::handleDryRunCommand(const std::vector<std::string>& jobNames) {
    int failed = 0;
    for (const JobConfig* job : selectJobs(jobNames)) {
        std::cout << "Job '" << job->name << "' [" << job->schedule << "]" << std::endl;
        try {
            std::vector<BackupTarget> targets = createJob(*job)->resolveTargets();
            for (const auto& target : targets) {
                std::cout << "  " << target.host->hostId() << ": " << target.vm.displayName << " ["
                          << target.vm.uuid << "]" << std::endl;
            }
            if (targets.empty()) {
                std::cout << "  (no VMs)" << std::endl;
            }
            std::cout << "  storages:";
            for (const auto& storage : config_.storagesForJob(*job)) {
                std::cout << " " << storage;
            }
            std::cout << std::endl;
        } catch (const XenKeeperError& e) {
            Logger::error("Failed to resolve targets of job '" + job->name + "': " + e.what());
            failed++;
        }
    }
    return failed == 0 ? 0 : 1;
}

int BackupCLI::handleInitStorageCommand(const std::vector<std::string>& storageNames) {
    int failed = 0;
    for (const auto& name : selectStorages(storageNames)) {
        try {
            std::shared_ptr<StorageBackend> backend = backendFor(name);
            backend->initialize();
            std::cout << "Initialized storage '" << name << "' ("
                      << storageBackendTypeToString(backend->getType()) << ")" << std::endl;
        } catch (const std::exception& e) {
            Logger::error("Failed to initialize storage '" + name + "': " + e.what());
            failed++;
        }
    }
    return failed == 0 ? 0 : 1;
}

int BackupCLI::handleListCommand(const std::vector<std::string>& storageNames) {
    int failed = 0;
    for (const auto& name : selectStorages(storageNames)) {
        std::shared_ptr<StorageBackend> backend = backendFor(name);
        std::cout << "Storage '" << name << "' (" << storageBackendTypeToString(backend->getType())
                  << ", " << backend->getRetention().describe() << ")" << std::endl;
        try {
            std::vector<BackupArtifact> artifacts = backend->list(ArtifactFilter{});
            for (const auto& artifact : artifacts) {
                std::cout << "  " << artifact.encode() << "  " << formatSize(artifact.size) << std::endl;
            }
            if (artifacts.empty()) {
                std::cout << "  (empty)" << std::endl;
            }
        } catch (const std::exception& e) {
            Logger::error("Failed to list storage '" + name + "': " + e.what());
            failed++;
        }
    }
    return failed == 0 ? 0 : 1;
}
