#pragma once

#include "backup/backup_artifact.hpp"
#include "backup/borg_storage_backend.hpp"
#include "backup/retention_policy.hpp"
#include "backup/storage_backend.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct GeneralConfig {
    std::string logLevel{"info"};
    std::string logPath{"/var/log/xenkeeper.log"};
    std::string hostname;  // defaults to the system hostname
};

struct XenHostConfig {
    std::string name;
    std::string server{"localhost"};
    std::string username{"root"};
    std::string password;

    bool isLocal() const { return server.empty() || server == "localhost" || server == "127.0.0.1"; }
};

struct StorageConfig {
    StorageBackendType type{StorageBackendType::LOCAL};
    bool enabled{true};
    std::string name;
    std::string path;                        // local only
    std::optional<Compression> compression;  // local only
    BorgSettings borg;                       // borg only
    RetentionPolicy retention{RetentionPolicy::flatCount(7)};
};

struct MailConfig {
    bool enabled{false};
    std::string smtpServer;
    int smtpPort{587};
    std::string smtpUser;
    std::string smtpPassword;
    std::string smtpFrom;
    std::vector<std::string> smtpTo;
};

struct HealthchecksConfig {
    bool enabled{false};
    std::string server{"https://healthchecks.io"};
    std::string apiKey;
    int grace{3600};
    int maxRetries{3};
};

struct JobConfig {
    bool enabled{true};
    std::string name;
    std::string schedule{"0 0 0 * * *"};
    std::vector<std::string> hosts;     // empty: every configured host
    std::vector<std::string> storages;  // empty: every enabled storage
    std::vector<std::string> tagFilter;
    std::vector<std::string> tagFilterExclude;
    int concurrency{1};
    bool useExistingSnapshot{false};
    int64_t snapshotMaxAgeSeconds{86400};
};

struct AppConfig {
    GeneralConfig general;
    std::vector<XenHostConfig> xenHosts;
    std::vector<StorageConfig> storages;
    MailConfig mail;
    HealthchecksConfig healthchecks;
    std::vector<JobConfig> jobs;

    // Built-in defaults overridden by every key present in the document, then validated.
    // Throw ConfigError.
    static AppConfig loadFromFile(const std::string& path);
    static AppConfig fromJson(const nlohmann::json& document);
    static AppConfig fromString(const std::string& text);

    void validate() const;

    const StorageConfig* findStorage(const std::string& name) const;
    const XenHostConfig* findHost(const std::string& name) const;
    const JobConfig* findJob(const std::string& name) const;

    // Resolved host and storage lists for a job, with the empty-means-all defaults applied
    std::vector<XenHostConfig> hostsForJob(const JobConfig& job) const;
    std::vector<std::string> storagesForJob(const JobConfig& job) const;
};

// Accepts an integer (flat count) or {"daily", "weekly", "monthly", "yearly"}
RetentionPolicy parseRetention(const nlohmann::json& value, const std::string& context);
