#include "backup/backup_config.hpp"
#include "common/cron_schedule.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "monitoring/monitoring_service.hpp"
#include <fstream>
#include <map>
#include <set>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string systemHostname() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        Logger::warning("Failed to read system hostname, using 'localhost'");
        return "localhost";
    }
    return buffer;
}

template<typename T>
void readKey(const json& object, const char* key, T& target, const std::string& context) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(context + "." + key + ": " + e.what());
    }
}

void requireObject(const json& value, const std::string& context) {
    if (!value.is_object()) {
        throw ConfigError(context + " must be an object");
    }
}

const json& arrayAt(const json& parent, const char* key, const std::string& context) {
    static const json empty = json::array();
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_array()) {
        throw ConfigError(context + "." + key + " must be an array");
    }
    return *it;
}

GeneralConfig parseGeneral(const json& document) {
    GeneralConfig general;
    auto it = document.find("general");
    if (it != document.end()) {
        requireObject(*it, "general");
        readKey(*it, "log_level", general.logLevel, "general");
        readKey(*it, "log_path", general.logPath, "general");
        readKey(*it, "hostname", general.hostname, "general");
    }
    if (general.hostname.empty()) {
        general.hostname = systemHostname();
    }
    return general;
}

StorageConfig parseLocalStorage(const json& entry, const std::string& context) {
    requireObject(entry, context);
    StorageConfig storage;
    storage.type = StorageBackendType::LOCAL;
    readKey(entry, "enabled", storage.enabled, context);
    readKey(entry, "name", storage.name, context);
    readKey(entry, "path", storage.path, context);

    std::string compression = "none";
    readKey(entry, "compression", compression, context);
    if (compression == "gzip" || compression == "gz") {
        storage.compression = Compression::Gzip;
    } else if (compression == "zstd" || compression == "zst") {
        storage.compression = Compression::Zstd;
    } else if (compression != "none") {
        throw ConfigError(context + ".compression: unsupported value '" + compression + "'");
    }

    if (entry.contains("retention")) {
        storage.retention = parseRetention(entry.at("retention"), context + ".retention");
    }
    return storage;
}

StorageConfig parseBorgStorage(const json& entry, const std::string& context) {
    requireObject(entry, context);
    StorageConfig storage;
    storage.type = StorageBackendType::BORG;
    readKey(entry, "enabled", storage.enabled, context);
    readKey(entry, "name", storage.name, context);
    readKey(entry, "repository", storage.borg.repository, context);
    readKey(entry, "passphrase", storage.borg.passphrase, context);
    readKey(entry, "encryption", storage.borg.encryption, context);
    readKey(entry, "compression", storage.borg.compression, context);
    readKey(entry, "binary", storage.borg.binary, context);

    static const std::set<std::string> encryptions{"repokey", "repokey-blake2", "none"};
    if (encryptions.count(storage.borg.encryption) == 0) {
        throw ConfigError(context + ".encryption: unsupported value '" + storage.borg.encryption + "'");
    }
    static const std::set<std::string> compressions{"none", "lz4", "zstd"};
    if (compressions.count(storage.borg.compression) == 0) {
        throw ConfigError(context + ".compression: unsupported value '" + storage.borg.compression + "'");
    }
    if (storage.borg.repository.empty()) {
        throw ConfigError(context + ".repository must be set");
    }

    if (entry.contains("retention")) {
        storage.retention = parseRetention(entry.at("retention"), context + ".retention");
    }
    return storage;
}

JobConfig parseJob(const json& entry, const std::string& context) {
    requireObject(entry, context);
    JobConfig job;
    readKey(entry, "enabled", job.enabled, context);
    readKey(entry, "name", job.name, context);
    readKey(entry, "schedule", job.schedule, context);
    readKey(entry, "hosts", job.hosts, context);
    readKey(entry, "storages", job.storages, context);
    readKey(entry, "tag_filter", job.tagFilter, context);
    readKey(entry, "tag_filter_exclude", job.tagFilterExclude, context);
    readKey(entry, "concurrency", job.concurrency, context);
    readKey(entry, "use_existing_snapshot", job.useExistingSnapshot, context);
    readKey(entry, "snapshot_max_age_seconds", job.snapshotMaxAgeSeconds, context);
    return job;
}

} // namespace

RetentionPolicy parseRetention(const json& value, const std::string& context) {
    if (value.is_number_integer()) {
        int count = value.get<int>();
        if (count < 1) {
            throw ConfigError(context + ": flat retention must be at least 1");
        }
        return RetentionPolicy::flatCount(count);
    }

    if (value.is_object()) {
        TieredRetention tiers;
        readKey(value, "daily", tiers.daily, context);
        readKey(value, "weekly", tiers.weekly, context);
        readKey(value, "monthly", tiers.monthly, context);
        readKey(value, "yearly", tiers.yearly, context);
        if (tiers.daily < 0 || tiers.weekly < 0 || tiers.monthly < 0 || tiers.yearly < 0) {
            throw ConfigError(context + ": tier counts must not be negative");
        }
        return RetentionPolicy::tiered(tiers);
    }

    throw ConfigError(context + " must be an integer or an object with daily/weekly/monthly/yearly");
}

AppConfig AppConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + path);
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    return fromJson(document);
}

AppConfig AppConfig::fromString(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    return fromJson(document);
}

AppConfig AppConfig::fromJson(const json& document) {
    requireObject(document, "configuration root");

    AppConfig config;
    config.general = parseGeneral(document);

    const json& hosts = arrayAt(document, "xen", "root");
    for (size_t i = 0; i < hosts.size(); ++i) {
        std::string context = "xen[" + std::to_string(i) + "]";
        requireObject(hosts[i], context);
        XenHostConfig host;
        readKey(hosts[i], "name", host.name, context);
        readKey(hosts[i], "server", host.server, context);
        readKey(hosts[i], "username", host.username, context);
        readKey(hosts[i], "password", host.password, context);
        if (host.name.empty()) {
            host.name = host.isLocal() ? config.general.hostname : host.server;
        }
        config.xenHosts.push_back(host);
    }
    if (config.xenHosts.empty()) {
        XenHostConfig local;
        local.name = config.general.hostname;
        config.xenHosts.push_back(local);
    }

    auto storageIt = document.find("storage");
    if (storageIt != document.end()) {
        requireObject(*storageIt, "storage");
        const json& local = arrayAt(*storageIt, "local", "storage");
        for (size_t i = 0; i < local.size(); ++i) {
            config.storages.push_back(parseLocalStorage(local[i], "storage.local[" + std::to_string(i) + "]"));
        }
        const json& borg = arrayAt(*storageIt, "borg", "storage");
        for (size_t i = 0; i < borg.size(); ++i) {
            config.storages.push_back(parseBorgStorage(borg[i], "storage.borg[" + std::to_string(i) + "]"));
        }
    }

    auto monitoringIt = document.find("monitoring");
    if (monitoringIt != document.end()) {
        requireObject(*monitoringIt, "monitoring");
        auto mailIt = monitoringIt->find("mail");
        if (mailIt != monitoringIt->end()) {
            requireObject(*mailIt, "monitoring.mail");
            readKey(*mailIt, "enabled", config.mail.enabled, "monitoring.mail");
            readKey(*mailIt, "smtp_server", config.mail.smtpServer, "monitoring.mail");
            readKey(*mailIt, "smtp_port", config.mail.smtpPort, "monitoring.mail");
            readKey(*mailIt, "smtp_user", config.mail.smtpUser, "monitoring.mail");
            readKey(*mailIt, "smtp_password", config.mail.smtpPassword, "monitoring.mail");
            readKey(*mailIt, "smtp_from", config.mail.smtpFrom, "monitoring.mail");
            readKey(*mailIt, "smtp_to", config.mail.smtpTo, "monitoring.mail");
        }
        auto hcIt = monitoringIt->find("healthchecks");
        if (hcIt != monitoringIt->end()) {
            requireObject(*hcIt, "monitoring.healthchecks");
            readKey(*hcIt, "enabled", config.healthchecks.enabled, "monitoring.healthchecks");
            readKey(*hcIt, "server", config.healthchecks.server, "monitoring.healthchecks");
            readKey(*hcIt, "api_key", config.healthchecks.apiKey, "monitoring.healthchecks");
            readKey(*hcIt, "grace", config.healthchecks.grace, "monitoring.healthchecks");
            readKey(*hcIt, "max_retries", config.healthchecks.maxRetries, "monitoring.healthchecks");
        }
    }

    const json& jobs = arrayAt(document, "jobs", "root");
    for (size_t i = 0; i < jobs.size(); ++i) {
        config.jobs.push_back(parseJob(jobs[i], "jobs[" + std::to_string(i) + "]"));
    }

    config.validate();
    return config;
}

void AppConfig::validate() const {
    std::set<std::string> hostNames;
    for (const auto& host : xenHosts) {
        if (!hostNames.insert(host.name).second) {
            throw ConfigError("duplicate xen host name '" + host.name + "'");
        }
    }

    std::set<std::string> storageNames;
    for (const auto& storage : storages) {
        if (storage.name.empty()) {
            throw ConfigError("every storage needs a name");
        }
        if (!storageNames.insert(storage.name).second) {
            throw ConfigError("duplicate storage name '" + storage.name + "'");
        }
        if (storage.type == StorageBackendType::LOCAL && storage.enabled && storage.path.empty()) {
            throw ConfigError("storage '" + storage.name + "' needs a path");
        }
    }

    if (mail.enabled) {
        if (mail.smtpServer.empty() || mail.smtpFrom.empty() || mail.smtpTo.empty()) {
            throw ConfigError("monitoring.mail needs smtp_server, smtp_from and smtp_to");
        }
        if (mail.smtpPort <= 0 || mail.smtpPort > 65535) {
            throw ConfigError("monitoring.mail.smtp_port out of range");
        }
    }
    if (healthchecks.enabled) {
        if (healthchecks.server.empty() || healthchecks.apiKey.empty()) {
            throw ConfigError("monitoring.healthchecks needs server and api_key");
        }
        if (healthchecks.maxRetries < 0 || healthchecks.grace < 0) {
            throw ConfigError("monitoring.healthchecks grace and max_retries must not be negative");
        }
    }

    std::set<std::string> jobNames;
    std::map<std::string, std::string> monitorKeys;
    for (const auto& job : jobs) {
        if (job.name.empty()) {
            throw ConfigError("every job needs a name");
        }
        if (!jobNames.insert(job.name).second) {
            throw ConfigError("duplicate job name '" + job.name + "'");
        }
        // Monitors address jobs by the rendered key, which folds some characters together
        std::string key = MonitorKey{general.hostname, job.name}.render();
        auto inserted = monitorKeys.emplace(key, job.name);
        if (!inserted.second) {
            throw ConfigError("jobs '" + inserted.first->second + "' and '" + job.name +
                              "' both report as '" + key + "'");
        }
        if (job.concurrency < 1) {
            throw ConfigError("job '" + job.name + "': concurrency must be at least 1");
        }
        if (job.snapshotMaxAgeSeconds < 0) {
            throw ConfigError("job '" + job.name + "': snapshot_max_age_seconds must not be negative");
        }
        try {
            CronSchedule::parse(job.schedule);
        } catch (const std::invalid_argument& e) {
            throw ConfigError("job '" + job.name + "': " + e.what());
        }
        for (const auto& storageName : job.storages) {
            const StorageConfig* storage = findStorage(storageName);
            if (!storage) {
                throw ConfigError("job '" + job.name + "' references unknown storage '" + storageName + "'");
            }
            if (!storage->enabled) {
                throw ConfigError("job '" + job.name + "' references disabled storage '" + storageName + "'");
            }
        }
        for (const auto& hostName : job.hosts) {
            if (!findHost(hostName)) {
                throw ConfigError("job '" + job.name + "' references unknown host '" + hostName + "'");
            }
        }
        if (job.enabled && storagesForJob(job).empty()) {
            throw ConfigError("job '" + job.name + "' has no storage to write to");
        }
    }
}

const StorageConfig* AppConfig::findStorage(const std::string& name) const {
    for (const auto& storage : storages) {
        if (storage.name == name) {
            return &storage;
        }
    }
    return nullptr;
}

const XenHostConfig* AppConfig::findHost(const std::string& name) const {
    for (const auto& host : xenHosts) {
        if (host.name == name) {
            return &host;
        }
    }
    return nullptr;
}

const JobConfig* AppConfig::findJob(const std::string& name) const {
    for (const auto& job : jobs) {
        if (job.name == name) {
            return &job;
        }
    }
    return nullptr;
}

std::vector<XenHostConfig> AppConfig::hostsForJob(const JobConfig& job) const {
    if (job.hosts.empty()) {
        return xenHosts;
    }
    std::vector<XenHostConfig> result;
    for (const auto& name : job.hosts) {
        if (const XenHostConfig* host = findHost(name)) {
            result.push_back(*host);
        }
    }
    return result;
}

std::vector<std::string> AppConfig::storagesForJob(const JobConfig& job) const {
    if (!job.storages.empty()) {
        return job.storages;
    }
    std::vector<std::string> result;
    for (const auto& storage : storages) {
        if (storage.enabled) {
            result.push_back(storage.name);
        }
    }
    return result;
}
