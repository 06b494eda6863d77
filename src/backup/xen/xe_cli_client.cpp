#include "backup/xen/xe_cli_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <set>
#include <sstream>

const char* const XeCliClient::kSnapshotLabel = "xenkeeper-snapshot";

namespace {

bool looksLikeUuid(const std::string& value) {
    return utils::split(value, "-").size() == 5;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw CollaboratorError("Unexpected value '" + value + "' for " + key);
}

class XeExportProcess : public ExportProcess {
public:
    explicit XeExportProcess(std::unique_ptr<ChildProcess> child)
        : child_(std::move(child)) {}

    ByteStream& stdoutStream() override { return child_->stdoutStream(); }
    ByteStream& stderrStream() override { return child_->stderrStream(); }
    int wait() override { return child_->wait(); }
    void terminate() override { child_->terminate(); }

private:
    std::unique_ptr<ChildProcess> child_;
};

} // namespace

XeCliClient::XeCliClient(const std::string& hostId, const XeConnection& connection)
    : hostId_(hostId)
    , connection_(connection) {}

std::vector<std::string> XeCliClient::baseCommand() const {
    std::vector<std::string> argv{connection_.binary};
    const std::string& server = connection_.server;
    if (server.empty() || server == "localhost" || server == "127.0.0.1") {
        return argv;
    }
    argv.insert(argv.end(), {"-s", server, "-u", connection_.username, "-pw", connection_.password});
    return argv;
}

std::string XeCliClient::runXe(const std::vector<std::string>& args) {
    std::vector<std::string> argv = baseCommand();
    argv.insert(argv.end(), args.begin(), args.end());
    Logger::debug("[" + hostId_ + "] Running: " + ProcessRunner::describe(argv));

    ProcessResult result;
    try {
        result = ProcessRunner::run(argv);
    } catch (const std::exception& e) {
        throw CollaboratorError("xe " + args.front() + " on host '" + hostId_ + "': " + e.what());
    }

    if (!result.success()) {
        throw CollaboratorError("xe " + args.front() + " on host '" + hostId_ + "' exited with " +
                                std::to_string(result.exitCode) + ": " + utils::trim(result.stderrData));
    }
    return result.stdoutData;
}

std::vector<std::string> XeCliClient::parseUuidList(const std::string& output) {
    std::string cleaned = output;
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\n'), cleaned.end());
    cleaned = utils::trim(cleaned);

    std::vector<std::string> uuids;
    if (cleaned.empty()) {
        return uuids;
    }
    for (const auto& piece : utils::split(cleaned, ",")) {
        std::string uuid = utils::trim(piece);
        if (!looksLikeUuid(uuid)) {
            throw CollaboratorError("Unexpected uuid '" + uuid + "' in xe output");
        }
        uuids.push_back(uuid);
    }
    return uuids;
}

std::string XeCliClient::parseUuid(const std::string& output) {
    std::vector<std::string> uuids = parseUuidList(output);
    if (uuids.size() != 1) {
        throw CollaboratorError("Expected exactly one uuid in xe output, got " + std::to_string(uuids.size()));
    }
    return uuids.front();
}

VmHandle XeCliClient::parseVmParams(const std::string& output) {
    VmHandle vm;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        // "name-label ( RW)    : mail" -> key "name-label"
        std::string keyPart = utils::trim(line.substr(0, colon));
        std::string key = keyPart.substr(0, keyPart.find(' '));
        std::string value = utils::trim(line.substr(colon + 1));

        if (key == "uuid") {
            vm.uuid = value;
        } else if (key == "name-label") {
            vm.displayName = value;
        } else if (key == "name-description") {
            vm.description = value;
        } else if (key == "is-a-template") {
            vm.isTemplate = parseBool(key, value);
        } else if (key == "is-a-snapshot") {
            vm.isSnapshot = parseBool(key, value);
        } else if (key == "snapshot-time") {
            if (!Timestamp::parseXenTimestamp(value, vm.snapshotTime)) {
                throw CollaboratorError("Unexpected snapshot-time '" + value + "'");
            }
        }
    }

    if (vm.uuid.empty()) {
        throw CollaboratorError("vm-param-list output has no uuid");
    }
    return vm;
}

std::vector<std::string> XeCliClient::listUuids(const std::vector<std::string>& filters) {
    std::vector<std::string> args{"vm-list", "is-a-template=false", "is-a-snapshot=false",
                                  "is-control-domain=false"};
    args.insert(args.end(), filters.begin(), filters.end());
    args.push_back("--minimal");
    return parseUuidList(runXe(args));
}

VmHandle XeCliClient::getVm(const std::string& uuid) {
    return parseVmParams(runXe({"vm-param-list", "uuid=" + uuid}));
}

std::vector<VmHandle> XeCliClient::listVms(const std::vector<std::string>& tags,
                                           const std::vector<std::string>& excludeTags) {
    // Ordered and de-duplicated across tags
    std::vector<std::string> included;
    std::set<std::string> seen;
    if (tags.empty()) {
        included = listUuids({});
    } else {
        for (const auto& tag : tags) {
            for (const auto& uuid : listUuids({"tags:contains=" + tag})) {
                if (seen.insert(uuid).second) {
                    included.push_back(uuid);
                }
            }
        }
    }

    std::set<std::string> excluded;
    for (const auto& tag : excludeTags) {
        for (const auto& uuid : listUuids({"tags:contains=" + tag})) {
            excluded.insert(uuid);
        }
    }

    std::vector<VmHandle> vms;
    for (const auto& uuid : included) {
        if (excluded.count(uuid) == 0) {
            vms.push_back(getVm(uuid));
        }
    }
    Logger::debug("[" + hostId_ + "] " + std::to_string(vms.size()) + " VMs match the tag filter");
    return vms;
}

VmHandle XeCliClient::createSnapshot(const VmHandle& vm) {
    std::string uuid = parseUuid(runXe({"vm-snapshot", "vm=" + vm.uuid,
                                        std::string("new-name-label=") + kSnapshotLabel}));
    return getVm(uuid);
}

std::vector<VmHandle> XeCliClient::listSnapshots(const VmHandle& vm) {
    std::vector<std::string> uuids =
        parseUuidList(runXe({"snapshot-list", "snapshot-of=" + vm.uuid, "--minimal"}));
    if (uuids.empty()) {
        throw NoSnapshotsError(vm.uuid);
    }

    std::vector<VmHandle> snapshots;
    for (const auto& uuid : uuids) {
        snapshots.push_back(getVm(uuid));
    }
    return snapshots;
}

void XeCliClient::markNotTemplate(const VmHandle& snapshot) {
    runXe({"snapshot-param-set", "is-a-template=false", "uuid=" + snapshot.uuid});
}

void XeCliClient::rename(const VmHandle& snapshot, const std::string& label) {
    runXe({"snapshot-param-set", "uuid=" + snapshot.uuid, "name-label=" + label});
}

void XeCliClient::deleteSnapshot(const std::string& snapshotUuid) {
    runXe({"snapshot-uninstall", "uuid=" + snapshotUuid, "force=true"});
}

std::unique_ptr<ExportProcess> XeCliClient::exportStream(const VmHandle& snapshot) {
    std::vector<std::string> argv = baseCommand();
    argv.insert(argv.end(), {"vm-export", "vm=" + snapshot.uuid, "filename="});
    Logger::debug("[" + hostId_ + "] Running: " + ProcessRunner::describe(argv));

    try {
        return std::make_unique<XeExportProcess>(ChildProcess::spawn(argv));
    } catch (const std::exception& e) {
        throw CollaboratorError("Failed to start export of " + snapshot.uuid + " on host '" +
                                hostId_ + "': " + e.what());
    }
}
