#include "backup/borg_storage_backend.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <future>
#include <sstream>

BorgStorageBackend::BorgStorageBackend(const std::string& name,
                                       const BorgSettings& settings,
                                       RetentionPolicy retention)
    : StorageBackend(name, retention)
    , settings_(settings) {}

ProcessOptions BorgStorageBackend::processOptions(bool pipeStdin) const {
    ProcessOptions options;
    options.pipeStdin = pipeStdin;
    if (!settings_.passphrase.empty()) {
        options.environment["BORG_PASSPHRASE"] = settings_.passphrase;
    }
    if (settings_.encryption == "none") {
        options.environment["BORG_UNKNOWN_UNENCRYPTED_REPO_ACCESS_IS_OK"] = "yes";
    }
    return options;
}

ProcessResult BorgStorageBackend::runBorg(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{settings_.binary};
    argv.insert(argv.end(), args.begin(), args.end());
    Logger::debug("Running: " + ProcessRunner::describe(argv));
    return ProcessRunner::run(argv, processOptions());
}

std::string BorgStorageBackend::archiveName(const BackupArtifact& artifact) const {
    BackupArtifact stored = artifact;
    stored.compression.reset();
    return stored.encode(true);
}

std::vector<std::string> BorgStorageBackend::createCommand(const BackupArtifact& artifact) const {
    return {
        settings_.binary, "create",
        "--stdin-name", artifact.objectName + "." + baseExtension(artifact.jobKind),
        "--compression", settings_.compression,
        settings_.repository + "::" + archiveName(artifact),
        "-"
    };
}

void BorgStorageBackend::initialize() {
    ProcessResult result;
    try {
        result = runBorg({"init", "--encryption=" + settings_.encryption, settings_.repository});
    } catch (const std::exception& e) {
        throw BackendInitError(name_, e.what());
    }

    if (result.success()) {
        Logger::info("Initialized borg repository " + settings_.repository);
        return;
    }
    if (result.stderrData.find("already exists") != std::string::npos) {
        Logger::info("Borg repository " + settings_.repository + " already exists");
        return;
    }
    throw BackendInitError(name_, "borg init exited with " + std::to_string(result.exitCode) +
                                      ": " + utils::trim(result.stderrData));
}

std::vector<BackupArtifact> BorgStorageBackend::parseArchiveList(const std::string& output) {
    std::vector<BackupArtifact> artifacts;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty()) {
            continue;
        }
        std::string error;
        std::optional<BackupArtifact> artifact = BackupArtifact::tryDecode(line, &error);
        if (!artifact) {
            Logger::warning("Skipping unrecognized borg archive: " + error);
            continue;
        }
        artifacts.push_back(std::move(*artifact));
    }
    return artifacts;
}

std::vector<BackupArtifact> BorgStorageBackend::list(const ArtifactFilter& filter) {
    ProcessResult result = runBorg({"list", "--short", settings_.repository});
    if (!result.success()) {
        throw std::runtime_error("borg list exited with " + std::to_string(result.exitCode) +
                                 ": " + utils::trim(result.stderrData));
    }

    std::vector<BackupArtifact> matching;
    for (auto& artifact : parseArchiveList(result.stdoutData)) {
        if (filter.matches(artifact)) {
            matching.push_back(std::move(artifact));
        }
    }
    return matching;
}

size_t BorgStorageBackend::rotate(const ArtifactFilter& filter) {
    size_t removed = StorageBackend::rotate(filter);
    if (removed == 0) {
        return removed;
    }

    // Deleting archives only marks segments; compact frees the space
    ProcessResult result = runBorg({"compact", settings_.repository});
    if (!result.success()) {
        Logger::warning("borg compact on " + settings_.repository + " exited with " +
                        std::to_string(result.exitCode) + ": " + utils::trim(result.stderrData));
    }
    return removed;
}

void BorgStorageBackend::remove(const BackupArtifact& artifact) {
    std::string archive = settings_.repository + "::" + archiveName(artifact);
    ProcessResult result = runBorg({"delete", archive});
    if (!result.success()) {
        throw RotationError("borg delete " + archive + " exited with " +
                            std::to_string(result.exitCode) + ": " + utils::trim(result.stderrData));
    }
    Logger::debug("Deleted archive " + archive);
}

void BorgStorageBackend::consumeExportStream(const BackupArtifact& artifact, ByteStream& out, ByteStream& err) {
    const std::string archive = archiveName(artifact);
    std::vector<std::string> argv = createCommand(artifact);
    Logger::debug("Running: " + ProcessRunner::describe(argv));

    std::unique_ptr<ChildProcess> borg;
    try {
        borg = ChildProcess::spawn(argv, processOptions(true));
    } catch (const std::exception& e) {
        throw StreamConsumptionError("Failed to start borg for " + archive + ": " + e.what());
    }

    auto exportErr = std::async(std::launch::async, [&err]() {
        std::string kept;
        ByteStream::drain(err, &kept);
        return kept;
    });
    auto borgOut = std::async(std::launch::async, [&borg]() {
        std::string kept;
        ByteStream::drain(borg->stdoutStream(), &kept);
        return kept;
    });
    auto borgErr = std::async(std::launch::async, [&borg]() {
        std::string kept;
        ByteStream::drain(borg->stderrStream(), &kept);
        return kept;
    });

    std::string failure;
    uint64_t totalBytes = 0;
    std::vector<char> buffer(kStreamBufferSize);
    try {
        while (true) {
            size_t n = out.read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            totalBytes += n;
            if (!failure.empty()) {
                continue;
            }
            try {
                borg->writeStdin(buffer.data(), n);
            } catch (const std::exception& e) {
                failure = e.what();
            }
        }
    } catch (const std::exception& e) {
        if (failure.empty()) {
            failure = std::string("reading export stream failed: ") + e.what();
        }
    }

    // A truncated stream still yields an archive; it is deleted below
    borg->closeStdin();
    int exitCode = borg->wait();

    std::string borgStderr;
    try {
        borgOut.get();
        borgStderr = borgErr.get();
    } catch (const std::exception& e) {
        Logger::warning("Failed to read borg output: " + std::string(e.what()));
    }

    try {
        std::string errData = exportErr.get();
        if (!errData.empty() && failure.empty()) {
            failure = "export reported errors: " + utils::trim(errData);
        }
    } catch (const std::exception& e) {
        if (failure.empty()) {
            failure = std::string("reading export error stream failed: ") + e.what();
        }
    }

    // borg exits with 1 for warnings; the archive is still complete
    bool archiveWritten = exitCode == 0 || exitCode == 1;
    if (exitCode == 1) {
        Logger::warning("borg create for " + archive + " finished with warnings: " + utils::trim(borgStderr));
    } else if (!archiveWritten && failure.empty()) {
        failure = "borg create exited with " + std::to_string(exitCode) + ": " + utils::trim(borgStderr);
    }

    if (!failure.empty()) {
        if (archiveWritten) {
            try {
                remove(artifact);
            } catch (const std::exception& e) {
                Logger::error("Failed to remove incomplete archive " + archive + ": " + e.what());
            }
        }
        throw StreamConsumptionError("Failed to store " + archive + " on storage '" + name_ + "': " + failure);
    }

    Logger::info("Stored archive " + settings_.repository + "::" + archive + " (" +
                 std::to_string(totalBytes) + " bytes)");
}
