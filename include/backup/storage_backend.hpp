#pragma once

#include "backup/backup_artifact.hpp"
#include "backup/retention_policy.hpp"
#include "common/byte_stream.hpp"
#include <optional>
#include <string>
#include <vector>

enum class StorageBackendType {
    LOCAL,
    BORG
};

std::string storageBackendTypeToString(StorageBackendType type);

// A configured backup destination. One instance is created per job run and shared by
// that run's worker tasks.
class StorageBackend {
public:
    StorageBackend(std::string name, RetentionPolicy retention);
    virtual ~StorageBackend() = default;

    const std::string& getName() const { return name_; }
    const RetentionPolicy& getRetention() const { return retention_; }
    virtual StorageBackendType getType() const = 0;

    // Compression the backend applies to artifacts it writes itself; nullopt when it
    // stores the stream as-is or compresses internally.
    virtual std::optional<Compression> artifactCompression() const = 0;

    // Idempotent. Throws BackendInitError.
    virtual void initialize() = 0;

    // Undecodable entries are logged and skipped
    virtual std::vector<BackupArtifact> list(const ArtifactFilter& filter) = 0;

    // Applies the retention policy to everything matching filter and removes the losers.
    // Returns the number of removed artifacts. Throws RotationError.
    virtual size_t rotate(const ArtifactFilter& filter);

    // Throws RotationError
    virtual void remove(const BackupArtifact& artifact) = 0;

    // Stores out under the artifact's name while draining err at the same time. Any err
    // output fails the call. On failure nothing is left behind and StreamConsumptionError
    // is thrown.
    virtual void consumeExportStream(const BackupArtifact& artifact, ByteStream& out, ByteStream& err) = 0;

protected:
    static constexpr size_t kStreamBufferSize = 1024 * 1024;

    std::string name_;
    RetentionPolicy retention_;
};
