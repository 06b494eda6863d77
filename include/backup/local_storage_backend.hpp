#pragma once

#include "backup/storage_backend.hpp"
#include <filesystem>

// Artifacts as plain files in one directory, optionally gzip or zstd compressed. Files are
// written under a hidden temporary name and renamed into place once complete.
class LocalStorageBackend : public StorageBackend {
public:
    LocalStorageBackend(const std::string& name,
                        const std::filesystem::path& directory,
                        RetentionPolicy retention,
                        std::optional<Compression> compression = std::nullopt);

    StorageBackendType getType() const override { return StorageBackendType::LOCAL; }
    std::optional<Compression> artifactCompression() const override { return compression_; }

    void initialize() override;
    std::vector<BackupArtifact> list(const ArtifactFilter& filter) override;
    void remove(const BackupArtifact& artifact) override;
    void consumeExportStream(const BackupArtifact& artifact, ByteStream& out, ByteStream& err) override;

    const std::filesystem::path& getDirectory() const { return directory_; }
    std::filesystem::path pathFor(const BackupArtifact& artifact) const;

private:
    std::filesystem::path directory_;
    std::optional<Compression> compression_;
};
