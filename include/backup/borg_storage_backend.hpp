#pragma once

#include "backup/storage_backend.hpp"
#include "common/process.hpp"
#include <string>
#include <vector>

struct BorgSettings {
    std::string repository;
    std::string passphrase;
    std::string encryption{"repokey"};
    std::string compression{"lz4"};
    std::string binary{"borg"};
};

// A borg repository driven through the borg CLI. Each artifact is one archive named
// after the artifact; compression is left to borg.
class BorgStorageBackend : public StorageBackend {
public:
    BorgStorageBackend(const std::string& name, const BorgSettings& settings, RetentionPolicy retention);

    StorageBackendType getType() const override { return StorageBackendType::BORG; }
    std::optional<Compression> artifactCompression() const override { return std::nullopt; }

    void initialize() override;
    std::vector<BackupArtifact> list(const ArtifactFilter& filter) override;
    size_t rotate(const ArtifactFilter& filter) override;
    void remove(const BackupArtifact& artifact) override;
    void consumeExportStream(const BackupArtifact& artifact, ByteStream& out, ByteStream& err) override;

    // One archive name per line, as printed by "borg list --short"
    static std::vector<BackupArtifact> parseArchiveList(const std::string& output);

    std::string archiveName(const BackupArtifact& artifact) const;
    std::vector<std::string> createCommand(const BackupArtifact& artifact) const;

private:
    ProcessOptions processOptions(bool pipeStdin = false) const;
    ProcessResult runBorg(const std::vector<std::string>& args) const;

    BorgSettings settings_;
};
