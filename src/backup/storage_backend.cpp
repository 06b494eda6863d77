#include "backup/storage_backend.hpp"
#include "backup/rotation_engine.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

std::string storageBackendTypeToString(StorageBackendType type) {
    switch (type) {
        case StorageBackendType::LOCAL:
            return "local";
        case StorageBackendType::BORG:
            return "borg";
    }
    return "unknown";
}

StorageBackend::StorageBackend(std::string name, RetentionPolicy retention)
    : name_(std::move(name))
    , retention_(retention) {}

size_t StorageBackend::rotate(const ArtifactFilter& filter) {
    std::vector<BackupArtifact> candidates;
    try {
        candidates = list(filter);
    } catch (const RotationError&) {
        throw;
    } catch (const std::exception& e) {
        throw RotationError("Failed to list storage '" + name_ + "' for rotation: " + e.what());
    }

    std::vector<BackupArtifact> toDelete =
        RotationEngine::selectForDeletion(retention_, candidates, Timestamp::now());

    Logger::debug("Rotation on storage '" + name_ + "' (" + retention_.describe() + "): " +
                  std::to_string(candidates.size()) + " candidates, " +
                  std::to_string(toDelete.size()) + " to delete");

    for (const auto& artifact : toDelete) {
        try {
            Logger::info("Rotating out " + artifact.encode() + " from storage '" + name_ + "'");
            remove(artifact);
        } catch (const RotationError&) {
            throw;
        } catch (const std::exception& e) {
            throw RotationError("Failed to delete artifact of '" + artifact.objectName +
                                "' from storage '" + name_ + "': " + e.what());
        }
    }
    return toDelete.size();
}
