#include "backup/storage_backend_factory.hpp"
#include "backup/borg_storage_backend.hpp"
#include "backup/local_storage_backend.hpp"
#include "common/logger.hpp"
#include <stdexcept>

std::shared_ptr<StorageBackend> createStorageBackend(const StorageConfig& config) {
    Logger::debug("Creating storage backend '" + config.name + "' of type: " +
                  storageBackendTypeToString(config.type));

    if (config.type == StorageBackendType::LOCAL) {
        if (config.path.empty()) {
            throw std::runtime_error("Local storage '" + config.name + "' has no path");
        }
        return std::make_shared<LocalStorageBackend>(config.name, config.path, config.retention,
                                                     config.compression);
    } else if (config.type == StorageBackendType::BORG) {
        if (config.borg.repository.empty()) {
            throw std::runtime_error("Borg storage '" + config.name + "' has no repository");
        }
        return std::make_shared<BorgStorageBackend>(config.name, config.borg, config.retention);
    }

    Logger::error("Unsupported storage backend type for '" + config.name + "'");
    throw std::runtime_error("Unsupported storage backend type for '" + config.name + "'");
}
