#pragma once

#include "backup/backup_config.hpp"
#include "backup/storage_backend.hpp"
#include <memory>

// Factory function to create the storage backend a configuration entry describes
std::shared_ptr<StorageBackend> createStorageBackend(const StorageConfig& config);
