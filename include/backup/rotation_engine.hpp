#pragma once

#include "backup/backup_artifact.hpp"
#include "backup/retention_policy.hpp"
#include <vector>

// Decides which artifacts a retention policy gives up. Pure: nothing is deleted here.
class RotationEngine {
public:
    // Candidates are grouped by (host, kind, object) and the policy is applied to each
    // group on its own. now is the reference instant for tiered age buckets.
    static std::vector<BackupArtifact> selectForDeletion(const RetentionPolicy& policy,
                                                         const std::vector<BackupArtifact>& candidates,
                                                         const Timestamp& now);

    static std::vector<BackupArtifact> selectFlatCount(int keep, std::vector<BackupArtifact> group);
    static std::vector<BackupArtifact> selectTiered(const TieredRetention& tiers,
                                                    std::vector<BackupArtifact> group,
                                                    const Timestamp& now);
};
