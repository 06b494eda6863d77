#include "backup/rotation_engine.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <map>

namespace {

enum class AgeBucket {
    DAILY,
    WEEKLY,
    MONTHLY,
    YEARLY,
    NONE
};

AgeBucket classify(int64_t ageDays) {
    if (ageDays <= 1) {
        return AgeBucket::DAILY;
    }
    if (ageDays <= 7) {
        return AgeBucket::WEEKLY;
    }
    if (ageDays <= 30) {
        return AgeBucket::MONTHLY;
    }
    if (ageDays <= 365) {
        return AgeBucket::YEARLY;
    }
    return AgeBucket::NONE;
}

int bucketLimit(const TieredRetention& tiers, AgeBucket bucket) {
    switch (bucket) {
        case AgeBucket::DAILY:
            return tiers.daily;
        case AgeBucket::WEEKLY:
            return tiers.weekly;
        case AgeBucket::MONTHLY:
            return tiers.monthly;
        case AgeBucket::YEARLY:
            return tiers.yearly;
        case AgeBucket::NONE:
            break;
    }
    return 0;
}

} // namespace

std::vector<BackupArtifact> RotationEngine::selectForDeletion(const RetentionPolicy& policy,
                                                              const std::vector<BackupArtifact>& candidates,
                                                              const Timestamp& now) {
    if (policy.getType() == RetentionPolicy::Type::TIERED && policy.getTiers().allZero()) {
        Logger::info("Tiered retention with all tiers at zero, skipping rotation");
        return {};
    }

    // Keyed by identity; insertion order inside a group is preserved for stable sorting
    std::map<std::string, std::vector<BackupArtifact>> groups;
    for (const auto& artifact : candidates) {
        groups[artifact.identityKey()].push_back(artifact);
    }

    std::vector<BackupArtifact> toDelete;
    for (auto& group : groups) {
        std::vector<BackupArtifact> selected;
        if (policy.getType() == RetentionPolicy::Type::FLAT_COUNT) {
            selected = selectFlatCount(policy.getCount(), std::move(group.second));
        } else {
            selected = selectTiered(policy.getTiers(), std::move(group.second), now);
        }
        toDelete.insert(toDelete.end(), selected.begin(), selected.end());
    }
    return toDelete;
}

std::vector<BackupArtifact> RotationEngine::selectFlatCount(int keep, std::vector<BackupArtifact> group) {
    std::stable_sort(group.begin(), group.end(),
                     [](const BackupArtifact& a, const BackupArtifact& b) {
                         return a.timestamp > b.timestamp;
                     });

    size_t kept = keep > 0 ? static_cast<size_t>(keep) : 0;
    if (group.size() <= kept) {
        return {};
    }
    return std::vector<BackupArtifact>(group.begin() + kept, group.end());
}

std::vector<BackupArtifact> RotationEngine::selectTiered(const TieredRetention& tiers,
                                                         std::vector<BackupArtifact> group,
                                                         const Timestamp& now) {
    std::stable_sort(group.begin(), group.end(),
                     [](const BackupArtifact& a, const BackupArtifact& b) {
                         return a.timestamp < b.timestamp;
                     });

    std::map<AgeBucket, int> counters;
    std::vector<BackupArtifact> toDelete;
    for (const auto& artifact : group) {
        int64_t ageDays = std::chrono::duration_cast<std::chrono::hours>(now.time - artifact.timestamp.time).count() / 24;
        AgeBucket bucket = classify(ageDays);
        if (bucket == AgeBucket::NONE) {
            continue;
        }
        int count = ++counters[bucket];
        if (count > bucketLimit(tiers, bucket)) {
            toDelete.push_back(artifact);
        }
    }
    return toDelete;
}
