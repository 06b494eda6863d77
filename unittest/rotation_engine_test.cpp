#include <gtest/gtest.h>
#include "backup/rotation_engine.hpp"
#include <algorithm>
#include <vector>

namespace {

const int64_t kNow = 1707473942;
const int64_t kDay = 86400;

BackupArtifact artifactAt(int64_t unixSeconds, const std::string& object = "web", const std::string& host = "xen01") {
    return BackupArtifact::create(host, JobKind::VmBackup, object, Timestamp::fromUnixSeconds(unixSeconds));
}

BackupArtifact artifactAged(int64_t ageSeconds, const std::string& object = "web") {
    return artifactAt(kNow - ageSeconds, object);
}

std::vector<BackupArtifact> without(std::vector<BackupArtifact> all, const std::vector<BackupArtifact>& removed) {
    for (const auto& artifact : removed) {
        all.erase(std::remove(all.begin(), all.end(), artifact), all.end());
    }
    return all;
}

TieredRetention tiers(int daily, int weekly, int monthly, int yearly) {
    TieredRetention result;
    result.daily = daily;
    result.weekly = weekly;
    result.monthly = monthly;
    result.yearly = yearly;
    return result;
}

} // namespace

TEST(RotationEngineTest, FlatCountDeletesOldestBeyondLimit) {
    std::vector<BackupArtifact> artifacts{artifactAt(300), artifactAt(100), artifactAt(500),
                                          artifactAt(200), artifactAt(400)};

    std::vector<BackupArtifact> selected = RotationEngine::selectForDeletion(
        RetentionPolicy::flatCount(3), artifacts, Timestamp::fromUnixSeconds(kNow));

    ASSERT_EQ(selected.size(), 2u);
    std::sort(selected.begin(), selected.end(), [](const BackupArtifact& a, const BackupArtifact& b) {
        return a.timestamp < b.timestamp;
    });
    EXPECT_EQ(selected[0], artifactAt(100));
    EXPECT_EQ(selected[1], artifactAt(200));
}

TEST(RotationEngineTest, FlatCountKeepsEverythingAtOrBelowLimit) {
    Timestamp now = Timestamp::fromUnixSeconds(kNow);
    EXPECT_TRUE(RotationEngine::selectForDeletion(RetentionPolicy::flatCount(3),
                                                  {artifactAt(100), artifactAt(200), artifactAt(300)}, now).empty());
    EXPECT_TRUE(RotationEngine::selectForDeletion(RetentionPolicy::flatCount(3), {artifactAt(100)}, now).empty());
    EXPECT_TRUE(RotationEngine::selectForDeletion(RetentionPolicy::flatCount(3), {}, now).empty());
}

TEST(RotationEngineTest, FlatCountIsIdempotent) {
    std::vector<BackupArtifact> artifacts;
    for (int i = 0; i < 10; ++i) {
        artifacts.push_back(artifactAt(1000 + i * 10));
    }
    RetentionPolicy policy = RetentionPolicy::flatCount(4);
    Timestamp now = Timestamp::fromUnixSeconds(kNow);

    std::vector<BackupArtifact> first = RotationEngine::selectForDeletion(policy, artifacts, now);
    EXPECT_EQ(first.size(), 6u);

    std::vector<BackupArtifact> remaining = without(artifacts, first);
    EXPECT_EQ(remaining.size(), 4u);
    EXPECT_TRUE(RotationEngine::selectForDeletion(policy, remaining, now).empty());
}

TEST(RotationEngineTest, FlatCountAppliesPerObjectAndHost) {
    std::vector<BackupArtifact> artifacts{
        artifactAt(100, "web"), artifactAt(200, "web"), artifactAt(300, "web"),
        artifactAt(100, "db"), artifactAt(200, "db"),
        artifactAt(100, "web", "xen02"), artifactAt(200, "web", "xen02"),
    };

    std::vector<BackupArtifact> selected = RotationEngine::selectForDeletion(
        RetentionPolicy::flatCount(2), artifacts, Timestamp::fromUnixSeconds(kNow));

    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0], artifactAt(100, "web"));
}

TEST(RotationEngineTest, TieredOneDayOldIsDaily) {
    // Only the daily tier is empty, so deletion proves the classification
    std::vector<BackupArtifact> selected = RotationEngine::selectTiered(
        tiers(0, 5, 5, 5), {artifactAged(kDay)}, Timestamp::fromUnixSeconds(kNow));
    ASSERT_EQ(selected.size(), 1u);

    selected = RotationEngine::selectTiered(
        tiers(5, 0, 0, 0), {artifactAged(kDay)}, Timestamp::fromUnixSeconds(kNow));
    EXPECT_TRUE(selected.empty());
}

TEST(RotationEngineTest, TieredSevenDaysOldIsWeekly) {
    std::vector<BackupArtifact> selected = RotationEngine::selectTiered(
        tiers(5, 0, 5, 5), {artifactAged(7 * kDay)}, Timestamp::fromUnixSeconds(kNow));
    ASSERT_EQ(selected.size(), 1u);

    selected = RotationEngine::selectTiered(
        tiers(0, 5, 0, 0), {artifactAged(7 * kDay)}, Timestamp::fromUnixSeconds(kNow));
    EXPECT_TRUE(selected.empty());

    // A day later it counts as monthly
    selected = RotationEngine::selectTiered(
        tiers(5, 0, 5, 5), {artifactAged(8 * kDay)}, Timestamp::fromUnixSeconds(kNow));
    EXPECT_TRUE(selected.empty());
}

TEST(RotationEngineTest, TieredDeletesArtifactsThatOverflowABucket) {
    BackupArtifact fiveDays = artifactAged(5 * kDay);
    BackupArtifact fourDays = artifactAged(4 * kDay);
    BackupArtifact threeDays = artifactAged(3 * kDay);

    std::vector<BackupArtifact> selected = RotationEngine::selectForDeletion(
        RetentionPolicy::tiered(tiers(1, 2, 1, 1)), {threeDays, fiveDays, fourDays},
        Timestamp::fromUnixSeconds(kNow));

    // Walked oldest first, so the newest one pushes the counter over
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0], threeDays);
}

TEST(RotationEngineTest, TieredKeepsArtifactsOlderThanAYear) {
    std::vector<BackupArtifact> selected = RotationEngine::selectForDeletion(
        RetentionPolicy::tiered(tiers(1, 0, 0, 0)),
        {artifactAged(400 * kDay), artifactAged(500 * kDay), artifactAged(366 * kDay)},
        Timestamp::fromUnixSeconds(kNow));
    EXPECT_TRUE(selected.empty());
}

TEST(RotationEngineTest, TieredAllZeroIsANoOp) {
    std::vector<BackupArtifact> artifacts;
    for (int i = 0; i < 5; ++i) {
        artifacts.push_back(artifactAged(i * kDay));
    }
    EXPECT_TRUE(RotationEngine::selectForDeletion(RetentionPolicy::tiered(tiers(0, 0, 0, 0)), artifacts,
                                                  Timestamp::fromUnixSeconds(kNow)).empty());
}

TEST(RotationEngineTest, TieredIsAppliedPerObject) {
    std::vector<BackupArtifact> artifacts{
        artifactAged(3600, "web"), artifactAged(7200, "web"),
        artifactAged(3600, "db"), artifactAged(7200, "db"),
    };

    std::vector<BackupArtifact> selected = RotationEngine::selectForDeletion(
        RetentionPolicy::tiered(tiers(1, 0, 0, 0)), artifacts, Timestamp::fromUnixSeconds(kNow));

    ASSERT_EQ(selected.size(), 2u);
    for (const auto& artifact : selected) {
        EXPECT_EQ(artifact.timestamp.unixSeconds(), kNow - 3600);
    }
}

TEST(RetentionPolicyTest, DescribesItself) {
    EXPECT_EQ(RetentionPolicy::flatCount(7).describe(), "keep 7");
    EXPECT_EQ(RetentionPolicy::tiered(tiers(7, 4, 12, 2)).describe(), "daily=7 weekly=4 monthly=12 yearly=2");
}
