#include "backup/retention_policy.hpp"
#include <sstream>

RetentionPolicy RetentionPolicy::flatCount(int count) {
    RetentionPolicy policy;
    policy.type_ = Type::FLAT_COUNT;
    policy.count_ = count;
    return policy;
}

RetentionPolicy RetentionPolicy::tiered(const TieredRetention& tiers) {
    RetentionPolicy policy;
    policy.type_ = Type::TIERED;
    policy.count_ = 0;
    policy.tiers_ = tiers;
    return policy;
}

std::string RetentionPolicy::describe() const {
    std::stringstream ss;
    if (type_ == Type::FLAT_COUNT) {
        ss << "keep " << count_;
    } else {
        ss << "daily=" << tiers_.daily
           << " weekly=" << tiers_.weekly
           << " monthly=" << tiers_.monthly
           << " yearly=" << tiers_.yearly;
    }
    return ss.str();
}
