#pragma once

#include <string>

struct TieredRetention {
    int daily{0};
    int weekly{0};
    int monthly{0};
    int yearly{0};

    bool allZero() const { return daily == 0 && weekly == 0 && monthly == 0 && yearly == 0; }
};

// How many artifacts of one logical object a storage backend keeps.
class RetentionPolicy {
public:
    enum class Type {
        FLAT_COUNT,
        TIERED
    };

    RetentionPolicy() = default;

    static RetentionPolicy flatCount(int count);
    static RetentionPolicy tiered(const TieredRetention& tiers);

    Type getType() const { return type_; }
    int getCount() const { return count_; }
    const TieredRetention& getTiers() const { return tiers_; }

    std::string describe() const;

private:
    Type type_{Type::FLAT_COUNT};
    int count_{1};
    TieredRetention tiers_;
};
