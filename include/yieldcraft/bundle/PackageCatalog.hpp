#pragma once

#include <string>
#include <vector>

#include "yieldcraft/bundle/BundleScorer.hpp"
#include "yieldcraft/pricing/PricingCalculator.hpp"

namespace yieldcraft {

struct BundlePackage {
    int rank = 0;

    uint64_t flight_id = 0;
    uint64_t hotel_id = 0;
    std::string flight_name;
    std::string hotel_name;

    double flight_price = 0.0;    // rule-based dynamic price
    double hotel_price = 0.0;
    double discount = 0.0;        // <= 0
    double final_price = 0.0;

    double urgency = 0.0;
    std::string urgency_label;
    double strategy_score = 0.0;

    VelocityRatio flight_velocity;
    VelocityRatio hotel_velocity;

    std::string justification;
};

const char* urgencyLabel(double urgency_score);

// Every flight x hotel pair, priced and ranked by strategy score.
class PackageCatalog {
public:
    PackageCatalog(
        const InventoryRepository& repo,
        const EngineConfig& cfg
    );

    std::vector<BundlePackage> build(
        const std::vector<InventoryUnit>& units,
        const Timestamp& reference
    ) const;

private:
    std::string justify(
        const BundlePackage& pkg
    ) const;

    EngineConfig config;
    PricingCalculator pricing;
    BundleScorer scorer;
};

}
