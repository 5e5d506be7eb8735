#pragma once

#include <optional>

#include "yieldcraft/config/EngineConfig.hpp"

namespace yieldcraft {

// Hotel-stock urgency, urgency-sized bundle discount and package ranking score.
class BundleScorer {
public:
    explicit BundleScorer(
        const EngineConfig& cfg
    );

    // clamp(w * time + (1 - w) * surplus, 0, 1), rounded to 4 decimals.
    double urgency(
        int remaining_stock,
        int total_stock,
        std::optional<int> lead_days
    ) const;

    // Hotel stock only; flights score 0.
    double urgencyFor(
        const InventoryUnit& unit,
        const Timestamp& reference
    ) const;

    // Never positive. |d| <= min(base * list_cap, dynamic * dynamic_cap).
    double bundleDiscount(
        double hotel_base_price,
        double hotel_dynamic_price,
        double urgency_score
    ) const;

    double strategyScore(
        double urgency_score,
        int flight_remaining,
        int flight_total
    ) const;

private:
    EngineConfig config;
};

}
