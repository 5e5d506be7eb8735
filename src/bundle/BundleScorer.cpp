#include "yieldcraft/bundle/BundleScorer.hpp"

#include <algorithm>

#include "yieldcraft/core/Format.hpp"

namespace yieldcraft {

BundleScorer::BundleScorer(
    const EngineConfig& cfg
) : config(cfg) {}

double BundleScorer::urgency(
    int remaining_stock,
    int total_stock,
    std::optional<int> lead_days
) const {
    double time_score = 0.0;
    if (lead_days && *lead_days >= 0 && config.urgency_horizon_days > 0.0) {
        time_score = std::max(
            0.0,
            1.0 - *lead_days / config.urgency_horizon_days
        );
    }

    double surplus_score =
        total_stock > 0
            ? static_cast<double>(remaining_stock) / total_stock
            : 0.0;

    double w = config.urgency_time_weight;
    double score =
        w * time_score +
        (1.0 - w) * surplus_score;

    return roundTo(std::clamp(score, 0.0, 1.0), 4);
}

double BundleScorer::urgencyFor(
    const InventoryUnit& unit,
    const Timestamp& reference
) const {
    switch (unit.kind) {
        case UnitKind::Hotel:
            return urgency(
                unit.remaining_stock,
                unit.total_stock,
                unit.leadDays(reference)
            );
        case UnitKind::Flight:
            return 0.0;
    }
    return 0.0;
}

double BundleScorer::bundleDiscount(
    double hotel_base_price,
    double hotel_dynamic_price,
    double urgency_score
) const {
    double unit = config.price_unit;

    double sized = roundToUnit(
        hotel_base_price * config.bundle_list_cap_pct * std::max(urgency_score, 0.0),
        unit
    );
    double list_cap = floorToUnit(hotel_base_price * config.bundle_list_cap_pct, unit);
    double dynamic_cap = floorToUnit(hotel_dynamic_price * config.bundle_dynamic_cap_pct, unit);

    double magnitude = std::max(0.0, std::min({sized, list_cap, dynamic_cap}));
    return magnitude > 0.0 ? -magnitude : 0.0;
}

double BundleScorer::strategyScore(
    double urgency_score,
    int flight_remaining,
    int flight_total
) const {
    double demand =
        flight_total > 0
            ? 1.0 - static_cast<double>(flight_remaining) / flight_total
            : 0.0;

    double w = config.strategy_urgency_weight;
    double score =
        w * urgency_score +
        (1.0 - w) * demand;

    return roundTo(std::clamp(score, 0.0, 1.0), 4);
}

}
