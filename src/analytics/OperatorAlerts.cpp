#include "yieldcraft/analytics/OperatorAlerts.hpp"

#include <unordered_map>

#include "yieldcraft/core/Format.hpp"

namespace yieldcraft {

const char* toString(AlertLevel level) {
    switch (level) {
        case AlertLevel::Info:    return "info";
        case AlertLevel::Warning: return "warning";
        case AlertLevel::Danger:  return "danger";
    }
    return "unknown";
}

std::vector<OperatorAlert> buildAlerts(
    const std::vector<PricingResult>& pricing_results,
    const std::vector<InventoryUnit>& units,
    const std::vector<BundlePackage>& packages,
    const EngineConfig& cfg
) {
    std::unordered_map<uint64_t, const InventoryUnit*> by_id;
    for (const auto& u : units) by_id[u.id] = &u;

    std::vector<OperatorAlert> out;

    for (const auto& r : pricing_results) {
        if (r.is_brake_active) {
            OperatorAlert a;
            a.level = AlertLevel::Danger;
            a.unit_id = r.unit_id;
            a.title = "Price brake engaged";
            a.message =
                r.name + " selling " + formatFixed(r.velocity_ratio.value_or(0.0), 1) +
                "x plan; price raised to " + formatAmount(r.final_price);
            out.push_back(a);
        }
    }

    for (const auto& r : pricing_results) {
        auto it = by_id.find(r.unit_id);
        double inventory_ratio =
            it != by_id.end() ? it->second->remainingRatio() : r.inventory_ratio;

        if (r.velocity_ratio &&
            *r.velocity_ratio < cfg.slow_pace_ratio &&
            inventory_ratio > cfg.slow_pace_min_inventory) {
            OperatorAlert a;
            a.level = AlertLevel::Warning;
            a.unit_id = r.unit_id;
            a.title = "Slow sales pace";
            a.message =
                r.name + " at " + formatFixed(*r.velocity_ratio, 1) + "x plan with " +
                std::to_string(static_cast<int>(inventory_ratio * 100.0 + 1e-9)) +
                "% stock left; consider bundling";
            out.push_back(a);
        }
    }

    if (!packages.empty() && packages.front().strategy_score > cfg.opportunity_score) {
        const BundlePackage& top = packages.front();
        OperatorAlert a;
        a.level = AlertLevel::Info;
        a.title = "Bundle opportunity";
        a.message =
            top.flight_name + " + " + top.hotel_name + " scores " +
            formatFixed(top.strategy_score, 2) + " at " + formatAmount(top.final_price);
        out.push_back(a);
    }
    return out;
}

}
