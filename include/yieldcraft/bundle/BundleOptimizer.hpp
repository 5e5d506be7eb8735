#pragma once

#include <string>
#include <vector>

#include "yieldcraft/sim/SalesSimulator.hpp"

namespace yieldcraft {

struct BundleRecommendation {
    uint64_t hotel_id = 0;
    uint64_t flight_id = 0;
    std::string hotel_name;
    std::string flight_name;
    Date departure_date;

    double discount = 0.0;
    double gain = 0.0;
    int packages_sold = 0;
    double profit_a = 0.0;
    double profit_b = 0.0;
    std::string reason;
};

struct StandaloneAdvice {
    uint64_t unit_id = 0;
    UnitKind kind = UnitKind::Hotel;
    std::string name;
    double expected_profit = 0.0;     // scenario-A profit over the lead window
    std::string advice;
};

struct ExcludedUnit {
    uint64_t unit_id = 0;
    std::string name;
    std::string reason;
};

struct OptimizationReport {
    Scenario scenario = Scenario::Base;

    std::vector<BundleRecommendation> recommendations;
    std::vector<StandaloneAdvice> standalone;
    std::vector<ExcludedUnit> excluded;
    int candidates = 0;               // same-date pairs simulated

    double standalone_total = 0.0;
    double optimized_total = 0.0;
    double uplift = 0.0;
};

// Greedy best-partner assignment over same-departure hotel/flight pairs.
class BundleOptimizer {
public:
    BundleOptimizer(
        const InventoryRepository& repo,
        const EngineConfig& cfg
    );

    OptimizationReport recommend(
        const std::vector<InventoryUnit>& units,
        Scenario scenario,
        const Timestamp& reference
    ) const;

    // round(rate * (hotel_price + flight_price)) to the price unit.
    double pairDiscount(
        double hotel_price,
        double flight_price
    ) const;

private:
    std::string paceAdvice(
        const SimulationLeg& leg,
        int lead_days
    ) const;

    EngineConfig config;
    SalesSimulator simulator;
};

}
