#pragma once

#include <optional>
#include <vector>

#include "yieldcraft/analytics/OperatorAlerts.hpp"
#include "yieldcraft/bundle/BundleOptimizer.hpp"
#include "yieldcraft/bundle/PackageCatalog.hpp"
#include "yieldcraft/forecast/DemandForecaster.hpp"
#include "yieldcraft/pricing/PricingCalculator.hpp"
#include "yieldcraft/sim/SalesSimulator.hpp"

namespace yieldcraft {

// Single entry point over one repository and one configuration.
// Holds no state between calls apart from the components' config copies.
class DecisionEngine {
public:
    DecisionEngine(
        InventoryRepository& repo,
        const EngineConfig& cfg
    );

    const EngineConfig& configuration() const { return config; }

    std::vector<InventoryUnit> snapshot(
        const Timestamp& reference
    ) const;

    PricingResult price(
        const InventoryUnit& unit,
        const Timestamp& reference,
        PricingStrategy strategy = PricingStrategy::RuleBased
    ) const;

    // Same as above with a one-off configuration.
    PricingResult price(
        const InventoryUnit& unit,
        const EngineConfig& override_cfg,
        const Timestamp& reference,
        PricingStrategy strategy = PricingStrategy::RuleBased
    ) const;

    std::vector<PricingResult> priceAll(
        const std::vector<InventoryUnit>& units,
        const Timestamp& reference,
        PricingStrategy strategy = PricingStrategy::RuleBased
    ) const;

    DemandForecast forecast(
        const InventoryUnit& unit,
        const Timestamp& reference
    ) const;

    PortfolioForecast summarize(
        const std::vector<InventoryUnit>& units,
        Scenario scenario,
        const Timestamp& reference
    ) const;

    std::vector<BundlePackage> packages(
        const std::vector<InventoryUnit>& units,
        const Timestamp& reference
    ) const;

    OptimizationReport recommend(
        const std::vector<InventoryUnit>& units,
        Scenario scenario,
        const Timestamp& reference
    ) const;

    // Accepts the pair in either order. Empty unless exactly one hotel and one flight.
    std::optional<SimulationResult> simulate(
        const InventoryUnit& a,
        const InventoryUnit& b,
        double discount,
        int horizon_days,
        Scenario scenario,
        const Timestamp& reference
    ) const;

    std::vector<OperatorAlert> alerts(
        const std::vector<InventoryUnit>& units,
        const Timestamp& reference
    ) const;

    void recordSale(
        const BookingEvent& event
    );

private:
    InventoryRepository& repository;
    EngineConfig config;

    PricingCalculator pricing;
    DemandForecaster forecaster;
    PackageCatalog catalog;
    SalesSimulator simulator;
    BundleOptimizer optimizer;
};

}
