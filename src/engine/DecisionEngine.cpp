#include "yieldcraft/engine/DecisionEngine.hpp"

namespace yieldcraft {

DecisionEngine::DecisionEngine(
    InventoryRepository& repo,
    const EngineConfig& cfg
) : repository(repo),
    config(cfg),
    pricing(repo, cfg),
    forecaster(repo, cfg),
    catalog(repo, cfg),
    simulator(repo, cfg),
    optimizer(repo, cfg) {}

std::vector<InventoryUnit> DecisionEngine::snapshot(
    const Timestamp& reference
) const {
    return repository.fetchSnapshot(reference);
}

PricingResult DecisionEngine::price(
    const InventoryUnit& unit,
    const Timestamp& reference,
    PricingStrategy strategy
) const {
    return pricing.price(unit, reference, strategy);
}

PricingResult DecisionEngine::price(
    const InventoryUnit& unit,
    const EngineConfig& override_cfg,
    const Timestamp& reference,
    PricingStrategy strategy
) const {
    PricingCalculator once(repository, override_cfg);
    return once.price(unit, reference, strategy);
}

std::vector<PricingResult> DecisionEngine::priceAll(
    const std::vector<InventoryUnit>& units,
    const Timestamp& reference,
    PricingStrategy strategy
) const {
    std::vector<PricingResult> out;
    out.reserve(units.size());
    for (const auto& u : units) {
        out.push_back(pricing.price(u, reference, strategy));
    }
    return out;
}

DemandForecast DecisionEngine::forecast(
    const InventoryUnit& unit,
    const Timestamp& reference
) const {
    return forecaster.forecast(unit, reference);
}

PortfolioForecast DecisionEngine::summarize(
    const std::vector<InventoryUnit>& units,
    Scenario scenario,
    const Timestamp& reference
) const {
    return forecaster.summarize(units, scenario, reference);
}

std::vector<BundlePackage> DecisionEngine::packages(
    const std::vector<InventoryUnit>& units,
    const Timestamp& reference
) const {
    return catalog.build(units, reference);
}

OptimizationReport DecisionEngine::recommend(
    const std::vector<InventoryUnit>& units,
    Scenario scenario,
    const Timestamp& reference
) const {
    return optimizer.recommend(units, scenario, reference);
}

std::optional<SimulationResult> DecisionEngine::simulate(
    const InventoryUnit& a,
    const InventoryUnit& b,
    double discount,
    int horizon_days,
    Scenario scenario,
    const Timestamp& reference
) const {
    if (a.kind == b.kind) return std::nullopt;

    const InventoryUnit& hotel = a.kind == UnitKind::Hotel ? a : b;
    const InventoryUnit& flight = a.kind == UnitKind::Flight ? a : b;

    return simulator.simulate(
        hotel,
        flight,
        discount,
        horizon_days,
        scenario,
        reference
    );
}

std::vector<OperatorAlert> DecisionEngine::alerts(
    const std::vector<InventoryUnit>& units,
    const Timestamp& reference
) const {
    return buildAlerts(
        priceAll(units, reference),
        units,
        catalog.build(units, reference),
        config
    );
}

void DecisionEngine::recordSale(
    const BookingEvent& event
) {
    repository.append(event);
}

}
