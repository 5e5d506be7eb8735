#pragma once

#include <optional>
#include <string>
#include <vector>

#include "yieldcraft/config/EngineConfig.hpp"
#include "yieldcraft/forecast/DemandForecaster.hpp"
#include "yieldcraft/inventory/InventoryRepository.hpp"
#include "yieldcraft/pricing/DecayCurve.hpp"
#include "yieldcraft/signal/VelocitySignal.hpp"

namespace yieldcraft {

enum class PricingStrategy : uint8_t {
    RuleBased,
    DemandElasticity
};

const char* toString(PricingStrategy strategy);
std::optional<PricingStrategy> parsePricingStrategy(const std::string& text);

enum class StepKind : uint8_t {
    Absolute,
    Relative,
    Total
};

const char* toString(StepKind kind);

struct WaterfallStep {
    std::string label;
    double value = 0.0;
    StepKind kind = StepKind::Relative;
};

struct PriceFactor {
    std::string label;
    double amount = 0.0;
    bool applicable = true;   // false = input missing, amount is 0 by construction
    bool engaged = false;     // threshold crossed, even when the amount rounds to 0
    std::string reason;
};

struct PricingResult {
    uint64_t unit_id = 0;
    std::string name;
    PricingStrategy strategy = PricingStrategy::RuleBased;

    double base_price = 0.0;
    std::vector<PriceFactor> factors;
    double theoretical_price = 0.0;
    double final_price = 0.0;

    double inventory_ratio = 0.0;
    std::optional<int> lead_days;
    VelocityRatio velocity_ratio;
    bool is_brake_active = false;

    std::string justification;
    std::vector<WaterfallStep> waterfall;

    // Amount of the named factor, 0 when absent.
    double factorAmount(const std::string& label) const;
    const PriceFactor* factor(const std::string& label) const;
};

class PricingCalculator {
public:
    PricingCalculator(
        const InventoryRepository& repo,
        const EngineConfig& cfg
    );

    PricingResult price(
        const InventoryUnit& unit,
        const Timestamp& reference,
        PricingStrategy strategy = PricingStrategy::RuleBased
    ) const;

    // Additive model with an already-computed velocity reading.
    PricingResult priceRuleBased(
        const InventoryUnit& unit,
        std::optional<int> lead_days,
        VelocityRatio velocity_ratio
    ) const;

    // Multiplicative model: elasticity-driven pace correction times the decay cliff.
    PricingResult priceElasticity(
        const InventoryUnit& unit,
        std::optional<int> lead_days,
        double current_pace,
        int horizon_days
    ) const;

    PriceFactor scarcityFactor(double base_price, double inventory_ratio) const;
    PriceFactor leadTimeFactor(double base_price, std::optional<int> lead_days) const;
    PriceFactor velocityFactor(double base_price, VelocityRatio velocity_ratio) const;

    // Forecast base-scenario pace when observed, else historical average over the
    // unit's age, else the theoretical pace.
    double currentPace(
        const InventoryUnit& unit,
        const Timestamp& reference
    ) const;

    double minPrice(double base_price) const;
    double maxPrice(double base_price) const;

private:
    void finalize(PricingResult& result) const;

    EngineConfig config;
    VelocitySignal signal;
    DemandForecaster forecaster;
    DecayCurve decay;
};

}
