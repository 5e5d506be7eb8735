#pragma once

#include <map>
#include <optional>
#include <vector>

#include "yieldcraft/config/EngineConfig.hpp"
#include "yieldcraft/inventory/InventoryRepository.hpp"

namespace yieldcraft {

enum class PaceSource : uint8_t {
    RecentEvents,
    Theoretical
};

const char* toString(PaceSource source);

struct ForecastResult {
    Scenario scenario = Scenario::Base;
    double daily_pace = 0.0;
    double predicted_sold = 0.0;
    double predicted_unsold = 0.0;
    double expected_profit = 0.0;
};

struct DemandForecast {
    uint64_t unit_id = 0;
    std::optional<int> lead_days;
    int remaining_stock = 0;
    double price = 0.0;
    double cost = 0.0;
    double baseline_pace = 0.0;
    PaceSource source = PaceSource::Theoretical;
    std::map<Scenario, ForecastResult> scenarios;

    const ForecastResult& at(Scenario scenario) const;
};

enum class WriteOffRisk : uint8_t {
    Low,
    Medium,
    High
};

const char* toString(WriteOffRisk risk);

struct PortfolioForecast {
    Scenario scenario = Scenario::Base;
    double expected_profit = 0.0;
    double unsold_units = 0.0;
    WriteOffRisk risk = WriteOffRisk::Low;
    int units = 0;
};

class DemandForecaster {
public:
    DemandForecaster(
        const InventoryRepository& repo,
        const EngineConfig& cfg
    );

    // Recent-events pace over the lookback window, else the theoretical pace.
    double baselinePace(
        uint64_t unit_id,
        int total_stock,
        std::optional<int> lead_days,
        const Timestamp& reference,
        PaceSource& source
    ) const;

    DemandForecast forecast(
        uint64_t unit_id,
        std::optional<int> lead_days,
        int remaining_stock,
        int total_stock,
        double price,
        double cost,
        const Timestamp& reference
    ) const;

    // price = base price, cost = unit cost (or base * default_cost_ratio)
    DemandForecast forecast(
        const InventoryUnit& unit,
        const Timestamp& reference
    ) const;

    PortfolioForecast summarize(
        const std::vector<InventoryUnit>& units,
        Scenario scenario,
        const Timestamp& reference
    ) const;

private:
    const InventoryRepository& repository;
    EngineConfig config;
};

}
