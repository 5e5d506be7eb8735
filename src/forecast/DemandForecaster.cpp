#include "yieldcraft/forecast/DemandForecaster.hpp"

#include <algorithm>
#include <stdexcept>

namespace yieldcraft {

const char* toString(PaceSource source) {
    switch (source) {
        case PaceSource::RecentEvents: return "recent_events";
        case PaceSource::Theoretical:  return "theoretical";
    }
    return "unknown";
}

const char* toString(WriteOffRisk risk) {
    switch (risk) {
        case WriteOffRisk::Low:    return "low";
        case WriteOffRisk::Medium: return "medium";
        case WriteOffRisk::High:   return "high";
    }
    return "unknown";
}

const ForecastResult& DemandForecast::at(Scenario scenario) const {
    auto it = scenarios.find(scenario);
    if (it == scenarios.end()) {
        throw std::out_of_range(std::string("no forecast for scenario ") + toString(scenario));
    }
    return it->second;
}

DemandForecaster::DemandForecaster(
    const InventoryRepository& repo,
    const EngineConfig& cfg
) : repository(repo),
    config(cfg) {}

double DemandForecaster::baselinePace(
    uint64_t unit_id,
    int total_stock,
    std::optional<int> lead_days,
    const Timestamp& reference,
    PaceSource& source
) const {
    int lookback = std::max(config.forecast_lookback_days, 1);
    const Timestamp from =
        reference - boost::posix_time::hours(24 * lookback);

    int recent = repository.sumQuantity(unit_id, from, reference);
    if (recent > 0) {
        source = PaceSource::RecentEvents;
        return static_cast<double>(recent) / lookback;
    }

    source = PaceSource::Theoretical;
    int days = std::max(lead_days.value_or(0), config.theoretical_min_days);
    if (days <= 0) return 0.0;
    return total_stock * config.theoretical_sell_ratio / days;
}

DemandForecast DemandForecaster::forecast(
    uint64_t unit_id,
    std::optional<int> lead_days,
    int remaining_stock,
    int total_stock,
    double price,
    double cost,
    const Timestamp& reference
) const {
    DemandForecast out;
    out.unit_id = unit_id;
    out.lead_days = lead_days;
    out.remaining_stock = remaining_stock;
    out.price = price;
    out.cost = cost;
    out.baseline_pace =
        baselinePace(unit_id, total_stock, lead_days, reference, out.source);

    // Unknown departure sells for zero days.
    double selling_days =
        std::max(lead_days.value_or(0), 0);

    for (Scenario s : {Scenario::Pessimistic, Scenario::Base, Scenario::Optimistic}) {
        ForecastResult r;
        r.scenario = s;
        r.daily_pace = out.baseline_pace * config.scenarios.of(s);
        r.predicted_sold = std::min<double>(remaining_stock, r.daily_pace * selling_days);
        r.predicted_unsold = remaining_stock - r.predicted_sold;
        r.expected_profit =
            r.predicted_sold * (price - cost) -
            r.predicted_unsold * cost;
        out.scenarios[s] = r;
    }
    return out;
}

DemandForecast DemandForecaster::forecast(
    const InventoryUnit& unit,
    const Timestamp& reference
) const {
    return forecast(
        unit.id,
        unit.leadDays(reference),
        unit.remaining_stock,
        unit.total_stock,
        unit.base_price,
        unit.costOr(config.default_cost_ratio),
        reference
    );
}

PortfolioForecast DemandForecaster::summarize(
    const std::vector<InventoryUnit>& units,
    Scenario scenario,
    const Timestamp& reference
) const {
    PortfolioForecast out;
    out.scenario = scenario;

    for (const auto& unit : units) {
        const ForecastResult& r = forecast(unit, reference).at(scenario);
        out.expected_profit += r.expected_profit;
        out.unsold_units += r.predicted_unsold;
        ++out.units;
    }

    if (out.unsold_units > config.unsold_risk_high) {
        out.risk = WriteOffRisk::High;
    } else if (out.unsold_units > config.unsold_risk_medium) {
        out.risk = WriteOffRisk::Medium;
    } else {
        out.risk = WriteOffRisk::Low;
    }
    return out;
}

}
