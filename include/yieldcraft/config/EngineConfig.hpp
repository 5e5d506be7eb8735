#pragma once
// =============================================================================
// EngineConfig.hpp - Tunable knobs for pricing, forecasting and bundling
// =============================================================================
// Every rate, threshold and weight used by the engine lives here. Components
// take a copy at construction; callers override per call by passing a
// modified copy.
// =============================================================================

#include "yieldcraft/core/Types.hpp"

namespace yieldcraft {

struct ScenarioMultipliers {
    double pessimistic = 0.7;
    double base = 1.0;
    double optimistic = 1.3;

    double of(Scenario scenario) const {
        switch (scenario) {
            case Scenario::Pessimistic: return pessimistic;
            case Scenario::Base:        return base;
            case Scenario::Optimistic:  return optimistic;
        }
        return base;
    }
};

struct EngineConfig {
    // =========================================================================
    // Velocity signal
    // =========================================================================
    double target_sell_ratio = 0.90;      // sell-through target by departure
    int velocity_window_hours = 24;

    // =========================================================================
    // Pricing
    // =========================================================================
    double brake_threshold = 1.5;         // velocity ratio that arms the brake
    double brake_strength_pct = 0.05;
    double max_discount_pct = 0.30;
    double max_markup_pct = 0.50;
    double price_unit = 100.0;            // currency rounding granularity

    double elasticity_pace_floor = 0.2;
    double elasticity_pace_cap = 5.0;
    double decay_steepness = 20.0;        // k
    double decay_midpoint = 0.12;         // p, fraction of horizon left at the cliff
    int default_horizon_days = 90;

    // =========================================================================
    // Forecast
    // =========================================================================
    ScenarioMultipliers scenarios;
    int forecast_lookback_days = 14;
    double theoretical_sell_ratio = 0.70;
    int theoretical_min_days = 30;
    double default_cost_ratio = 0.70;     // cost = base * ratio when unit_cost unset
    double unsold_risk_high = 50.0;
    double unsold_risk_medium = 20.0;

    // =========================================================================
    // Bundling
    // =========================================================================
    double bundle_velocity_boost = 1.5;
    double bundle_discount_rate = 0.08;   // share of combined price
    double bundle_gain_threshold = 5000.0;
    double cannibalization_base_rate = 0.15;
    double reference_discount = 10000.0;  // discount that doubles package pace

    double urgency_time_weight = 0.6;     // surplus weight is 1 - this
    double urgency_horizon_days = 30.0;
    double bundle_list_cap_pct = 0.25;    // of hotel base price
    double bundle_dynamic_cap_pct = 0.30; // of hotel dynamic price
    double strategy_urgency_weight = 0.7; // flight demand weight is 1 - this

    // =========================================================================
    // Alerts
    // =========================================================================
    double slow_pace_ratio = 0.5;
    double slow_pace_min_inventory = 0.6;
    double opportunity_score = 0.8;
};

}
