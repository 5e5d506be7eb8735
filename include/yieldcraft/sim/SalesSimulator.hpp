#pragma once

#include <string>
#include <vector>

#include "yieldcraft/forecast/DemandForecaster.hpp"
#include "yieldcraft/pricing/DecayCurve.hpp"
#include "yieldcraft/pricing/PricingCalculator.hpp"
#include "yieldcraft/signal/VelocitySignal.hpp"

namespace yieldcraft {

// One unit as the simulator sees it: frozen price, cost and daily pace.
struct SimulationLeg {
    uint64_t unit_id = 0;
    UnitKind kind = UnitKind::Hotel;
    std::string name;
    int stock = 0;
    double price = 0.0;
    double cost = 0.0;
    double pace = 0.0;            // units per day
    VelocityRatio velocity_ratio;

    double margin() const { return price - cost; }
};

struct SimulationDay {
    int day = 0;                  // days to departure, 0 = write-off
    double decay = 0.0;

    // Scenario A: independent sales
    int a_hotel_sold = 0;
    int a_flight_sold = 0;
    int a_hotel_stock = 0;
    int a_flight_stock = 0;
    double a_profit = 0.0;        // cumulative
    double a_residual = 0.0;

    // Scenario B: packages first, then the surviving leg alone
    int b_packages = 0;
    int b_hotel_sold = 0;         // standalone only
    int b_flight_sold = 0;
    int b_hotel_stock = 0;
    int b_flight_stock = 0;
    double b_profit = 0.0;
    double b_residual = 0.0;
};

struct SimulationResult {
    SimulationLeg hotel;
    SimulationLeg flight;
    Scenario scenario = Scenario::Base;
    int horizon_days = 0;

    double discount = 0.0;
    double package_pace = 0.0;
    double cannibalization_rate = 0.0;
    double cannibalization = 0.0; // per package
    double package_profit = 0.0;  // per package

    double profit_a = 0.0;
    double profit_b = 0.0;
    double gain = 0.0;            // profit_b - profit_a
    int packages_sold = 0;

    double write_off_a = 0.0;
    double write_off_b = 0.0;

    std::vector<SimulationDay> trace;   // horizon ... 0
};

// Day-by-day comparison of selling two units independently (A) against
// selling them as a discounted package (B).
class SalesSimulator {
public:
    SalesSimulator(
        const InventoryRepository& repo,
        const EngineConfig& cfg
    );

    SimulationLeg buildLeg(
        const InventoryUnit& unit,
        Scenario scenario,
        const Timestamp& reference
    ) const;

    SimulationResult simulate(
        const InventoryUnit& hotel,
        const InventoryUnit& flight,
        double discount,
        int horizon_days,
        Scenario scenario,
        const Timestamp& reference
    ) const;

    // Pure state machine. discount is the package price reduction (magnitude).
    SimulationResult run(
        const SimulationLeg& hotel,
        const SimulationLeg& flight,
        double discount,
        int horizon_days,
        Scenario scenario
    ) const;

    // Scenario A for a single leg, including the write-off.
    double standaloneProfit(
        const SimulationLeg& leg,
        int horizon_days
    ) const;

    double cannibalizationRate(
        const SimulationLeg& flight
    ) const;

private:
    EngineConfig config;
    PricingCalculator pricing;
    DemandForecaster forecaster;
    VelocitySignal signal;
    DecayCurve decay;
};

}
