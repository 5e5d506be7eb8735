#include "yieldcraft/sim/SalesSimulator.hpp"

#include <algorithm>
#include <cmath>

namespace yieldcraft {

namespace {

// Whole units out of a fractional daily pace.
struct PaceStream {
    double pace = 0.0;
    double carry = 0.0;

    int draw(int available) {
        carry += std::max(pace, 0.0);
        int n = std::min(
            std::max(available, 0),
            static_cast<int>(std::floor(carry))
        );
        carry -= n;
        return n;
    }
};

}

SalesSimulator::SalesSimulator(
    const InventoryRepository& repo,
    const EngineConfig& cfg
) : config(cfg),
    pricing(repo, cfg),
    forecaster(repo, cfg),
    signal(repo, cfg),
    decay(cfg.decay_steepness, cfg.decay_midpoint) {}

SimulationLeg SalesSimulator::buildLeg(
    const InventoryUnit& unit,
    Scenario scenario,
    const Timestamp& reference
) const {
    SimulationLeg leg;
    leg.unit_id = unit.id;
    leg.kind = unit.kind;
    leg.name = unit.name;
    leg.stock = unit.remaining_stock;
    leg.price =
        pricing.price(unit, reference, PricingStrategy::RuleBased).final_price;
    leg.cost = unit.costOr(config.default_cost_ratio);
    leg.pace =
        forecaster.forecast(unit, reference).at(scenario).daily_pace;
    leg.velocity_ratio = signal.ratioFor(unit, reference);
    return leg;
}

SimulationResult SalesSimulator::simulate(
    const InventoryUnit& hotel,
    const InventoryUnit& flight,
    double discount,
    int horizon_days,
    Scenario scenario,
    const Timestamp& reference
) const {
    return run(
        buildLeg(hotel, scenario, reference),
        buildLeg(flight, scenario, reference),
        discount,
        horizon_days,
        scenario
    );
}

double SalesSimulator::cannibalizationRate(
    const SimulationLeg& flight
) const {
    if (flight.velocity_ratio) {
        return std::max(0.0, *flight.velocity_ratio - 1.0);
    }
    return config.cannibalization_base_rate;
}

SimulationResult SalesSimulator::run(
    const SimulationLeg& hotel,
    const SimulationLeg& flight,
    double discount,
    int horizon_days,
    Scenario scenario
) const {
    SimulationResult out;
    out.hotel = hotel;
    out.flight = flight;
    out.scenario = scenario;
    out.horizon_days = std::max(horizon_days, 0);
    out.discount = std::fabs(discount);

    double discount_lift =
        config.reference_discount > 0.0
            ? 1.0 + out.discount / config.reference_discount
            : 1.0;
    out.package_pace =
        hotel.pace *
        config.bundle_velocity_boost *
        discount_lift;

    out.cannibalization_rate = cannibalizationRate(flight);
    out.cannibalization =
        std::round(std::max(0.0, flight.margin()) * out.cannibalization_rate);
    out.package_profit =
        hotel.margin() +
        flight.margin() -
        out.discount -
        out.cannibalization;

    // Scenario A state
    int a_hotel = std::max(hotel.stock, 0);
    int a_flight = std::max(flight.stock, 0);
    PaceStream a_hotel_stream{hotel.pace};
    PaceStream a_flight_stream{flight.pace};

    // Scenario B state
    int b_hotel = a_hotel;
    int b_flight = a_flight;
    PaceStream package_stream{out.package_pace};
    PaceStream b_hotel_stream{hotel.pace};
    PaceStream b_flight_stream{flight.pace};

    out.trace.reserve(out.horizon_days + 1);

    for (int t = out.horizon_days; t >= 0; --t) {
        SimulationDay day;
        day.day = t;
        day.decay = decay.forLeadDays(t, out.horizon_days);

        if (t >= 1) {
            day.a_hotel_sold = a_hotel_stream.draw(a_hotel);
            day.a_flight_sold = a_flight_stream.draw(a_flight);
            a_hotel -= day.a_hotel_sold;
            a_flight -= day.a_flight_sold;
            out.profit_a +=
                day.a_hotel_sold * hotel.margin() +
                day.a_flight_sold * flight.margin();

            if (b_hotel > 0 && b_flight > 0) {
                day.b_packages =
                    package_stream.draw(std::min(b_hotel, b_flight));
                b_hotel -= day.b_packages;
                b_flight -= day.b_packages;
                out.packages_sold += day.b_packages;
                out.profit_b += day.b_packages * out.package_profit;
            } else if (b_hotel > 0) {
                day.b_hotel_sold = b_hotel_stream.draw(b_hotel);
                b_hotel -= day.b_hotel_sold;
                out.profit_b += day.b_hotel_sold * hotel.margin();
            } else if (b_flight > 0) {
                day.b_flight_sold = b_flight_stream.draw(b_flight);
                b_flight -= day.b_flight_sold;
                out.profit_b += day.b_flight_sold * flight.margin();
            }
        } else {
            out.write_off_a = a_hotel * hotel.cost + a_flight * flight.cost;
            out.write_off_b = b_hotel * hotel.cost + b_flight * flight.cost;
            out.profit_a -= out.write_off_a;
            out.profit_b -= out.write_off_b;
        }

        day.a_hotel_stock = a_hotel;
        day.a_flight_stock = a_flight;
        day.b_hotel_stock = b_hotel;
        day.b_flight_stock = b_flight;
        day.a_profit = out.profit_a;
        day.b_profit = out.profit_b;
        day.a_residual =
            (a_hotel * hotel.cost + a_flight * flight.cost) * day.decay;
        day.b_residual =
            (b_hotel * hotel.cost + b_flight * flight.cost) * day.decay;

        out.trace.push_back(day);
    }

    out.gain = out.profit_b - out.profit_a;
    return out;
}

double SalesSimulator::standaloneProfit(
    const SimulationLeg& leg,
    int horizon_days
) const {
    int stock = std::max(leg.stock, 0);
    PaceStream stream{leg.pace};
    double profit = 0.0;

    for (int t = std::max(horizon_days, 0); t >= 1; --t) {
        int sold = stream.draw(stock);
        stock -= sold;
        profit += sold * leg.margin();
    }
    return profit - stock * leg.cost;
}

}
