#include "yieldcraft/bundle/BundleOptimizer.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

#include "yieldcraft/core/Format.hpp"

namespace yieldcraft {

namespace {

struct Eligible {
    const InventoryUnit* unit = nullptr;
    SimulationLeg leg;
    int lead_days = 0;
    double standalone_profit = 0.0;
};

struct BestPartner {
    const Eligible* hotel = nullptr;
    const Eligible* flight = nullptr;
    SimulationResult sim;
};

}

BundleOptimizer::BundleOptimizer(
    const InventoryRepository& repo,
    const EngineConfig& cfg
) : config(cfg),
    simulator(repo, cfg) {}

double BundleOptimizer::pairDiscount(
    double hotel_price,
    double flight_price
) const {
    return roundToUnit(
        config.bundle_discount_rate * (hotel_price + flight_price),
        config.price_unit
    );
}

OptimizationReport BundleOptimizer::recommend(
    const std::vector<InventoryUnit>& units,
    Scenario scenario,
    const Timestamp& reference
) const {
    OptimizationReport report;
    report.scenario = scenario;

    // Id order makes the pass independent of input order.
    std::vector<const InventoryUnit*> ordered;
    ordered.reserve(units.size());
    for (const auto& u : units) ordered.push_back(&u);
    std::sort(
        ordered.begin(),
        ordered.end(),
        [](const InventoryUnit* a, const InventoryUnit* b) { return a->id < b->id; }
    );

    std::map<Date, std::vector<Eligible>> by_date;

    for (const InventoryUnit* u : ordered) {
        std::string reason;
        std::optional<int> lead = u->leadDays(reference);

        if (!u->departure_date) {
            reason = "no departure date";
        } else if (!lead || *lead <= 0) {
            reason = "already departed";
        } else if (u->remaining_stock <= 0) {
            reason = "sold out";
        }

        if (!reason.empty()) {
            std::cerr << "[OPTIMIZER] Excluded unit " << u->id
                      << " (" << u->name << "): " << reason << "\n";
            report.excluded.push_back({u->id, u->name, reason});
            continue;
        }

        Eligible e;
        e.unit = u;
        e.lead_days = *lead;
        try {
            e.leg = simulator.buildLeg(*u, scenario, reference);
        } catch (const std::exception& ex) {
            std::cerr << "[OPTIMIZER] Excluded unit " << u->id
                      << " (" << u->name << "): " << ex.what() << "\n";
            report.excluded.push_back({u->id, u->name, ex.what()});
            continue;
        }
        e.standalone_profit = simulator.standaloneProfit(e.leg, e.lead_days);
        report.standalone_total += e.standalone_profit;

        by_date[*u->departure_date].push_back(std::move(e));
    }

    // Best flight per hotel, same departure date only.
    std::vector<BestPartner> best;

    for (const auto& kv : by_date) {
        const std::vector<Eligible>& group = kv.second;

        for (const Eligible& h : group) {
            if (h.unit->kind != UnitKind::Hotel) continue;

            BestPartner bp;
            bp.hotel = &h;

            for (const Eligible& f : group) {
                if (f.unit->kind != UnitKind::Flight) continue;

                SimulationResult sim =
                    simulator.run(
                        h.leg,
                        f.leg,
                        pairDiscount(h.leg.price, f.leg.price),
                        h.lead_days,
                        scenario
                    );
                ++report.candidates;

                // Strict > keeps the lower flight id on ties.
                if (!bp.flight || sim.gain > bp.sim.gain) {
                    bp.flight = &f;
                    bp.sim = std::move(sim);
                }
            }

            if (bp.flight) best.push_back(std::move(bp));
        }
    }

    std::stable_sort(
        best.begin(),
        best.end(),
        [](const BestPartner& a, const BestPartner& b) {
            if (a.sim.gain != b.sim.gain) return a.sim.gain > b.sim.gain;
            return a.hotel->unit->id < b.hotel->unit->id;
        }
    );

    std::set<uint64_t> claimed;
    double assigned_gain = 0.0;

    for (const BestPartner& bp : best) {
        uint64_t flight_id = bp.flight->unit->id;
        if (claimed.count(flight_id)) continue;
        if (bp.sim.gain <= config.bundle_gain_threshold) continue;

        claimed.insert(flight_id);
        claimed.insert(bp.hotel->unit->id);
        assigned_gain += bp.sim.gain;

        BundleRecommendation rec;
        rec.hotel_id = bp.hotel->unit->id;
        rec.flight_id = flight_id;
        rec.hotel_name = bp.hotel->unit->name;
        rec.flight_name = bp.flight->unit->name;
        rec.departure_date = *bp.hotel->unit->departure_date;
        rec.discount = bp.sim.discount;
        rec.gain = bp.sim.gain;
        rec.packages_sold = bp.sim.packages_sold;
        rec.profit_a = bp.sim.profit_a;
        rec.profit_b = bp.sim.profit_b;
        rec.reason =
            "Bundle " + rec.hotel_name + " with " + rec.flight_name +
            " at -" + formatAmount(rec.discount) + ": " +
            std::to_string(rec.packages_sold) + " packages, gain " +
            formatSignedAmount(rec.gain) + " over separate sales";

        std::cout << "[OPTIMIZER] Assigned hotel " << rec.hotel_id
                  << " + flight " << rec.flight_id
                  << " gain=" << formatSignedAmount(rec.gain) << "\n";

        report.recommendations.push_back(std::move(rec));
    }

    for (const auto& kv : by_date) {
        for (const Eligible& e : kv.second) {
            if (claimed.count(e.unit->id)) continue;

            StandaloneAdvice adv;
            adv.unit_id = e.unit->id;
            adv.kind = e.unit->kind;
            adv.name = e.unit->name;
            adv.expected_profit = e.standalone_profit;
            adv.advice = paceAdvice(e.leg, e.lead_days);
            report.standalone.push_back(std::move(adv));
        }
    }
    std::sort(
        report.standalone.begin(),
        report.standalone.end(),
        [](const StandaloneAdvice& a, const StandaloneAdvice& b) { return a.unit_id < b.unit_id; }
    );

    report.optimized_total = report.standalone_total + assigned_gain;
    report.uplift = report.optimized_total - report.standalone_total;

    std::cout << "[OPTIMIZER] " << toString(scenario) << ": "
              << report.candidates << " candidates, "
              << report.recommendations.size() << " bundles, uplift "
              << formatSignedAmount(report.uplift) << "\n";
    return report;
}

std::string BundleOptimizer::paceAdvice(
    const SimulationLeg& leg,
    int lead_days
) const {
    double expected_sales = leg.pace * std::max(lead_days, 0);

    if (leg.velocity_ratio && *leg.velocity_ratio >= config.brake_threshold) {
        return "Selling " + formatFixed(*leg.velocity_ratio, 1) +
               "x plan: hold price and sell standalone";
    }
    if (expected_sales >= leg.stock) {
        return "Pace " + formatFixed(leg.pace, 2) +
               "/day clears stock by departure: sell standalone";
    }
    int unsold = leg.stock - static_cast<int>(std::floor(expected_sales));
    return "Pace " + formatFixed(leg.pace, 2) + "/day leaves about " +
           std::to_string(unsold) + " unsold: consider a price cut or a later bundle";
}

}
