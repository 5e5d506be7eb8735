#include "yieldcraft/bundle/PackageCatalog.hpp"

#include <algorithm>
#include <unordered_map>

#include "yieldcraft/core/Format.hpp"

namespace yieldcraft {

const char* urgencyLabel(double urgency_score) {
    if (urgency_score >= 0.80) return "critical";
    if (urgency_score >= 0.60) return "high";
    if (urgency_score >= 0.40) return "moderate";
    return "low";
}

PackageCatalog::PackageCatalog(
    const InventoryRepository& repo,
    const EngineConfig& cfg
) : config(cfg),
    pricing(repo, cfg),
    scorer(cfg) {}

std::vector<BundlePackage> PackageCatalog::build(
    const std::vector<InventoryUnit>& units,
    const Timestamp& reference
) const {
    std::vector<const InventoryUnit*> flights;
    std::vector<const InventoryUnit*> hotels;
    std::unordered_map<uint64_t, PricingResult> priced;

    for (const auto& u : units) {
        switch (u.kind) {
            case UnitKind::Flight: flights.push_back(&u); break;
            case UnitKind::Hotel:  hotels.push_back(&u);  break;
        }
        priced.emplace(u.id, pricing.price(u, reference, PricingStrategy::RuleBased));
    }

    std::vector<BundlePackage> out;
    out.reserve(flights.size() * hotels.size());

    for (const InventoryUnit* f : flights) {
        const PricingResult& fp = priced.at(f->id);

        for (const InventoryUnit* h : hotels) {
            const PricingResult& hp = priced.at(h->id);

            BundlePackage pkg;
            pkg.flight_id = f->id;
            pkg.hotel_id = h->id;
            pkg.flight_name = f->name;
            pkg.hotel_name = h->name;
            pkg.flight_price = fp.final_price;
            pkg.hotel_price = hp.final_price;
            pkg.flight_velocity = fp.velocity_ratio;
            pkg.hotel_velocity = hp.velocity_ratio;

            pkg.urgency = scorer.urgencyFor(*h, reference);
            pkg.urgency_label = urgencyLabel(pkg.urgency);
            pkg.discount =
                scorer.bundleDiscount(
                    h->base_price,
                    hp.final_price,
                    pkg.urgency
                );
            pkg.final_price =
                pkg.flight_price +
                pkg.hotel_price +
                pkg.discount;
            pkg.strategy_score =
                scorer.strategyScore(
                    pkg.urgency,
                    f->remaining_stock,
                    f->total_stock
                );

            pkg.justification = justify(pkg);
            out.push_back(std::move(pkg));
        }
    }

    std::sort(
        out.begin(),
        out.end(),
        [](const BundlePackage& a, const BundlePackage& b) {
            if (a.strategy_score != b.strategy_score) return a.strategy_score > b.strategy_score;
            if (a.hotel_id != b.hotel_id) return a.hotel_id < b.hotel_id;
            return a.flight_id < b.flight_id;
        }
    );

    int rank = 1;
    for (auto& pkg : out) {
        pkg.rank = rank++;
    }
    return out;
}

std::string PackageCatalog::justify(
    const BundlePackage& pkg
) const {
    std::string text =
        "Hotel urgency " + formatFixed(pkg.urgency, 2) +
        " (" + pkg.urgency_label + ")";

    if (pkg.discount < 0.0) {
        text += ": bundle discount " + formatSignedAmount(pkg.discount) +
                " moves hotel stock with the flight";
    } else {
        text += ": no bundle discount needed";
    }

    if (pkg.flight_velocity && *pkg.flight_velocity >= config.brake_threshold) {
        text += ". Flight selling " + formatFixed(*pkg.flight_velocity, 1) +
                "x plan, package rides its demand";
    } else if (pkg.flight_velocity) {
        text += ". Flight pace " + formatFixed(*pkg.flight_velocity, 1) + "x plan";
    }

    if (pkg.hotel_velocity && *pkg.hotel_velocity < config.slow_pace_ratio) {
        text += ". Hotel pace slow at " + formatFixed(*pkg.hotel_velocity, 1) + "x plan";
    }
    return text + ".";
}

}
