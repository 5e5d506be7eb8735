#include "yieldcraft/pricing/PricingCalculator.hpp"

#include <algorithm>
#include <cmath>

#include "yieldcraft/core/Format.hpp"

namespace yieldcraft {

namespace {

// === SCARCITY BANDS (remaining / total) ===
struct Scarcity {
    static constexpr double PREMIUM_BELOW = 0.20;
    static constexpr double PRESSURE_BELOW = 0.50;
    static constexpr double STANDARD_BELOW = 0.70;

    static constexpr double PREMIUM_PCT = 0.30;
    static constexpr double PRESSURE_PCT = 0.10;
    static constexpr double SURPLUS_PCT = -0.15;
};

// === LEAD-TIME BANDS (days to departure) ===
struct LeadTime {
    static constexpr int LAST_MINUTE_MAX = 7;
    static constexpr int PEAK_MAX = 30;
    static constexpr int STANDARD_MAX = 90;

    static constexpr double LAST_MINUTE_PCT = -0.15;
    static constexpr double PEAK_PCT = 0.10;
    static constexpr double EARLY_BIRD_PCT = -0.10;
};

int wholePercent(double ratio) {
    return static_cast<int>(ratio * 100.0 + 1e-9);
}

std::string withAmount(const std::string& text, double amount) {
    return text + " (" + formatSignedAmount(amount) + ")";
}

}

const char* toString(PricingStrategy strategy) {
    switch (strategy) {
        case PricingStrategy::RuleBased:        return "rule_based";
        case PricingStrategy::DemandElasticity: return "demand_elasticity";
    }
    return "unknown";
}

std::optional<PricingStrategy> parsePricingStrategy(const std::string& text) {
    if (text == "rule" || text == "rule_based") return PricingStrategy::RuleBased;
    if (text == "elasticity" || text == "demand_elasticity") return PricingStrategy::DemandElasticity;
    return std::nullopt;
}

const char* toString(StepKind kind) {
    switch (kind) {
        case StepKind::Absolute: return "absolute";
        case StepKind::Relative: return "relative";
        case StepKind::Total:    return "total";
    }
    return "unknown";
}

double PricingResult::factorAmount(const std::string& label) const {
    const PriceFactor* f = factor(label);
    return f ? f->amount : 0.0;
}

const PriceFactor* PricingResult::factor(const std::string& label) const {
    for (const auto& f : factors) {
        if (f.label == label) return &f;
    }
    return nullptr;
}

PricingCalculator::PricingCalculator(
    const InventoryRepository& repo,
    const EngineConfig& cfg
) : config(cfg),
    signal(repo, cfg),
    forecaster(repo, cfg),
    decay(cfg.decay_steepness, cfg.decay_midpoint) {}

double PricingCalculator::minPrice(double base_price) const {
    return base_price * (1.0 - config.max_discount_pct);
}

double PricingCalculator::maxPrice(double base_price) const {
    return base_price * (1.0 + config.max_markup_pct);
}

PricingResult PricingCalculator::price(
    const InventoryUnit& unit,
    const Timestamp& reference,
    PricingStrategy strategy
) const {
    std::optional<int> lead = unit.leadDays(reference);

    switch (strategy) {
        case PricingStrategy::RuleBased:
            return priceRuleBased(
                unit,
                lead,
                signal.ratioFor(unit, reference)
            );
        case PricingStrategy::DemandElasticity: {
            PricingResult r = priceElasticity(
                unit,
                lead,
                currentPace(unit, reference),
                unit.horizonDays().value_or(config.default_horizon_days)
            );
            r.velocity_ratio = signal.ratioFor(unit, reference);
            return r;
        }
    }
    return priceRuleBased(unit, lead, std::nullopt);
}

PriceFactor PricingCalculator::scarcityFactor(
    double base_price,
    double inventory_ratio
) const {
    PriceFactor f;
    f.label = "scarcity";

    std::string prefix =
        "Remaining stock " + std::to_string(wholePercent(inventory_ratio)) + "%: ";

    if (inventory_ratio < Scarcity::PREMIUM_BELOW) {
        f.amount = std::round(base_price * Scarcity::PREMIUM_PCT);
        f.reason = withAmount(prefix + "scarcity premium", f.amount);
    } else if (inventory_ratio < Scarcity::PRESSURE_BELOW) {
        f.amount = std::round(base_price * Scarcity::PRESSURE_PCT);
        f.reason = withAmount(prefix + "demand pressure markup", f.amount);
    } else if (inventory_ratio < Scarcity::STANDARD_BELOW) {
        f.amount = 0.0;
        f.reason = prefix + "standard price, no adjustment";
    } else {
        f.amount = std::round(base_price * Scarcity::SURPLUS_PCT);
        f.reason = withAmount(prefix + "surplus discount", f.amount);
    }
    return f;
}

PriceFactor PricingCalculator::leadTimeFactor(
    double base_price,
    std::optional<int> lead_days
) const {
    PriceFactor f;
    f.label = "lead_time";

    if (!lead_days) {
        f.applicable = false;
        f.reason = "Departure date not set: lead-time adjustment not applicable";
        return f;
    }

    int d = *lead_days;
    std::string prefix = std::to_string(d) + " days to departure: ";

    if (d < 0) {
        f.amount = 0.0;
        f.reason = "Already departed: outside the pricing window";
    } else if (d <= LeadTime::LAST_MINUTE_MAX) {
        f.amount = std::round(base_price * LeadTime::LAST_MINUTE_PCT);
        f.reason = withAmount(prefix + "last-minute discount", f.amount);
    } else if (d <= LeadTime::PEAK_MAX) {
        f.amount = std::round(base_price * LeadTime::PEAK_PCT);
        f.reason = withAmount(prefix + "peak-decision markup", f.amount);
    } else if (d <= LeadTime::STANDARD_MAX) {
        f.amount = 0.0;
        f.reason = prefix + "standard price, no adjustment";
    } else {
        f.amount = std::round(base_price * LeadTime::EARLY_BIRD_PCT);
        f.reason = withAmount(prefix + "early-bird discount", f.amount);
    }
    return f;
}

PriceFactor PricingCalculator::velocityFactor(
    double base_price,
    VelocityRatio velocity_ratio
) const {
    PriceFactor f;
    f.label = "velocity_brake";

    if (!velocity_ratio) {
        f.applicable = false;
        f.reason = "Sales velocity: insufficient data, no brake";
        return f;
    }

    std::string pace = "Sales pace " + formatFixed(*velocity_ratio, 1) + "x plan";
    if (*velocity_ratio >= config.brake_threshold) {
        f.engaged = true;
        f.amount = std::round(base_price * config.brake_strength_pct);
        f.reason = withAmount(pace + ": automatic price brake engaged", f.amount);
    } else {
        f.amount = 0.0;
        f.reason = pace + ": pace normal, no brake";
    }
    return f;
}

PricingResult PricingCalculator::priceRuleBased(
    const InventoryUnit& unit,
    std::optional<int> lead_days,
    VelocityRatio velocity_ratio
) const {
    PricingResult r;
    r.unit_id = unit.id;
    r.name = unit.name;
    r.strategy = PricingStrategy::RuleBased;
    r.base_price = unit.base_price;
    r.inventory_ratio = unit.remainingRatio();
    r.lead_days = lead_days;
    r.velocity_ratio = velocity_ratio;

    r.factors.push_back(scarcityFactor(unit.base_price, r.inventory_ratio));
    r.factors.push_back(leadTimeFactor(unit.base_price, lead_days));

    PriceFactor brake = velocityFactor(unit.base_price, velocity_ratio);
    r.is_brake_active = brake.engaged;
    r.factors.push_back(brake);

    finalize(r);
    return r;
}

PricingResult PricingCalculator::priceElasticity(
    const InventoryUnit& unit,
    std::optional<int> lead_days,
    double current_pace,
    int horizon_days
) const {
    PricingResult r;
    r.unit_id = unit.id;
    r.name = unit.name;
    r.strategy = PricingStrategy::DemandElasticity;
    r.base_price = unit.base_price;
    r.inventory_ratio = unit.remainingRatio();
    r.lead_days = lead_days;

    PriceFactor demand;
    demand.label = "demand_elasticity";
    double multiplier = 1.0;

    if (!lead_days) {
        demand.applicable = false;
        demand.reason = "Departure date not set: demand elasticity not applicable";
    } else if (unit.elasticity >= 0.0) {
        demand.applicable = false;
        demand.reason = "Elasticity coefficient " + formatFixed(unit.elasticity, 2) +
                        " is not negative: demand adjustment skipped";
    } else if (current_pace <= 0.0) {
        demand.applicable = false;
        demand.reason = "No current sales pace: demand adjustment skipped";
    } else {
        double target_pace =
            static_cast<double>(unit.remaining_stock) / std::max(*lead_days, 1);
        double pace_ratio = std::clamp(
            target_pace / current_pace,
            config.elasticity_pace_floor,
            config.elasticity_pace_cap
        );
        multiplier = std::pow(pace_ratio, 1.0 / unit.elasticity);
        demand.amount = std::round(unit.base_price * (multiplier - 1.0));
        demand.reason = withAmount(
            "Target pace " + formatFixed(target_pace, 2) + "/day vs current " +
            formatFixed(current_pace, 2) + "/day: demand multiplier " +
            formatFixed(multiplier, 2),
            demand.amount
        );
    }
    r.factors.push_back(demand);

    PriceFactor cliff;
    cliff.label = "decay";
    if (!lead_days) {
        cliff.applicable = false;
        cliff.reason = "Departure date not set: decay not applicable";
    } else {
        double d = decay.forLeadDays(*lead_days, horizon_days);
        cliff.amount = std::round(unit.base_price * multiplier * (d - 1.0));
        if (*lead_days <= 0) {
            cliff.reason = withAmount("Departed: residual value collapsed", cliff.amount);
        } else {
            cliff.reason = withAmount(
                "Decay factor " + formatFixed(d, 3) + " with " +
                std::to_string(*lead_days) + " of " + std::to_string(horizon_days) +
                " days left",
                cliff.amount
            );
        }
    }
    r.factors.push_back(cliff);

    finalize(r);
    return r;
}

double PricingCalculator::currentPace(
    const InventoryUnit& unit,
    const Timestamp& reference
) const {
    std::optional<int> lead = unit.leadDays(reference);

    PaceSource source = PaceSource::Theoretical;
    double pace = forecaster.baselinePace(
        unit.id,
        unit.total_stock,
        lead,
        reference,
        source
    ) * config.scenarios.of(Scenario::Base);

    if (source == PaceSource::RecentEvents) return pace;

    if (unit.procurement_date) {
        int age = wholeDaysBetween(*unit.procurement_date, reference.date());
        int sold = unit.total_stock - unit.remaining_stock;
        if (age > 0 && sold > 0) {
            return static_cast<double>(sold) / age;
        }
    }
    return pace;
}

void PricingCalculator::finalize(PricingResult& r) const {
    double theoretical = r.base_price;
    for (const auto& f : r.factors) {
        theoretical += f.amount;
    }
    r.theoretical_price = theoretical;

    double rounded = roundToUnit(theoretical, config.price_unit);
    r.final_price = std::clamp(
        rounded,
        minPrice(r.base_price),
        maxPrice(r.base_price)
    );

    r.justification.clear();
    for (const auto& f : r.factors) {
        r.justification += f.reason + ". ";
    }
    if (!r.justification.empty()) r.justification.pop_back();

    r.waterfall.clear();
    r.waterfall.push_back({"base_price", r.base_price, StepKind::Absolute});
    for (const auto& f : r.factors) {
        r.waterfall.push_back({f.label, f.amount, StepKind::Relative});
    }
    r.waterfall.push_back({"final_price", r.final_price, StepKind::Total});
}

}
