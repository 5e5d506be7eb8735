#include "yieldcraft/signal/VelocitySignal.hpp"

#include "yieldcraft/core/Format.hpp"

namespace yieldcraft {

VelocitySignal::VelocitySignal(
    const InventoryRepository& repo,
    const EngineConfig& cfg
) : repository(repo),
    config(cfg) {}

VelocityRatio VelocitySignal::ratio(
    uint64_t unit_id,
    int total_stock,
    int remaining_stock,
    std::optional<int> lead_days,
    const Timestamp& reference
) const {
    return ratio(
        unit_id,
        total_stock,
        remaining_stock,
        lead_days,
        reference,
        config.velocity_window_hours
    );
}

VelocityRatio VelocitySignal::ratio(
    uint64_t unit_id,
    int total_stock,
    int /*remaining_stock*/,
    std::optional<int> lead_days,
    const Timestamp& reference,
    int window_hours
) const {
    if (window_hours <= 0) return std::nullopt;

    const Timestamp from =
        reference - boost::posix_time::hours(window_hours);

    int in_window =
        repository.sumQuantity(unit_id, from, reference);

    if (in_window == 0) return std::nullopt;

    double actual_daily =
        in_window * (24.0 / window_hours);

    if (!lead_days || *lead_days <= 0) return std::nullopt;

    double expected_daily =
        total_stock * config.target_sell_ratio / *lead_days;

    if (expected_daily <= 0.0) return std::nullopt;

    return roundTo(actual_daily / expected_daily, 3);
}

VelocityRatio VelocitySignal::ratioFor(
    const InventoryUnit& unit,
    const Timestamp& reference
) const {
    return ratio(
        unit.id,
        unit.total_stock,
        unit.remaining_stock,
        unit.leadDays(reference),
        reference
    );
}

}
