#pragma once

#include <optional>

#include "yieldcraft/config/EngineConfig.hpp"
#include "yieldcraft/inventory/InventoryRepository.hpp"

namespace yieldcraft {

// Recent booking pace relative to the pace needed to reach the sell-through
// target by departure.
class VelocitySignal {
public:
    VelocitySignal(
        const InventoryRepository& repo,
        const EngineConfig& cfg
    );

    // Empty when the window holds no bookings, lead is unknown or <= 0, or the
    // expected pace is not positive. Rounded to 3 decimals.
    VelocityRatio ratio(
        uint64_t unit_id,
        int total_stock,
        int remaining_stock,
        std::optional<int> lead_days,
        const Timestamp& reference
    ) const;

    VelocityRatio ratio(
        uint64_t unit_id,
        int total_stock,
        int remaining_stock,
        std::optional<int> lead_days,
        const Timestamp& reference,
        int window_hours
    ) const;

    VelocityRatio ratioFor(
        const InventoryUnit& unit,
        const Timestamp& reference
    ) const;

private:
    const InventoryRepository& repository;
    EngineConfig config;
};

}
