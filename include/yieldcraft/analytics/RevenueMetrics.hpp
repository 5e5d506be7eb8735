#pragma once

#include <vector>

#include "yieldcraft/core/Types.hpp"

namespace yieldcraft {

struct DailyRevenue {
    Date date;
    double dynamic_revenue = 0.0;
    double fixed_revenue = 0.0;
};

// Realized revenue against what the same sales would have brought at base price.
struct RoiSummary {
    double dynamic_revenue = 0.0;
    double fixed_revenue = 0.0;
    double lift = 0.0;
    double lift_pct = 0.0;        // 1 decimal, 0 when fixed revenue is 0
    int units_sold = 0;
    std::vector<DailyRevenue> daily;   // ascending by date
};

struct RescueSummary {
    double rescue_rate_pct = 0.0;
    int rescued_units = 0;
    int total_units = 0;
    double hotel_rescue_rate_pct = 0.0;
    int hotel_rescued_units = 0;
    int hotel_units = 0;
};

RoiSummary computeRoi(
    const std::vector<BookingEvent>& events
);

RescueSummary computeRescue(
    const std::vector<BookingEvent>& events,
    const std::vector<InventoryUnit>& units
);

}
