#include "yieldcraft/analytics/RevenueMetrics.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

#include "yieldcraft/core/Format.hpp"

namespace yieldcraft {

RoiSummary computeRoi(
    const std::vector<BookingEvent>& events
) {
    RoiSummary out;
    std::map<Date, DailyRevenue> days;

    for (const auto& e : events) {
        double dynamic = e.quantity * e.sold_price;
        double fixed = e.quantity * e.base_price_at_sale;

        out.dynamic_revenue += dynamic;
        out.fixed_revenue += fixed;
        out.units_sold += e.quantity;

        DailyRevenue& d = days[e.booked_at.date()];
        d.date = e.booked_at.date();
        d.dynamic_revenue += dynamic;
        d.fixed_revenue += fixed;
    }

    out.lift = out.dynamic_revenue - out.fixed_revenue;
    out.lift_pct =
        out.fixed_revenue > 0.0
            ? roundTo(out.lift / out.fixed_revenue * 100.0, 1)
            : 0.0;

    out.daily.reserve(days.size());
    for (const auto& kv : days) {
        out.daily.push_back(kv.second);
    }
    return out;
}

RescueSummary computeRescue(
    const std::vector<BookingEvent>& events,
    const std::vector<InventoryUnit>& units
) {
    std::unordered_set<uint64_t> hotels;
    for (const auto& u : units) {
        if (u.kind == UnitKind::Hotel) hotels.insert(u.id);
    }

    RescueSummary out;
    for (const auto& e : events) {
        bool is_hotel = hotels.count(e.unit_id) > 0;

        out.total_units += e.quantity;
        if (is_hotel) out.hotel_units += e.quantity;

        if (e.is_bundle) {
            out.rescued_units += e.quantity;
            if (is_hotel) out.hotel_rescued_units += e.quantity;
        }
    }

    out.rescue_rate_pct = roundTo(
        100.0 * out.rescued_units / std::max(out.total_units, 1),
        1
    );
    out.hotel_rescue_rate_pct = roundTo(
        100.0 * out.hotel_rescued_units / std::max(out.hotel_units, 1),
        1
    );
    return out;
}

}
