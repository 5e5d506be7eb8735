#include "TestFixtures.hpp"

#include <atomic>
#include <filesystem>

namespace yieldcraft {
namespace testing {

Timestamp referenceTime() {
    return Timestamp(
        Date(2026, 10, 19),
        boost::posix_time::hours(12)
    );
}

InventoryUnit makeUnit(
    uint64_t id,
    UnitKind kind,
    int total,
    int remaining,
    double base_price,
    std::optional<int> lead_days
) {
    InventoryUnit u;
    u.id = id;
    u.kind = kind;
    u.name = std::string(toString(kind)) + "-" + std::to_string(id);
    u.total_stock = total;
    u.remaining_stock = remaining;
    u.base_price = base_price;
    if (lead_days) {
        u.departure_date =
            referenceTime().date() + boost::gregorian::days(*lead_days);
    }
    return u;
}

InventoryUnit makeHotel(uint64_t id, int total, int remaining, double base_price,
                        std::optional<int> lead_days) {
    return makeUnit(id, UnitKind::Hotel, total, remaining, base_price, lead_days);
}

InventoryUnit makeFlight(uint64_t id, int total, int remaining, double base_price,
                         std::optional<int> lead_days) {
    return makeUnit(id, UnitKind::Flight, total, remaining, base_price, lead_days);
}

BookingEvent makeSale(
    uint64_t unit_id,
    int quantity,
    const Timestamp& booked_at,
    double sold_price
) {
    BookingEvent e;
    e.unit_id = unit_id;
    e.quantity = quantity;
    e.booked_at = booked_at;
    e.sold_price = sold_price;
    e.base_price_at_sale = sold_price;
    return e;
}

std::string tempPath(const std::string& stem) {
    static std::atomic<int> counter{0};
    std::filesystem::path p =
        std::filesystem::temp_directory_path() /
        ("yieldcraft_" + stem + "_" + std::to_string(counter++) + ".jsonl");
    std::filesystem::remove(p);
    return p.string();
}

}
}
