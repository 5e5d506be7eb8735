#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace yieldcraft {

using Date = boost::gregorian::date;
using Timestamp = boost::posix_time::ptime;

enum class UnitKind : uint8_t {
    Hotel = 1,
    Flight = 2
};

enum class Scenario : uint8_t {
    Pessimistic = 0,
    Base = 1,
    Optimistic = 2
};

enum class Availability : uint8_t {
    SoldOut,
    LastFew,
    Limited,
    Available
};

const char* toString(UnitKind kind);
const char* toString(Scenario scenario);
const char* toString(Availability availability);

std::optional<UnitKind> parseUnitKind(const std::string& text);
std::optional<Scenario> parseScenario(const std::string& text);

// Empty = no bookings in the window (NoSignal). Not the same as a ratio of 0.
using VelocityRatio = std::optional<double>;

struct InventoryUnit {
    uint64_t id = 0;
    UnitKind kind = UnitKind::Hotel;
    std::string name;
    int total_stock = 0;
    int remaining_stock = 0;
    double base_price = 0.0;
    double elasticity = -1.5;
    std::optional<Date> departure_date;
    std::optional<Date> procurement_date;
    std::optional<double> unit_cost;

    // 0 when total_stock is 0.
    double remainingRatio() const;

    // Whole days from the reference date to departure; empty when departure is unset.
    std::optional<int> leadDays(const Timestamp& reference) const;

    // Days from procurement to departure, when both dates are known.
    std::optional<int> horizonDays() const;

    double costOr(double cost_ratio) const;
    Availability availability() const;
};

// Append-only sale record.
struct BookingEvent {
    uint64_t unit_id = 0;
    std::optional<uint64_t> partner_id;
    Timestamp booked_at;
    int quantity = 1;
    double sold_price = 0.0;
    double base_price_at_sale = 0.0;
    bool is_bundle = false;
    double discount_amount = 0.0;
};

int wholeDaysBetween(const Date& from, const Date& to);

}
