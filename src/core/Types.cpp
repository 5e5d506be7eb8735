#include "yieldcraft/core/Types.hpp"

namespace yieldcraft {

const char* toString(UnitKind kind) {
    switch (kind) {
        case UnitKind::Hotel:  return "hotel";
        case UnitKind::Flight: return "flight";
    }
    return "unknown";
}

const char* toString(Scenario scenario) {
    switch (scenario) {
        case Scenario::Pessimistic: return "pessimistic";
        case Scenario::Base:        return "base";
        case Scenario::Optimistic:  return "optimistic";
    }
    return "unknown";
}

const char* toString(Availability availability) {
    switch (availability) {
        case Availability::SoldOut:   return "sold_out";
        case Availability::LastFew:   return "last_few";
        case Availability::Limited:   return "limited";
        case Availability::Available: return "available";
    }
    return "unknown";
}

std::optional<UnitKind> parseUnitKind(const std::string& text) {
    if (text == "hotel") return UnitKind::Hotel;
    if (text == "flight") return UnitKind::Flight;
    return std::nullopt;
}

std::optional<Scenario> parseScenario(const std::string& text) {
    if (text == "pessimistic") return Scenario::Pessimistic;
    if (text == "base") return Scenario::Base;
    if (text == "optimistic") return Scenario::Optimistic;
    return std::nullopt;
}

int wholeDaysBetween(const Date& from, const Date& to) {
    return static_cast<int>((to - from).days());
}

double InventoryUnit::remainingRatio() const {
    if (total_stock <= 0) return 0.0;
    return static_cast<double>(remaining_stock) / total_stock;
}

std::optional<int> InventoryUnit::leadDays(const Timestamp& reference) const {
    if (!departure_date) return std::nullopt;
    return wholeDaysBetween(reference.date(), *departure_date);
}

std::optional<int> InventoryUnit::horizonDays() const {
    if (!departure_date || !procurement_date) return std::nullopt;
    return wholeDaysBetween(*procurement_date, *departure_date);
}

double InventoryUnit::costOr(double cost_ratio) const {
    if (unit_cost) return *unit_cost;
    return base_price * cost_ratio;
}

Availability InventoryUnit::availability() const {
    if (remaining_stock <= 0) return Availability::SoldOut;
    double ratio = remainingRatio();
    if (ratio <= 0.10) return Availability::LastFew;
    if (ratio <= 0.30) return Availability::Limited;
    return Availability::Available;
}

}
