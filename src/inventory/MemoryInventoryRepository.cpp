#include "yieldcraft/inventory/MemoryInventoryRepository.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "yieldcraft/audit/EventJournal.hpp"

namespace yieldcraft {

MemoryInventoryRepository::MemoryInventoryRepository(
    std::vector<InventoryUnit> units,
    std::vector<BookingEvent> events
) : units_(std::move(units)),
    events_(std::move(events)) {}

void MemoryInventoryRepository::attachJournal(EventJournal* journal) {
    journal_ = journal;
}

void MemoryInventoryRepository::addUnit(const InventoryUnit& unit) {
    units_.push_back(unit);
}

void MemoryInventoryRepository::setRemaining(uint64_t unit_id, int remaining) {
    for (auto& u : units_) {
        if (u.id != unit_id) continue;
        u.remaining_stock = std::clamp(remaining, 0, std::max(u.total_stock, 0));
        return;
    }
    std::cerr << "[REPO] setRemaining: unknown unit " << unit_id << "\n";
}

std::vector<InventoryUnit> MemoryInventoryRepository::fetchSnapshot(const Timestamp&) const {
    return units_;
}

int MemoryInventoryRepository::sumQuantity(
    uint64_t unit_id,
    const Timestamp& from,
    const Timestamp& to
) const {
    int total = 0;
    for (const auto& e : events_) {
        if (e.unit_id != unit_id) continue;
        if (e.booked_at < from || e.booked_at > to) continue;
        total += e.quantity;
    }
    return total;
}

std::vector<BookingEvent> MemoryInventoryRepository::eventsBetween(
    const Timestamp& from,
    const Timestamp& to
) const {
    std::vector<BookingEvent> out;
    for (const auto& e : events_) {
        if (e.booked_at < from || e.booked_at > to) continue;
        out.push_back(e);
    }
    return out;
}

// Journal first: a failed write leaves memory unchanged.
void MemoryInventoryRepository::append(const BookingEvent& event) {
    if (journal_) {
        journal_->append(event);
    }
    events_.push_back(event);
}

}
