#pragma once

#include <vector>

#include "yieldcraft/inventory/InventoryRepository.hpp"

namespace yieldcraft {

class EventJournal;

class MemoryInventoryRepository : public InventoryRepository {
public:
    MemoryInventoryRepository() = default;
    MemoryInventoryRepository(std::vector<InventoryUnit> units, std::vector<BookingEvent> events);

    // Appends are mirrored to the journal when one is attached. Not owned.
    void attachJournal(EventJournal* journal);

    void addUnit(const InventoryUnit& unit);
    void setRemaining(uint64_t unit_id, int remaining);

    std::vector<InventoryUnit> fetchSnapshot(const Timestamp& as_of) const override;
    int sumQuantity(uint64_t unit_id, const Timestamp& from, const Timestamp& to) const override;
    std::vector<BookingEvent> eventsBetween(const Timestamp& from, const Timestamp& to) const override;
    void append(const BookingEvent& event) override;

    const std::vector<BookingEvent>& allEvents() const { return events_; }
    size_t unitCount() const { return units_.size(); }

private:
    std::vector<InventoryUnit> units_;
    std::vector<BookingEvent> events_;
    EventJournal* journal_ = nullptr;
};

}
