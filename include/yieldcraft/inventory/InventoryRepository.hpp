#pragma once

#include <vector>

#include "yieldcraft/core/Types.hpp"

namespace yieldcraft {

// Read-only inventory snapshot plus the append-only booking log.
// Injected into every component; nothing in the engine reaches a store any other way.
class InventoryRepository {
public:
    virtual ~InventoryRepository() = default;

    virtual std::vector<InventoryUnit> fetchSnapshot(const Timestamp& as_of) const = 0;

    // Sum of event quantities for unit_id with from <= booked_at <= to.
    virtual int sumQuantity(uint64_t unit_id, const Timestamp& from, const Timestamp& to) const = 0;

    virtual std::vector<BookingEvent> eventsBetween(const Timestamp& from, const Timestamp& to) const = 0;

    virtual void append(const BookingEvent& event) = 0;
};

}
