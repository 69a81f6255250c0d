#ifndef SEATBOOK_SEAT_INITIALIZER_H
#define SEATBOOK_SEAT_INITIALIZER_H

#include "SeatDatabase.h"
#include <string>
#include <vector>

namespace seatbook {

/**
 * Populates an event's seat inventory from its capacity.
 *
 * Layout is fixed: rows A..Z, columns 1..10, emitted row-major until
 * capacity seats exist (at most 260). When the event already has at least
 * capacity seats nothing happens; otherwise every seat of the event is
 * dropped, ledgers included, and the full layout is regenerated.
 * Only call it before any booking can exist for the event.
 */
class SeatInitializer {
public:
    explicit SeatInitializer(SeatDatabase& db, int seat_price = 200);

    // Opens its own write transaction. Returns the number of seats generated (0 = no-op).
    int ensureSeats(EventId event_id, int capacity);

    // Runs inside the caller's transaction
    int ensureSeats(SeatDatabase::Transaction& tx, EventId event_id, int capacity);

    // Seat ids in generation order for a capacity
    static std::vector<std::string> seatLayout(int capacity);

private:
    SeatDatabase& database_;
    int seat_price_;

    std::vector<Seat> buildSeats(EventId event_id, int capacity) const;
};

} // namespace seatbook

#endif // SEATBOOK_SEAT_INITIALIZER_H
