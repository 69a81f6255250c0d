#include "SeatInitializer.h"
#include "seatbook/errors.hpp"
#include "seatbook/log.hpp"

#include <algorithm>

namespace seatbook {

SeatInitializer::SeatInitializer(SeatDatabase& db, int seat_price)
    : database_(db), seat_price_(seat_price) {}

int SeatInitializer::ensureSeats(EventId event_id, int capacity) {
    try {
        SeatDatabase::Transaction tx(database_);
        int generated = ensureSeats(tx, event_id, capacity);
        tx.commit();
        return generated;
    } catch (const StoreError& e) {
        log::error("initializer", "Failed to initialize seats",
                   {{"event_id", event_id}, {"capacity", capacity}, {"reason", e.what()}});
        throw ReservationError::internal("Failed to initialize seats");
    }
}

int SeatInitializer::ensureSeats(SeatDatabase::Transaction& tx, EventId event_id, int capacity) {
    if (capacity < 1) {
        throw ReservationError::invalidInput("Total seats must be a positive integer");
    }
    if (!database_.findEvent(tx, event_id)) {
        throw ReservationError::notFound("Event not found");
    }

    // The grid never holds more than kMaxSeats
    const int target = std::min(capacity, kMaxSeats);
    int existing = database_.countSeats(tx, event_id);
    if (existing >= target) {
        log::info("initializer", "Seats already initialized",
                  {{"event_id", event_id}, {"existing", existing}, {"capacity", capacity}});
        return 0;
    }

    // Clear existing seats, then regenerate the whole layout
    int cleared = database_.deleteSeats(tx, event_id);
    if (cleared > 0) {
        log::warn("initializer", "Cleared existing seats",
                  {{"event_id", event_id}, {"cleared", cleared}});
    }

    std::vector<Seat> seats = buildSeats(event_id, target);
    database_.insertSeats(tx, seats);

    log::info("initializer", "Seats initialized",
              {{"event_id", event_id}, {"seats", seats.size()}});
    return static_cast<int>(seats.size());
}

std::vector<std::string> SeatInitializer::seatLayout(int capacity) {
    std::vector<std::string> ids;
    int total = std::min(std::max(capacity, 0), kMaxSeats);
    ids.reserve(total);

    for (int row = 0; row < kSeatRows && static_cast<int>(ids.size()) < total; ++row) {
        for (int col = 1; col <= kSeatColumns && static_cast<int>(ids.size()) < total; ++col) {
            ids.push_back(std::string(1, static_cast<char>('A' + row)) + std::to_string(col));
        }
    }
    return ids;
}

std::vector<Seat> SeatInitializer::buildSeats(EventId event_id, int capacity) const {
    std::vector<Seat> seats;
    for (const auto& id : seatLayout(capacity)) {
        Seat seat;
        seat.event_id = event_id;
        seat.seat_id = id;
        seat.row = id.substr(0, 1);
        seat.column = std::stoi(id.substr(1));
        seat.price = seat_price_;
        seats.push_back(seat);
    }
    return seats;
}

} // namespace seatbook
