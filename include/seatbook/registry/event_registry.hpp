#pragma once
// Event metadata: creation with inventory, deletion, listings, roster

#include "seatbook/Config.h"
#include "seatbook/models.hpp"
#include <vector>

namespace seatbook {

class SeatDatabase;
class SeatInitializer;

class EventRegistry {
public:
    EventRegistry(SeatDatabase& db, SeatInitializer& initializer,
                  const ServiceConfig& config, DateSource today);

    // Event row and its seats are written in one transaction
    Event createEvent(const NewEvent& fields);

    // Refused once any seat carries a booking
    void deleteEvent(EventId id);

    Event getEvent(EventId id);

    // Tops up the seat grid to capacity. Refused with Conflict when seats
    // would be regenerated while bookings exist.
    int ensureSeats(EventId id, int capacity);

    std::vector<Event> listUpcoming();
    std::vector<Event> listPast();
    std::vector<Event> listRecent();

    // Bookings for the event's own date, row-major
    std::vector<BookingRow> eventBookings(EventId id);

private:
    void validate(const NewEvent& fields) const;

    SeatDatabase& db_;
    SeatInitializer& initializer_;
    ServiceConfig config_;
    DateSource today_;
};

} // namespace seatbook
