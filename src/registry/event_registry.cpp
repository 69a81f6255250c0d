#include "seatbook/registry/event_registry.hpp"
#include "seatbook/errors.hpp"
#include "seatbook/log.hpp"
#include "seatbook/TimeUtils.h"

#include "db_core/SeatDatabase.h"
#include "db_core/SeatInitializer.h"

#include <utility>

namespace seatbook {

EventRegistry::EventRegistry(SeatDatabase& db, SeatInitializer& initializer,
                             const ServiceConfig& config, DateSource today)
    : db_(db), initializer_(initializer), config_(config), today_(std::move(today)) {}

void EventRegistry::validate(const NewEvent& fields) const {
    if (fields.name.empty() || fields.date.empty() || fields.time.empty() ||
        fields.description.empty() || fields.venue.empty()) {
        throw ReservationError::invalidInput("All fields are required");
    }
    if (!TimeUtils::isIsoDate(fields.date)) {
        throw ReservationError::invalidInput("Invalid date format. Use YYYY-MM-DD");
    }
    if (!TimeUtils::isClockTime(fields.time)) {
        throw ReservationError::invalidInput("Invalid time format. Use HH:MM");
    }
    if (fields.total_seats < 1 || fields.total_seats > kMaxSeats) {
        throw ReservationError::invalidInput("Total seats must be between 1 and " +
                                             std::to_string(kMaxSeats));
    }
}

Event EventRegistry::createEvent(const NewEvent& fields) {
    validate(fields);

    if (config_.forbid_same_day && fields.date == today_()) {
        log::warn("registry", "Cannot create event for today", {{"date", fields.date}});
        throw ReservationError::invalidInput("Cannot create event for the current date");
    }

    try {
        SeatDatabase::Transaction tx(db_);

        if (db_.findEventByDate(tx, fields.date)) {
            log::warn("registry", "Event already exists for date", {{"date", fields.date}});
            throw ReservationError::conflict("An event already exists for this date");
        }

        EventId id = db_.insertEvent(tx, fields);
        initializer_.ensureSeats(tx, id, fields.total_seats);
        auto created = db_.findEvent(tx, id);
        tx.commit();

        log::info("registry", "Event created",
                  {{"event_id", id}, {"date", fields.date}, {"total_seats", fields.total_seats}});
        return *created;
    } catch (const StoreError& e) {
        if (e.isConstraintViolation()) {
            throw ReservationError::conflict("An event already exists for this date");
        }
        throw ReservationError::internal("Failed to create event");
    }
}

void EventRegistry::deleteEvent(EventId id) {
    try {
        SeatDatabase::Transaction tx(db_);

        if (!db_.findEvent(tx, id)) {
            throw ReservationError::notFound("Event not found");
        }
        if (db_.countBookings(tx, id) > 0) {
            log::warn("registry", "Cannot delete event with bookings", {{"event_id", id}});
            throw ReservationError::conflict("Cannot delete event with existing bookings");
        }

        int seats = db_.deleteSeats(tx, id);
        db_.deleteEvent(tx, id);
        tx.commit();

        log::info("registry", "Event and associated seats deleted",
                  {{"event_id", id}, {"seats", seats}});
    } catch (const StoreError&) {
        throw ReservationError::internal("Failed to delete event");
    }
}

Event EventRegistry::getEvent(EventId id) {
    std::optional<Event> event;
    try {
        SeatDatabase::Transaction tx(db_, SeatDatabase::Transaction::Mode::Read);
        event = db_.findEvent(tx, id);
        tx.commit();
    } catch (const StoreError&) {
        throw ReservationError::internal("Failed to fetch event details");
    }

    if (!event) {
        throw ReservationError::notFound("Event not found");
    }
    if (config_.forbid_same_day && event->date == today_()) {
        throw ReservationError::invalidInput("Cannot access event scheduled for today");
    }
    return *event;
}

int EventRegistry::ensureSeats(EventId id, int capacity) {
    try {
        SeatDatabase::Transaction tx(db_);

        if (!db_.findEvent(tx, id)) {
            throw ReservationError::notFound("Event not found");
        }
        const int seats = db_.countSeats(tx, id);
        if (capacity > seats && seats < kMaxSeats && db_.countBookings(tx, id) > 0) {
            log::warn("registry", "Cannot regenerate seats with existing bookings",
                      {{"event_id", id}, {"seats", seats}, {"capacity", capacity}});
            throw ReservationError::conflict("Cannot regenerate seats for an event with existing bookings");
        }

        int generated = initializer_.ensureSeats(tx, id, capacity);
        tx.commit();
        return generated;
    } catch (const StoreError&) {
        throw ReservationError::internal("Failed to initialize seats");
    }
}

std::vector<Event> EventRegistry::listUpcoming() {
    try {
        SeatDatabase::Transaction tx(db_, SeatDatabase::Transaction::Mode::Read);
        auto events = db_.listUpcomingEvents(tx, today_());
        tx.commit();
        return events;
    } catch (const StoreError&) {
        throw ReservationError::internal("Failed to fetch events");
    }
}

std::vector<Event> EventRegistry::listPast() {
    try {
        SeatDatabase::Transaction tx(db_, SeatDatabase::Transaction::Mode::Read);
        auto events = db_.listPastEvents(tx, today_());
        tx.commit();
        return events;
    } catch (const StoreError&) {
        throw ReservationError::internal("Failed to retrieve past events");
    }
}

std::vector<Event> EventRegistry::listRecent() {
    const std::string today = today_();
    const std::string since = TimeUtils::addDays(today, -config_.recent_window_days);
    try {
        SeatDatabase::Transaction tx(db_, SeatDatabase::Transaction::Mode::Read);
        auto events = db_.listRecentEvents(tx, today, since);
        tx.commit();
        return events;
    } catch (const StoreError&) {
        throw ReservationError::internal("Failed to retrieve recent events");
    }
}

std::vector<BookingRow> EventRegistry::eventBookings(EventId id) {
    std::vector<BookingRow> rows;
    try {
        SeatDatabase::Transaction tx(db_, SeatDatabase::Transaction::Mode::Read);
        auto event = db_.findEvent(tx, id);
        if (!event) {
            throw ReservationError::notFound("Event not found");
        }
        rows = db_.bookingRoster(tx, id, event->date);
        tx.commit();
    } catch (const StoreError&) {
        throw ReservationError::internal("Failed to fetch event bookings");
    }

    log::info("registry", "Event bookings fetched",
              {{"event_id", id}, {"booking_count", rows.size()}});
    return rows;
}

} // namespace seatbook
