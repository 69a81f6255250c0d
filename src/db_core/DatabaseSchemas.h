#ifndef SEATBOOK_DATABASE_SCHEMAS_H
#define SEATBOOK_DATABASE_SCHEMAS_H

#include <string>

namespace seatbook {
namespace DatabaseSchemas {
    // Events, one per calendar date
    const std::string CREATE_EVENTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            date TEXT NOT NULL UNIQUE,
            time TEXT NOT NULL,
            description TEXT NOT NULL,
            venue TEXT NOT NULL,
            total_seats INTEGER NOT NULL CHECK(total_seats >= 1),
            registration_closed INTEGER NOT NULL DEFAULT 0 CHECK(registration_closed IN (0, 1)),
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
    )";
    // Seat inventory per event
    const std::string CREATE_SEATS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS seats (
            event_id INTEGER NOT NULL,
            seat_id TEXT NOT NULL,
            row_letter TEXT NOT NULL,
            col INTEGER NOT NULL CHECK(col BETWEEN 1 AND 10),
            price INTEGER NOT NULL CHECK(price >= 0),
            PRIMARY KEY (event_id, seat_id),
            FOREIGN KEY (event_id) REFERENCES events(id)
        );
    )";
    // Booking ledger, at most one entry per seat and date
    const std::string CREATE_SEAT_BOOKINGS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS seat_bookings (
            booking_id INTEGER PRIMARY KEY AUTOINCREMENT,
            event_id INTEGER NOT NULL,
            seat_id TEXT NOT NULL,
            date TEXT NOT NULL,
            name TEXT NOT NULL,
            email TEXT NOT NULL,
            phone TEXT,
            status TEXT NOT NULL DEFAULT 'booked' CHECK(status IN ('booked')),
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
            FOREIGN KEY (event_id, seat_id) REFERENCES seats(event_id, seat_id),
            UNIQUE(event_id, seat_id, date)
        );
    )";
    const std::string CREATE_SEAT_BOOKINGS_INDEX = R"(
        CREATE INDEX IF NOT EXISTS idx_seat_bookings_event_date
            ON seat_bookings(event_id, date);
    )";
    // registration_closed is one-way
    const std::string CREATE_REGISTRATION_TRIGGER = R"(
        CREATE TRIGGER IF NOT EXISTS trg_events_registration_one_way
        BEFORE UPDATE OF registration_closed ON events
        WHEN OLD.registration_closed = 1 AND NEW.registration_closed = 0
        BEGIN
            SELECT RAISE(ABORT, 'registration cannot be reopened');
        END;
    )";
} // namespace DatabaseSchemas
} // namespace seatbook

#endif // SEATBOOK_DATABASE_SCHEMAS_H
