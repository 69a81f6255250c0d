#include "SeatDatabase.h"
#include "DatabaseSchemas.h"
#include "seatbook/log.hpp"

#include <sqlite3.h>
#include <sstream>
#include <unordered_map>

namespace seatbook {

namespace {

[[noreturn]] void rethrow(const std::string& operation, const SQLite::Exception& e) {
    log::error("store", operation + " failed", {{"reason", e.what()}, {"code", e.getErrorCode()}});
    throw StoreError(operation + " failed: " + e.what(), e.getErrorCode());
}

std::string placeholders(std::size_t count) {
    std::ostringstream ss;
    for (std::size_t i = 0; i < count; ++i) {
        ss << (i == 0 ? "?" : ", ?");
    }
    return ss.str();
}

const char* kEventColumns =
    "id, name, date, time, description, venue, total_seats, registration_closed, created_at";

Event readEvent(SQLite::Statement& query) {
    Event event;
    event.id = query.getColumn(0).getInt64();
    event.name = query.getColumn(1).getString();
    event.date = query.getColumn(2).getString();
    event.time = query.getColumn(3).getString();
    event.description = query.getColumn(4).getString();
    event.venue = query.getColumn(5).getString();
    event.total_seats = query.getColumn(6).getInt();
    event.registration_closed = query.getColumn(7).getInt() != 0;
    event.created_at = query.getColumn(8).getString();
    return event;
}

std::vector<Event> readEvents(SQLite::Statement& query) {
    std::vector<Event> events;
    while (query.executeStep()) {
        events.push_back(readEvent(query));
    }
    return events;
}

Seat readSeat(SQLite::Statement& query) {
    Seat seat;
    seat.event_id = query.getColumn(0).getInt64();
    seat.seat_id = query.getColumn(1).getString();
    seat.row = query.getColumn(2).getString();
    seat.column = query.getColumn(3).getInt();
    seat.price = query.getColumn(4).getInt();
    return seat;
}

} // namespace

bool StoreError::isTransient() const {
    return result_code_ == SQLITE_BUSY || result_code_ == SQLITE_LOCKED;
}

bool StoreError::isConstraintViolation() const {
    return result_code_ == SQLITE_CONSTRAINT;
}

// ---------------------------------------------------------------------------
// Transaction

SeatDatabase::Transaction::Transaction(SeatDatabase& db, Mode mode)
    : db_(db), lock_(db.db_mutex_) {
    try {
        db_.database_->exec(mode == Mode::Write ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED");
        active_ = true;
    } catch (const SQLite::Exception& e) {
        rethrow("Begin transaction", e);
    }
}

SeatDatabase::Transaction::~Transaction() {
    if (!active_) return;
    try {
        db_.database_->exec("ROLLBACK");
    } catch (const SQLite::Exception& e) {
        log::error("store", "Rollback transaction failed", {{"reason", e.what()}});
    }
}

void SeatDatabase::Transaction::commit() {
    try {
        db_.database_->exec("COMMIT");
        active_ = false;
    } catch (const SQLite::Exception& e) {
        rethrow("Commit transaction", e);
    }
}

// ---------------------------------------------------------------------------
// Connection / schema

SeatDatabase::SeatDatabase(const std::string& db_path, int busy_timeout_ms) : db_path_(db_path) {
    try {
        database_ = std::make_unique<SQLite::Database>(db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        database_->setBusyTimeout(busy_timeout_ms);
        database_->exec("PRAGMA foreign_keys = ON");
        log::info("store", "Database opened successfully", {{"path", db_path}});
    } catch (const SQLite::Exception& e) {
        rethrow("Open database " + db_path, e);
    }
}

bool SeatDatabase::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    bool success = createTables();
    if (success) {
        log::info("store", "Database initialized successfully");
    }
    return success;
}

bool SeatDatabase::createTables() {
    try {
        database_->exec(DatabaseSchemas::CREATE_EVENTS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_SEATS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_SEAT_BOOKINGS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_SEAT_BOOKINGS_INDEX);
        database_->exec(DatabaseSchemas::CREATE_REGISTRATION_TRIGGER);
        return true;
    } catch (const SQLite::Exception& e) {
        log::error("store", "Table creation failed", {{"reason", e.what()}});
        return false;
    }
}

// ---------------------------------------------------------------------------
// Events

EventId SeatDatabase::insertEvent(Transaction&, const NewEvent& event) {
    try {
        SQLite::Statement query(*database_,
            "INSERT INTO events (name, date, time, description, venue, total_seats, registration_closed) "
            "VALUES (?, ?, ?, ?, ?, ?, 0)");

        query.bind(1, event.name);
        query.bind(2, event.date);
        query.bind(3, event.time);
        query.bind(4, event.description);
        query.bind(5, event.venue);
        query.bind(6, event.total_seats);
        query.exec();

        return database_->getLastInsertRowid();
    } catch (const SQLite::Exception& e) {
        rethrow("Insert event", e);
    }
}

std::optional<Event> SeatDatabase::findEvent(Transaction&, EventId id) {
    try {
        SQLite::Statement query(*database_,
            std::string("SELECT ") + kEventColumns + " FROM events WHERE id = ?");
        query.bind(1, id);

        if (query.executeStep()) {
            return readEvent(query);
        }
        return std::nullopt;
    } catch (const SQLite::Exception& e) {
        rethrow("Find event", e);
    }
}

std::optional<Event> SeatDatabase::findEventByDate(Transaction&, const std::string& date) {
    try {
        SQLite::Statement query(*database_,
            std::string("SELECT ") + kEventColumns + " FROM events WHERE date = ?");
        query.bind(1, date);

        if (query.executeStep()) {
            return readEvent(query);
        }
        return std::nullopt;
    } catch (const SQLite::Exception& e) {
        rethrow("Find event by date", e);
    }
}

// date >= today and date != today, still open
std::vector<Event> SeatDatabase::listUpcomingEvents(Transaction&, const std::string& today) {
    try {
        SQLite::Statement query(*database_,
            std::string("SELECT ") + kEventColumns +
            " FROM events WHERE date > ? AND registration_closed = 0 ORDER BY date ASC");
        query.bind(1, today);
        return readEvents(query);
    } catch (const SQLite::Exception& e) {
        rethrow("List upcoming events", e);
    }
}

std::vector<Event> SeatDatabase::listPastEvents(Transaction&, const std::string& today) {
    try {
        SQLite::Statement query(*database_,
            std::string("SELECT ") + kEventColumns +
            " FROM events WHERE date < ? OR registration_closed = 1 ORDER BY date DESC");
        query.bind(1, today);
        return readEvents(query);
    } catch (const SQLite::Exception& e) {
        rethrow("List past events", e);
    }
}

std::vector<Event> SeatDatabase::listRecentEvents(Transaction&, const std::string& today,
                                                  const std::string& created_since) {
    try {
        SQLite::Statement query(*database_,
            std::string("SELECT ") + kEventColumns +
            " FROM events WHERE created_at >= ? AND date > ? AND registration_closed = 0"
            " ORDER BY created_at DESC, id DESC");
        query.bind(1, created_since);
        query.bind(2, today);
        return readEvents(query);
    } catch (const SQLite::Exception& e) {
        rethrow("List recent events", e);
    }
}

bool SeatDatabase::deleteEvent(Transaction&, EventId id) {
    try {
        SQLite::Statement query(*database_, "DELETE FROM events WHERE id = ?");
        query.bind(1, id);
        return query.exec() == 1;
    } catch (const SQLite::Exception& e) {
        rethrow("Delete event", e);
    }
}

bool SeatDatabase::markRegistrationClosed(EventId id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "UPDATE events SET registration_closed = 1 WHERE id = ? AND registration_closed = 0");
        query.bind(1, id);
        return query.exec() == 1;
    } catch (const SQLite::Exception& e) {
        rethrow("Close registration", e);
    }
}

// ---------------------------------------------------------------------------
// Seats

int SeatDatabase::countSeats(Transaction&, EventId event_id) {
    try {
        SQLite::Statement query(*database_, "SELECT COUNT(*) FROM seats WHERE event_id = ?");
        query.bind(1, event_id);
        return query.executeStep() ? query.getColumn(0).getInt() : 0;
    } catch (const SQLite::Exception& e) {
        rethrow("Count seats", e);
    }
}

// Drops the seats and their ledgers
int SeatDatabase::deleteSeats(Transaction&, EventId event_id) {
    try {
        SQLite::Statement bookings(*database_, "DELETE FROM seat_bookings WHERE event_id = ?");
        bookings.bind(1, event_id);
        bookings.exec();

        SQLite::Statement seats(*database_, "DELETE FROM seats WHERE event_id = ?");
        seats.bind(1, event_id);
        return seats.exec();
    } catch (const SQLite::Exception& e) {
        rethrow("Delete seats", e);
    }
}

void SeatDatabase::insertSeats(Transaction&, const std::vector<Seat>& seats) {
    try {
        SQLite::Statement query(*database_,
            "INSERT INTO seats (event_id, seat_id, row_letter, col, price) VALUES (?, ?, ?, ?, ?)");

        for (const auto& seat : seats) {
            query.bind(1, seat.event_id);
            query.bind(2, seat.seat_id);
            query.bind(3, seat.row);
            query.bind(4, seat.column);
            query.bind(5, seat.price);
            query.exec();
            query.reset();
        }
    } catch (const SQLite::Exception& e) {
        rethrow("Insert seats", e);
    }
}

std::vector<Seat> SeatDatabase::findSeats(Transaction&, EventId event_id,
                                          const std::vector<std::string>& seat_ids) {
    std::vector<Seat> seats;
    if (seat_ids.empty()) return seats;

    try {
        SQLite::Statement query(*database_,
            "SELECT event_id, seat_id, row_letter, col, price FROM seats "
            "WHERE event_id = ? AND seat_id IN (" + placeholders(seat_ids.size()) + ") "
            "ORDER BY row_letter, col");

        query.bind(1, event_id);
        int index = 2;
        for (const auto& id : seat_ids) {
            query.bind(index++, id);
        }

        while (query.executeStep()) {
            seats.push_back(readSeat(query));
        }
        attachBookings(seats);
    } catch (const SQLite::Exception& e) {
        rethrow("Find seats", e);
    }
    return seats;
}

std::vector<Seat> SeatDatabase::loadSeats(Transaction&, EventId event_id) {
    std::vector<Seat> seats;
    try {
        SQLite::Statement query(*database_,
            "SELECT event_id, seat_id, row_letter, col, price FROM seats "
            "WHERE event_id = ? ORDER BY row_letter, col");
        query.bind(1, event_id);

        while (query.executeStep()) {
            seats.push_back(readSeat(query));
        }
        attachBookings(seats);
    } catch (const SQLite::Exception& e) {
        rethrow("Load seats", e);
    }
    return seats;
}

// Fills each seat's ledger in insertion order; all seats share one event
void SeatDatabase::attachBookings(std::vector<Seat>& seats) {
    if (seats.empty()) return;

    std::unordered_map<std::string, Seat*> by_id;
    for (auto& seat : seats) {
        by_id[seat.seat_id] = &seat;
    }

    SQLite::Statement query(*database_,
        "SELECT seat_id, date, name, email, phone, status FROM seat_bookings "
        "WHERE event_id = ? ORDER BY booking_id");
    query.bind(1, seats.front().event_id);

    while (query.executeStep()) {
        auto it = by_id.find(query.getColumn(0).getString());
        if (it == by_id.end()) continue;

        BookingEntry entry;
        entry.date = query.getColumn(1).getString();
        entry.name = query.getColumn(2).getString();
        entry.email = query.getColumn(3).getString();
        entry.phone = query.getColumn(4).isNull() ? std::string() : query.getColumn(4).getString();
        entry.status = query.getColumn(5).getString();
        it->second->bookings.push_back(entry);
    }
}

// ---------------------------------------------------------------------------
// Booking ledger

int SeatDatabase::countBookings(Transaction&, EventId event_id) {
    try {
        SQLite::Statement query(*database_, "SELECT COUNT(*) FROM seat_bookings WHERE event_id = ?");
        query.bind(1, event_id);
        return query.executeStep() ? query.getColumn(0).getInt() : 0;
    } catch (const SQLite::Exception& e) {
        rethrow("Count bookings", e);
    }
}

void SeatDatabase::appendBooking(Transaction&, EventId event_id, const std::string& seat_id,
                                 const BookingEntry& entry) {
    try {
        SQLite::Statement query(*database_,
            "INSERT INTO seat_bookings (event_id, seat_id, date, name, email, phone, status) "
            "VALUES (?, ?, ?, ?, ?, ?, ?)");

        query.bind(1, event_id);
        query.bind(2, seat_id);
        query.bind(3, entry.date);
        query.bind(4, entry.name);
        query.bind(5, entry.email);
        if (entry.phone.empty()) {
            query.bind(6);
        } else {
            query.bind(6, entry.phone);
        }
        query.bind(7, entry.status);
        query.exec();
    } catch (const SQLite::Exception& e) {
        rethrow("Append booking", e);
    }
}

std::vector<BookingRow> SeatDatabase::bookingRoster(Transaction&, EventId event_id,
                                                    const std::string& date) {
    std::vector<BookingRow> rows;
    try {
        SQLite::Statement query(*database_, R"(
            SELECT b.seat_id, b.name, b.email, b.phone
            FROM seat_bookings b
            JOIN seats s ON s.event_id = b.event_id AND s.seat_id = b.seat_id
            WHERE b.event_id = ? AND b.date = ?
            ORDER BY s.row_letter, s.col
        )");
        query.bind(1, event_id);
        query.bind(2, date);

        while (query.executeStep()) {
            BookingRow row;
            row.seat_id = query.getColumn(0).getString();
            row.name = query.getColumn(1).getString();
            row.email = query.getColumn(2).getString();
            row.phone = query.getColumn(3).isNull() ? "N/A" : query.getColumn(3).getString();
            rows.push_back(row);
        }
    } catch (const SQLite::Exception& e) {
        rethrow("Read booking roster", e);
    }
    return rows;
}

} // namespace seatbook
