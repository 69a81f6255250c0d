#pragma once
// Core records: events, seats, per-date booking ledger, batch requests

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace seatbook {

using EventId = std::int64_t;

// Supplies the current calendar date as "YYYY-MM-DD"
using DateSource = std::function<std::string()>;

inline constexpr int kSeatRows = 26;     // A..Z
inline constexpr int kSeatColumns = 10;  // 1..10
inline constexpr int kMaxSeats = kSeatRows * kSeatColumns;

// Event (one per calendar date)
struct Event {
    EventId     id = 0;
    std::string name;
    std::string date;                  // YYYY-MM-DD, unique
    std::string time;                  // HH:MM
    std::string description;
    std::string venue;
    int         total_seats = 0;       // capacity
    bool        registration_closed = false;
    std::string created_at;            // store timestamp
};

// Fields accepted when creating an event
struct NewEvent {
    std::string name;
    std::string date;
    std::string time;
    std::string description;
    std::string venue;
    int         total_seats = 0;
};

// One occupant of one seat for one date
struct BookingEntry {
    std::string date;
    std::string name;
    std::string email;
    std::string phone;                 // optional, empty when absent
    std::string status = "booked";
};

struct Seat {
    EventId     event_id = 0;
    std::string seat_id;               // e.g. "A1"
    std::string row;                   // "A".."Z"
    int         column = 0;            // 1..10
    int         price = 0;
    std::vector<BookingEntry> bookings;

    // Ledger entry for a date, nullptr when the seat is free that day
    const BookingEntry* bookingOn(const std::string& date) const {
        for (const auto& b : bookings) {
            if (b.date == date) return &b;
        }
        return nullptr;
    }
};

// One element of a booking batch
struct BookingRequest {
    std::string seat_id;
    std::string name;
    std::string email;
    std::string phone;
    std::string booking_date;
};

// Identity resolved by the caller; the core never authenticates
struct Requester {
    bool        is_admin = false;
    std::string user_id;
};

// Flattened roster line
struct BookingRow {
    std::string seat_id;
    std::string name;
    std::string email;
    std::string phone;                 // "N/A" when the booking had none
};

// Seats booked by the same occupant email in one batch
struct ConfirmationGroup {
    std::string email;
    std::string name;
    std::vector<std::string> seat_ids;
    std::string date;
};

struct BookingOutcome {
    EventId     event_id = 0;
    std::string date;
    std::vector<Seat> seats;           // booked seats with their ledgers
    std::vector<ConfirmationGroup> groups;
    int         attempts = 0;
};

struct SeatAvailability {
    Seat seat;
    bool booked = false;
    std::optional<BookingEntry> booked_by;
};

struct CloseSummary {
    Event event;
    std::vector<BookingRow> roster;
    int notifications_sent = 0;
    int notifications_failed = 0;
};

} // namespace seatbook
