#ifndef SEATBOOK_SEAT_DATABASE_H
#define SEATBOOK_SEAT_DATABASE_H

#include <SQLiteCpp/SQLiteCpp.h>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "seatbook/models.hpp"

namespace seatbook {

// Storage failure; result_code is the SQLite primary result code
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& message, int result_code)
        : std::runtime_error(message), result_code_(result_code) {}

    int resultCode() const { return result_code_; }

    // SQLITE_BUSY / SQLITE_LOCKED: another writer held the database, safe to retry
    bool isTransient() const;

    // SQLITE_CONSTRAINT
    bool isConstraintViolation() const;

private:
    int result_code_;
};

class SeatDatabase {
public:
    explicit SeatDatabase(const std::string& db_path, int busy_timeout_ms = 5000);

    // Copying and assignment are prohibited
    SeatDatabase(const SeatDatabase&) = delete;
    SeatDatabase& operator=(const SeatDatabase&) = delete;

    /**
     * Scoped transaction. Holds the connection mutex for its whole lifetime,
     * so every statement issued with it is isolated from other threads.
     * Immediate mode takes SQLite's write lock up front (BEGIN IMMEDIATE),
     * which serializes writers across processes as well.
     * Rolls back on destruction unless commit() succeeded.
     */
    class Transaction {
    public:
        enum class Mode { Read, Write };

        explicit Transaction(SeatDatabase& db, Mode mode = Mode::Write);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        friend class SeatDatabase;
        SeatDatabase& db_;
        std::unique_lock<std::mutex> lock_;
        bool active_ = false;
    };

    // Create tables, indexes and triggers
    bool initialize();

    // Events
    EventId insertEvent(Transaction& tx, const NewEvent& event);
    std::optional<Event> findEvent(Transaction& tx, EventId id);
    std::optional<Event> findEventByDate(Transaction& tx, const std::string& date);
    std::vector<Event> listUpcomingEvents(Transaction& tx, const std::string& today);
    std::vector<Event> listPastEvents(Transaction& tx, const std::string& today);
    std::vector<Event> listRecentEvents(Transaction& tx, const std::string& today,
                                        const std::string& created_since);
    bool deleteEvent(Transaction& tx, EventId id);

    // Single conditional update, no transaction needed.
    // Returns false when the event was already closed or does not exist.
    bool markRegistrationClosed(EventId id);

    // Seats
    int countSeats(Transaction& tx, EventId event_id);
    int deleteSeats(Transaction& tx, EventId event_id);
    void insertSeats(Transaction& tx, const std::vector<Seat>& seats);
    std::vector<Seat> findSeats(Transaction& tx, EventId event_id,
                                const std::vector<std::string>& seat_ids);
    std::vector<Seat> loadSeats(Transaction& tx, EventId event_id);

    // Booking ledger
    int countBookings(Transaction& tx, EventId event_id);
    void appendBooking(Transaction& tx, EventId event_id, const std::string& seat_id,
                       const BookingEntry& entry);
    std::vector<BookingRow> bookingRoster(Transaction& tx, EventId event_id,
                                          const std::string& date);

    const std::string& path() const { return db_path_; }

private:
    std::string db_path_;
    std::unique_ptr<SQLite::Database> database_;
    std::mutex db_mutex_;

    bool createTables();
    void attachBookings(std::vector<Seat>& seats);
};

} // namespace seatbook

#endif // SEATBOOK_SEAT_DATABASE_H
