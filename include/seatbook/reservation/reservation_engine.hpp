#pragma once

#include "seatbook/Config.h"
#include "seatbook/models.hpp"
#include <string>
#include <vector>

namespace seatbook {

class INotifier;
class SeatDatabase;
class SeatInitializer;

/**
 * Books batches of seats for one event, all or nothing.
 *
 * A batch is checked for shape (seat ids, required fields, duplicates)
 * before the store is touched. Everything that depends on stored state
 * (event, registration flag, dates, seat existence, existing bookings) is
 * re-read and checked inside the same write transaction that appends the
 * booking entries, so two batches sharing a seat can never both commit it.
 *
 * Transient store contention is retried up to
 * ServiceConfig::max_transaction_retries times. Business rule failures are
 * reported immediately as ReservationError.
 *
 * After commit, booked seats are grouped by occupant email and handed to
 * the notifier. A failing notifier is logged and does not affect the result.
 */
class ReservationEngine {
public:
    ReservationEngine(SeatDatabase& db, SeatInitializer& initializer, INotifier& notifier,
                      const ServiceConfig& config, DateSource today);

    BookingOutcome book(EventId event_id, const std::vector<BookingRequest>& batch,
                        const Requester& requester);

    // Seat map of the event held on date. Read only, never regenerates seats.
    std::vector<SeatAvailability> seatAvailability(const std::string& date);
    std::vector<SeatAvailability> seatAvailability(const std::string& date,
                                                   const std::vector<std::string>& seat_ids);

private:
    void checkBatchShape(const std::vector<BookingRequest>& batch) const;
    BookingOutcome commitBatch(EventId event_id, const std::vector<BookingRequest>& batch,
                               const Requester& requester);
    void dispatchConfirmations(const BookingOutcome& outcome);
    std::vector<SeatAvailability> readAvailability(const std::string& date,
                                                   const std::vector<std::string>* seat_ids);

    SeatDatabase& db_;
    SeatInitializer& initializer_;
    INotifier& notifier_;
    ServiceConfig config_;
    DateSource today_;
};

} // namespace seatbook
