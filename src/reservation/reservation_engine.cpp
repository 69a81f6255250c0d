#include "seatbook/reservation/reservation_engine.hpp"
#include "seatbook/errors.hpp"
#include "seatbook/log.hpp"
#include "seatbook/notify/notifier.hpp"
#include "seatbook/validation.hpp"

#include "db_core/SeatDatabase.h"
#include "db_core/SeatInitializer.h"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <thread>
#include <unordered_set>
#include <utility>

namespace seatbook {

namespace {

std::string joinIds(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

std::vector<std::string> batchSeatIds(const std::vector<BookingRequest>& batch) {
    std::vector<std::string> ids;
    ids.reserve(batch.size());
    for (const auto& request : batch) {
        ids.push_back(request.seat_id);
    }
    return ids;
}

// Seats that went missing before any booking existed are regenerated inside
// the booking transaction. Once bookings exist the inventory is left alone.
void recoverInventory(SeatDatabase& db, SeatInitializer& initializer,
                      SeatDatabase::Transaction& tx, const Event& event) {
    int seats = db.countSeats(tx, event.id);
    if (seats >= event.total_seats) return;

    if (db.countBookings(tx, event.id) > 0) {
        log::error("reservation", "Inventory below capacity with bookings present, not regenerating",
                   {{"event_id", event.id}, {"seats", seats}, {"capacity", event.total_seats}});
        return;
    }
    initializer.ensureSeats(tx, event.id, event.total_seats);
}

} // namespace

ReservationEngine::ReservationEngine(SeatDatabase& db, SeatInitializer& initializer,
                                     INotifier& notifier, const ServiceConfig& config,
                                     DateSource today)
    : db_(db), initializer_(initializer), notifier_(notifier),
      config_(config), today_(std::move(today)) {}

BookingOutcome ReservationEngine::book(EventId event_id, const std::vector<BookingRequest>& batch,
                                       const Requester& requester) {
    try {
        checkBatchShape(batch);
    } catch (const ReservationError& e) {
        log::warn("reservation", "Booking rejected", {{"event_id", event_id},
                  {"reason", e.what()}, {"code", errorCodeName(e.code())}});
        throw;
    }

    BookingOutcome outcome;
    for (int attempt = 1;; ++attempt) {
        try {
            outcome = commitBatch(event_id, batch, requester);
            outcome.attempts = attempt;
            break;
        } catch (const ReservationError& e) {
            log::warn("reservation", "Booking rejected", {{"event_id", event_id},
                      {"reason", e.what()}, {"code", errorCodeName(e.code())},
                      {"user_id", requester.user_id}});
            throw;
        } catch (const StoreError& e) {
            if (e.isTransient() && attempt <= config_.max_transaction_retries) {
                log::warn("reservation", "Transient store conflict, retrying",
                          {{"event_id", event_id}, {"attempt", attempt}});
                std::this_thread::sleep_for(
                    std::chrono::milliseconds(config_.retry_backoff_ms * attempt));
                continue;
            }
            log::error("reservation", "Book seats failed",
                       {{"event_id", event_id}, {"attempts", attempt}, {"reason", e.what()}});
            throw ReservationError::internal("Failed to book seats");
        }
    }

    log::info("reservation", "Seats booked", {{"event_id", event_id}, {"date", outcome.date},
              {"seats", batchSeatIds(batch)}, {"attempts", outcome.attempts}});

    dispatchConfirmations(outcome);
    return outcome;
}

// Checks that need no stored state
void ReservationEngine::checkBatchShape(const std::vector<BookingRequest>& batch) const {
    if (batch.empty()) {
        throw ReservationError::invalidInput("bookings array is required");
    }

    for (const auto& request : batch) {
        if (request.seat_id.empty() || request.name.empty() ||
            request.email.empty() || request.booking_date.empty()) {
            throw ReservationError::invalidInput(
                "seatId, name, email, and bookingDate are required for seat " +
                (request.seat_id.empty() ? std::string("unknown") : request.seat_id));
        }
        if (!isValidSeatId(request.seat_id)) {
            throw ReservationError::invalidInput("Invalid seatId format: " + request.seat_id);
        }
    }

    std::unordered_set<std::string> seen;
    for (const auto& request : batch) {
        if (!seen.insert(request.seat_id).second) {
            throw ReservationError::conflict("Duplicate seatIds provided", {request.seat_id});
        }
    }
}

BookingOutcome ReservationEngine::commitBatch(EventId event_id,
                                              const std::vector<BookingRequest>& batch,
                                              const Requester& requester) {
    SeatDatabase::Transaction tx(db_);

    auto event = db_.findEvent(tx, event_id);
    if (!event) {
        throw ReservationError::notFound("No event found for this eventId");
    }

    bool may_book_closed = requester.is_admin && config_.admin_override_after_close;
    if (event->registration_closed && !may_book_closed) {
        throw ReservationError::conflict("Registration for this event is closed");
    }

    for (const auto& request : batch) {
        if (request.booking_date != event->date) {
            throw ReservationError::invalidInput("All booking dates must match event date");
        }
    }

    if (config_.forbid_same_day && event->date == today_()) {
        throw ReservationError::invalidInput("Cannot book seats for the current date");
    }

    recoverInventory(db_, initializer_, tx, *event);

    const std::vector<std::string> seat_ids = batchSeatIds(batch);
    std::vector<Seat> seats = db_.findSeats(tx, event_id, seat_ids);
    if (seats.size() != seat_ids.size()) {
        std::vector<std::string> missing;
        for (const auto& id : seat_ids) {
            bool found = std::any_of(seats.begin(), seats.end(),
                                     [&id](const Seat& s) { return s.seat_id == id; });
            if (!found) missing.push_back(id);
        }
        throw ReservationError::notFound("Seats not found: " + joinIds(missing), missing);
    }

    // First conflict in batch order
    for (const auto& id : seat_ids) {
        auto seat = std::find_if(seats.begin(), seats.end(),
                                 [&id](const Seat& s) { return s.seat_id == id; });
        if (seat->bookingOn(event->date)) {
            throw ReservationError::conflict("Seat " + id + " is already booked for this date", {id});
        }
    }

    BookingOutcome outcome;
    outcome.event_id = event_id;
    outcome.date = event->date;

    for (const auto& request : batch) {
        BookingEntry entry;
        entry.date = request.booking_date;
        entry.name = request.name;
        entry.email = request.email;
        entry.phone = request.phone;
        db_.appendBooking(tx, event_id, request.seat_id, entry);

        auto seat = std::find_if(seats.begin(), seats.end(),
                                 [&request](const Seat& s) { return s.seat_id == request.seat_id; });
        seat->bookings.push_back(entry);

        auto group = std::find_if(outcome.groups.begin(), outcome.groups.end(),
                                  [&request](const ConfirmationGroup& g) { return g.email == request.email; });
        if (group == outcome.groups.end()) {
            outcome.groups.push_back({request.email, request.name, {}, event->date});
            group = std::prev(outcome.groups.end());
        }
        group->seat_ids.push_back(request.seat_id);
    }

    tx.commit();

    outcome.seats = std::move(seats);
    return outcome;
}

void ReservationEngine::dispatchConfirmations(const BookingOutcome& outcome) {
    for (const auto& group : outcome.groups) {
        try {
            notifier_.notifyBookingConfirmed(group.email, group.seat_ids, group.name, group.date);
        } catch (const std::exception& e) {
            log::error("reservation", "Failed to send booking confirmation",
                       {{"email", group.email}, {"seats", group.seat_ids}, {"reason", e.what()}});
        }
    }
}

std::vector<SeatAvailability> ReservationEngine::seatAvailability(const std::string& date) {
    return readAvailability(date, nullptr);
}

std::vector<SeatAvailability> ReservationEngine::seatAvailability(
    const std::string& date, const std::vector<std::string>& seat_ids) {
    if (seat_ids.empty()) {
        throw ReservationError::invalidInput("seatIds and date are required");
    }
    for (const auto& id : seat_ids) {
        if (!isValidSeatId(id)) {
            throw ReservationError::invalidInput("Invalid seatId format in: " + joinIds(seat_ids));
        }
    }
    return readAvailability(date, &seat_ids);
}

std::vector<SeatAvailability> ReservationEngine::readAvailability(
    const std::string& date, const std::vector<std::string>* seat_ids) {
    if (date.empty()) {
        throw ReservationError::invalidInput("Date is required");
    }
    if (config_.forbid_same_day && date == today_()) {
        throw ReservationError::invalidInput("Cannot fetch seats for the current date");
    }

    std::vector<Seat> seats;
    try {
        SeatDatabase::Transaction tx(db_, SeatDatabase::Transaction::Mode::Read);
        auto event = db_.findEventByDate(tx, date);
        if (!event) {
            throw ReservationError::notFound("No event scheduled for this date");
        }
        seats = seat_ids ? db_.findSeats(tx, event->id, *seat_ids) : db_.loadSeats(tx, event->id);
        tx.commit();

        if (seat_ids && seats.size() != seat_ids->size()) {
            throw ReservationError::notFound("Not all seats found for seatIds: " +
                                             joinIds(*seat_ids) + " and date: " + date);
        }
        if (!seat_ids && static_cast<int>(seats.size()) < event->total_seats) {
            log::warn("reservation", "Seat inventory below capacity",
                      {{"event_id", event->id}, {"seats", seats.size()},
                       {"capacity", event->total_seats}});
        }
    } catch (const StoreError&) {
        throw ReservationError::internal("Failed to fetch seats");
    }

    std::vector<SeatAvailability> result;
    result.reserve(seats.size());
    for (auto& seat : seats) {
        SeatAvailability view;
        const BookingEntry* booking = seat.bookingOn(date);
        view.booked = booking != nullptr;
        if (booking) view.booked_by = *booking;
        view.seat = std::move(seat);
        result.push_back(std::move(view));
    }
    return result;
}

} // namespace seatbook
