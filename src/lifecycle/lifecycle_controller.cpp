#include "seatbook/lifecycle/lifecycle_controller.hpp"
#include "seatbook/errors.hpp"
#include "seatbook/log.hpp"
#include "seatbook/notify/notifier.hpp"

#include "db_core/SeatDatabase.h"

#include <optional>

namespace seatbook {

LifecycleController::LifecycleController(SeatDatabase& db, INotifier& notifier)
    : db_(db), notifier_(notifier) {}

CloseSummary LifecycleController::closeRegistration(EventId event_id, const Requester& requester) {
    if (!requester.is_admin) {
        log::warn("lifecycle", "Admin access denied",
                  {{"event_id", event_id}, {"user_id", requester.user_id}});
        throw ReservationError::forbidden("Forbidden: Admin access required");
    }

    CloseSummary summary;
    try {
        std::optional<Event> event;
        {
            SeatDatabase::Transaction tx(db_, SeatDatabase::Transaction::Mode::Read);
            event = db_.findEvent(tx, event_id);
            tx.commit();
        }
        if (!event) {
            throw ReservationError::notFound("Event not found");
        }
        if (event->registration_closed) {
            throw ReservationError::conflict("Registration is already closed");
        }

        if (!db_.markRegistrationClosed(event_id)) {
            // closed by a concurrent request in between
            throw ReservationError::conflict("Registration is already closed");
        }
        event->registration_closed = true;
        summary.event = *event;
    } catch (const StoreError& e) {
        log::error("lifecycle", "End registration failed",
                   {{"event_id", event_id}, {"reason", e.what()}});
        throw ReservationError::internal("Failed to end registration");
    }

    // The close has committed; from here on failures are reported, not raised
    try {
        SeatDatabase::Transaction tx(db_, SeatDatabase::Transaction::Mode::Read);
        summary.roster = db_.bookingRoster(tx, event_id, summary.event.date);
        tx.commit();
    } catch (const StoreError& e) {
        log::error("lifecycle", "Failed to read booking roster, notifications skipped",
                   {{"event_id", event_id}, {"reason", e.what()}});
        ++summary.notifications_failed;
        return summary;
    }

    log::info("lifecycle", "Registration closed",
              {{"event_id", event_id}, {"booking_count", summary.roster.size()}});

    for (const auto& row : summary.roster) {
        try {
            notifier_.notifyBookingConfirmed(row.email, {row.seat_id}, row.name, summary.event.date);
            ++summary.notifications_sent;
        } catch (const std::exception& e) {
            ++summary.notifications_failed;
            log::error("lifecycle", "Failed to send confirmation",
                       {{"email", row.email}, {"seat_id", row.seat_id}, {"reason", e.what()}});
        }
    }

    try {
        notifier_.notifyRosterReady(summary.event, summary.roster);
        ++summary.notifications_sent;
    } catch (const std::exception& e) {
        ++summary.notifications_failed;
        log::error("lifecycle", "Failed to send booking roster",
                   {{"event_id", event_id}, {"reason", e.what()}});
    }

    return summary;
}

} // namespace seatbook
