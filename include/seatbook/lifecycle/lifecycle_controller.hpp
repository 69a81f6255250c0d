#pragma once

#include "seatbook/models.hpp"

namespace seatbook {

class INotifier;
class SeatDatabase;

// Closes registration (one way) and fans the roster out to the notifier
class LifecycleController {
public:
    LifecycleController(SeatDatabase& db, INotifier& notifier);

    /**
     * Admin only. Fails with NotFound / Conflict (already closed) before
     * anything changes. Once the flag is flipped the close stands: each
     * notification is attempted independently and failures are only
     * counted and logged.
     */
    CloseSummary closeRegistration(EventId event_id, const Requester& requester);

private:
    SeatDatabase& db_;
    INotifier& notifier_;
};

} // namespace seatbook
