#pragma once
// Downstream hand-off for committed bookings (email, push, websocket...)

#include "seatbook/models.hpp"
#include <string>
#include <vector>

namespace seatbook {

/**
 * Notifier gateway. Called after the booking transaction has committed and
 * outside any store lock. Implementations may throw; callers log the
 * failure and carry on, a notification never undoes a booking.
 * Implementations must tolerate calls from several threads.
 */
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual void notifyBookingConfirmed(const std::string& email,
                                        const std::vector<std::string>& seat_ids,
                                        const std::string& occupant_name,
                                        const std::string& date) = 0;

    // Full roster of an event, sent once registration closes
    virtual void notifyRosterReady(const Event& event,
                                   const std::vector<BookingRow>& rows) = 0;
};

} // namespace seatbook
