#pragma once

#include "seatbook/notify/notifier.hpp"
#include <mutex>
#include <string>

namespace seatbook {

// Appends every notification as one JSON line to a file (outbox for a mailer)
class JsonlNotifier : public INotifier {
public:
    JsonlNotifier(std::string path, std::string roster_recipient);

    void notifyBookingConfirmed(const std::string& email,
                                const std::vector<std::string>& seat_ids,
                                const std::string& occupant_name,
                                const std::string& date) override;

    void notifyRosterReady(const Event& event,
                           const std::vector<BookingRow>& rows) override;

    const std::string& path() const { return path_; }

private:
    void append(const std::string& line);

    std::string path_;
    std::string roster_recipient_;
    std::mutex mutex_;
};

} // namespace seatbook
