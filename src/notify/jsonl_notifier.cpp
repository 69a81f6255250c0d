#include "seatbook/notify/jsonl_notifier.hpp"
#include "seatbook/notify/notification_messages.hpp"
#include "seatbook/log.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace seatbook {

JsonlNotifier::JsonlNotifier(std::string path, std::string roster_recipient)
    : path_(std::move(path)), roster_recipient_(std::move(roster_recipient)) {
    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            log::warn("notifier", "Cannot create notification directory",
                      {{"path", parent.string()}, {"reason", ec.message()}});
        }
    }
}

void JsonlNotifier::notifyBookingConfirmed(const std::string& email,
                                           const std::vector<std::string>& seat_ids,
                                           const std::string& occupant_name,
                                           const std::string& date) {
    append(messages::bookingConfirmed(email, seat_ids, occupant_name, date).dump());
    log::info("notifier", "Booking confirmation queued",
              {{"email", email}, {"seats", seat_ids}, {"date", date}});
}

void JsonlNotifier::notifyRosterReady(const Event& event, const std::vector<BookingRow>& rows) {
    append(messages::rosterReady(event, rows, roster_recipient_).dump());
    log::info("notifier", "Roster queued",
              {{"event_id", event.id}, {"booking_count", rows.size()}});
}

void JsonlNotifier::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open notification outbox: " + path_);
    }
    out << line << '\n';
    if (!out) {
        throw std::runtime_error("Failed to write notification outbox: " + path_);
    }
}

} // namespace seatbook
