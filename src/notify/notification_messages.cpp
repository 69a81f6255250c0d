#include "seatbook/notify/notification_messages.hpp"
#include "seatbook/TimeUtils.h"

namespace seatbook::messages {

using nlohmann::json;

json bookingConfirmed(const std::string& email, const std::vector<std::string>& seat_ids,
                      const std::string& occupant_name, const std::string& date) {
    return {
        {"type", "booking_confirmed"},
        {"email", email},
        {"name", occupant_name},
        {"date", date},
        {"seats", seat_ids},
        {"admit", seat_ids.size()},
        {"timestamp", TimeUtils::getCurrentTimestamp()}
    };
}

json rosterReady(const Event& event, const std::vector<BookingRow>& rows,
                 const std::string& recipient) {
    json bookings = json::array();
    for (const auto& row : rows) {
        bookings.push_back(toJson(row));
    }
    return {
        {"type", "roster_ready"},
        {"recipient", recipient},
        {"event", toJson(event)},
        {"booking_count", rows.size()},
        {"bookings", bookings},
        {"timestamp", TimeUtils::getCurrentTimestamp()}
    };
}

json toJson(const Event& event) {
    return {
        {"id", event.id},
        {"name", event.name},
        {"date", event.date},
        {"time", event.time},
        {"description", event.description},
        {"venue", event.venue},
        {"total_seats", event.total_seats},
        {"registration_closed", event.registration_closed},
        {"created_at", event.created_at}
    };
}

json toJson(const BookingEntry& entry) {
    json j = {
        {"date", entry.date},
        {"name", entry.name},
        {"email", entry.email},
        {"status", entry.status}
    };
    if (!entry.phone.empty()) j["phone"] = entry.phone;
    return j;
}

json toJson(const BookingRow& row) {
    return {
        {"seat_id", row.seat_id},
        {"name", row.name},
        {"email", row.email},
        {"phone", row.phone}
    };
}

json toJson(const SeatAvailability& seat) {
    return {
        {"seat_id", seat.seat.seat_id},
        {"row", seat.seat.row},
        {"column", seat.seat.column},
        {"price", seat.seat.price},
        {"status", seat.booked ? "booked" : "available"},
        {"booked_by", seat.booked_by ? toJson(*seat.booked_by) : json(nullptr)}
    };
}

} // namespace seatbook::messages
