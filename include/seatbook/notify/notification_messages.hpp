#pragma once
// JSON payloads shared by the notification sinks

#include "seatbook/models.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace seatbook::messages {

// {"type":"booking_confirmed","email":..,"name":..,"date":..,"seats":[..],"admit":N,"timestamp":..}
nlohmann::json bookingConfirmed(const std::string& email,
                                const std::vector<std::string>& seat_ids,
                                const std::string& occupant_name,
                                const std::string& date);

// {"type":"roster_ready","recipient":..,"event":{..},"booking_count":N,"bookings":[..],"timestamp":..}
nlohmann::json rosterReady(const Event& event, const std::vector<BookingRow>& rows,
                           const std::string& recipient);

nlohmann::json toJson(const Event& event);
nlohmann::json toJson(const BookingEntry& entry);
nlohmann::json toJson(const BookingRow& row);
nlohmann::json toJson(const SeatAvailability& seat);

} // namespace seatbook::messages
