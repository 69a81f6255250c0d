#include "seatbook/validation.hpp"

#include <regex>

namespace seatbook {

bool isValidSeatId(const std::string& seat_id) {
    if (seat_id.size() < 2 || seat_id.size() > 3) return false;
    if (seat_id[0] < 'A' || seat_id[0] > 'Z') return false;
    if (seat_id[1] < '1' || seat_id[1] > '9') return false;
    if (seat_id.size() == 3 && (seat_id[2] < '0' || seat_id[2] > '9')) return false;
    return true;
}

bool isValidEmail(const std::string& email) {
    static const std::regex pattern(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
    return std::regex_match(email, pattern);
}

bool isValidPhone(const std::string& phone) {
    static const std::regex pattern(R"(^(\+?\d{1,3}[-.\s]?)?\d{10}$)");
    return std::regex_match(phone, pattern);
}

} // namespace seatbook
