#pragma once
// Field-shape checks shared by the boundary layers (CLI, websocket hub)
// and by the core where a shape gates an invariant (seat ids).

#include <string>

namespace seatbook {

// <A-Z><1-9>[0-9], e.g. "A1", "C10", "Z99"
bool isValidSeatId(const std::string& seat_id);

// local@domain.tld with the usual character classes
bool isValidEmail(const std::string& email);

// 10 digits, optionally prefixed by +<1-3 digit country code> and a separator
bool isValidPhone(const std::string& phone);

} // namespace seatbook
