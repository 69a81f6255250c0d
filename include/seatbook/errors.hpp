#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace seatbook {

enum class ErrorCode {
    InvalidInput,   // caller-fixable, one malformed field
    NotFound,       // event or seat absent
    Conflict,       // business rule violated
    Forbidden,      // requester lacks the privilege
    Internal        // storage / transport failure
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::NotFound:     return "NotFound";
        case ErrorCode::Conflict:     return "Conflict";
        case ErrorCode::Forbidden:    return "Forbidden";
        case ErrorCode::Internal:     return "Internal";
    }
    return "Internal";
}

/**
 * Error raised by every core operation.
 *
 * Client faults (everything except Internal) carry a message that can be
 * shown to the caller as is. Internal errors carry a generic message only.
 */
class ReservationError : public std::runtime_error {
public:
    ReservationError(ErrorCode code, const std::string& message,
                     std::vector<std::string> seat_ids = {})
        : std::runtime_error(message), code_(code), seat_ids_(std::move(seat_ids)) {}

    static ReservationError invalidInput(const std::string& message) {
        return ReservationError(ErrorCode::InvalidInput, message);
    }

    static ReservationError notFound(const std::string& message,
                                     std::vector<std::string> seat_ids = {}) {
        return ReservationError(ErrorCode::NotFound, message, std::move(seat_ids));
    }

    static ReservationError conflict(const std::string& message,
                                     std::vector<std::string> seat_ids = {}) {
        return ReservationError(ErrorCode::Conflict, message, std::move(seat_ids));
    }

    static ReservationError forbidden(const std::string& message) {
        return ReservationError(ErrorCode::Forbidden, message);
    }

    static ReservationError internal(const std::string& message) {
        return ReservationError(ErrorCode::Internal, message);
    }

    ErrorCode code() const { return code_; }

    // Seats the failure is attributed to (missing or already booked)
    const std::vector<std::string>& seatIds() const { return seat_ids_; }

    bool isClientFault() const { return code_ != ErrorCode::Internal; }

private:
    ErrorCode code_;
    std::vector<std::string> seat_ids_;
};

} // namespace seatbook
