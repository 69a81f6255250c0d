#ifndef SEATBOOK_TIME_UTILS_H
#define SEATBOOK_TIME_UTILS_H

#include <string>
#include <ctime>

namespace seatbook {

class TimeUtils {
public:
    // Current UTC calendar date, "YYYY-MM-DD"
    static std::string todayDate();
    // Current UTC time, "YYYY-MM-DD HH:MM:SS" (same shape as SQLite CURRENT_TIMESTAMP)
    static std::string getCurrentTimestamp();
    static std::string addDays(const std::string& date, int days);
    static bool isIsoDate(const std::string& date);
    static bool isClockTime(const std::string& time);

private:
    static bool parseDate(const std::string& date, std::tm& out);
    static std::string formatUtc(std::time_t time, const char* format);
};

} // namespace seatbook

#endif // SEATBOOK_TIME_UTILS_H
