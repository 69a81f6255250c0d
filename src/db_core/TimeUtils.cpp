#include "seatbook/TimeUtils.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace seatbook {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (days_from_civil)
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeap(y)) ? 29 : kDays[m - 1];
}

} // namespace

std::string TimeUtils::todayDate() {
    auto now = std::chrono::system_clock::now();
    return formatUtc(std::chrono::system_clock::to_time_t(now), "%Y-%m-%d");
}

std::string TimeUtils::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    return formatUtc(std::chrono::system_clock::to_time_t(now), "%Y-%m-%d %H:%M:%S");
}

std::string TimeUtils::addDays(const std::string& date, int days) {
    std::tm tm = {};
    if (!parseDate(date, tm)) {
        throw std::runtime_error("Failed to parse date: " + date);
    }

    std::int64_t serial = daysFromCivil(tm.tm_year + 1900,
                                        static_cast<unsigned>(tm.tm_mon + 1),
                                        static_cast<unsigned>(tm.tm_mday)) + days;
    std::time_t shifted = static_cast<std::time_t>(serial * 86400);
    return formatUtc(shifted, "%Y-%m-%d");
}

bool TimeUtils::isIsoDate(const std::string& date) {
    std::tm tm = {};
    return parseDate(date, tm);
}

// HH:MM, 24h clock
bool TimeUtils::isClockTime(const std::string& time) {
    if (time.size() != 5 || time[2] != ':') return false;
    for (int i : {0, 1, 3, 4}) {
        if (!std::isdigit(static_cast<unsigned char>(time[i]))) return false;
    }
    int hour = (time[0] - '0') * 10 + (time[1] - '0');
    int minute = (time[3] - '0') * 10 + (time[4] - '0');
    return hour <= 23 && minute <= 59;
}

bool TimeUtils::parseDate(const std::string& date, std::tm& out) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;

    std::istringstream ss(date);
    ss >> std::get_time(&out, "%Y-%m-%d");
    if (ss.fail()) return false;

    int year = out.tm_year + 1900;
    int month = out.tm_mon + 1;
    return month >= 1 && month <= 12 &&
           out.tm_mday >= 1 && out.tm_mday <= daysInMonth(year, month);
}

std::string TimeUtils::formatUtc(std::time_t time, const char* format) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

} // namespace seatbook
