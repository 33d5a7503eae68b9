#include "daily_input_counter/calendar.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dic::stats {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool parseDigits(const std::string& text, std::size_t pos, std::size_t len, int& out) {
    int value = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    out = value;
    return true;
}

}  // namespace

int daysInMonth(int year, int month) noexcept {
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

std::optional<CalendarDate> CalendarDate::parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    CalendarDate date;
    if (!parseDigits(text, 0, 4, date.year) ||
        !parseDigits(text, 5, 2, date.month) ||
        !parseDigits(text, 8, 2, date.day)) {
        return std::nullopt;
    }
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

bool CalendarDate::isValid() const noexcept {
    return year >= 1 && year <= 9999 && month >= 1 && month <= 12 &&
           day >= 1 && day <= daysInMonth(year, month);
}

// Days since 1970-01-01 (civil-from-days / days-from-civil).
long long CalendarDate::dayNumber() const noexcept {
    const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (month + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CalendarDate::fromDayNumber(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const long long doe = days - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const long long d = doy - (153 * mp + 2) / 5 + 1;
    const long long m = mp < 10 ? mp + 3 : mp - 9;
    const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return CalendarDate{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

CalendarDate CalendarDate::addDays(long long delta) const {
    return fromDayNumber(dayNumber() + delta);
}

std::string CalendarDate::toString() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-' << std::setw(2) << day;
    return oss.str();
}

long long daysBetween(const CalendarDate& from, const CalendarDate& to) noexcept {
    return to.dayNumber() - from.dayNumber();
}

std::string LocalDateTime::toString() const {
    std::ostringstream oss;
    oss << date.toString() << ' ' << std::setfill('0')
        << std::setw(2) << hour << ':' << std::setw(2) << minute << ':'
        << std::setw(2) << second;
    return oss.str();
}

LocalDateTime SystemClock::now() const {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&t, &local);
    LocalDateTime out;
    out.date = CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
    out.hour = local.tm_hour;
    out.minute = local.tm_min;
    out.second = local.tm_sec;
    return out;
}

}  // namespace dic::stats
