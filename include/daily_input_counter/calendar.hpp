#pragma once

#include <optional>
#include <string>
#include <tuple>

namespace dic::stats {

// Proleptic Gregorian calendar day, local time.
struct CalendarDate {
    int year{1970};
    int month{1};
    int day{1};

    // Accepts exactly "YYYY-MM-DD"; nullopt on malformed or impossible dates.
    [[nodiscard]] static std::optional<CalendarDate> parse(const std::string& text);
    [[nodiscard]] static CalendarDate fromDayNumber(long long days);

    [[nodiscard]] bool isValid() const noexcept;
    [[nodiscard]] long long dayNumber() const noexcept;
    [[nodiscard]] CalendarDate addDays(long long delta) const;
    [[nodiscard]] std::string toString() const;
};

[[nodiscard]] int daysInMonth(int year, int month) noexcept;
[[nodiscard]] long long daysBetween(const CalendarDate& from, const CalendarDate& to) noexcept;

inline bool operator==(const CalendarDate& lhs, const CalendarDate& rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

inline bool operator!=(const CalendarDate& lhs, const CalendarDate& rhs) {
    return !(lhs == rhs);
}

inline bool operator<(const CalendarDate& lhs, const CalendarDate& rhs) {
    return std::tie(lhs.year, lhs.month, lhs.day) < std::tie(rhs.year, rhs.month, rhs.day);
}

inline bool operator<=(const CalendarDate& lhs, const CalendarDate& rhs) {
    return !(rhs < lhs);
}

struct LocalDateTime {
    CalendarDate date;
    int hour{0};
    int minute{0};
    int second{0};

    // "YYYY-MM-DD HH:MM:SS"
    [[nodiscard]] std::string toString() const;
};

class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual LocalDateTime now() const = 0;
};

// Wall clock in the process time zone.
class SystemClock : public Clock {
public:
    [[nodiscard]] LocalDateTime now() const override;
};

}  // namespace dic::stats
