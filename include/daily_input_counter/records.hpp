#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "daily_input_counter/calendar.hpp"
#include "daily_input_counter/types.hpp"

namespace dic::stats {

struct DailyRecord {
    CalendarDate date;
    CounterSet counters;
    std::int64_t session_count{0};
    std::string created_at;
    std::string updated_at;
};

struct HourlyRecord {
    CalendarDate date;
    int hour{0};
    CounterSet counters;
    std::string created_at;
    std::string updated_at;
};

struct SessionRecord {
    std::string session_id;
    std::string start_time;
    std::optional<std::string> end_time;
    CounterSet counters;
};

struct StoreSummary {
    std::int64_t total_days{0};
    std::int64_t total_sessions{0};
    CounterSet totals;
    double avg_chinese{0.0};
    double avg_english{0.0};
    double avg_total{0.0};
    std::optional<CalendarDate> first_date;
    std::optional<CalendarDate> last_date;
};

struct DailyDelta {
    CalendarDate date;
    CounterSet delta;
};

struct HourlyDelta {
    CalendarDate date;
    int hour{0};
    CounterSet delta;
};

// Session counters are absolute. newly_opened asks the store to create the
// row (and bump the start date's session_count) before updating it.
struct SessionChange {
    std::string session_id;
    std::string start_time;
    bool newly_opened{false};
    std::optional<std::string> end_time;
    CounterSet counters;
};

// Everything one flush cycle writes. Applied as a single transaction.
struct FlushBatch {
    std::vector<DailyDelta> daily;
    std::vector<HourlyDelta> hourly;
    std::vector<SessionChange> sessions;

    [[nodiscard]] bool empty() const noexcept {
        return daily.empty() && hourly.empty() && sessions.empty();
    }
};

}  // namespace dic::stats
