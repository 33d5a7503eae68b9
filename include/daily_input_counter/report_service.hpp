#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "daily_input_counter/calendar.hpp"
#include "daily_input_counter/records.hpp"
#include "daily_input_counter/stats_store.hpp"

namespace dic::stats {

struct PeriodSummary {
    CalendarDate start;
    CalendarDate end;
    int day_count{0};
    int active_days{0};
    CounterSet totals;
    std::int64_t session_count{0};
    // totals.total / day_count
    double daily_average{0.0};
};

using WeeklySummary = PeriodSummary;
using MonthlySummary = PeriodSummary;

struct TrendAnalysis {
    // One entry per day of the window, oldest first; days without data are
    // zero-filled.
    std::vector<DailyRecord> days;
    CounterSet totals;
    // totals.total divided by the requested window length.
    double daily_average{0.0};
    std::optional<DailyRecord> peak;
};

// Read-only views over the store. Arguments are validated before the store
// is touched; bad input throws ValidationError.
class ReportService {
public:
    static constexpr int kMaxTrendDays = 3660;

    ReportService(const StatsStore& store, const Clock& clock);

    [[nodiscard]] std::optional<DailyRecord> getDaily(const std::string& date) const;
    [[nodiscard]] std::optional<DailyRecord> getDaily(const CalendarDate& date) const;
    [[nodiscard]] std::vector<DailyRecord> getRange(const std::string& start,
                                                    const std::string& end) const;
    [[nodiscard]] std::vector<DailyRecord> getRange(const CalendarDate& start,
                                                    const CalendarDate& end) const;

    [[nodiscard]] WeeklySummary weeklySummary(const std::string& week_start) const;
    [[nodiscard]] WeeklySummary weeklySummary(const CalendarDate& week_start) const;
    [[nodiscard]] MonthlySummary monthlySummary(int year, int month) const;
    [[nodiscard]] TrendAnalysis trendAnalysis(int days) const;

    [[nodiscard]] StoreSummary summary() const;

private:
    PeriodSummary summarize(const CalendarDate& start, const CalendarDate& end) const;

    const StatsStore& store_;
    const Clock& clock_;
};

}  // namespace dic::stats
