#include "daily_input_counter/report_service.hpp"

#include "daily_input_counter/errors.hpp"

namespace dic::stats {

namespace {

CalendarDate parseDate(const std::string& text) {
    auto date = CalendarDate::parse(text);
    if (!date) {
        throw ValidationError("Invalid date '" + text + "', expected YYYY-MM-DD");
    }
    return *date;
}

void requireValid(const CalendarDate& date) {
    if (!date.isValid()) {
        throw ValidationError("Invalid date " + date.toString());
    }
}

void requireOrdered(const CalendarDate& start, const CalendarDate& end) {
    if (end < start) {
        throw ValidationError("Range end " + end.toString() + " is before start " +
                              start.toString());
    }
}

}  // namespace

ReportService::ReportService(const StatsStore& store, const Clock& clock)
    : store_(store), clock_(clock) {}

std::optional<DailyRecord> ReportService::getDaily(const std::string& date) const {
    return store_.getDaily(parseDate(date));
}

std::optional<DailyRecord> ReportService::getDaily(const CalendarDate& date) const {
    requireValid(date);
    return store_.getDaily(date);
}

std::vector<DailyRecord> ReportService::getRange(const std::string& start,
                                                 const std::string& end) const {
    return getRange(parseDate(start), parseDate(end));
}

std::vector<DailyRecord> ReportService::getRange(const CalendarDate& start,
                                                 const CalendarDate& end) const {
    requireValid(start);
    requireValid(end);
    requireOrdered(start, end);
    return store_.getRange(start, end);
}

PeriodSummary ReportService::summarize(const CalendarDate& start, const CalendarDate& end) const {
    PeriodSummary out;
    out.start = start;
    out.end = end;
    out.day_count = static_cast<int>(daysBetween(start, end) + 1);
    for (const auto& record : store_.getRange(start, end)) {
        out.totals += record.counters;
        out.session_count += record.session_count;
        if (record.counters.total > 0) {
            ++out.active_days;
        }
    }
    out.daily_average = static_cast<double>(out.totals.total) / out.day_count;
    return out;
}

WeeklySummary ReportService::weeklySummary(const std::string& week_start) const {
    return weeklySummary(parseDate(week_start));
}

WeeklySummary ReportService::weeklySummary(const CalendarDate& week_start) const {
    requireValid(week_start);
    const CalendarDate week_end = week_start.addDays(6);
    if (!week_end.isValid()) {
        throw ValidationError("Week starting " + week_start.toString() +
                              " runs past the last supported date 9999-12-31");
    }
    return summarize(week_start, week_end);
}

MonthlySummary ReportService::monthlySummary(int year, int month) const {
    if (year <= 0 || year > 9999) {
        throw ValidationError("Invalid year: " + std::to_string(year));
    }
    if (month < 1 || month > 12) {
        throw ValidationError("Invalid month: " + std::to_string(month));
    }
    const CalendarDate first{year, month, 1};
    const CalendarDate last{year, month, daysInMonth(year, month)};
    return summarize(first, last);
}

TrendAnalysis ReportService::trendAnalysis(int days) const {
    if (days <= 0) {
        throw ValidationError("Trend window must be positive, got " + std::to_string(days));
    }
    if (days > kMaxTrendDays) {
        throw ValidationError("Trend window too large: " + std::to_string(days));
    }

    const CalendarDate end = clock_.now().date;
    const CalendarDate start = end.addDays(-(days - 1));
    if (!start.isValid()) {
        throw ValidationError("Trend window of " + std::to_string(days) +
                              " days starts before 0001-01-01");
    }
    const auto stored = store_.getRange(start, end);

    TrendAnalysis out;
    out.days.reserve(static_cast<std::size_t>(days));
    auto it = stored.begin();
    for (int offset = 0; offset < days; ++offset) {
        const CalendarDate date = start.addDays(offset);
        if (it != stored.end() && it->date == date) {
            out.days.push_back(*it);
            ++it;
        } else {
            DailyRecord empty;
            empty.date = date;
            out.days.push_back(empty);
        }

        const auto& day = out.days.back();
        out.totals += day.counters;
        if (day.counters.total > 0 && (!out.peak || day.counters.total > out.peak->counters.total)) {
            out.peak = day;
        }
    }
    out.daily_average = static_cast<double>(out.totals.total) / days;
    return out;
}

StoreSummary ReportService::summary() const {
    return store_.summary();
}

}  // namespace dic::stats
