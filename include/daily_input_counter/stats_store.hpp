#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "daily_input_counter/records.hpp"

namespace dic::stats {

// Durable home of daily, hourly and session rows. Writes merge deltas into
// existing rows; every write is atomic. Failures throw StorageError.
class StatsStore {
public:
    virtual ~StatsStore() = default;

    virtual std::string id() const = 0;

    virtual void upsertDaily(const CalendarDate& date, const CounterSet& delta) = 0;
    virtual void upsertHourly(const CalendarDate& date, int hour, const CounterSet& delta) = 0;
    virtual void openSession(const std::string& session_id, const std::string& start_time) = 0;
    virtual void closeSession(const std::string& session_id,
                              const std::string& end_time,
                              const CounterSet& final_counters) = 0;
    virtual void applyBatch(const FlushBatch& batch) = 0;

    [[nodiscard]] virtual std::optional<DailyRecord> getDaily(const CalendarDate& date) const = 0;
    [[nodiscard]] virtual std::vector<DailyRecord> getRange(const CalendarDate& start,
                                                            const CalendarDate& end) const = 0;
    [[nodiscard]] virtual std::vector<HourlyRecord> getHourly(const CalendarDate& date) const = 0;
    [[nodiscard]] virtual std::optional<SessionRecord> getSession(const std::string& session_id) const = 0;
    [[nodiscard]] virtual std::vector<SessionRecord> getSessions(const CalendarDate& start,
                                                                 const CalendarDate& end) const = 0;
    [[nodiscard]] virtual StoreSummary summary() const = 0;

    // Closes rows whose end_time is still NULL; returns how many were closed.
    virtual std::size_t closeDanglingSessions() = 0;
    // Dates whose hourly rows do not sum to the daily row.
    [[nodiscard]] virtual std::vector<CalendarDate> hourlyMismatches() const = 0;
    virtual void backup(const std::string& destination) const = 0;
};

}  // namespace dic::stats
