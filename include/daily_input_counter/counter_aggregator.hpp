#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "daily_input_counter/calendar.hpp"
#include "daily_input_counter/records.hpp"
#include "daily_input_counter/types.hpp"

namespace dic::stats {

// Live counters for today, the current hour and the current session, plus the
// deltas not yet written to the store. Safe to call from the input thread and
// the flush thread concurrently. Readers see counters for the clock's current
// day and hour even when nothing has been recorded since midnight.
class CounterAggregator {
public:
    using RolloverListener = std::function<void(const CalendarDate& previous,
                                                const CalendarDate& current)>;

    explicit CounterAggregator(const Clock& clock);

    // Invoked outside the counter lock whenever the tracked date changes.
    // Replacing the listener waits for a running invocation to return, so
    // once setRolloverListener(nullptr) returns the old one is never called.
    void setRolloverListener(RolloverListener listener);

    // Adds counters already persisted for `date` to the live view without
    // making them pending again.
    void seedToday(const CalendarDate& date, const CounterSet& persisted);

    void record(Category category);
    void recordText(const std::string& text);
    void rolloverIfNeeded(const LocalDateTime& now);
    void rolloverIfNeeded();

    std::string beginSession();
    std::optional<std::string> endSession();
    [[nodiscard]] std::optional<std::string> activeSessionId() const;

    [[nodiscard]] CounterSet getCurrentCounters() const;
    [[nodiscard]] CounterSet currentHourCounters() const;
    [[nodiscard]] CounterSet currentSessionCounters() const;
    [[nodiscard]] CalendarDate today() const;

    // Copy of everything pending. Pass the same batch to acknowledge() once
    // the store has committed it; anything recorded in between stays pending.
    [[nodiscard]] FlushBatch snapshotPending() const;
    void acknowledge(const FlushBatch& batch);
    [[nodiscard]] bool hasPending() const;

private:
    struct SessionState {
        std::string id;
        std::string start_time;
        std::optional<std::string> end_time;
        CounterSet counters;
        bool persisted_open{false};
        CounterSet persisted_counters;
    };

    std::optional<CalendarDate> rolloverLocked(const LocalDateTime& now);
    void notifyRollover(const std::optional<CalendarDate>& previous);
    std::string makeSessionId(const LocalDateTime& now);
    static SessionChange toChange(const SessionState& state);

    const Clock& clock_;

    mutable std::mutex mutex_;
    CalendarDate today_;
    int hour_{0};
    CounterSet today_counters_;
    CounterSet hour_counters_;
    std::map<CalendarDate, CounterSet> pending_daily_;
    std::map<std::pair<CalendarDate, int>, CounterSet> pending_hourly_;
    std::optional<SessionState> session_;
    std::vector<SessionState> closed_sessions_;
    std::mt19937_64 rng_;

    // Held while the listener runs; never taken while holding mutex_.
    std::mutex listener_mutex_;
    RolloverListener on_rollover_;
};

}  // namespace dic::stats
