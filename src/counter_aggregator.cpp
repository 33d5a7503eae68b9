#include "daily_input_counter/counter_aggregator.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "daily_input_counter/character_classifier.hpp"

namespace dic::stats {

CounterAggregator::CounterAggregator(const Clock& clock)
    : clock_(clock), rng_(std::random_device{}()) {
    const auto now = clock_.now();
    today_ = now.date;
    hour_ = now.hour;
}

void CounterAggregator::setRolloverListener(RolloverListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    on_rollover_ = std::move(listener);
}

void CounterAggregator::seedToday(const CalendarDate& date, const CounterSet& persisted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (date != today_) {
        return;
    }
    today_counters_ += persisted;
}

void CounterAggregator::record(Category category) {
    std::optional<CalendarDate> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = rolloverLocked(clock_.now());
        today_counters_.add(category);
        hour_counters_.add(category);
        pending_daily_[today_].add(category);
        pending_hourly_[{today_, hour_}].add(category);
        if (session_) {
            session_->counters.add(category);
        }
    }
    notifyRollover(previous);
}

void CounterAggregator::recordText(const std::string& text) {
    for (char32_t cp : decodeUtf8(text)) {
        record(classify(cp));
    }
}

void CounterAggregator::rolloverIfNeeded(const LocalDateTime& now) {
    std::optional<CalendarDate> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = rolloverLocked(now);
    }
    notifyRollover(previous);
}

void CounterAggregator::rolloverIfNeeded() {
    rolloverIfNeeded(clock_.now());
}

std::optional<CalendarDate> CounterAggregator::rolloverLocked(const LocalDateTime& now) {
    if (now.date != today_) {
        const CalendarDate previous = today_;
        // The stale day's delta stays in pending_daily_ under its own date.
        today_ = now.date;
        hour_ = now.hour;
        today_counters_ = CounterSet{};
        hour_counters_ = CounterSet{};
        return previous;
    }
    if (now.hour != hour_) {
        hour_ = now.hour;
        hour_counters_ = CounterSet{};
    }
    return std::nullopt;
}

void CounterAggregator::notifyRollover(const std::optional<CalendarDate>& previous) {
    if (!previous) {
        return;
    }
    CalendarDate current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = today_;
    }
    std::cout << "[CounterAggregator] Date rollover " << previous->toString()
              << " -> " << current.toString() << '\n';

    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (on_rollover_) {
        on_rollover_(*previous, current);
    }
}

std::string CounterAggregator::makeSessionId(const LocalDateTime& now) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << now.date.year << std::setw(2) << now.date.month
        << std::setw(2) << now.date.day << 'T' << std::setw(2) << now.hour
        << std::setw(2) << now.minute << std::setw(2) << now.second << '-'
        << std::hex << std::setw(8) << (rng_() & 0xFFFFFFFFULL);
    return oss.str();
}

std::string CounterAggregator::beginSession() {
    std::optional<CalendarDate> previous;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.now();
        previous = rolloverLocked(now);
        if (session_) {
            session_->end_time = now.toString();
            closed_sessions_.push_back(std::move(*session_));
            session_.reset();
        }
        SessionState state;
        state.id = makeSessionId(now);
        state.start_time = now.toString();
        id = state.id;
        session_ = std::move(state);
    }
    notifyRollover(previous);
    return id;
}

std::optional<std::string> CounterAggregator::endSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    session_->end_time = clock_.now().toString();
    std::string id = session_->id;
    closed_sessions_.push_back(std::move(*session_));
    session_.reset();
    return id;
}

std::optional<std::string> CounterAggregator::activeSessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->id;
}

CounterSet CounterAggregator::getCurrentCounters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (clock_.now().date != today_) {
        return CounterSet{};  // nothing recorded yet on the new day
    }
    return today_counters_;
}

CounterSet CounterAggregator::currentHourCounters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.now();
    if (now.date != today_ || now.hour != hour_) {
        return CounterSet{};
    }
    return hour_counters_;
}

CounterSet CounterAggregator::currentSessionCounters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ ? session_->counters : CounterSet{};
}

CalendarDate CounterAggregator::today() const {
    return clock_.now().date;
}

SessionChange CounterAggregator::toChange(const SessionState& state) {
    SessionChange change;
    change.session_id = state.id;
    change.start_time = state.start_time;
    change.newly_opened = !state.persisted_open;
    change.end_time = state.end_time;
    change.counters = state.counters;
    return change;
}

FlushBatch CounterAggregator::snapshotPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    FlushBatch batch;
    for (const auto& [date, delta] : pending_daily_) {
        if (!delta.empty()) {
            batch.daily.push_back(DailyDelta{date, delta});
        }
    }
    for (const auto& [key, delta] : pending_hourly_) {
        if (!delta.empty()) {
            batch.hourly.push_back(HourlyDelta{key.first, key.second, delta});
        }
    }
    for (const auto& closed : closed_sessions_) {
        batch.sessions.push_back(toChange(closed));
    }
    if (session_ && (!session_->persisted_open || session_->counters != session_->persisted_counters)) {
        batch.sessions.push_back(toChange(*session_));
    }
    return batch;
}

void CounterAggregator::acknowledge(const FlushBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& daily : batch.daily) {
        auto it = pending_daily_.find(daily.date);
        if (it == pending_daily_.end()) {
            continue;
        }
        it->second -= daily.delta;
        if (it->second.empty()) {
            pending_daily_.erase(it);
        }
    }
    for (const auto& hourly : batch.hourly) {
        auto it = pending_hourly_.find({hourly.date, hourly.hour});
        if (it == pending_hourly_.end()) {
            continue;
        }
        it->second -= hourly.delta;
        if (it->second.empty()) {
            pending_hourly_.erase(it);
        }
    }
    for (const auto& change : batch.sessions) {
        if (session_ && session_->id == change.session_id) {
            session_->persisted_open = true;
            session_->persisted_counters = change.counters;
            continue;
        }
        auto it = std::find_if(closed_sessions_.begin(), closed_sessions_.end(),
                               [&](const SessionState& s) { return s.id == change.session_id; });
        if (it == closed_sessions_.end()) {
            continue;
        }
        if (change.end_time) {
            closed_sessions_.erase(it);
        } else {
            // Ended after the snapshot was taken; the close is still owed.
            it->persisted_open = true;
            it->persisted_counters = change.counters;
        }
    }
}

bool CounterAggregator::hasPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_daily_.empty() || !pending_hourly_.empty() || !closed_sessions_.empty() ||
           (session_ && (!session_->persisted_open ||
                         session_->counters != session_->persisted_counters));
}

}  // namespace dic::stats
