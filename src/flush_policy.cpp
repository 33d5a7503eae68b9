#include "daily_input_counter/flush_policy.hpp"

#include <algorithm>
#include <iostream>

#include "daily_input_counter/errors.hpp"

namespace dic::stats {

const char* flushStateName(FlushState state) noexcept {
    switch (state) {
        case FlushState::Idle: return "idle";
        case FlushState::Flushing: return "flushing";
        case FlushState::ShuttingDown: return "shutting-down";
        case FlushState::Flushed: return "flushed";
        case FlushState::Terminated: return "terminated";
    }
    return "unknown";
}

FlushPolicy::FlushPolicy(CounterAggregator& aggregator, StatsStore& store, FlushSettings settings)
    : aggregator_(aggregator), store_(store), settings_(settings) {
    aggregator_.setRolloverListener([this](const CalendarDate&, const CalendarDate&) {
        requestFlush();
    });
}

FlushPolicy::~FlushPolicy() {
    aggregator_.setRolloverListener(nullptr);
    stopTicker();
}

void FlushPolicy::recoverOnStartup() {
    try {
        const auto closed = store_.closeDanglingSessions();
        if (closed > 0) {
            std::cout << "[FlushPolicy] Closed " << closed
                      << " session(s) left open by a previous run" << '\n';
        }
        for (const auto& date : store_.hourlyMismatches()) {
            std::cerr << "[FlushPolicy] Hourly rows for " << date.toString()
                      << " do not add up to the daily total" << '\n';
        }
        const auto today = aggregator_.today();
        if (auto record = store_.getDaily(today)) {
            aggregator_.seedToday(today, record->counters);
        }
    } catch (const StorageError& ex) {
        std::cerr << "[FlushPolicy] Startup recovery skipped: " << ex.what() << '\n';
    }
}

void FlushPolicy::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable() || state_ == FlushState::Terminated) {
        return;
    }
    stop_ = false;
    thread_ = std::thread(&FlushPolicy::runLoop, this);
}

void FlushPolicy::requestFlush() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flush_requested_ = true;
    }
    cv_.notify_all();
}

bool FlushPolicy::flushNow() {
    return attemptFlush();
}

void FlushPolicy::stopTicker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::chrono::milliseconds FlushPolicy::nextDelayLocked() const {
    if (consecutive_failures_ == 0) {
        return settings_.interval;
    }
    auto delay = settings_.retry_backoff;
    for (std::size_t i = 1; i < consecutive_failures_ && delay < settings_.interval; ++i) {
        delay *= 2;
    }
    return std::min(delay, settings_.interval);
}

std::chrono::milliseconds FlushPolicy::nextDelay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextDelayLocked();
}

void FlushPolicy::runLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        const auto delay = nextDelayLocked();
        cv_.wait_for(lock, delay, [this] { return stop_ || flush_requested_; });
        if (stop_) {
            break;
        }
        flush_requested_ = false;
        lock.unlock();
        // An idle midnight still moves the live counters to the new day.
        aggregator_.rolloverIfNeeded();
        attemptFlush();
        lock.lock();
    }
}

bool FlushPolicy::attemptFlush() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == FlushState::Terminated) {
            return false;
        }
        if (state_ != FlushState::ShuttingDown) {
            state_ = FlushState::Flushing;
        }
    }

    const auto batch = aggregator_.snapshotPending();
    try {
        store_.applyBatch(batch);
    } catch (const StorageError& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++consecutive_failures_;
        std::cerr << "[FlushPolicy] Flush failed (attempt " << consecutive_failures_
                  << "), keeping delta for retry: " << ex.what() << '\n';
        return false;
    }
    aggregator_.acknowledge(batch);

    std::lock_guard<std::mutex> lock(mutex_);
    if (consecutive_failures_ > 0) {
        std::cout << "[FlushPolicy] Flush recovered after " << consecutive_failures_
                  << " failed attempt(s)" << '\n';
    }
    consecutive_failures_ = 0;
    if (state_ == FlushState::Flushing) {
        state_ = FlushState::Idle;
    }
    return true;
}

void FlushPolicy::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == FlushState::Terminated) {
            return;
        }
        state_ = FlushState::ShuttingDown;
    }
    stopTicker();
    aggregator_.endSession();

    const auto deadline = std::chrono::steady_clock::now() + settings_.shutdown_timeout;
    bool saved = false;
    while (true) {
        if (attemptFlush()) {
            saved = true;
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(nextDelay(), remaining));
    }

    if (saved) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = FlushState::Flushed;
        std::cout << "[FlushPolicy] Final flush complete" << '\n';
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = FlushState::Terminated;
    if (!saved) {
        throw ShutdownTimeoutError("Final flush did not complete within " +
                                   std::to_string(settings_.shutdown_timeout.count()) + " ms");
    }
}

FlushState FlushPolicy::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t FlushPolicy::consecutiveFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

}  // namespace dic::stats
