#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "daily_input_counter/counter_aggregator.hpp"
#include "daily_input_counter/stats_store.hpp"

namespace dic::stats {

enum class FlushState {
    Idle,
    Flushing,
    ShuttingDown,
    Flushed,
    Terminated,
};

[[nodiscard]] const char* flushStateName(FlushState state) noexcept;

struct FlushSettings {
    std::chrono::milliseconds interval{std::chrono::seconds{60}};
    std::chrono::milliseconds retry_backoff{std::chrono::seconds{1}};
    std::chrono::milliseconds shutdown_timeout{std::chrono::seconds{5}};
};

// Moves the aggregator's pending deltas into the store on a timer, on date
// rollover and at shutdown. The only writer of the store.
//
// Registers itself as the aggregator's rollover listener. The aggregator and
// the store must outlive the policy. The destructor unregisters the listener
// and waits for a rollover notification already in progress, so recording
// threads may keep running while the policy is destroyed.
class FlushPolicy {
public:
    FlushPolicy(CounterAggregator& aggregator, StatsStore& store, FlushSettings settings);
    ~FlushPolicy();

    FlushPolicy(const FlushPolicy&) = delete;
    FlushPolicy& operator=(const FlushPolicy&) = delete;

    // Closes sessions a crash left open and seeds today's live counters.
    void recoverOnStartup();

    void start();
    void requestFlush();
    // Returns false when the store rejected the batch; the delta is kept.
    bool flushNow();
    // Stops the ticker, ends the open session and retries the final flush
    // until it lands or shutdown_timeout passes. Throws ShutdownTimeoutError
    // in the latter case, after reaching Terminated.
    void shutdown();

    [[nodiscard]] FlushState state() const;
    [[nodiscard]] std::size_t consecutiveFailures() const;
    [[nodiscard]] std::chrono::milliseconds nextDelay() const;

private:
    void runLoop();
    void stopTicker();
    bool attemptFlush();
    std::chrono::milliseconds nextDelayLocked() const;

    CounterAggregator& aggregator_;
    StatsStore& store_;
    const FlushSettings settings_;

    std::mutex flush_mutex_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    FlushState state_{FlushState::Idle};
    bool stop_{false};
    bool flush_requested_{false};
    std::size_t consecutive_failures_{0};
    std::thread thread_;
};

}  // namespace dic::stats
