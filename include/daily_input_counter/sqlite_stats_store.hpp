#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "daily_input_counter/stats_store.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace dic::stats {

class SqliteStatsStore : public StatsStore {
public:
    // ":memory:" opens a private in-memory database. created_at / updated_at
    // columns are stamped from `clock`; the one-argument form uses the
    // system clock.
    explicit SqliteStatsStore(std::string path);
    SqliteStatsStore(std::string path, const Clock& clock);
    ~SqliteStatsStore() override;

    SqliteStatsStore(const SqliteStatsStore&) = delete;
    SqliteStatsStore& operator=(const SqliteStatsStore&) = delete;

    std::string id() const override;
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    void upsertDaily(const CalendarDate& date, const CounterSet& delta) override;
    void upsertHourly(const CalendarDate& date, int hour, const CounterSet& delta) override;
    void openSession(const std::string& session_id, const std::string& start_time) override;
    void closeSession(const std::string& session_id,
                      const std::string& end_time,
                      const CounterSet& final_counters) override;
    void applyBatch(const FlushBatch& batch) override;

    [[nodiscard]] std::optional<DailyRecord> getDaily(const CalendarDate& date) const override;
    [[nodiscard]] std::vector<DailyRecord> getRange(const CalendarDate& start,
                                                    const CalendarDate& end) const override;
    [[nodiscard]] std::vector<HourlyRecord> getHourly(const CalendarDate& date) const override;
    [[nodiscard]] std::optional<SessionRecord> getSession(const std::string& session_id) const override;
    [[nodiscard]] std::vector<SessionRecord> getSessions(const CalendarDate& start,
                                                         const CalendarDate& end) const override;
    [[nodiscard]] StoreSummary summary() const override;

    std::size_t closeDanglingSessions() override;
    [[nodiscard]] std::vector<CalendarDate> hourlyMismatches() const override;
    void backup(const std::string& destination) const override;

private:
    struct DbDeleter {
        void operator()(sqlite3* db) const noexcept;
    };
    struct StmtDeleter {
        void operator()(sqlite3_stmt* stmt) const noexcept;
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

    [[noreturn]] void fail(const std::string& context) const;
    void exec(const char* sql) const;
    Statement prepare(const char* sql) const;
    void step(sqlite3_stmt* stmt, const char* context) const;
    void createSchema();

    // Callers hold mutex_.
    void runTransaction(const std::function<void()>& body);
    void upsertDailyLocked(const CalendarDate& date, const CounterSet& delta,
                           const std::string& stamp);
    void upsertHourlyLocked(const CalendarDate& date, int hour, const CounterSet& delta,
                            const std::string& stamp);
    void openSessionLocked(const std::string& session_id, const std::string& start_time,
                           const std::string& stamp);
    void updateSessionLocked(const std::string& session_id,
                             const std::optional<std::string>& end_time,
                             const CounterSet& counters,
                             const std::string& stamp);
    std::string stamp() const;

    std::string path_;
    const Clock& clock_;
    mutable std::mutex mutex_;
    std::unique_ptr<sqlite3, DbDeleter> db_;
};

}  // namespace dic::stats
