#include "daily_input_counter/sqlite_stats_store.hpp"

#include <sqlite3.h>

#include <exception>
#include <iostream>

#include "daily_input_counter/errors.hpp"

namespace dic::stats {

namespace {

constexpr const char* kCreateDaily = R"(
    CREATE TABLE IF NOT EXISTS daily_stats (
        date          TEXT PRIMARY KEY,
        chinese_chars INTEGER NOT NULL DEFAULT 0,
        english_chars INTEGER NOT NULL DEFAULT 0,
        number_chars  INTEGER NOT NULL DEFAULT 0,
        symbol_chars  INTEGER NOT NULL DEFAULT 0,
        other_chars   INTEGER NOT NULL DEFAULT 0,
        total_chars   INTEGER NOT NULL DEFAULT 0,
        session_count INTEGER NOT NULL DEFAULT 0,
        created_at    TEXT NOT NULL DEFAULT (datetime('now', 'localtime')),
        updated_at    TEXT NOT NULL DEFAULT (datetime('now', 'localtime'))
    )
)";

constexpr const char* kCreateHourly = R"(
    CREATE TABLE IF NOT EXISTS hourly_stats (
        date          TEXT NOT NULL,
        hour          INTEGER NOT NULL CHECK (hour BETWEEN 0 AND 23),
        chinese_chars INTEGER NOT NULL DEFAULT 0,
        english_chars INTEGER NOT NULL DEFAULT 0,
        number_chars  INTEGER NOT NULL DEFAULT 0,
        symbol_chars  INTEGER NOT NULL DEFAULT 0,
        other_chars   INTEGER NOT NULL DEFAULT 0,
        total_chars   INTEGER NOT NULL DEFAULT 0,
        created_at    TEXT NOT NULL DEFAULT (datetime('now', 'localtime')),
        updated_at    TEXT NOT NULL DEFAULT (datetime('now', 'localtime')),
        PRIMARY KEY (date, hour)
    )
)";

constexpr const char* kCreateSessions = R"(
    CREATE TABLE IF NOT EXISTS sessions (
        session_id    TEXT PRIMARY KEY,
        start_time    TEXT NOT NULL,
        end_time      TEXT,
        chinese_chars INTEGER NOT NULL DEFAULT 0,
        english_chars INTEGER NOT NULL DEFAULT 0,
        number_chars  INTEGER NOT NULL DEFAULT 0,
        symbol_chars  INTEGER NOT NULL DEFAULT 0,
        other_chars   INTEGER NOT NULL DEFAULT 0,
        total_chars   INTEGER NOT NULL DEFAULT 0,
        updated_at    TEXT NOT NULL DEFAULT (datetime('now', 'localtime'))
    )
)";

constexpr const char* kUpsertDaily = R"(
    INSERT INTO daily_stats
        (date, chinese_chars, english_chars, number_chars, symbol_chars, other_chars, total_chars,
         created_at, updated_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?8)
    ON CONFLICT(date) DO UPDATE SET
        chinese_chars = chinese_chars + excluded.chinese_chars,
        english_chars = english_chars + excluded.english_chars,
        number_chars  = number_chars + excluded.number_chars,
        symbol_chars  = symbol_chars + excluded.symbol_chars,
        other_chars   = other_chars + excluded.other_chars,
        total_chars   = total_chars + excluded.total_chars,
        updated_at    = excluded.updated_at
)";

constexpr const char* kUpsertHourly = R"(
    INSERT INTO hourly_stats
        (date, hour, chinese_chars, english_chars, number_chars, symbol_chars, other_chars, total_chars,
         created_at, updated_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?9)
    ON CONFLICT(date, hour) DO UPDATE SET
        chinese_chars = chinese_chars + excluded.chinese_chars,
        english_chars = english_chars + excluded.english_chars,
        number_chars  = number_chars + excluded.number_chars,
        symbol_chars  = symbol_chars + excluded.symbol_chars,
        other_chars   = other_chars + excluded.other_chars,
        total_chars   = total_chars + excluded.total_chars,
        updated_at    = excluded.updated_at
)";

constexpr const char* kBumpSessionCount = R"(
    INSERT INTO daily_stats (date, session_count, created_at, updated_at) VALUES (?1, 1, ?2, ?2)
    ON CONFLICT(date) DO UPDATE SET
        session_count = session_count + 1,
        updated_at    = excluded.updated_at
)";

constexpr const char* kInsertSession =
    "INSERT OR IGNORE INTO sessions (session_id, start_time, updated_at) VALUES (?1, ?2, ?3)";

constexpr const char* kUpdateSession = R"(
    UPDATE sessions SET
        chinese_chars = ?2,
        english_chars = ?3,
        number_chars  = ?4,
        symbol_chars  = ?5,
        other_chars   = ?6,
        total_chars   = ?7,
        end_time      = COALESCE(?8, end_time),
        updated_at    = ?9
    WHERE session_id = ?1
)";

constexpr const char* kDailyColumns =
    "date, chinese_chars, english_chars, number_chars, symbol_chars, other_chars, "
    "total_chars, session_count, created_at, updated_at";

constexpr const char* kSessionColumns =
    "session_id, start_time, end_time, chinese_chars, english_chars, number_chars, "
    "symbol_chars, other_chars, total_chars";

std::string columnText(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text));
}

CounterSet readCounters(sqlite3_stmt* stmt, int first_col) {
    CounterSet counters;
    counters.chinese = sqlite3_column_int64(stmt, first_col);
    counters.english = sqlite3_column_int64(stmt, first_col + 1);
    counters.number = sqlite3_column_int64(stmt, first_col + 2);
    counters.symbol = sqlite3_column_int64(stmt, first_col + 3);
    counters.other = sqlite3_column_int64(stmt, first_col + 4);
    counters.total = sqlite3_column_int64(stmt, first_col + 5);
    return counters;
}

CalendarDate columnDate(sqlite3_stmt* stmt, int col) {
    const auto text = columnText(stmt, col);
    auto date = CalendarDate::parse(text);
    if (!date) {
        throw StorageError("Corrupt date value in database: '" + text + "'");
    }
    return *date;
}

DailyRecord readDaily(sqlite3_stmt* stmt) {
    DailyRecord record;
    record.date = columnDate(stmt, 0);
    record.counters = readCounters(stmt, 1);
    record.session_count = sqlite3_column_int64(stmt, 7);
    record.created_at = columnText(stmt, 8);
    record.updated_at = columnText(stmt, 9);
    return record;
}

SessionRecord readSession(sqlite3_stmt* stmt) {
    SessionRecord record;
    record.session_id = columnText(stmt, 0);
    record.start_time = columnText(stmt, 1);
    if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
        record.end_time = columnText(stmt, 2);
    }
    record.counters = readCounters(stmt, 3);
    return record;
}

const Clock& systemClock() {
    static const SystemClock clock;
    return clock;
}

}  // namespace

void SqliteStatsStore::DbDeleter::operator()(sqlite3* db) const noexcept {
    if (db != nullptr) {
        sqlite3_close(db);
    }
}

void SqliteStatsStore::StmtDeleter::operator()(sqlite3_stmt* stmt) const noexcept {
    if (stmt != nullptr) {
        sqlite3_finalize(stmt);
    }
}

SqliteStatsStore::SqliteStatsStore(std::string path)
    : SqliteStatsStore(std::move(path), systemClock()) {}

SqliteStatsStore::SqliteStatsStore(std::string path, const Clock& clock)
    : path_(std::move(path)), clock_(clock) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path_.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    db_.reset(raw);
    if (rc != SQLITE_OK) {
        const std::string reason = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        throw StorageError("Unable to open database " + path_ + ": " + reason);
    }

    sqlite3_busy_timeout(db_.get(), 2000);
    if (path_ != ":memory:") {
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
    }
    createSchema();
    std::cout << "[SqliteStatsStore] Opened database: " << path_ << '\n';
}

SqliteStatsStore::~SqliteStatsStore() = default;

std::string SqliteStatsStore::id() const {
    return "sqlite";
}

std::string SqliteStatsStore::stamp() const {
    return clock_.now().toString();
}

void SqliteStatsStore::fail(const std::string& context) const {
    throw StorageError(context + ": " + sqlite3_errmsg(db_.get()));
}

void SqliteStatsStore::exec(const char* sql) const {
    char* err = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError(std::string("SQL failed (") + sql + "): " + message);
    }
}

SqliteStatsStore::Statement SqliteStatsStore::prepare(const char* sql) const {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr) != SQLITE_OK) {
        fail("Prepare failed");
    }
    return Statement(raw);
}

void SqliteStatsStore::step(sqlite3_stmt* stmt, const char* context) const {
    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        fail(context);
    }
}

void SqliteStatsStore::createSchema() {
    exec(kCreateDaily);
    exec(kCreateHourly);
    exec(kCreateSessions);
    exec("CREATE INDEX IF NOT EXISTS idx_sessions_start ON sessions(start_time)");
}

namespace {

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value) {
    if (sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StorageError(std::string("Bind failed: ") + sqlite3_errmsg(db));
    }
}

void bindInt(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value) {
    if (sqlite3_bind_int64(stmt, index, value) != SQLITE_OK) {
        throw StorageError(std::string("Bind failed: ") + sqlite3_errmsg(db));
    }
}

void bindNull(sqlite3* db, sqlite3_stmt* stmt, int index) {
    if (sqlite3_bind_null(stmt, index) != SQLITE_OK) {
        throw StorageError(std::string("Bind failed: ") + sqlite3_errmsg(db));
    }
}

void bindCounters(sqlite3* db, sqlite3_stmt* stmt, int first_index, const CounterSet& c) {
    bindInt(db, stmt, first_index, c.chinese);
    bindInt(db, stmt, first_index + 1, c.english);
    bindInt(db, stmt, first_index + 2, c.number);
    bindInt(db, stmt, first_index + 3, c.symbol);
    bindInt(db, stmt, first_index + 4, c.other);
    bindInt(db, stmt, first_index + 5, c.total);
}

}  // namespace

void SqliteStatsStore::runTransaction(const std::function<void()>& body) {
    exec("BEGIN IMMEDIATE");
    try {
        body();
        exec("COMMIT");
    } catch (const std::exception& ex) {
        char* err = nullptr;
        if (sqlite3_exec(db_.get(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[SqliteStatsStore] Rollback failed: " << (err ? err : "unknown") << '\n';
            sqlite3_free(err);
        }
        throw;
    }
}

void SqliteStatsStore::upsertDailyLocked(const CalendarDate& date, const CounterSet& delta,
                                         const std::string& stamp) {
    auto stmt = prepare(kUpsertDaily);
    bindText(db_.get(), stmt.get(), 1, date.toString());
    bindCounters(db_.get(), stmt.get(), 2, delta);
    bindText(db_.get(), stmt.get(), 8, stamp);
    step(stmt.get(), "Daily upsert failed");
}

void SqliteStatsStore::upsertHourlyLocked(const CalendarDate& date, int hour, const CounterSet& delta,
                                          const std::string& stamp) {
    if (hour < 0 || hour > 23) {
        throw ValidationError("Hour out of range: " + std::to_string(hour));
    }
    auto stmt = prepare(kUpsertHourly);
    bindText(db_.get(), stmt.get(), 1, date.toString());
    bindInt(db_.get(), stmt.get(), 2, hour);
    bindCounters(db_.get(), stmt.get(), 3, delta);
    bindText(db_.get(), stmt.get(), 9, stamp);
    step(stmt.get(), "Hourly upsert failed");
}

void SqliteStatsStore::openSessionLocked(const std::string& session_id, const std::string& start_time,
                                         const std::string& stamp) {
    const auto start_date = CalendarDate::parse(start_time.substr(0, 10));
    if (!start_date) {
        throw ValidationError("Invalid session start time: " + start_time);
    }

    auto insert = prepare(kInsertSession);
    bindText(db_.get(), insert.get(), 1, session_id);
    bindText(db_.get(), insert.get(), 2, start_time);
    bindText(db_.get(), insert.get(), 3, stamp);
    step(insert.get(), "Session insert failed");
    if (sqlite3_changes(db_.get()) == 0) {
        return;  // already open
    }

    auto bump = prepare(kBumpSessionCount);
    bindText(db_.get(), bump.get(), 1, start_date->toString());
    bindText(db_.get(), bump.get(), 2, stamp);
    step(bump.get(), "Session count update failed");
}

void SqliteStatsStore::updateSessionLocked(const std::string& session_id,
                                           const std::optional<std::string>& end_time,
                                           const CounterSet& counters,
                                           const std::string& stamp) {
    auto stmt = prepare(kUpdateSession);
    bindText(db_.get(), stmt.get(), 1, session_id);
    bindCounters(db_.get(), stmt.get(), 2, counters);
    if (end_time) {
        bindText(db_.get(), stmt.get(), 8, *end_time);
    } else {
        bindNull(db_.get(), stmt.get(), 8);
    }
    bindText(db_.get(), stmt.get(), 9, stamp);
    step(stmt.get(), "Session update failed");
    if (sqlite3_changes(db_.get()) == 0) {
        throw StorageError("Unknown session: " + session_id);
    }
}

void SqliteStatsStore::upsertDaily(const CalendarDate& date, const CounterSet& delta) {
    if (delta.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    runTransaction([&] { upsertDailyLocked(date, delta, stamp()); });
}

void SqliteStatsStore::upsertHourly(const CalendarDate& date, int hour, const CounterSet& delta) {
    if (delta.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    runTransaction([&] { upsertHourlyLocked(date, hour, delta, stamp()); });
}

void SqliteStatsStore::openSession(const std::string& session_id, const std::string& start_time) {
    std::lock_guard<std::mutex> lock(mutex_);
    runTransaction([&] { openSessionLocked(session_id, start_time, stamp()); });
}

void SqliteStatsStore::closeSession(const std::string& session_id,
                                    const std::string& end_time,
                                    const CounterSet& final_counters) {
    std::lock_guard<std::mutex> lock(mutex_);
    runTransaction([&] { updateSessionLocked(session_id, end_time, final_counters, stamp()); });
}

void SqliteStatsStore::applyBatch(const FlushBatch& batch) {
    if (batch.empty()) {
        return;
    }
    const std::string now = stamp();
    std::lock_guard<std::mutex> lock(mutex_);
    runTransaction([&] {
        for (const auto& daily : batch.daily) {
            if (!daily.delta.empty()) {
                upsertDailyLocked(daily.date, daily.delta, now);
            }
        }
        for (const auto& hourly : batch.hourly) {
            if (!hourly.delta.empty()) {
                upsertHourlyLocked(hourly.date, hourly.hour, hourly.delta, now);
            }
        }
        for (const auto& session : batch.sessions) {
            if (session.newly_opened) {
                openSessionLocked(session.session_id, session.start_time, now);
            }
            updateSessionLocked(session.session_id, session.end_time, session.counters, now);
        }
    });
}

std::optional<DailyRecord> SqliteStatsStore::getDaily(const CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string("SELECT ") + kDailyColumns +
                            " FROM daily_stats WHERE date = ?1";
    auto stmt = prepare(sql.c_str());
    bindText(db_.get(), stmt.get(), 1, date.toString());
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return readDaily(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        fail("Daily lookup failed");
    }
    return std::nullopt;
}

std::vector<DailyRecord> SqliteStatsStore::getRange(const CalendarDate& start,
                                                    const CalendarDate& end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string("SELECT ") + kDailyColumns +
                            " FROM daily_stats WHERE date BETWEEN ?1 AND ?2 ORDER BY date ASC";
    auto stmt = prepare(sql.c_str());
    bindText(db_.get(), stmt.get(), 1, start.toString());
    bindText(db_.get(), stmt.get(), 2, end.toString());

    std::vector<DailyRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(readDaily(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        fail("Range query failed");
    }
    return out;
}

std::vector<HourlyRecord> SqliteStatsStore::getHourly(const CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(
        "SELECT date, hour, chinese_chars, english_chars, number_chars, symbol_chars, "
        "other_chars, total_chars, created_at, updated_at "
        "FROM hourly_stats WHERE date = ?1 ORDER BY hour ASC");
    bindText(db_.get(), stmt.get(), 1, date.toString());

    std::vector<HourlyRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        HourlyRecord record;
        record.date = columnDate(stmt.get(), 0);
        record.hour = sqlite3_column_int(stmt.get(), 1);
        record.counters = readCounters(stmt.get(), 2);
        record.created_at = columnText(stmt.get(), 8);
        record.updated_at = columnText(stmt.get(), 9);
        out.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        fail("Hourly query failed");
    }
    return out;
}

std::optional<SessionRecord> SqliteStatsStore::getSession(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string("SELECT ") + kSessionColumns +
                            " FROM sessions WHERE session_id = ?1";
    auto stmt = prepare(sql.c_str());
    bindText(db_.get(), stmt.get(), 1, session_id);
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return readSession(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        fail("Session lookup failed");
    }
    return std::nullopt;
}

std::vector<SessionRecord> SqliteStatsStore::getSessions(const CalendarDate& start,
                                                         const CalendarDate& end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql = std::string("SELECT ") + kSessionColumns +
                            " FROM sessions WHERE substr(start_time, 1, 10) BETWEEN ?1 AND ?2"
                            " ORDER BY start_time ASC";
    auto stmt = prepare(sql.c_str());
    bindText(db_.get(), stmt.get(), 1, start.toString());
    bindText(db_.get(), stmt.get(), 2, end.toString());

    std::vector<SessionRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(readSession(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        fail("Session query failed");
    }
    return out;
}

StoreSummary SqliteStatsStore::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(
        "SELECT COUNT(*), SUM(chinese_chars), SUM(english_chars), SUM(number_chars), "
        "SUM(symbol_chars), SUM(other_chars), SUM(total_chars), SUM(session_count), "
        "AVG(chinese_chars), AVG(english_chars), AVG(total_chars), MIN(date), MAX(date) "
        "FROM daily_stats");
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        fail("Summary query failed");
    }

    StoreSummary out;
    out.total_days = sqlite3_column_int64(stmt.get(), 0);
    if (out.total_days == 0) {
        return out;
    }
    out.totals = readCounters(stmt.get(), 1);
    out.total_sessions = sqlite3_column_int64(stmt.get(), 7);
    out.avg_chinese = sqlite3_column_double(stmt.get(), 8);
    out.avg_english = sqlite3_column_double(stmt.get(), 9);
    out.avg_total = sqlite3_column_double(stmt.get(), 10);
    out.first_date = columnDate(stmt.get(), 11);
    out.last_date = columnDate(stmt.get(), 12);
    return out;
}

std::size_t SqliteStatsStore::closeDanglingSessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t closed = 0;
    runTransaction([&] {
        exec("UPDATE sessions SET end_time = updated_at WHERE end_time IS NULL");
        closed = static_cast<std::size_t>(sqlite3_changes(db_.get()));
    });
    return closed;
}

std::vector<CalendarDate> SqliteStatsStore::hourlyMismatches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(
        "SELECT d.date FROM daily_stats d "
        "LEFT JOIN (SELECT date, SUM(total_chars) AS total FROM hourly_stats GROUP BY date) h "
        "ON h.date = d.date "
        "WHERE COALESCE(h.total, 0) <> d.total_chars ORDER BY d.date ASC");

    std::vector<CalendarDate> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(columnDate(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        fail("Consistency query failed");
    }
    return out;
}

void SqliteStatsStore::backup(const std::string& destination) const {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* raw = nullptr;
    const int open_rc = sqlite3_open(destination.c_str(), &raw);
    std::unique_ptr<sqlite3, DbDeleter> target(raw);
    if (open_rc != SQLITE_OK) {
        const std::string reason = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(open_rc);
        throw StorageError("Unable to open backup target " + destination + ": " + reason);
    }

    sqlite3_backup* job = sqlite3_backup_init(target.get(), "main", db_.get(), "main");
    if (job == nullptr) {
        throw StorageError("Backup init failed: " + std::string(sqlite3_errmsg(target.get())));
    }
    const int step_rc = sqlite3_backup_step(job, -1);
    const int finish_rc = sqlite3_backup_finish(job);
    if (step_rc != SQLITE_DONE || finish_rc != SQLITE_OK) {
        throw StorageError("Backup to " + destination + " failed: " +
                           std::string(sqlite3_errmsg(target.get())));
    }
    std::cout << "[SqliteStatsStore] Backed up database to " << destination << '\n';
}

}  // namespace dic::stats
