#include <gtest/gtest.h>

#include <filesystem>

#include "daily_input_counter/errors.hpp"
#include "daily_input_counter/sqlite_stats_store.hpp"
#include "test_helpers.hpp"

using namespace dic::stats;
using namespace dic::stats::testing;

class SqliteStatsStoreTest : public ::testing::Test {
protected:
    SqliteStatsStore store{":memory:"};
};

TEST_F(SqliteStatsStoreTest, MissingDateHasNoRecord) {
    EXPECT_FALSE(store.getDaily(date("2024-01-01")).has_value());
    EXPECT_TRUE(store.getRange(date("2024-01-01"), date("2024-12-31")).empty());
    EXPECT_TRUE(store.getHourly(date("2024-01-01")).empty());
}

TEST_F(SqliteStatsStoreTest, UpsertsMergeDeltas) {
    const auto d1 = counters(3, 5, 1, 1, 0);
    const auto d2 = counters(2, 0, 4, 0, 7);

    store.upsertDaily(date("2024-01-01"), d1);
    store.upsertDaily(date("2024-01-01"), d2);

    const auto record = store.getDaily(date("2024-01-01"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->counters, d1 + d2);
    EXPECT_EQ(record->counters.total, 23);
    EXPECT_EQ(record->session_count, 0);
    EXPECT_FALSE(record->created_at.empty());
    EXPECT_FALSE(record->updated_at.empty());
}

TEST_F(SqliteStatsStoreTest, ZeroDeltaLeavesRowsUntouched) {
    store.upsertDaily(date("2024-01-02"), CounterSet{});
    EXPECT_FALSE(store.getDaily(date("2024-01-02")).has_value());

    store.upsertDaily(date("2024-01-01"), counters(1, 1));
    const auto before = store.getDaily(date("2024-01-01"));
    store.upsertDaily(date("2024-01-01"), CounterSet{});
    store.applyBatch(FlushBatch{});
    const auto after = store.getDaily(date("2024-01-01"));

    ASSERT_TRUE(before && after);
    EXPECT_EQ(before->counters, after->counters);
    EXPECT_EQ(before->updated_at, after->updated_at);
}

TEST_F(SqliteStatsStoreTest, HourlyRowsAreKeyedByHour) {
    store.upsertHourly(date("2024-01-01"), 23, counters(0, 3));
    store.upsertHourly(date("2024-01-01"), 0, counters(0, 1));
    store.upsertHourly(date("2024-01-01"), 23, counters(0, 2));

    const auto rows = store.getHourly(date("2024-01-01"));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].hour, 0);
    EXPECT_EQ(rows[0].counters.total, 1);
    EXPECT_EQ(rows[1].hour, 23);
    EXPECT_EQ(rows[1].counters.total, 5);

    EXPECT_THROW(store.upsertHourly(date("2024-01-01"), 24, counters(1, 0)), ValidationError);
    EXPECT_THROW(store.upsertHourly(date("2024-01-01"), -1, counters(1, 0)), ValidationError);
}

TEST_F(SqliteStatsStoreTest, RangeIsInclusiveAndOrdered) {
    store.upsertDaily(date("2024-01-03"), counters(0, 3));
    store.upsertDaily(date("2024-01-01"), counters(0, 1));
    store.upsertDaily(date("2024-01-05"), counters(0, 5));
    store.upsertDaily(date("2024-01-07"), counters(0, 7));

    const auto rows = store.getRange(date("2024-01-01"), date("2024-01-05"));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].date, date("2024-01-01"));
    EXPECT_EQ(rows[1].date, date("2024-01-03"));
    EXPECT_EQ(rows[2].date, date("2024-01-05"));
}

TEST_F(SqliteStatsStoreTest, OpeningSessionCountsOnStartDate) {
    store.openSession("s1", "2024-01-01 23:50:00");
    store.openSession("s1", "2024-01-01 23:50:00");
    store.openSession("s2", "2024-01-02 08:00:00");

    const auto jan1 = store.getDaily(date("2024-01-01"));
    ASSERT_TRUE(jan1.has_value());
    EXPECT_EQ(jan1->session_count, 1);
    EXPECT_EQ(jan1->counters.total, 0);

    store.closeSession("s1", "2024-01-02 00:10:00", counters(4, 4));
    const auto s1 = store.getSession("s1");
    ASSERT_TRUE(s1.has_value());
    EXPECT_EQ(s1->start_time, "2024-01-01 23:50:00");
    ASSERT_TRUE(s1->end_time.has_value());
    EXPECT_EQ(*s1->end_time, "2024-01-02 00:10:00");
    EXPECT_EQ(s1->counters.total, 8);

    const auto sessions = store.getSessions(date("2024-01-01"), date("2024-01-02"));
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].session_id, "s1");
    EXPECT_FALSE(sessions[1].end_time.has_value());

    EXPECT_FALSE(store.getSession("nope").has_value());
    EXPECT_THROW(store.closeSession("nope", "2024-01-02 00:00:00", CounterSet{}), StorageError);
    EXPECT_THROW(store.openSession("bad", "yesterday"), ValidationError);
}

TEST_F(SqliteStatsStoreTest, BatchAppliesEverythingTogether) {
    FlushBatch batch;
    batch.daily.push_back(DailyDelta{date("2024-01-01"), counters(2, 3)});
    batch.hourly.push_back(HourlyDelta{date("2024-01-01"), 10, counters(2, 3)});
    SessionChange change;
    change.session_id = "s1";
    change.start_time = "2024-01-01 10:00:00";
    change.newly_opened = true;
    change.counters = counters(2, 3);
    batch.sessions.push_back(change);

    store.applyBatch(batch);

    const auto record = store.getDaily(date("2024-01-01"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->counters.total, 5);
    EXPECT_EQ(record->session_count, 1);
    EXPECT_EQ(store.getHourly(date("2024-01-01")).size(), 1u);
    EXPECT_EQ(store.getSession("s1")->counters.total, 5);
    EXPECT_TRUE(store.hourlyMismatches().empty());
}

TEST_F(SqliteStatsStoreTest, FailedBatchRollsBack) {
    store.upsertDaily(date("2024-01-01"), counters(1, 1));

    FlushBatch batch;
    batch.daily.push_back(DailyDelta{date("2024-01-01"), counters(10, 10)});
    SessionChange unknown;
    unknown.session_id = "never-opened";
    unknown.start_time = "2024-01-01 10:00:00";
    unknown.counters = counters(10, 10);
    batch.sessions.push_back(unknown);

    EXPECT_THROW(store.applyBatch(batch), StorageError);
    EXPECT_EQ(store.getDaily(date("2024-01-01"))->counters.total, 2);

    FlushBatch bad_hour;
    bad_hour.daily.push_back(DailyDelta{date("2024-01-01"), counters(5, 0)});
    bad_hour.hourly.push_back(HourlyDelta{date("2024-01-01"), 25, counters(5, 0)});
    EXPECT_THROW(store.applyBatch(bad_hour), ValidationError);
    EXPECT_EQ(store.getDaily(date("2024-01-01"))->counters.total, 2);
}

TEST_F(SqliteStatsStoreTest, SummaryAggregatesAllDays) {
    EXPECT_EQ(store.summary().total_days, 0);
    EXPECT_FALSE(store.summary().first_date.has_value());

    store.upsertDaily(date("2024-01-01"), counters(10, 20));
    store.upsertDaily(date("2024-01-05"), counters(30, 40));
    store.openSession("s1", "2024-01-05 09:00:00");

    const auto summary = store.summary();
    EXPECT_EQ(summary.total_days, 2);
    EXPECT_EQ(summary.total_sessions, 1);
    EXPECT_EQ(summary.totals, counters(40, 60));
    EXPECT_DOUBLE_EQ(summary.avg_chinese, 20.0);
    EXPECT_DOUBLE_EQ(summary.avg_english, 30.0);
    EXPECT_DOUBLE_EQ(summary.avg_total, 50.0);
    EXPECT_EQ(*summary.first_date, date("2024-01-01"));
    EXPECT_EQ(*summary.last_date, date("2024-01-05"));
}

TEST_F(SqliteStatsStoreTest, DanglingSessionsAreClosed) {
    store.openSession("s1", "2024-01-01 10:00:00");
    store.openSession("s2", "2024-01-01 11:00:00");
    store.closeSession("s2", "2024-01-01 11:30:00", CounterSet{});

    EXPECT_EQ(store.closeDanglingSessions(), 1u);
    EXPECT_TRUE(store.getSession("s1")->end_time.has_value());
    EXPECT_EQ(*store.getSession("s2")->end_time, "2024-01-01 11:30:00");
    EXPECT_EQ(store.closeDanglingSessions(), 0u);
}

TEST(SqliteStatsStoreClockTest, TimestampsComeFromInjectedClock) {
    ManualClock clock(at("2024-01-01", 10));
    SqliteStatsStore store(":memory:", clock);

    store.upsertDaily(date("2024-01-01"), counters(1, 1));
    store.upsertHourly(date("2024-01-01"), 10, counters(1, 1));
    store.openSession("s1", "2024-01-01 10:00:00");

    clock.set(at("2024-01-01", 10, 30));
    store.upsertDaily(date("2024-01-01"), counters(0, 2));
    const auto daily = store.getDaily(date("2024-01-01"));
    ASSERT_TRUE(daily.has_value());
    EXPECT_EQ(daily->created_at, "2024-01-01 10:00:00");
    EXPECT_EQ(daily->updated_at, "2024-01-01 10:30:00");
    EXPECT_EQ(store.getHourly(date("2024-01-01"))[0].updated_at, "2024-01-01 10:00:00");

    clock.set(at("2024-01-01", 10, 45));
    FlushBatch batch;
    SessionChange change;
    change.session_id = "s1";
    change.start_time = "2024-01-01 10:00:00";
    change.counters = counters(0, 4);
    batch.sessions.push_back(change);
    store.applyBatch(batch);

    // A dangling session ends at its last write, not at the recovery time.
    clock.set(at("2024-01-01", 11));
    EXPECT_EQ(store.closeDanglingSessions(), 1u);
    const auto s1 = store.getSession("s1");
    ASSERT_TRUE(s1 && s1->end_time);
    EXPECT_EQ(*s1->end_time, "2024-01-01 10:45:00");
}

TEST_F(SqliteStatsStoreTest, ReportsHourlyMismatches) {
    store.upsertDaily(date("2024-01-01"), counters(0, 5));
    store.upsertDaily(date("2024-01-02"), counters(0, 2));
    store.upsertHourly(date("2024-01-02"), 9, counters(0, 2));

    const auto mismatches = store.hourlyMismatches();
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0], date("2024-01-01"));
}

TEST(SqliteStatsStoreFileTest, DataSurvivesReopenAndBackup) {
    TempDir dir;
    const auto db_path = (dir.path() / "daily_stats.db").string();
    const auto backup_path = (dir.path() / "copy.db").string();

    {
        SqliteStatsStore store(db_path);
        store.upsertDaily(date("2024-02-29"), counters(7, 8, 9));
    }

    SqliteStatsStore reopened(db_path);
    ASSERT_TRUE(reopened.getDaily(date("2024-02-29")).has_value());
    EXPECT_EQ(reopened.getDaily(date("2024-02-29"))->counters.total, 24);

    reopened.backup(backup_path);
    ASSERT_TRUE(std::filesystem::exists(backup_path));
    SqliteStatsStore copy(backup_path);
    EXPECT_EQ(copy.getDaily(date("2024-02-29"))->counters, counters(7, 8, 9));
}

TEST(SqliteStatsStoreFileTest, UnopenablePathThrows) {
    TempDir dir;
    const auto bad = (dir.path() / "missing" / "nested" / "db.sqlite").string();
    EXPECT_THROW(SqliteStatsStore store(bad), StorageError);
}
