#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "daily_input_counter/counter_aggregator.hpp"
#include "daily_input_counter/flush_policy.hpp"
#include "daily_input_counter/report_service.hpp"
#include "daily_input_counter/stats_cli.hpp"
#include "test_helpers.hpp"

using namespace dic::stats;
using namespace dic::stats::testing;

class StatsCLITest : public ::testing::Test {
protected:
    TempDir dir;
    ManualClock clock{at("2024-03-10", 12)};
    FlakyStore store{clock};
    CounterAggregator aggregator{clock};
    FlushPolicy policy{aggregator, store, FlushSettings{}};
    ReportService reports{store, clock};
    StatsCLI cli{aggregator, policy, reports, store, clock, dir.path()};

    std::string run(const std::string& line) {
        std::ostringstream out;
        EXPECT_TRUE(cli.execute(line, out));
        return out.str();
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }
};

TEST_F(StatsCLITest, TypeCountsTextIntoToday) {
    const auto out = run("type Hello你好123!");
    EXPECT_TRUE(contains(out, "Today: chinese=2 english=5 number=3 symbol=1 other=0 total=11"))
        << out;
    EXPECT_TRUE(contains(run("hour"), "total=11"));
    EXPECT_TRUE(contains(run("type"), "Nothing to count"));
}

TEST_F(StatsCLITest, FlushThenQueryStoredDay) {
    run("type abc");
    EXPECT_TRUE(contains(run("day 2024-03-10"), "No statistics for 2024-03-10"));
    EXPECT_TRUE(contains(run("flush"), "Flushed"));

    const auto day = run("day 2024-03-10");
    EXPECT_TRUE(contains(day, "2024-03-10"));
    EXPECT_TRUE(contains(day, "english=3"));
    EXPECT_TRUE(contains(run("range 2024-03-01 2024-03-31"), "1 day(s) with data"));
    EXPECT_TRUE(contains(run("week 2024-03-04"), "(1/7 active days"));
    EXPECT_TRUE(contains(run("month 2024 3"), "(1/31 active days"));
    EXPECT_TRUE(contains(run("trend 3"), "2024-03-10  3"));
    EXPECT_TRUE(contains(run("summary"), "Recorded days: 1"));
}

TEST_F(StatsCLITest, FailedFlushIsReported) {
    run("type abc");
    store.failNextBatches(1);
    EXPECT_TRUE(contains(run("flush"), "Flush failed, will retry"));
    EXPECT_TRUE(contains(run("flush"), "Flushed"));
    EXPECT_EQ(store.getDaily(date("2024-03-10"))->counters.total, 3);
}

TEST_F(StatsCLITest, SessionCommands) {
    EXPECT_TRUE(contains(run("session"), "No session is running"));
    EXPECT_TRUE(contains(run("stop"), "No session is running"));

    const auto started = run("start");
    EXPECT_TRUE(contains(started, "Session 20240310T120000-"));
    run("type ab");
    EXPECT_TRUE(contains(run("session"), "total=2"));

    const auto stopped = run("stop");
    EXPECT_TRUE(contains(stopped, "stopped"));
    EXPECT_TRUE(contains(stopped, "Session: chinese=0 english=2"));
}

TEST_F(StatsCLITest, InvalidInputIsReportedNotThrown) {
    EXPECT_TRUE(contains(run("day 2024-13-40"), "Invalid input:"));
    EXPECT_TRUE(contains(run("range 2024-03-10 2024-03-01"), "Invalid input:"));
    EXPECT_TRUE(contains(run("trend 0"), "Invalid input:"));
    EXPECT_TRUE(contains(run("month 2024 13"), "Invalid input:"));
    EXPECT_TRUE(contains(run("day"), "Usage: day"));
    EXPECT_TRUE(contains(run("trend many"), "Usage: trend"));
    EXPECT_TRUE(contains(run("frobnicate"), "Unknown command"));
    EXPECT_EQ(run(""), "");
}

TEST_F(StatsCLITest, ExportAndBackupWriteFiles) {
    run("type 你好");
    run("flush");

    const auto csv = (dir.path() / "out.csv").string();
    EXPECT_TRUE(contains(run("export 2024-03-01 2024-03-31 " + csv), "Exported 1 day(s)"));
    EXPECT_TRUE(std::filesystem::exists(csv));

    EXPECT_TRUE(contains(run("backup"), "Backup written to"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "daily_stats_backup_20240310_120000.db"));

    const auto named = (dir.path() / "named.db").string();
    run("backup " + named);
    EXPECT_TRUE(std::filesystem::exists(named));
}

TEST_F(StatsCLITest, QuitStopsTheLoop) {
    std::ostringstream out;
    EXPECT_FALSE(cli.execute("quit", out));
    EXPECT_FALSE(cli.execute("exit", out));

    std::istringstream in("type xyz\nquit\ntype never\n");
    std::ostringstream session;
    cli.run(in, session);
    EXPECT_TRUE(contains(session.str(), "Exiting"));
    EXPECT_EQ(aggregator.getCurrentCounters().total, 3);
}

TEST_F(StatsCLITest, StatusShowsFlushState) {
    run("type a");
    const auto before = run("status");
    EXPECT_TRUE(contains(before, "Store: sqlite, flush state: idle, pending: yes")) << before;

    store.failNextBatches(1);
    run("flush");
    EXPECT_TRUE(contains(run("status"), "flush state: flushing, pending: yes, failed attempts: 1"));

    run("flush");
    EXPECT_TRUE(contains(run("status"), "flush state: idle, pending: no, failed attempts: 0"));
}
