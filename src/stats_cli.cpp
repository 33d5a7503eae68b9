#include "daily_input_counter/stats_cli.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "daily_input_counter/calendar.hpp"
#include "daily_input_counter/counter_aggregator.hpp"
#include "daily_input_counter/csv_exporter.hpp"
#include "daily_input_counter/errors.hpp"
#include "daily_input_counter/flush_policy.hpp"
#include "daily_input_counter/report_service.hpp"
#include "daily_input_counter/stats_store.hpp"

namespace dic::stats {

namespace {

std::string restOfLine(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    const auto first = rest.find_first_not_of(' ');
    return first == std::string::npos ? std::string() : rest.substr(first);
}

std::string backupStamp(const LocalDateTime& now) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << now.date.year << std::setw(2) << now.date.month
        << std::setw(2) << now.date.day << '_' << std::setw(2) << now.hour
        << std::setw(2) << now.minute << std::setw(2) << now.second;
    return oss.str();
}

}  // namespace

StatsCLI::StatsCLI(CounterAggregator& aggregator,
                   FlushPolicy& policy,
                   const ReportService& reports,
                   const StatsStore& store,
                   const Clock& clock,
                   std::filesystem::path backup_dir)
    : aggregator_(aggregator),
      policy_(policy),
      reports_(reports),
      store_(store),
      clock_(clock),
      backup_dir_(std::move(backup_dir)) {}

void StatsCLI::printHelp(std::ostream& out) const {
    out << "Commands:" << '\n'
        << "  help                      - show this help" << '\n'
        << "  type <text>               - count the characters of <text>" << '\n'
        << "  start | stop              - open / close a listening session" << '\n'
        << "  today | hour | session    - live counters" << '\n'
        << "  day <date>                - stored totals for one date (YYYY-MM-DD)" << '\n'
        << "  range <start> <end>       - stored totals per day" << '\n'
        << "  week <start>              - 7-day summary starting at <start>" << '\n'
        << "  month <year> <month>      - calendar month summary" << '\n'
        << "  trend <days>              - trailing per-day trend and average" << '\n'
        << "  summary                   - all-time totals" << '\n'
        << "  export <start> <end> <file> - write a CSV of daily totals" << '\n'
        << "  status                    - flush state and pending work" << '\n'
        << "  flush                     - write pending counters now" << '\n'
        << "  backup [file]             - copy the database" << '\n'
        << "  quit                      - flush and exit" << '\n';
}

void StatsCLI::printCounters(std::ostream& out, const std::string& label,
                             const CounterSet& counters) const {
    out << label << ": " << describe(counters) << '\n';
}

void StatsCLI::printRecord(std::ostream& out, const DailyRecord& record) const {
    out << "  " << record.date.toString()
        << "  chinese=" << record.counters.chinese
        << " english=" << record.counters.english
        << " number=" << record.counters.number
        << " symbol=" << record.counters.symbol
        << " other=" << record.counters.other
        << " total=" << record.counters.total
        << " sessions=" << record.session_count << '\n';
}

void StatsCLI::printPeriod(std::ostream& out, const std::string& label,
                           const PeriodSummary& summary) const {
    out << label << " " << summary.start.toString() << " .. " << summary.end.toString()
        << " (" << summary.active_days << "/" << summary.day_count << " active days, "
        << summary.session_count << " sessions)" << '\n';
    printCounters(out, "  totals", summary.totals);
    out << "  daily average: " << std::fixed << std::setprecision(1)
        << summary.daily_average << std::defaultfloat << '\n';
}

void StatsCLI::handleType(const std::string& text, std::ostream& out) {
    if (text.empty()) {
        out << "Nothing to count" << '\n';
        return;
    }
    aggregator_.recordText(text);
    printCounters(out, "Today", aggregator_.getCurrentCounters());
}

void StatsCLI::handleStart(std::ostream& out) {
    const auto id = aggregator_.beginSession();
    out << "Session " << id << " started" << '\n';
}

void StatsCLI::handleStop(std::ostream& out) {
    const auto counters = aggregator_.currentSessionCounters();
    const auto id = aggregator_.endSession();
    if (!id) {
        out << "No session is running" << '\n';
        return;
    }
    out << "Session " << *id << " stopped" << '\n';
    printCounters(out, "Session", counters);
}

void StatsCLI::handleTrend(int days, std::ostream& out) const {
    const auto trend = reports_.trendAnalysis(days);
    out << "Trend over " << days << " day(s):" << '\n';
    for (const auto& day : trend.days) {
        out << "  " << day.date.toString() << "  " << day.counters.total << '\n';
    }
    out << "  daily average: " << std::fixed << std::setprecision(1)
        << trend.daily_average << std::defaultfloat << '\n';
    if (trend.peak) {
        out << "  peak: " << trend.peak->date.toString() << " ("
            << trend.peak->counters.total << ")" << '\n';
    }
}

void StatsCLI::handleSummary(std::ostream& out) const {
    const auto summary = reports_.summary();
    if (summary.total_days == 0) {
        out << "No statistics recorded yet" << '\n';
        return;
    }
    out << "Recorded days: " << summary.total_days << " ("
        << summary.first_date->toString() << " .. " << summary.last_date->toString() << ")"
        << ", sessions: " << summary.total_sessions << '\n';
    printCounters(out, "  totals", summary.totals);
    out << std::fixed << std::setprecision(1)
        << "  average per day: chinese=" << summary.avg_chinese
        << " english=" << summary.avg_english
        << " total=" << summary.avg_total << std::defaultfloat << '\n';
}

void StatsCLI::handleExport(const std::string& start, const std::string& end,
                            const std::string& path, std::ostream& out) const {
    const auto records = reports_.getRange(start, end);
    CsvExporter::writeFile(records, path);
    out << "Exported " << records.size() << " day(s) to " << path << '\n';
}

void StatsCLI::handleBackup(const std::string& path, std::ostream& out) const {
    std::filesystem::path target = path;
    if (target.empty()) {
        target = backup_dir_ / ("daily_stats_backup_" + backupStamp(clock_.now()) + ".db");
    }
    store_.backup(target.string());
    out << "Backup written to " << target.string() << '\n';
}

bool StatsCLI::execute(const std::string& line, std::ostream& out) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) {
        return true;
    }

    try {
        if (cmd == "help") {
            printHelp(out);
        } else if (cmd == "type") {
            handleType(restOfLine(iss), out);
        } else if (cmd == "start") {
            handleStart(out);
        } else if (cmd == "stop") {
            handleStop(out);
        } else if (cmd == "today") {
            printCounters(out, "Today", aggregator_.getCurrentCounters());
        } else if (cmd == "hour") {
            printCounters(out, "This hour", aggregator_.currentHourCounters());
        } else if (cmd == "session") {
            const auto id = aggregator_.activeSessionId();
            if (!id) {
                out << "No session is running" << '\n';
            } else {
                printCounters(out, "Session " + *id, aggregator_.currentSessionCounters());
            }
        } else if (cmd == "day") {
            std::string date;
            if (!(iss >> date)) {
                out << "Usage: day <YYYY-MM-DD>" << '\n';
            } else if (auto record = reports_.getDaily(date)) {
                printRecord(out, *record);
            } else {
                out << "No statistics for " << date << '\n';
            }
        } else if (cmd == "range") {
            std::string start;
            std::string end;
            if (!(iss >> start >> end)) {
                out << "Usage: range <start> <end>" << '\n';
            } else {
                const auto records = reports_.getRange(start, end);
                out << records.size() << " day(s) with data" << '\n';
                for (const auto& record : records) {
                    printRecord(out, record);
                }
            }
        } else if (cmd == "week") {
            std::string start;
            if (!(iss >> start)) {
                out << "Usage: week <YYYY-MM-DD>" << '\n';
            } else {
                printPeriod(out, "Week", reports_.weeklySummary(start));
            }
        } else if (cmd == "month") {
            int year = 0;
            int month = 0;
            if (!(iss >> year >> month)) {
                out << "Usage: month <year> <month>" << '\n';
            } else {
                printPeriod(out, "Month", reports_.monthlySummary(year, month));
            }
        } else if (cmd == "trend") {
            int days = 0;
            if (!(iss >> days)) {
                out << "Usage: trend <days>" << '\n';
            } else {
                handleTrend(days, out);
            }
        } else if (cmd == "summary") {
            handleSummary(out);
        } else if (cmd == "export") {
            std::string start;
            std::string end;
            std::string path;
            if (!(iss >> start >> end >> path)) {
                out << "Usage: export <start> <end> <file>" << '\n';
            } else {
                handleExport(start, end, path, out);
            }
        } else if (cmd == "status") {
            out << "Store: " << store_.id() << ", flush state: " << flushStateName(policy_.state())
                << ", pending: " << (aggregator_.hasPending() ? "yes" : "no")
                << ", failed attempts: " << policy_.consecutiveFailures() << '\n';
        } else if (cmd == "flush") {
            out << (policy_.flushNow() ? "Flushed" : "Flush failed, will retry") << '\n';
        } else if (cmd == "backup") {
            std::string path;
            iss >> path;
            handleBackup(path, out);
        } else if (cmd == "quit" || cmd == "exit") {
            return false;
        } else {
            out << "Unknown command" << '\n';
        }
    } catch (const ValidationError& ex) {
        out << "Invalid input: " << ex.what() << '\n';
    } catch (const StorageError& ex) {
        out << "Storage error: " << ex.what() << '\n';
    } catch (const std::runtime_error& ex) {
        out << "Error: " << ex.what() << '\n';
    }
    return true;
}

void StatsCLI::run(std::istream& in, std::ostream& out) {
    out << "Daily input counter. Today is " << aggregator_.today().toString() << '\n';
    printHelp(out);

    std::string line;
    while (true) {
        out << "> " << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        if (!execute(line, out)) {
            break;
        }
    }
    out << "Exiting" << '\n';
}

void StatsCLI::run() {
    run(std::cin, std::cout);
}

}  // namespace dic::stats
