#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>

#include "daily_input_counter/types.hpp"

namespace dic::stats {

class Clock;
class CounterAggregator;
class FlushPolicy;
class ReportService;
class StatsStore;
struct DailyRecord;
struct PeriodSummary;

// Line-oriented console. Typed text is fed through the classifier into the
// aggregator; the remaining commands are reports and maintenance.
class StatsCLI {
public:
    StatsCLI(CounterAggregator& aggregator,
             FlushPolicy& policy,
             const ReportService& reports,
             const StatsStore& store,
             const Clock& clock,
             std::filesystem::path backup_dir);

    void run();
    void run(std::istream& in, std::ostream& out);

    // Returns false when the command asks to quit.
    bool execute(const std::string& line, std::ostream& out);

private:
    CounterAggregator& aggregator_;
    FlushPolicy& policy_;
    const ReportService& reports_;
    const StatsStore& store_;
    const Clock& clock_;
    std::filesystem::path backup_dir_;

    void printHelp(std::ostream& out) const;
    void printCounters(std::ostream& out, const std::string& label, const CounterSet& counters) const;
    void printRecord(std::ostream& out, const DailyRecord& record) const;
    void printPeriod(std::ostream& out, const std::string& label, const PeriodSummary& summary) const;

    void handleType(const std::string& text, std::ostream& out);
    void handleStart(std::ostream& out);
    void handleStop(std::ostream& out);
    void handleTrend(int days, std::ostream& out) const;
    void handleSummary(std::ostream& out) const;
    void handleExport(const std::string& start, const std::string& end,
                      const std::string& path, std::ostream& out) const;
    void handleBackup(const std::string& path, std::ostream& out) const;
};

}  // namespace dic::stats
