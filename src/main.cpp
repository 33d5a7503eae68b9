#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "daily_input_counter/calendar.hpp"
#include "daily_input_counter/config_loader.hpp"
#include "daily_input_counter/counter_aggregator.hpp"
#include "daily_input_counter/errors.hpp"
#include "daily_input_counter/flush_policy.hpp"
#include "daily_input_counter/report_service.hpp"
#include "daily_input_counter/sqlite_stats_store.hpp"
#include "daily_input_counter/stats_cli.hpp"

using dic::stats::ConfigLoader;
using dic::stats::CounterAggregator;
using dic::stats::FlushPolicy;
using dic::stats::ReportService;
using dic::stats::RuntimeConfig;
using dic::stats::ShutdownTimeoutError;
using dic::stats::SqliteStatsStore;
using dic::stats::StatsCLI;
using dic::stats::SystemClock;

int main(int argc, char** argv) {
    try {
        ConfigLoader loader;

        std::string config_path = "configs/example.toml";
        if (argc > 1) {
            config_path = argv[1];
        }

        RuntimeConfig runtime = loader.loadFromFile(config_path);
        std::filesystem::create_directories(runtime.data_dir);

        SystemClock clock;
        SqliteStatsStore store(runtime.database_path.string(), clock);
        CounterAggregator aggregator(clock);
        FlushPolicy policy(aggregator, store, runtime.flush);
        policy.recoverOnStartup();

        if (runtime.auto_start) {
            const auto id = aggregator.beginSession();
            std::cout << "[main] Session " << id << " started" << '\n';
        }
        policy.start();

        ReportService reports(store, clock);
        StatsCLI cli(aggregator, policy, reports, store, clock, runtime.data_dir);
        cli.run();

        try {
            policy.shutdown();
        } catch (const ShutdownTimeoutError& ex) {
            std::cerr << "[main] Statistics may be incomplete: " << ex.what() << '\n';
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
