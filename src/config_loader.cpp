#include "daily_input_counter/config_loader.hpp"

// Use the system package include path
#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dic::stats {

namespace {

// Upper bound for every configured duration: one day.
constexpr std::int64_t kMaxDurationMs = 24LL * 60 * 60 * 1000;

std::chrono::milliseconds positiveDuration(const toml::table& tbl,
                                           std::string_view section,
                                           std::string_view key,
                                           std::int64_t fallback,
                                           std::int64_t unit_ms) {
    const std::int64_t value = tbl[section][key].value_or(fallback);
    if (value <= 0) {
        throw std::runtime_error("[" + std::string(section) + "] " + std::string(key) +
                                 " must be positive, got " + std::to_string(value));
    }
    if (value > kMaxDurationMs / unit_ms) {
        throw std::runtime_error("[" + std::string(section) + "] " + std::string(key) +
                                 " must be at most " + std::to_string(kMaxDurationMs / unit_ms) +
                                 ", got " + std::to_string(value));
    }
    return std::chrono::milliseconds(value * unit_ms);
}

RuntimeConfig buildConfig(const toml::table& tbl, const std::filesystem::path& base_dir) {
    RuntimeConfig config;

    // 1. Storage
    std::filesystem::path data_dir = tbl["storage"]["data_path"].value_or(std::string("./data"));
    if (data_dir.is_relative()) {
        data_dir = base_dir / data_dir;
    }
    const std::string database = tbl["storage"]["database"].value_or(std::string("daily_stats.db"));
    if (database.empty()) {
        throw std::runtime_error("[storage] database must not be empty");
    }
    config.data_dir = data_dir.lexically_normal();
    config.database_path = database == ":memory:" ? std::filesystem::path(database)
                                                  : config.data_dir / database;

    // 2. Flush timing
    config.flush.interval = positiveDuration(tbl, "flush", "interval_seconds", 60, 1000);
    config.flush.retry_backoff = positiveDuration(tbl, "flush", "retry_backoff_ms", 1000, 1);
    config.flush.shutdown_timeout = positiveDuration(tbl, "flush", "shutdown_timeout_ms", 5000, 1);

    // 3. Listener
    config.auto_start = tbl["listener"]["auto_start"].value_or(true);
    return config;
}

}  // namespace

RuntimeConfig ConfigLoader::loadFromFile(const std::string& path) const {
    const auto file_path = std::filesystem::absolute(path);
    if (!std::filesystem::exists(file_path)) {
        throw std::runtime_error("Config file not found: " + file_path.string());
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(file_path.string());
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error: " + std::string(err.description()));
    }

    auto config = buildConfig(tbl, file_path.parent_path());
    std::cout << "[ConfigLoader] Loaded " << file_path.string() << " (database "
              << config.database_path.string() << ", flush every "
              << config.flush.interval.count() << " ms)" << '\n';
    return config;
}

RuntimeConfig ConfigLoader::loadFromString(const std::string& toml_text,
                                           const std::filesystem::path& base_dir) const {
    toml::table tbl;
    try {
        tbl = toml::parse(toml_text);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error: " + std::string(err.description()));
    }
    return buildConfig(tbl, base_dir);
}

}  // namespace dic::stats
