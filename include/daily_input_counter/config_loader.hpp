#pragma once

#include <filesystem>
#include <string>

#include "daily_input_counter/flush_policy.hpp"

namespace dic::stats {

struct RuntimeConfig {
    std::filesystem::path data_dir{"data"};
    std::filesystem::path database_path{"data/daily_stats.db"};
    FlushSettings flush;
    bool auto_start{true};
};

class ConfigLoader {
public:
    [[nodiscard]] RuntimeConfig loadFromFile(const std::string& path) const;
    [[nodiscard]] RuntimeConfig loadFromString(const std::string& toml_text,
                                               const std::filesystem::path& base_dir) const;
};

}  // namespace dic::stats
