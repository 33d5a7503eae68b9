#pragma once

#include <string>
#include <vector>

#include "daily_input_counter/records.hpp"

namespace dic::stats {

class CsvExporter {
public:
    static constexpr const char* kHeader = "date,chinese_chars,english_chars,total_chars,session_count";

    // Rows are written in the order given; callers pass getRange() output.
    [[nodiscard]] static std::string format(const std::vector<DailyRecord>& records);
    static void writeFile(const std::vector<DailyRecord>& records, const std::string& path);
};

}  // namespace dic::stats
