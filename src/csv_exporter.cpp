#include "daily_input_counter/csv_exporter.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace dic::stats {

std::string CsvExporter::format(const std::vector<DailyRecord>& records) {
    std::ostringstream oss;
    oss << kHeader << '\n';
    for (const auto& record : records) {
        oss << record.date.toString() << ','
            << record.counters.chinese << ','
            << record.counters.english << ','
            << record.counters.total << ','
            << record.session_count << '\n';
    }
    return oss.str();
}

void CsvExporter::writeFile(const std::vector<DailyRecord>& records, const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open export file: " + path);
    }
    out << format(records);
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write export file: " + path);
    }
    std::cout << "[CsvExporter] Wrote " << records.size() << " row(s) to " << path << '\n';
}

}  // namespace dic::stats
