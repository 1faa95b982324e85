#include <tundra/data/csv_bar_loader.hpp>
#include <tundra/core/time_utils.hpp>
#include <tundra/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <execution>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace tundra::data {

namespace {

struct ColumnMap {
    int timestamp = -1;
    int open = -1;
    int high = -1;
    int low = -1;
    int close = -1;
    int volume = -1;

    bool complete() const {
        return timestamp >= 0 && open >= 0 && high >= 0 && low >= 0 && close >= 0;
    }
};

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\"");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\"");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

ColumnMap map_columns(const std::string& header) {
    ColumnMap columns;
    std::vector<std::string> names = split(header);
    for (size_t i = 0; i < names.size(); ++i) {
        std::string name = names[i];
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        int index = static_cast<int>(i);

        if (name == "timestamp" || name == "time" || name == "date" || name == "datetime") {
            if (columns.timestamp < 0) columns.timestamp = index;
        } else if (name == "open") {
            columns.open = index;
        } else if (name == "high") {
            columns.high = index;
        } else if (name == "low") {
            columns.low = index;
        } else if (name == "close") {
            columns.close = index;
        } else if (name == "volume" || name == "tick_volume") {
            if (columns.volume < 0) columns.volume = index;
        }
    }
    return columns;
}

std::optional<core::Bar> parse_row(const std::string& line, const ColumnMap& columns) {
    std::vector<std::string> fields = split(line);
    int needed = std::max({columns.timestamp, columns.open, columns.high,
                           columns.low, columns.close, columns.volume});
    if (static_cast<int>(fields.size()) <= needed) {
        return std::nullopt;
    }

    auto timestamp = core::parse_timestamp(fields[columns.timestamp]);
    if (!timestamp) {
        return std::nullopt;
    }

    try {
        core::Bar bar(*timestamp,
                      std::stod(fields[columns.open]),
                      std::stod(fields[columns.high]),
                      std::stod(fields[columns.low]),
                      std::stod(fields[columns.close]),
                      columns.volume >= 0 && !fields[columns.volume].empty()
                          ? std::stod(fields[columns.volume]) : 0.0);
        if (!bar.is_well_formed()) {
            return std::nullopt;
        }
        return bar;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<CsvLoadResult> parse_csv_bars(std::istream& input, const std::string& source_name) {
    std::string header;
    if (!std::getline(input, header)) {
        utils::Logger::error() << "CSV source is empty: " << source_name << utils::Logger::endl;
        return std::nullopt;
    }

    ColumnMap columns = map_columns(header);
    if (!columns.complete()) {
        utils::Logger::error() << "CSV header of " << source_name
                               << " needs timestamp, open, high, low and close columns"
                               << utils::Logger::endl;
        return std::nullopt;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
    }

    std::vector<std::optional<core::Bar>> parsed(lines.size());
    std::transform(std::execution::par, lines.begin(), lines.end(), parsed.begin(),
                   [&columns](const std::string& row) { return parse_row(row, columns); });

    CsvLoadResult result;
    result.rows_read = lines.size();
    result.bars.reserve(lines.size());
    for (auto& bar : parsed) {
        if (bar) {
            result.bars.push_back(*bar);
        } else {
            result.rows_skipped++;
        }
    }

    std::stable_sort(result.bars.begin(), result.bars.end(),
                     [](const core::Bar& a, const core::Bar& b) { return a.timestamp < b.timestamp; });

    auto last = std::unique(result.bars.begin(), result.bars.end(),
                            [](const core::Bar& a, const core::Bar& b) { return a.timestamp == b.timestamp; });
    result.duplicates_dropped = static_cast<size_t>(std::distance(last, result.bars.end()));
    result.bars.erase(last, result.bars.end());

    if (result.rows_skipped > 0) {
        utils::Logger::warn() << "Skipped " << result.rows_skipped << " malformed rows in "
                              << source_name << utils::Logger::endl;
    }
    if (result.duplicates_dropped > 0) {
        utils::Logger::warn() << "Dropped " << result.duplicates_dropped << " duplicate timestamps in "
                              << source_name << utils::Logger::endl;
    }

    return result;
}

std::optional<CsvLoadResult> load_csv_bars(const std::string& csv_file) {
    auto start_time = std::chrono::high_resolution_clock::now();

    if (!std::filesystem::exists(csv_file)) {
        utils::Logger::error() << "CSV file does not exist: " << csv_file << utils::Logger::endl;
        return std::nullopt;
    }

    std::ifstream file(csv_file);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to open CSV file: " << csv_file << utils::Logger::endl;
        return std::nullopt;
    }

    auto result = parse_csv_bars(file, csv_file);
    if (!result) {
        return std::nullopt;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    utils::Logger::info() << "Loaded " << result->bars.size() << " bars from "
                          << result->rows_read << " rows in " << csv_file
                          << " (" << duration << "ms)" << utils::Logger::endl;
    return result;
}

bool load_symbol(const std::string& symbol, const std::string& csv_file, core::BarSeriesMap& bars) {
    auto result = load_csv_bars(csv_file);
    if (!result || result->bars.empty()) {
        utils::Logger::warn() << "No data for " << symbol << " in " << csv_file << utils::Logger::endl;
        return false;
    }
    bars[symbol] = std::move(result->bars);
    return true;
}

} // namespace tundra::data
