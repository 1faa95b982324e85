#pragma once
#include <tundra/core/bar.hpp>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace tundra::data {

struct CsvLoadResult {
    core::BarSeries bars;        // sorted by timestamp, unique timestamps
    size_t rows_read = 0;
    size_t rows_skipped = 0;     // unparseable or malformed
    size_t duplicates_dropped = 0;
};

// One symbol per file. The header row names the columns; "timestamp" (or
// "time", "date", "datetime"), "open", "high", "low" and "close" are
// required, "volume" (or "tick_volume") is optional. Column names are case
// insensitive. Returns std::nullopt if the file cannot be read or the header
// lacks a required column.
std::optional<CsvLoadResult> load_csv_bars(const std::string& csv_file);

std::optional<CsvLoadResult> parse_csv_bars(std::istream& input, const std::string& source_name);

// Loads `csv_file` into `bars[symbol]`. Returns false (and leaves `bars`
// untouched) if nothing usable was loaded.
bool load_symbol(const std::string& symbol, const std::string& csv_file, core::BarSeriesMap& bars);

} // namespace tundra::data
