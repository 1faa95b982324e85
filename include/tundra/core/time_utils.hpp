#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tundra::core {

// Bar timestamps are seconds since the Unix epoch, UTC.
constexpr int64_t kSecondsPerDay = 86400;

constexpr int64_t days(int64_t n) { return n * kSecondsPerDay; }

// UTC calendar day number of a timestamp (floor division, so negative
// timestamps land on the right day).
int64_t day_index(int64_t timestamp);

// Accepts epoch seconds, "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" (a 'T'
// separator works too). Interpreted as UTC.
std::optional<int64_t> parse_timestamp(const std::string& text);

// YYYY-MM-DD
std::string format_date(int64_t timestamp);

// YYYY-MM-DD HH:MM:SS
std::string format_datetime(int64_t timestamp);

} // namespace tundra::core
