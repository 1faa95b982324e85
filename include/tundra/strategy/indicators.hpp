#pragma once
#include <tundra/core/bar.hpp>
#include <cstddef>
#include <optional>

namespace tundra::strategy {

// Indicator helpers for strategy authors. Each works on the visible history
// and returns std::nullopt when the history is too short.

// Mean of the last `period` closes, current bar included.
std::optional<double> sma(const core::BarHistory& history, size_t period);

// max(high - low, |high - prev_close|, |low - prev_close|). Without a previous
// bar this is high - low.
double true_range(const core::Bar& bar, const core::Bar* previous);

// Rolling mean of the true range over the last `period` bars. Needs
// period + 1 bars so every true range has a previous close.
std::optional<double> atr(const core::BarHistory& history, size_t period);

struct Channel {
    double upper;
    double lower;
};

// Highest high / lowest low of the `period` bars before the current one.
std::optional<Channel> donchian(const core::BarHistory& history, size_t period);

} // namespace tundra::strategy
