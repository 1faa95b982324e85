#include <tundra/strategy/indicators.hpp>
#include <algorithm>
#include <cmath>

namespace tundra::strategy {

std::optional<double> sma(const core::BarHistory& history, size_t period) {
    if (period == 0 || history.size() < period) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (size_t i = history.size() - period; i < history.size(); ++i) {
        sum += history[i].close;
    }
    return sum / static_cast<double>(period);
}

double true_range(const core::Bar& bar, const core::Bar* previous) {
    double range = bar.high - bar.low;
    if (previous == nullptr) {
        return range;
    }
    return std::max({range,
                     std::fabs(bar.high - previous->close),
                     std::fabs(bar.low - previous->close)});
}

std::optional<double> atr(const core::BarHistory& history, size_t period) {
    if (period == 0 || history.size() < period + 1) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (size_t i = history.size() - period; i < history.size(); ++i) {
        sum += true_range(history[i], &history[i - 1]);
    }
    return sum / static_cast<double>(period);
}

std::optional<Channel> donchian(const core::BarHistory& history, size_t period) {
    if (period == 0 || history.size() < period + 1) {
        return std::nullopt;
    }
    size_t last = history.size() - 1;  // current bar excluded
    Channel channel{history[last - period].high, history[last - period].low};
    for (size_t i = last - period; i < last; ++i) {
        channel.upper = std::max(channel.upper, history[i].high);
        channel.lower = std::min(channel.lower, history[i].low);
    }
    return channel;
}

} // namespace tundra::strategy
