#include <tundra/core/bar.hpp>
#include <algorithm>

namespace tundra::core {

Bar::Bar()
    : timestamp(0), open(0.0), high(0.0), low(0.0), close(0.0), volume(0.0) {}

Bar::Bar(int64_t ts, double o, double h, double l, double c, double vol)
    : timestamp(ts), open(o), high(h), low(l), close(c), volume(vol) {}

bool Bar::is_well_formed() const {
    if (open <= 0.0 || high <= 0.0 || low <= 0.0 || close <= 0.0) {
        return false;
    }
    if (high < low) {
        return false;
    }
    return open >= low && open <= high && close >= low && close <= high;
}

BarSeriesMap slice_bars(const BarSeriesMap& bars, int64_t start, int64_t end) {
    BarSeriesMap sliced;
    for (const auto& [symbol, series] : bars) {
        auto first = std::lower_bound(series.begin(), series.end(), start,
            [](const Bar& bar, int64_t ts) { return bar.timestamp < ts; });
        auto last = std::lower_bound(first, series.end(), end,
            [](const Bar& bar, int64_t ts) { return bar.timestamp < ts; });

        if (first != last) {
            sliced.emplace(symbol, BarSeries(first, last));
        }
    }
    return sliced;
}

} // namespace tundra::core
