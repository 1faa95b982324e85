#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tundra::core {

struct Bar {
    int64_t timestamp; // seconds since epoch, UTC
    double open;
    double high;
    double low;
    double close;
    double volume;

    Bar();
    Bar(int64_t ts, double o, double h, double l, double c, double vol = 0.0);

    // high >= low, prices positive and inside the high/low range
    bool is_well_formed() const;
};

using BarSeries = std::vector<Bar>;

// Ordered by symbol so that iteration order, and therefore the simulation, is
// deterministic.
using BarSeriesMap = std::map<std::string, BarSeries>;

// Read-only view of the first `count` bars of a series: the history a strategy
// is allowed to see at a given bar, current bar included.
class BarHistory {
public:
    BarHistory(const BarSeries& series, size_t count)
        : data_(series.data()), size_(count < series.size() ? count : series.size()) {}

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const Bar& operator[](size_t i) const { return data_[i]; }
    const Bar& back() const { return data_[size_ - 1]; }
    const Bar& front() const { return data_[0]; }

    const Bar* begin() const { return data_; }
    const Bar* end() const { return data_ + size_; }

private:
    const Bar* data_;
    size_t size_;
};

// Bars with start <= timestamp < end. Symbols left without bars are dropped.
BarSeriesMap slice_bars(const BarSeriesMap& bars, int64_t start, int64_t end);

} // namespace tundra::core
