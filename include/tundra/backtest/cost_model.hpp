#pragma once
#include <tundra/core/position.hpp>

namespace tundra::backtest {

// Execution costs in price units (spread, slippage) and account currency per
// unit of volume (commission).
struct CostModel {
    double spread = 0.0;
    double slippage = 0.0;
    double commission_per_lot = 0.0;

    // Long entries pay up, short entries sell down.
    double entry_fill(double price, core::Direction direction) const {
        return price + core::direction_sign(direction) * (spread + slippage);
    }

    double commission(double volume) const {
        return commission_per_lot * volume;
    }
};

} // namespace tundra::backtest
