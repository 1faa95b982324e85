#include <tundra/risk/position_sizer.hpp>
#include <algorithm>
#include <cmath>

namespace tundra::risk {

double PositionSizer::size(double entry_price, double stop_loss,
                           double account_balance, double risk_fraction) const {
    double risk_per_unit = std::fabs(entry_price - stop_loss);
    double risk_amount = account_balance * risk_fraction;
    if (risk_per_unit <= 0.0 || risk_amount <= 0.0) {
        return 0.0;
    }

    double volume = risk_amount / risk_per_unit;
    if (config_.volume_step > 0.0) {
        // epsilon keeps 0.3 / 0.01 from flooring to 29
        volume = std::floor(volume / config_.volume_step + 1e-9) * config_.volume_step;
    }
    return std::clamp(volume, config_.min_volume, config_.max_volume);
}

SizingFunction PositionSizer::as_function() const {
    PositionSizer sizer = *this;
    return [sizer](double entry, double stop, double balance, double risk) {
        return sizer.size(entry, stop, balance, risk);
    };
}

} // namespace tundra::risk
