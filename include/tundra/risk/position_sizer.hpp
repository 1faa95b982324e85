#pragma once
#include <functional>

namespace tundra::risk {

// size(entry_price, stop_loss, account_balance, risk_fraction) -> volume
using SizingFunction = std::function<double(double, double, double, double)>;

struct SizingConfig {
    double min_volume = 0.01;
    double max_volume = 100.0;
    double volume_step = 0.01;
};

/**
 * @class PositionSizer
 * @brief Fixed-fractional sizing: risk a fraction of the balance between
 * entry and stop.
 *
 * volume = balance * risk_fraction / |entry - stop|, floored to volume_step
 * and clamped to [min_volume, max_volume]. A zero stop distance, or nothing
 * to risk, sizes to 0.
 */
class PositionSizer {
public:
    PositionSizer() = default;
    explicit PositionSizer(const SizingConfig& config) : config_(config) {}

    double size(double entry_price, double stop_loss,
                double account_balance, double risk_fraction) const;

    SizingFunction as_function() const;

    const SizingConfig& config() const { return config_; }

private:
    SizingConfig config_;
};

} // namespace tundra::risk
