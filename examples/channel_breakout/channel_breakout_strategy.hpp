// examples/channel_breakout/channel_breakout_strategy.hpp
#pragma once
#include <algorithm>
#include <utility>
#include <string>
#include "tundra/strategy/indicators.hpp"
#include "tundra/strategy/strategy_base.hpp"
#include "tundra/strategy/strategy_factory.hpp"

namespace tundra {
namespace examples {

// Donchian breakout: go long when the close clears the highest high of the
// last entry_period bars, short when it breaks the lowest low. The stop sits
// atr_multiplier ATRs away. Optional target at take_profit_multiple times the
// stop distance, optional exit on an opposite exit_period channel break.
class ChannelBreakoutStrategy : public strategy::StrategyBase {
public:
    explicit ChannelBreakoutStrategy(std::string name = "ChannelBreakout")
        : StrategyBase(std::move(name)) {}

    void configure(const core::ParameterSet& params) override {
        StrategyBase::configure(params);
        entry_period_ = static_cast<size_t>(std::max(1, params.get_int("entry_period", 20)));
        atr_period_ = static_cast<size_t>(std::max(1, params.get_int("atr_period", 14)));
        atr_multiplier_ = params.get_double("atr_multiplier", 2.0);
        take_profit_multiple_ = params.get_double("take_profit_multiple", 0.0);
        exit_period_ = static_cast<size_t>(std::max(0, params.get_int("exit_period", 0)));
    }

    size_t min_lookback() const override {
        return std::max({entry_period_, atr_period_, exit_period_}) + 1;
    }

    core::Signal generate_signal(const core::BarHistory& history,
                                 core::PositionState state) override {
        const double close = history.back().close;

        if (state != core::PositionState::FLAT) {
            if (exit_period_ == 0) {
                return core::Signal::none();
            }
            auto exit_channel = strategy::donchian(history, exit_period_);
            if (!exit_channel) {
                return core::Signal::none();
            }
            if ((state == core::PositionState::LONG && close < exit_channel->lower) ||
                (state == core::PositionState::SHORT && close > exit_channel->upper)) {
                return core::Signal::exit();
            }
            return core::Signal::none();
        }

        auto channel = strategy::donchian(history, entry_period_);
        auto range = strategy::atr(history, atr_period_);
        if (!channel || !range || *range <= 0.0) {
            return core::Signal::none();
        }

        const double stop_distance = *range * atr_multiplier_;
        if (stop_distance <= 0.0) {
            return core::Signal::none();
        }
        const double target_distance = stop_distance * take_profit_multiple_;

        if (close > channel->upper) {
            double target = take_profit_multiple_ > 0.0 ? close + target_distance : 0.0;
            return core::Signal::enter_long(close, close - stop_distance, target);
        }
        if (close < channel->lower) {
            double target = take_profit_multiple_ > 0.0 ? std::max(close - target_distance, 0.0) : 0.0;
            return core::Signal::enter_short(close, close + stop_distance, target);
        }
        return core::Signal::none();
    }

private:
    size_t entry_period_ = 20;
    size_t atr_period_ = 14;
    double atr_multiplier_ = 2.0;
    double take_profit_multiple_ = 0.0;
    size_t exit_period_ = 0;
};

// Register the strategy with the factory
namespace {
    bool registered = []() {
        strategy::StrategyFactory::register_type<ChannelBreakoutStrategy>("ChannelBreakout");
        return true;
    }();
}

} // namespace examples
} // namespace tundra
