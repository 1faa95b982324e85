// include/tundra/strategy/strategy_base.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include "tundra/core/bar.hpp"
#include "tundra/core/parameter_set.hpp"
#include "tundra/core/signal.hpp"

namespace tundra {
namespace strategy {

class StrategyBase {
protected:
    std::string name_;
    core::ParameterSet params_;

public:
    explicit StrategyBase(std::string name) : name_(std::move(name)) {}
    virtual ~StrategyBase() = default;

    // Core method that must be implemented by all strategies. `history` ends
    // with the current bar; nothing after it is visible.
    virtual core::Signal generate_signal(const core::BarHistory& history,
                                         core::PositionState state) = 0;

    // Bars required before generate_signal is called for a symbol
    virtual size_t min_lookback() const { return 1; }

    // Called once before every simulation run. Strategies that keep state
    // between bars must reset it here.
    virtual void initialize() {}

    // Configuration
    virtual void configure(const core::ParameterSet& params) {
        params_ = params;
    }

    const core::ParameterSet& parameters() const { return params_; }

    double get_param(const std::string& key, double default_value) const {
        return params_.get_double(key, default_value);
    }

    // Accessors
    const std::string& name() const { return name_; }
};

using StrategyPtr = std::shared_ptr<StrategyBase>;

// Builds a configured strategy for one parameter combination.
using StrategyBuilder = std::function<StrategyPtr(const core::ParameterSet&)>;

} // namespace strategy
} // namespace tundra
