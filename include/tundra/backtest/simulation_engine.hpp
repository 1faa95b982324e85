#pragma once

#include <tundra/backtest/cost_model.hpp>
#include <tundra/core/bar.hpp>
#include <tundra/core/error.hpp>
#include <tundra/core/portfolio.hpp>
#include <tundra/core/position.hpp>
#include <tundra/risk/position_sizer.hpp>
#include <tundra/strategy/strategy_base.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace tundra::backtest {

// Which level fills when a single bar touches both the stop and the target.
enum class IntrabarPolicy {
    StopLossFirst,
    TakeProfitFirst
};

const char* to_string(IntrabarPolicy policy);

struct SimulationConfig {
    double initial_balance = 10000.0;
    double risk_fraction = 0.01;
    IntrabarPolicy intrabar_policy = IntrabarPolicy::StopLossFirst;

    // Empty means the default fixed-fractional PositionSizer.
    risk::SizingFunction sizer;
};

struct SimulationResult {
    core::Status status;
    std::vector<core::Trade> trades;
    std::vector<core::EquityPoint> equity_curve;
    double initial_balance = 0.0;
    double final_balance = 0.0;
    double final_equity = 0.0;
    size_t bars_processed = 0;
    size_t rejected_fills = 0;
    size_t skipped_bars = 0;
    std::vector<std::string> skipped_symbols;  // empty series

    bool success() const { return status.is_ok(); }
};

/**
 * @class SimulationEngine
 * @brief Replays bars through a strategy, one timestamp at a time.
 *
 * All symbols are merged by timestamp; within a timestamp symbols are handled
 * in lexicographic order. Per symbol bar an open position is first checked
 * against its stop and target, and only if it survives is the strategy asked
 * for a signal. One EquityPoint is appended per timestamp.
 *
 * Single threaded and deterministic: the same bars, strategy parameters and
 * costs always give the same trades and equity curve. Positions still open
 * when the data ends are left open and valued at their last close.
 */
class SimulationEngine {
public:
    SimulationEngine(const CostModel& cost_model, const SimulationConfig& config);

    SimulationResult run(const core::BarSeriesMap& bars, strategy::StrategyBase& strategy) const;

    const CostModel& cost_model() const { return cost_model_; }
    const SimulationConfig& config() const { return config_; }

private:
    struct Cursor {
        std::string symbol;
        core::BarSeries bars;
        size_t next = 0;
    };

    std::vector<Cursor> prepare(const core::BarSeriesMap& bars, SimulationResult& result) const;

    // Returns true if the position was closed on this bar.
    bool check_exits(core::Portfolio& portfolio, const std::string& symbol,
                     const core::Bar& bar) const;

    void handle_signal(core::Portfolio& portfolio, const std::string& symbol,
                       const core::Bar& bar, const core::Signal& signal,
                       SimulationResult& result) const;

    CostModel cost_model_;
    SimulationConfig config_;
    risk::SizingFunction sizer_;
};

// Convenience wrapper with default risk settings.
SimulationResult simulate(const core::BarSeriesMap& bars, strategy::StrategyBase& strategy,
                          const CostModel& cost_model, double initial_balance);

} // namespace tundra::backtest
