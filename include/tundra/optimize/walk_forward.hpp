#pragma once
#include <tundra/backtest/cost_model.hpp>
#include <tundra/backtest/performance_analyzer.hpp>
#include <tundra/backtest/simulation_engine.hpp>
#include <tundra/core/bar.hpp>
#include <tundra/core/error.hpp>
#include <tundra/core/parameter_set.hpp>
#include <tundra/optimize/grid_optimizer.hpp>
#include <tundra/strategy/strategy_base.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tundra::optimize {

// In-sample [is_start, is_end) followed by out-of-sample [oos_start, oos_end).
struct WindowSpec {
    size_t window_index = 0;  // 1-based
    int64_t is_start = 0;
    int64_t is_end = 0;
    int64_t oos_start = 0;
    int64_t oos_end = 0;

    bool operator==(const WindowSpec& other) const {
        return window_index == other.window_index && is_start == other.is_start &&
               is_end == other.is_end && oos_start == other.oos_start && oos_end == other.oos_end;
    }
};

// Starting at range_start: is_end = is_start + window_size, oos_start = is_end,
// oos_end = oos_start + oos_size. Stops as soon as oos_end > range_end,
// otherwise emits the window and advances is_start by step_size. Sizes are in
// seconds; non-positive sizes yield no windows.
std::vector<WindowSpec> generate_windows(int64_t range_start, int64_t range_end,
                                         int64_t window_size, int64_t oos_size,
                                         int64_t step_size);

struct WalkForwardConfig {
    int64_t range_start = 0;
    int64_t range_end = 0;
    int64_t window_size = 0;  // seconds
    int64_t oos_size = 0;
    int64_t step_size = 0;

    OptimizerConfig optimizer;
    backtest::CostModel cost_model;
    backtest::SimulationConfig simulation;
};

struct WindowResult {
    WindowSpec window;
    bool success = false;
    std::string error;
    core::ParameterSet best_parameters;
    backtest::PerformanceMetrics is_metrics;
    backtest::PerformanceMetrics oos_metrics;
    double is_metric = 0.0;
    double oos_metric = 0.0;
    size_t combinations_evaluated = 0;
    size_t combinations_valid = 0;
};

struct WalkForwardReport {
    core::Status status;
    std::string metric;
    std::vector<WindowResult> windows;
    size_t successful_windows = 0;

    core::ParameterSet robust_parameters;
    backtest::SimulationResult full_range;   // robust parameters over the whole range
    backtest::PerformanceMetrics full_range_metrics;

    double mean_is_metric = 0.0;
    double mean_oos_metric = 0.0;
    double efficiency = 0.0;  // mean OOS / mean IS, 0 when mean IS is 0 or either mean is not finite

    bool success() const { return status.is_ok(); }
};

core::Status validate_config(const WalkForwardConfig& config);

// Numeric parameters: mean of the per-window values, snapped to the nearest
// domain value (the earlier one on a tie). Categorical parameters: the most
// frequent value, the first seen on a tie.
core::ParameterSet find_robust_parameters(const std::vector<core::ParameterSet>& window_best,
                                          const std::vector<core::ParameterDomain>& domains);

/**
 * @class WalkForwardOrchestrator
 * @brief Optimize in-sample, validate out-of-sample, slide, repeat.
 *
 * Each window runs a GridOptimizer over its in-sample bars and one simulation
 * of the winner over the out-of-sample bars. A window without a valid
 * combination (or without out-of-sample data) is recorded as failed and left
 * out of the aggregation. The robust parameter set is validated with one
 * simulation over the full range.
 */
class WalkForwardOrchestrator {
public:
    explicit WalkForwardOrchestrator(const WalkForwardConfig& config) : config_(config) {}

    WalkForwardReport run(const core::BarSeriesMap& bars,
                          const strategy::StrategyBuilder& builder,
                          const std::vector<core::ParameterDomain>& domains) const;

    const WalkForwardConfig& config() const { return config_; }

private:
    backtest::SimulationResult simulate_range(const core::BarSeriesMap& bars,
                                              const strategy::StrategyBuilder& builder,
                                              const core::ParameterSet& params,
                                              int64_t start, int64_t end) const;

    WindowResult run_window(const core::BarSeriesMap& bars,
                            const strategy::StrategyBuilder& builder,
                            const std::vector<core::ParameterDomain>& domains,
                            const WindowSpec& window) const;

    WalkForwardConfig config_;
};

} // namespace tundra::optimize
