#pragma once
#include <tundra/backtest/performance_analyzer.hpp>
#include <tundra/core/error.hpp>
#include <tundra/core/parameter_set.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tundra::optimize {

enum class OptimizationDirection {
    MAXIMIZE,
    MINIMIZE
};

const char* to_string(OptimizationDirection direction);

// "max"/"maximize", "min"/"minimize"
std::optional<OptimizationDirection> parse_direction(const std::string& text);

// Runs one simulation for a parameter combination and returns its metrics.
using EvaluateFn = std::function<backtest::PerformanceMetrics(const core::ParameterSet&)>;

struct OptimizerConfig {
    std::string metric = "sharpe_ratio";
    OptimizationDirection direction = OptimizationDirection::MAXIMIZE;
    int min_trades = 10;
    bool parallel = true;

    // When set and raised, evaluations that have not started are skipped and
    // marked invalid with reason "cancelled".
    const std::atomic<bool>* cancel_flag = nullptr;
};

struct OptimizationResult {
    core::ParameterSet parameters;
    backtest::PerformanceMetrics metrics;
    double metric_value = 0.0;
    bool valid = false;
    std::string invalid_reason;
    size_t enumeration_index = 0;
};

struct OptimizationReport {
    core::Status status;
    std::string metric;
    OptimizationDirection direction = OptimizationDirection::MAXIMIZE;
    std::vector<OptimizationResult> ranked;       // valid only, best first
    std::vector<OptimizationResult> all_results;  // every combination, enumeration order

    bool success() const { return status.is_ok(); }
    const OptimizationResult* best() const { return ranked.empty() ? nullptr : &ranked.front(); }
    size_t evaluated() const { return all_results.size(); }
    size_t valid_count() const { return ranked.size(); }
};

// Rejects empty domain lists, empty domains, unnamed and duplicate names.
core::Status validate_domains(const std::vector<core::ParameterDomain>& domains);

// Cartesian product in declaration order, first domain outermost.
std::vector<core::ParameterSet> enumerate_combinations(const std::vector<core::ParameterDomain>& domains);

/**
 * @class GridOptimizer
 * @brief Exhaustive search over the cartesian product of parameter domains.
 *
 * Each combination is evaluated independently (in parallel unless disabled)
 * into its own result slot, so the ranking never depends on completion
 * order. Results are ranked by the configured metric; ties keep enumeration
 * order. Combinations with fewer than min_trades trades, a NaN
 * metric, or an evaluation that threw are invalid: kept in all_results with a
 * reason, left out of the ranking.
 */
class GridOptimizer {
public:
    GridOptimizer() = default;
    explicit GridOptimizer(const OptimizerConfig& config) : config_(config) {}

    OptimizationReport optimize(const std::vector<core::ParameterDomain>& domains,
                                const EvaluateFn& evaluate) const;

    const OptimizerConfig& config() const { return config_; }

private:
    void evaluate_one(const EvaluateFn& evaluate, OptimizationResult& result) const;

    OptimizerConfig config_;
};

OptimizationReport optimize(const std::vector<core::ParameterDomain>& domains,
                            const EvaluateFn& evaluate,
                            const std::string& metric_name,
                            OptimizationDirection direction);

} // namespace tundra::optimize
