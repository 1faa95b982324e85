#pragma once
#include <tundra/core/error.hpp>
#include <tundra/core/position.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace tundra::analysis {

struct MonteCarloConfig {
    int num_simulations = 1000;
    uint64_t seed = 42;
    bool parallel = true;
};

struct MonteCarloDistribution {
    core::Status status;
    int num_simulations = 0;
    size_t trades_per_path = 0;
    double initial_balance = 0.0;

    std::vector<double> final_balances;  // one per path, path order
    std::vector<double> max_drawdowns;   // fractions, path order

    double mean_final = 0.0;
    double median_final = 0.0;
    double stdev_final = 0.0;
    double min_final = 0.0;
    double max_final = 0.0;
    std::map<int, double> percentiles;   // 5, 25, 50, 75, 95 -> final balance

    double worst_drawdown = 0.0;
    double mean_drawdown = 0.0;
    double drawdown_p95 = 0.0;
    double probability_of_loss = 0.0;    // final < initial

    bool success() const { return status.is_ok(); }
};

// Linear interpolation between closest ranks; `sorted` must be ascending.
double percentile(const std::vector<double>& sorted, double pct);

/**
 * @class MonteCarloResampler
 * @brief Bootstrap of a trade log to estimate the spread of outcomes.
 *
 * Each trade contributes its return profit_loss / initial_balance. Every path
 * draws as many returns as there are trades, with replacement, and compounds
 * them from the initial balance. Path i draws from its own generator seeded
 * with (seed, i), so the output is identical for an identical seed no matter
 * how paths are scheduled across threads.
 */
class MonteCarloResampler {
public:
    MonteCarloResampler() = default;
    explicit MonteCarloResampler(const MonteCarloConfig& config) : config_(config) {}

    MonteCarloDistribution resample(const std::vector<core::Trade>& trades,
                                    double initial_balance) const;

    const MonteCarloConfig& config() const { return config_; }

private:
    MonteCarloConfig config_;
};

MonteCarloDistribution resample(const std::vector<core::Trade>& trades, double initial_balance,
                                int num_simulations, uint64_t seed);

} // namespace tundra::analysis
