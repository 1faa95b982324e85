#include <tundra/analysis/monte_carlo.hpp>
#include <tundra/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <execution>
#include <numeric>
#include <random>

namespace tundra::analysis {

namespace {

struct PathOutcome {
    double final_balance = 0.0;
    double max_drawdown = 0.0;
};

PathOutcome run_path(const std::vector<double>& returns, double initial_balance,
                     uint64_t seed, size_t path_index) {
    std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                      static_cast<uint32_t>(path_index), static_cast<uint32_t>(path_index >> 32)};
    std::mt19937_64 gen(seq);
    std::uniform_int_distribution<size_t> pick(0, returns.size() - 1);

    PathOutcome outcome;
    double balance = initial_balance;
    double peak = initial_balance;
    for (size_t i = 0; i < returns.size(); ++i) {
        balance *= 1.0 + returns[pick(gen)];
        peak = std::max(peak, balance);
        if (peak > 0.0) {
            outcome.max_drawdown = std::max(outcome.max_drawdown, (peak - balance) / peak);
        }
    }
    outcome.final_balance = balance;
    return outcome;
}

} // namespace

double percentile(const std::vector<double>& sorted, double pct) {
    if (sorted.empty()) {
        return 0.0;
    }
    if (sorted.size() == 1) {
        return sorted.front();
    }
    double rank = std::clamp(pct, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = std::min(lower + 1, sorted.size() - 1);
    double weight = rank - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * weight;
}

MonteCarloDistribution MonteCarloResampler::resample(const std::vector<core::Trade>& trades,
                                                     double initial_balance) const {
    MonteCarloDistribution dist;
    dist.num_simulations = config_.num_simulations;
    dist.trades_per_path = trades.size();
    dist.initial_balance = initial_balance;

    if (config_.num_simulations <= 0) {
        dist.status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                            "number of simulations must be positive");
    } else if (initial_balance <= 0.0) {
        dist.status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                            "initial balance must be positive");
    } else if (trades.empty()) {
        dist.status = core::Status::failure(core::ErrorCode::NoData, "no trades to resample");
    }
    if (!dist.status.is_ok()) {
        utils::Logger::error() << "Monte Carlo rejected: " << dist.status.reason << utils::Logger::endl;
        return dist;
    }

    utils::Logger::info() << "Running Monte Carlo analysis with " << config_.num_simulations
                          << " simulations of " << trades.size() << " trades" << utils::Logger::endl;

    std::vector<double> returns;
    returns.reserve(trades.size());
    for (const auto& trade : trades) {
        returns.push_back(trade.profit_loss / initial_balance);
    }

    size_t paths = static_cast<size_t>(config_.num_simulations);
    std::vector<size_t> indices(paths);
    std::iota(indices.begin(), indices.end(), size_t{0});
    std::vector<PathOutcome> outcomes(paths);

    auto simulate = [&](size_t i) {
        outcomes[i] = run_path(returns, initial_balance, config_.seed, i);
    };
    if (config_.parallel) {
        std::for_each(std::execution::par, indices.begin(), indices.end(), simulate);
    } else {
        std::for_each(std::execution::seq, indices.begin(), indices.end(), simulate);
    }

    dist.final_balances.reserve(paths);
    dist.max_drawdowns.reserve(paths);
    for (const auto& outcome : outcomes) {
        dist.final_balances.push_back(outcome.final_balance);
        dist.max_drawdowns.push_back(outcome.max_drawdown);
    }

    std::vector<double> sorted = dist.final_balances;
    std::sort(sorted.begin(), sorted.end());

    double sum = std::accumulate(sorted.begin(), sorted.end(), 0.0);
    dist.mean_final = sum / static_cast<double>(paths);
    double sq_sum = 0.0;
    for (double v : sorted) {
        sq_sum += (v - dist.mean_final) * (v - dist.mean_final);
    }
    dist.stdev_final = std::sqrt(sq_sum / static_cast<double>(paths));
    dist.min_final = sorted.front();
    dist.max_final = sorted.back();
    dist.median_final = percentile(sorted, 50.0);
    for (int pct : {5, 25, 50, 75, 95}) {
        dist.percentiles[pct] = percentile(sorted, pct);
    }

    std::vector<double> drawdowns = dist.max_drawdowns;
    std::sort(drawdowns.begin(), drawdowns.end());
    dist.worst_drawdown = drawdowns.back();
    dist.mean_drawdown = std::accumulate(drawdowns.begin(), drawdowns.end(), 0.0) /
                         static_cast<double>(paths);
    dist.drawdown_p95 = percentile(drawdowns, 95.0);

    size_t losing = static_cast<size_t>(std::count_if(sorted.begin(), sorted.end(),
        [initial_balance](double v) { return v < initial_balance; }));
    dist.probability_of_loss = static_cast<double>(losing) / static_cast<double>(paths);

    dist.status = core::Status::ok();

    utils::Logger::info() << "Monte Carlo analysis completed. Median final balance: " << dist.median_final
                          << ", probability of loss: " << dist.probability_of_loss * 100.0 << "%"
                          << utils::Logger::endl;
    return dist;
}

MonteCarloDistribution resample(const std::vector<core::Trade>& trades, double initial_balance,
                                int num_simulations, uint64_t seed) {
    MonteCarloConfig config;
    config.num_simulations = num_simulations;
    config.seed = seed;
    return MonteCarloResampler(config).resample(trades, initial_balance);
}

} // namespace tundra::analysis
