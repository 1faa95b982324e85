#include <tundra/backtest/performance_analyzer.hpp>
#include <tundra/backtest/simulation_engine.hpp>
#include <tundra/core/time_utils.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <set>

namespace tundra::backtest {

std::vector<std::pair<std::string, double>> PerformanceMetrics::to_list() const {
    return {
        {"initial_equity", initial_equity},
        {"final_equity", final_equity},
        {"net_profit", net_profit},
        {"net_profit_pct", net_profit_pct},
        {"total_return", total_return},
        {"annualized_return", annualized_return},
        {"total_trades", static_cast<double>(total_trades)},
        {"winning_trades", static_cast<double>(winning_trades)},
        {"losing_trades", static_cast<double>(losing_trades)},
        {"win_rate", win_rate},
        {"gross_profit", gross_profit},
        {"gross_loss", gross_loss},
        {"profit_factor", profit_factor},
        {"avg_win", avg_win},
        {"avg_loss", avg_loss},
        {"avg_trade", avg_trade},
        {"largest_win", largest_win},
        {"largest_loss", largest_loss},
        {"max_consecutive_wins", static_cast<double>(max_consecutive_wins)},
        {"max_consecutive_losses", static_cast<double>(max_consecutive_losses)},
        {"expectancy", expectancy},
        {"kelly_fraction", kelly_fraction},
        {"max_drawdown", max_drawdown},
        {"max_drawdown_duration", max_drawdown_duration},
        {"sharpe_ratio", sharpe_ratio},
        {"sortino_ratio", sortino_ratio},
        {"volatility", volatility},
        {"calmar_ratio", calmar_ratio},
        {"trading_days", static_cast<double>(trading_days)},
    };
}

const std::vector<std::string>& PerformanceMetrics::names() {
    static const std::vector<std::string> all = [] {
        std::vector<std::string> list;
        for (const auto& [name, _] : PerformanceMetrics().to_list()) {
            list.push_back(name);
        }
        return list;
    }();
    return all;
}

std::optional<double> PerformanceMetrics::get(const std::string& name) const {
    for (const auto& [key, value] : to_list()) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

double PerformanceAnalyzer::starting_equity(const std::vector<core::EquityPoint>& equity_curve) const {
    if (initial_capital_ > 0.0) {
        return initial_capital_;
    }
    return equity_curve.empty() ? 0.0 : equity_curve.front().equity;
}

std::vector<double> PerformanceAnalyzer::daily_returns(
        const std::vector<core::EquityPoint>& equity_curve) const {
    std::vector<double> closes;
    int64_t current_day = 0;
    for (const auto& point : equity_curve) {
        int64_t day = core::day_index(point.timestamp);
        if (closes.empty() || day != current_day) {
            closes.push_back(point.equity);
            current_day = day;
        } else {
            closes.back() = point.equity;
        }
    }

    std::vector<double> returns;
    returns.reserve(closes.size());
    double previous = starting_equity(equity_curve);
    for (double close : closes) {
        returns.push_back(previous > 0.0 ? close / previous - 1.0 : 0.0);
        previous = close;
    }
    return returns;
}

double PerformanceAnalyzer::sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }

    double sum = std::accumulate(returns.begin(), returns.end(), 0.0);
    double mean = sum / returns.size();

    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean) * (r - mean);
    }

    double std_dev = std::sqrt(sq_sum / returns.size());
    if (std_dev < 1e-12) {
        return 0.0;
    }

    return mean / std_dev * std::sqrt(static_cast<double>(trading_days_per_year_));
}

double PerformanceAnalyzer::sortino_ratio(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }

    double sum = std::accumulate(returns.begin(), returns.end(), 0.0);
    double mean = sum / returns.size();

    // Downside deviation about 0, negative returns only
    double sq_sum = 0.0;
    int count = 0;
    for (double r : returns) {
        if (r < 0) {
            sq_sum += r * r;
            count++;
        }
    }

    if (count == 0) {
        return 0.0;
    }
    double downside_dev = std::sqrt(sq_sum / count);
    if (downside_dev < 1e-12) {
        return 0.0;
    }

    return mean / downside_dev * std::sqrt(static_cast<double>(trading_days_per_year_));
}

double PerformanceAnalyzer::max_drawdown(const std::vector<core::EquityPoint>& equity_curve,
                                         double& duration) const {
    duration = 0.0;
    if (equity_curve.empty()) {
        return 0.0;
    }

    double max_dd = 0.0;
    // Seeded with the starting balance, not only the first point: entry costs
    // paid on the first bar already count as drawdown.
    double peak = std::max(starting_equity(equity_curve), equity_curve.front().equity);
    double underwater = 0.0;

    for (const auto& point : equity_curve) {
        if (point.equity >= peak) {
            peak = point.equity;
            underwater = 0.0;
            continue;
        }

        // Longest stretch below the running peak, in equity points
        underwater += 1.0;
        duration = std::max(duration, underwater);

        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - point.equity) / peak);
        }
    }

    return max_dd;
}

PerformanceMetrics PerformanceAnalyzer::compute_metrics(
        const std::vector<core::Trade>& trades,
        const std::vector<core::EquityPoint>& equity_curve) const {
    PerformanceMetrics metrics;

    // Equity based
    metrics.initial_equity = starting_equity(equity_curve);
    metrics.final_equity = equity_curve.empty() ? metrics.initial_equity : equity_curve.back().equity;
    metrics.net_profit = metrics.final_equity - metrics.initial_equity;
    metrics.total_return = metrics.initial_equity > 0.0 ? metrics.net_profit / metrics.initial_equity : 0.0;
    metrics.net_profit_pct = metrics.total_return * 100.0;

    std::vector<double> returns = daily_returns(equity_curve);
    metrics.sharpe_ratio = sharpe_ratio(returns);
    metrics.sortino_ratio = sortino_ratio(returns);
    metrics.max_drawdown = max_drawdown(equity_curve, metrics.max_drawdown_duration);

    if (!returns.empty()) {
        double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
        double sq_sum = 0.0;
        for (double r : returns) {
            sq_sum += (r - mean) * (r - mean);
        }
        metrics.volatility = std::sqrt(sq_sum / returns.size()) *
                             std::sqrt(static_cast<double>(trading_days_per_year_));

        double years = static_cast<double>(returns.size()) / trading_days_per_year_;
        if (metrics.total_return > -1.0) {
            metrics.annualized_return = std::pow(1.0 + metrics.total_return, 1.0 / years) - 1.0;
        } else {
            metrics.annualized_return = -1.0;
        }
    }

    metrics.calmar_ratio = metrics.max_drawdown > 1e-12
        ? metrics.annualized_return / metrics.max_drawdown : 0.0;

    // Trade based
    metrics.total_trades = static_cast<int>(trades.size());
    int consecutive_wins = 0;
    int consecutive_losses = 0;

    for (const auto& trade : trades) {
        if (trade.profit_loss > 0) {
            metrics.winning_trades++;
            metrics.gross_profit += trade.profit_loss;
            metrics.largest_win = std::max(metrics.largest_win, trade.profit_loss);
            consecutive_wins++;
            consecutive_losses = 0;
            metrics.max_consecutive_wins = std::max(metrics.max_consecutive_wins, consecutive_wins);
        } else {
            metrics.losing_trades++;
            metrics.gross_loss += trade.profit_loss;
            metrics.largest_loss = std::min(metrics.largest_loss, trade.profit_loss);
            consecutive_losses++;
            consecutive_wins = 0;
            metrics.max_consecutive_losses = std::max(metrics.max_consecutive_losses, consecutive_losses);
        }
    }

    if (metrics.total_trades > 0) {
        metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.total_trades;
        metrics.avg_trade = (metrics.gross_profit + metrics.gross_loss) / metrics.total_trades;
    }
    metrics.avg_win = metrics.winning_trades > 0 ? metrics.gross_profit / metrics.winning_trades : 0.0;
    metrics.avg_loss = metrics.losing_trades > 0 ? -metrics.gross_loss / metrics.losing_trades : 0.0;

    if (metrics.gross_loss < 0.0) {
        metrics.profit_factor = metrics.gross_profit / -metrics.gross_loss;
    } else if (metrics.gross_profit > 0.0) {
        metrics.profit_factor = std::numeric_limits<double>::infinity();
    } else {
        metrics.profit_factor = 0.0;
    }

    metrics.expectancy = metrics.win_rate * metrics.avg_win - (1.0 - metrics.win_rate) * metrics.avg_loss;

    if (metrics.avg_win <= 0.0) {
        metrics.kelly_fraction = 0.0;
    } else if (metrics.avg_loss <= 0.0) {
        metrics.kelly_fraction = metrics.win_rate;
    } else {
        metrics.kelly_fraction = metrics.win_rate -
            (1.0 - metrics.win_rate) / (metrics.avg_win / metrics.avg_loss);
    }

    metrics.trading_days = count_trading_days(trades);

    return metrics;
}

PerformanceMetrics compute_metrics(const std::vector<core::Trade>& trades,
                                   const std::vector<core::EquityPoint>& equity_curve,
                                   double initial_balance) {
    return PerformanceAnalyzer(initial_balance).compute_metrics(trades, equity_curve);
}

PerformanceMetrics compute_metrics(const SimulationResult& result) {
    return compute_metrics(result.trades, result.equity_curve, result.initial_balance);
}

int count_trading_days(const std::vector<core::Trade>& trades) {
    std::set<int64_t> days;
    for (const auto& trade : trades) {
        days.insert(core::day_index(trade.entry_time));
        days.insert(core::day_index(trade.exit_time));
    }
    return static_cast<int>(days.size());
}

} // namespace tundra::backtest
