#pragma once
#include <tundra/core/position.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tundra::backtest {

struct SimulationResult;

struct PerformanceMetrics {
    double initial_equity = 0.0;
    double final_equity = 0.0;
    double net_profit = 0.0;
    double net_profit_pct = 0.0;
    double total_return = 0.0;       // fraction of initial equity
    double annualized_return = 0.0;

    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;           // 0..1
    double gross_profit = 0.0;
    double gross_loss = 0.0;         // <= 0
    double profit_factor = 0.0;      // +inf with profit and no loss
    double avg_win = 0.0;
    double avg_loss = 0.0;           // magnitude, >= 0
    double avg_trade = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;       // <= 0
    int max_consecutive_wins = 0;
    int max_consecutive_losses = 0;
    double expectancy = 0.0;
    double kelly_fraction = 0.0;

    double max_drawdown = 0.0;       // fraction of peak, >= 0
    double max_drawdown_duration = 0.0;  // longest run of equity points below the peak
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double volatility = 0.0;         // annualized
    double calmar_ratio = 0.0;
    int trading_days = 0;

    // Looks a metric up by its field name, e.g. "sharpe_ratio".
    std::optional<double> get(const std::string& name) const;

    // Every metric in a fixed order, for reports.
    std::vector<std::pair<std::string, double>> to_list() const;

    static const std::vector<std::string>& names();
};

/**
 * @class PerformanceAnalyzer
 * @brief Scalar statistics of one concluded simulation.
 *
 * Pure: the same trades and equity curve always give the same numbers.
 * Degenerate inputs (no trades, flat equity, no losing trades) resolve to
 * sentinel values instead of raising.
 */
class PerformanceAnalyzer {
private:
    double initial_capital_;
    int trading_days_per_year_ = 252;

public:
    // initial_capital <= 0 means "first equity point"
    explicit PerformanceAnalyzer(double initial_capital = 0.0)
        : initial_capital_(initial_capital) {}

    PerformanceMetrics compute_metrics(const std::vector<core::Trade>& trades,
                                       const std::vector<core::EquityPoint>& equity_curve) const;

    // Helper methods
    // Last equity of each UTC day, as returns relative to the previous day
    // (the first day is relative to the starting equity).
    std::vector<double> daily_returns(const std::vector<core::EquityPoint>& equity_curve) const;
    double sharpe_ratio(const std::vector<double>& returns) const;
    double sortino_ratio(const std::vector<double>& returns) const;
    double max_drawdown(const std::vector<core::EquityPoint>& equity_curve, double& duration) const;

private:
    double starting_equity(const std::vector<core::EquityPoint>& equity_curve) const;
};

PerformanceMetrics compute_metrics(const std::vector<core::Trade>& trades,
                                   const std::vector<core::EquityPoint>& equity_curve,
                                   double initial_balance);

PerformanceMetrics compute_metrics(const SimulationResult& result);

// Distinct UTC days with a trade entry or exit.
int count_trading_days(const std::vector<core::Trade>& trades);

} // namespace tundra::backtest
