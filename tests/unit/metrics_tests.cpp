#include <gtest/gtest.h>
#include <tundra/backtest/performance_analyzer.hpp>
#include <tundra/backtest/simulation_engine.hpp>
#include <tundra/core/position.hpp>
#include <tundra/core/time_utils.hpp>

#include <cmath>
#include <limits>
#include <vector>

using namespace tundra;

namespace {

core::Trade make_trade(double pnl, int64_t entry_day = 0, int64_t exit_day = 0) {
    core::Trade trade;
    trade.symbol = "TEST";
    trade.entry_time = core::days(entry_day);
    trade.exit_time = core::days(exit_day) + 3600;
    trade.profit_loss = pnl;
    return trade;
}

std::vector<core::EquityPoint> make_curve(const std::vector<double>& equities) {
    std::vector<core::EquityPoint> curve;
    for (size_t i = 0; i < equities.size(); ++i) {
        core::EquityPoint point;
        point.timestamp = core::days(static_cast<int64_t>(i));
        point.balance = equities[i];
        point.equity = equities[i];
        curve.push_back(point);
    }
    return curve;
}

} // namespace

TEST(PerformanceAnalyzerTest, NoLosingTrades) {
    auto metrics = backtest::compute_metrics({make_trade(100.0), make_trade(50.0)},
                                             make_curve({10100.0, 10150.0}), 10000.0);

    EXPECT_EQ(metrics.total_trades, 2);
    EXPECT_EQ(metrics.losing_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 1.0);
    EXPECT_TRUE(std::isinf(metrics.profit_factor));
    EXPECT_GT(metrics.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(metrics.avg_loss, 0.0);
    EXPECT_DOUBLE_EQ(metrics.largest_loss, 0.0);
    EXPECT_DOUBLE_EQ(metrics.kelly_fraction, 1.0);
    EXPECT_EQ(metrics.max_consecutive_wins, 2);
}

TEST(PerformanceAnalyzerTest, MixedTradeStatistics) {
    std::vector<core::Trade> trades = {make_trade(100.0), make_trade(-50.0),
                                       make_trade(30.0), make_trade(-20.0), make_trade(-10.0)};
    auto metrics = backtest::compute_metrics(trades, make_curve({10050.0}), 10000.0);

    EXPECT_EQ(metrics.winning_trades, 2);
    EXPECT_EQ(metrics.losing_trades, 3);
    EXPECT_DOUBLE_EQ(metrics.gross_profit, 130.0);
    EXPECT_DOUBLE_EQ(metrics.gross_loss, -80.0);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 130.0 / 80.0);
    EXPECT_DOUBLE_EQ(metrics.avg_win, 65.0);
    EXPECT_NEAR(metrics.avg_loss, 80.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(metrics.avg_trade, 10.0);
    EXPECT_DOUBLE_EQ(metrics.largest_win, 100.0);
    EXPECT_DOUBLE_EQ(metrics.largest_loss, -50.0);
    EXPECT_EQ(metrics.max_consecutive_wins, 1);
    EXPECT_EQ(metrics.max_consecutive_losses, 2);

    double win_rate = 0.4;
    double avg_loss = 80.0 / 3.0;
    EXPECT_NEAR(metrics.expectancy, win_rate * 65.0 - (1.0 - win_rate) * avg_loss, 1e-12);
    EXPECT_NEAR(metrics.kelly_fraction, win_rate - (1.0 - win_rate) / (65.0 / avg_loss), 1e-12);
}

TEST(PerformanceAnalyzerTest, MaxDrawdownFromPeak) {
    backtest::PerformanceAnalyzer analyzer(100.0);
    double duration = 0.0;
    double dd = analyzer.max_drawdown(make_curve({100.0, 120.0, 90.0, 110.0, 130.0}), duration);

    EXPECT_DOUBLE_EQ(dd, 0.25);
    EXPECT_DOUBLE_EQ(duration, 2.0);

    // Losing from the first point counts against the initial balance
    EXPECT_DOUBLE_EQ(analyzer.max_drawdown(make_curve({80.0, 90.0}), duration), 0.2);
    EXPECT_DOUBLE_EQ(duration, 2.0);

    // Monotonic growth has no drawdown
    EXPECT_DOUBLE_EQ(analyzer.max_drawdown(make_curve({101.0, 102.0, 103.0}), duration), 0.0);
}

TEST(PerformanceAnalyzerTest, DrawdownDurationIsLongestTimeUnderwater) {
    backtest::PerformanceAnalyzer analyzer(100.0);
    double duration = 0.0;

    // Deepest drop lasts one point, a shallower one lasts three
    double dd = analyzer.max_drawdown(
        make_curve({100.0, 120.0, 80.0, 125.0, 124.0, 123.0, 122.0, 126.0}), duration);

    EXPECT_NEAR(dd, 40.0 / 120.0, 1e-12);
    EXPECT_DOUBLE_EQ(duration, 3.0);

    // Still underwater when the curve ends
    analyzer.max_drawdown(make_curve({100.0, 99.0, 98.0, 97.0, 96.0}), duration);
    EXPECT_DOUBLE_EQ(duration, 4.0);
}

TEST(PerformanceAnalyzerTest, DegenerateInputs) {
    auto empty = backtest::compute_metrics({}, {}, 10000.0);
    EXPECT_EQ(empty.total_trades, 0);
    EXPECT_DOUBLE_EQ(empty.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(empty.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(empty.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(empty.final_equity, 10000.0);
    EXPECT_DOUBLE_EQ(empty.kelly_fraction, 0.0);

    auto flat = backtest::compute_metrics({}, make_curve({10000.0, 10000.0, 10000.0}), 10000.0);
    EXPECT_DOUBLE_EQ(flat.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(flat.sortino_ratio, 0.0);
    EXPECT_DOUBLE_EQ(flat.volatility, 0.0);
    EXPECT_DOUBLE_EQ(flat.calmar_ratio, 0.0);
}

TEST(PerformanceAnalyzerTest, RiskAdjustedRatios) {
    backtest::PerformanceAnalyzer analyzer;
    std::vector<double> returns = {0.01, -0.01, 0.02};

    double mean = 0.02 / 3.0;
    double variance = ((0.01 - mean) * (0.01 - mean) + (-0.01 - mean) * (-0.01 - mean) +
                       (0.02 - mean) * (0.02 - mean)) / 3.0;
    EXPECT_NEAR(analyzer.sharpe_ratio(returns), mean / std::sqrt(variance) * std::sqrt(252.0), 1e-9);
    EXPECT_NEAR(analyzer.sortino_ratio(returns), mean / 0.01 * std::sqrt(252.0), 1e-9);

    // No negative returns: no downside deviation
    EXPECT_DOUBLE_EQ(analyzer.sortino_ratio({0.01, 0.02}), 0.0);
    EXPECT_DOUBLE_EQ(analyzer.sharpe_ratio({}), 0.0);
}

TEST(PerformanceAnalyzerTest, DailyReturnsUseLastEquityOfDay) {
    backtest::PerformanceAnalyzer analyzer(1000.0);
    std::vector<core::EquityPoint> curve(3);
    curve[0].timestamp = 3600;
    curve[0].equity = 900.0;
    curve[1].timestamp = 7200;
    curve[1].equity = 1100.0;
    curve[2].timestamp = core::days(1) + 60;
    curve[2].equity = 1210.0;

    std::vector<double> returns = analyzer.daily_returns(curve);
    ASSERT_EQ(returns.size(), 2u);
    EXPECT_NEAR(returns[0], 0.1, 1e-12);
    EXPECT_NEAR(returns[1], 0.1, 1e-12);
}

TEST(PerformanceAnalyzerTest, ReturnsAndDays) {
    std::vector<core::Trade> trades = {make_trade(200.0, 0, 1), make_trade(-100.0, 1, 3)};
    auto metrics = backtest::compute_metrics(trades, make_curve({10000.0, 10200.0, 10100.0, 10100.0}), 10000.0);

    EXPECT_DOUBLE_EQ(metrics.initial_equity, 10000.0);
    EXPECT_DOUBLE_EQ(metrics.final_equity, 10100.0);
    EXPECT_DOUBLE_EQ(metrics.net_profit, 100.0);
    EXPECT_NEAR(metrics.total_return, 0.01, 1e-12);
    EXPECT_NEAR(metrics.net_profit_pct, 1.0, 1e-9);
    EXPECT_EQ(metrics.trading_days, 3);  // days 0, 1 and 3
    EXPECT_GE(metrics.max_drawdown, 0.0);
    EXPECT_GT(metrics.annualized_return, 0.0);
}

TEST(PerformanceMetricsTest, LookupByName) {
    backtest::PerformanceMetrics metrics;
    metrics.sharpe_ratio = 1.25;
    metrics.total_trades = 7;

    ASSERT_TRUE(metrics.get("sharpe_ratio").has_value());
    EXPECT_DOUBLE_EQ(*metrics.get("sharpe_ratio"), 1.25);
    EXPECT_DOUBLE_EQ(*metrics.get("total_trades"), 7.0);
    EXPECT_FALSE(metrics.get("alpha").has_value());
    EXPECT_EQ(backtest::PerformanceMetrics::names().size(), metrics.to_list().size());
}

TEST(PerformanceAnalyzerTest, FromSimulationResult) {
    backtest::SimulationResult result;
    result.initial_balance = 5000.0;
    result.trades = {make_trade(-250.0)};
    result.equity_curve = make_curve({4750.0});

    auto metrics = backtest::compute_metrics(result);
    EXPECT_DOUBLE_EQ(metrics.initial_equity, 5000.0);
    EXPECT_NEAR(metrics.max_drawdown, 0.05, 1e-12);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 0.0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
