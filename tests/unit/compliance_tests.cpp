#include <gtest/gtest.h>
#include <tundra/backtest/simulation_engine.hpp>
#include <tundra/compliance/compliance_checker.hpp>
#include <tundra/core/time_utils.hpp>

#include <set>
#include <string>
#include <vector>

using namespace tundra;

namespace {

compliance::DailyEquitySeries make_series(double initial,
                                          const std::vector<std::pair<double, double>>& min_close) {
    compliance::DailyEquitySeries series;
    series.initial_balance = initial;
    int64_t day = 0;
    for (const auto& [low, close] : min_close) {
        series.days.push_back(compliance::DailyBalance{day++, low, close});
    }
    return series;
}

} // namespace

TEST(ComplianceCheckerTest, DailyLossBreachIsTheOnlyViolation) {
    // Day 2 dips 6% below the previous close, everything else is fine
    auto series = make_series(100000.0, {{99000.0, 104000.0},
                                         {97760.0, 105000.0},
                                         {104000.0, 108000.0},
                                         {107000.0, 111000.0}});
    std::set<int64_t> trade_days = {0, 1, 2, 3};

    auto verdict = compliance::ComplianceChecker().check(series, trade_days);

    EXPECT_FALSE(verdict.is_compliant);
    EXPECT_TRUE(verdict.profit_target_met);
    EXPECT_FALSE(verdict.daily_loss_compliant);
    EXPECT_TRUE(verdict.total_drawdown_compliant);
    EXPECT_TRUE(verdict.trading_days_compliant);
    ASSERT_EQ(verdict.violated_rules.size(), 1u);
    EXPECT_EQ(verdict.violated_rules[0], compliance::kDailyLossRule);
    ASSERT_EQ(verdict.reasons.size(), 1u);
    EXPECT_NE(verdict.reasons[0].find("1970-01-02"), std::string::npos);

    EXPECT_NEAR(verdict.metrics.worst_daily_drawdown, -0.06, 1e-12);
    EXPECT_NEAR(verdict.metrics.total_return, 0.11, 1e-12);
    EXPECT_EQ(verdict.metrics.trading_days, 4);
    ASSERT_EQ(verdict.metrics.daily.size(), 4u);
    EXPECT_NEAR(verdict.metrics.daily[0].daily_pnl_pct, 0.04, 1e-12);
}

TEST(ComplianceCheckerTest, PassingAccount) {
    auto series = make_series(100000.0, {{100000.0, 103000.0},
                                         {102000.0, 106000.0},
                                         {105000.0, 108000.0},
                                         {107500.0, 110500.0}});
    auto verdict = compliance::check(series, {0, 1, 2, 3}, compliance::ComplianceRules());

    EXPECT_TRUE(verdict.is_compliant);
    EXPECT_TRUE(verdict.violated_rules.empty());
    EXPECT_TRUE(verdict.reasons.empty());
}

TEST(ComplianceCheckerTest, EveryRuleReportedIndependently) {
    auto series = make_series(100000.0, {{88000.0, 89000.0},
                                         {78000.0, 79000.0}});
    auto verdict = compliance::ComplianceChecker().check(series, {0});

    EXPECT_FALSE(verdict.is_compliant);
    EXPECT_FALSE(verdict.profit_target_met);
    EXPECT_FALSE(verdict.daily_loss_compliant);
    EXPECT_FALSE(verdict.total_drawdown_compliant);
    EXPECT_FALSE(verdict.trading_days_compliant);

    std::vector<std::string> expected = {compliance::kProfitTargetRule, compliance::kDailyLossRule,
                                         compliance::kTotalDrawdownRule, compliance::kTradingDaysRule};
    EXPECT_EQ(verdict.violated_rules, expected);
    EXPECT_EQ(verdict.reasons.size(), 4u);

    // Peak is the best close, not the starting balance
    EXPECT_NEAR(verdict.metrics.max_total_drawdown, (79000.0 - 89000.0) / 89000.0, 1e-12);
}

TEST(ComplianceCheckerTest, CustomRules) {
    compliance::ComplianceRules rules;
    rules.profit_target = 0.02;
    rules.max_daily_loss = 0.10;
    rules.min_trading_days = 1;

    auto series = make_series(100000.0, {{94000.0, 103000.0}});
    auto verdict = compliance::ComplianceChecker(rules).check(series, {0});

    EXPECT_TRUE(verdict.is_compliant);
    EXPECT_EQ(compliance::ComplianceChecker(rules).rules().min_trading_days, 1);
}

TEST(ComplianceCheckerTest, EmptySeries) {
    auto verdict = compliance::ComplianceChecker().check(make_series(50000.0, {}), {});

    EXPECT_DOUBLE_EQ(verdict.metrics.final_balance, 50000.0);
    EXPECT_FALSE(verdict.profit_target_met);
    EXPECT_TRUE(verdict.daily_loss_compliant);
    EXPECT_TRUE(verdict.total_drawdown_compliant);
    EXPECT_FALSE(verdict.trading_days_compliant);
}

TEST(ComplianceCheckerTest, EmptySeriesWithNegativeDailyLimit) {
    // A negative limit makes the daily rule fail with no day to blame
    compliance::ComplianceRules rules;
    rules.max_daily_loss = -0.05;
    auto verdict = compliance::check(make_series(10000.0, {}), {}, rules);

    EXPECT_FALSE(verdict.daily_loss_compliant);
    ASSERT_EQ(verdict.violated_rules.size(), verdict.reasons.size());
    bool found = false;
    for (size_t i = 0; i < verdict.violated_rules.size(); ++i) {
        if (verdict.violated_rules[i] == compliance::kDailyLossRule) {
            found = true;
            EXPECT_EQ(verdict.reasons[i].find(" on "), std::string::npos);
        }
    }
    EXPECT_TRUE(found);
}

TEST(ComplianceSeriesTest, BuiltFromEquityCurve) {
    std::vector<core::EquityPoint> curve(4);
    curve[0].timestamp = 3600;
    curve[0].equity = 100.0;
    curve[1].timestamp = 7200;
    curve[1].equity = 95.0;
    curve[2].timestamp = 10800;
    curve[2].equity = 98.0;
    curve[3].timestamp = core::days(1) + 60;
    curve[3].equity = 110.0;

    auto series = compliance::build_daily_series(curve, 100.0);
    EXPECT_DOUBLE_EQ(series.initial_balance, 100.0);
    ASSERT_EQ(series.days.size(), 2u);
    EXPECT_EQ(series.days[0].day, 0);
    EXPECT_DOUBLE_EQ(series.days[0].min_balance, 95.0);
    EXPECT_DOUBLE_EQ(series.days[0].close_balance, 98.0);
    EXPECT_EQ(series.days[1].day, 1);
    EXPECT_DOUBLE_EQ(series.days[1].close_balance, 110.0);
}

TEST(ComplianceSeriesTest, TradeDaysAndSimulationResult) {
    core::Trade first;
    first.entry_time = 3600;
    first.exit_time = core::days(2) + 60;
    core::Trade second;
    second.entry_time = core::days(2) + 7200;
    second.exit_time = core::days(3);
    EXPECT_EQ(compliance::collect_trade_days({first, second}), (std::set<int64_t>{0, 2, 3}));

    backtest::SimulationResult result;
    result.initial_balance = 1000.0;
    result.trades = {first, second};
    result.equity_curve.resize(1);
    result.equity_curve[0].timestamp = core::days(3);
    result.equity_curve[0].equity = 1200.0;

    auto verdict = compliance::ComplianceChecker().check(result);
    EXPECT_TRUE(verdict.profit_target_met);
    EXPECT_EQ(verdict.metrics.trading_days, 3);
    EXPECT_FALSE(verdict.trading_days_compliant);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
