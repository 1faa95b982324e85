#include <gtest/gtest.h>
#include <tundra/core/time_utils.hpp>
#include <tundra/optimize/walk_forward.hpp>
#include <tundra/strategy/strategy_base.hpp>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace tundra;

namespace {

// Test strategy: always long, exits after `hold` bars
class HoldStrategy : public strategy::StrategyBase {
public:
    HoldStrategy() : StrategyBase("Hold") {}

    core::Signal generate_signal(const core::BarHistory& history,
                                 core::PositionState state) override {
        size_t hold = static_cast<size_t>(params_.get_int("hold", 1));
        if (state == core::PositionState::FLAT) {
            entry_index_ = history.size();
            double close = history.back().close;
            return core::Signal::enter_long(0.0, close * 0.5);
        }
        if (history.size() - entry_index_ >= hold) {
            return core::Signal::exit();
        }
        return core::Signal::none();
    }

    void initialize() override { entry_index_ = 0; }

private:
    size_t entry_index_ = 0;
};

strategy::StrategyPtr build_hold(const core::ParameterSet& params) {
    auto strategy = std::make_shared<HoldStrategy>();
    strategy->configure(params);
    return strategy;
}

// One bar per day, rising by 1 per day
core::BarSeriesMap daily_bars(int first_day, int last_day) {
    core::BarSeriesMap bars;
    for (int day = first_day; day < last_day; ++day) {
        double close = 100.0 + day;
        bars["TEST"].emplace_back(core::days(day), close, close + 1.0, close - 1.0, close);
    }
    return bars;
}

optimize::WalkForwardConfig quarterly_config() {
    optimize::WalkForwardConfig config;
    config.range_start = 0;
    config.range_end = core::days(180);
    config.window_size = core::days(90);
    config.oos_size = core::days(30);
    config.step_size = core::days(30);
    config.optimizer.metric = "total_trades";
    config.optimizer.min_trades = 1;
    return config;
}

std::vector<core::ParameterDomain> hold_domain() {
    return {core::ParameterDomain::numeric("hold", {1, 2, 3})};
}

} // namespace

TEST(WindowGenerationTest, SlidesByStep) {
    auto windows = optimize::generate_windows(0, core::days(180), core::days(90),
                                              core::days(30), core::days(30));
    ASSERT_EQ(windows.size(), 3u);

    EXPECT_EQ(windows[0].window_index, 1u);
    EXPECT_EQ(windows[0].is_start, 0);
    EXPECT_EQ(windows[0].is_end, core::days(90));
    EXPECT_EQ(windows[0].oos_start, core::days(90));
    EXPECT_EQ(windows[0].oos_end, core::days(120));

    EXPECT_EQ(windows[1].is_start, core::days(30));
    EXPECT_EQ(windows[1].oos_end, core::days(150));

    EXPECT_EQ(windows[2].window_index, 3u);
    EXPECT_EQ(windows[2].is_start, core::days(60));
    EXPECT_EQ(windows[2].oos_start, core::days(150));
    EXPECT_EQ(windows[2].oos_end, core::days(180));

    for (const auto& window : windows) {
        EXPECT_LT(window.is_start, window.is_end);
        EXPECT_EQ(window.is_end, window.oos_start);
        EXPECT_LE(window.oos_end, core::days(180));
    }
}

TEST(WindowGenerationTest, DegenerateRanges) {
    EXPECT_TRUE(optimize::generate_windows(0, core::days(100), core::days(90),
                                           core::days(30), core::days(30)).empty());
    EXPECT_TRUE(optimize::generate_windows(0, core::days(180), 0, core::days(30), core::days(30)).empty());
    EXPECT_TRUE(optimize::generate_windows(0, core::days(180), core::days(90), core::days(30), 0).empty());
    EXPECT_TRUE(optimize::generate_windows(core::days(10), 0, 1, 1, 1).empty());

    // Exactly one window fits
    EXPECT_EQ(optimize::generate_windows(0, core::days(120), core::days(90),
                                         core::days(30), core::days(30)).size(), 1u);
}

TEST(RobustParametersTest, NumericMeanSnapsToDomain) {
    std::vector<core::ParameterDomain> domains = {core::ParameterDomain::numeric("period", {10, 15, 20})};
    std::vector<core::ParameterSet> best = {core::ParameterSet({{"period", 10.0}}),
                                            core::ParameterSet({{"period", 20.0}}),
                                            core::ParameterSet({{"period", 20.0}})};

    auto robust = optimize::find_robust_parameters(best, domains);
    EXPECT_DOUBLE_EQ(robust.get_double("period", 0.0), 15.0);
}

TEST(RobustParametersTest, NumericTieTakesEarlierDomainValue) {
    std::vector<core::ParameterDomain> domains = {core::ParameterDomain::numeric("period", {10, 20})};
    std::vector<core::ParameterSet> best = {core::ParameterSet({{"period", 10.0}}),
                                            core::ParameterSet({{"period", 20.0}})};

    auto robust = optimize::find_robust_parameters(best, domains);
    EXPECT_DOUBLE_EQ(robust.get_double("period", 0.0), 10.0);
}

TEST(RobustParametersTest, CategoricalMode) {
    std::vector<core::ParameterDomain> domains = {core::ParameterDomain::categorical("mode", {"a", "b"})};

    auto majority = optimize::find_robust_parameters(
        {core::ParameterSet({{"mode", std::string("a")}}),
         core::ParameterSet({{"mode", std::string("b")}}),
         core::ParameterSet({{"mode", std::string("b")}})}, domains);
    EXPECT_EQ(majority.get_string("mode", ""), "b");

    auto tie = optimize::find_robust_parameters(
        {core::ParameterSet({{"mode", std::string("b")}}),
         core::ParameterSet({{"mode", std::string("a")}})}, domains);
    EXPECT_EQ(tie.get_string("mode", ""), "b");  // first seen
}

TEST(WalkForwardTest, OptimizesEveryWindow) {
    optimize::WalkForwardOrchestrator orchestrator(quarterly_config());
    auto report = orchestrator.run(daily_bars(0, 180), build_hold, hold_domain());

    ASSERT_TRUE(report.success()) << report.status.reason;
    EXPECT_EQ(report.metric, "total_trades");
    ASSERT_EQ(report.windows.size(), 3u);
    EXPECT_EQ(report.successful_windows, 3u);

    for (const auto& window : report.windows) {
        EXPECT_TRUE(window.success) << window.error;
        EXPECT_EQ(window.combinations_evaluated, 3u);
        // Shortest hold trades most often
        EXPECT_EQ(window.best_parameters.get_int("hold", 0), 1);
        EXPECT_GT(window.is_metric, window.oos_metric);
        EXPECT_GT(window.oos_metrics.total_trades, 0);
    }

    EXPECT_EQ(report.robust_parameters.get_int("hold", 0), 1);
    ASSERT_TRUE(report.full_range.success());
    EXPECT_GT(report.full_range_metrics.total_trades, report.windows[0].is_metrics.total_trades);
    EXPECT_GT(report.mean_is_metric, 0.0);
    EXPECT_NEAR(report.efficiency, report.mean_oos_metric / report.mean_is_metric, 1e-12);
}

TEST(WalkForwardTest, EfficiencyWithUnboundedMetric) {
    // Rising prices, every trade wins: profit factor is +inf in and out of sample
    auto config = quarterly_config();
    config.optimizer.metric = "profit_factor";
    auto report = optimize::WalkForwardOrchestrator(config).run(daily_bars(0, 180), build_hold, hold_domain());

    ASSERT_TRUE(report.success()) << report.status.reason;
    EXPECT_EQ(report.successful_windows, 3u);
    EXPECT_TRUE(std::isinf(report.mean_is_metric));
    EXPECT_TRUE(std::isinf(report.mean_oos_metric));
    EXPECT_FALSE(std::isnan(report.efficiency));
    EXPECT_DOUBLE_EQ(report.efficiency, 0.0);
}

TEST(WalkForwardTest, WindowWithoutDataFails) {
    // Nothing before day 100, the first in-sample period [0, 90) is empty
    optimize::WalkForwardOrchestrator orchestrator(quarterly_config());
    auto report = orchestrator.run(daily_bars(100, 180), build_hold, hold_domain());

    ASSERT_TRUE(report.success()) << report.status.reason;
    ASSERT_EQ(report.windows.size(), 3u);
    EXPECT_FALSE(report.windows[0].success);
    EXPECT_EQ(report.windows[0].error, "no in-sample data");
    EXPECT_TRUE(report.windows[1].success);
    EXPECT_TRUE(report.windows[2].success);
    EXPECT_EQ(report.successful_windows, 2u);
}

TEST(WalkForwardTest, AllWindowsFailing) {
    auto config = quarterly_config();
    config.optimizer.min_trades = 1000;
    auto report = optimize::WalkForwardOrchestrator(config).run(daily_bars(0, 180), build_hold, hold_domain());

    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.status.code, core::ErrorCode::NoValidResults);
    EXPECT_EQ(report.windows.size(), 3u);
    EXPECT_EQ(report.successful_windows, 0u);
}

TEST(WalkForwardTest, BuilderWithoutStrategy) {
    auto report = optimize::WalkForwardOrchestrator(quarterly_config()).run(
        daily_bars(0, 180), [](const core::ParameterSet&) { return strategy::StrategyPtr(); }, hold_domain());

    EXPECT_FALSE(report.success());
    EXPECT_FALSE(report.windows.empty());
    EXPECT_EQ(report.windows[0].combinations_valid, 0u);
}

TEST(WalkForwardTest, RejectsInvalidConfiguration) {
    auto bars = daily_bars(0, 180);

    auto reversed = quarterly_config();
    reversed.range_start = core::days(200);
    EXPECT_EQ(optimize::WalkForwardOrchestrator(reversed).run(bars, build_hold, hold_domain()).status.code,
              core::ErrorCode::InvalidConfiguration);

    auto too_short = quarterly_config();
    too_short.range_end = core::days(100);
    auto short_report = optimize::WalkForwardOrchestrator(too_short).run(bars, build_hold, hold_domain());
    EXPECT_EQ(short_report.status.code, core::ErrorCode::InvalidConfiguration);
    EXPECT_TRUE(short_report.windows.empty());

    auto bad_metric = quarterly_config();
    bad_metric.optimizer.metric = "alpha";
    EXPECT_EQ(optimize::WalkForwardOrchestrator(bad_metric).run(bars, build_hold, hold_domain()).status.code,
              core::ErrorCode::InvalidConfiguration);

    EXPECT_EQ(optimize::WalkForwardOrchestrator(quarterly_config()).run(bars, build_hold, {}).status.code,
              core::ErrorCode::InvalidConfiguration);
    EXPECT_EQ(optimize::WalkForwardOrchestrator(quarterly_config())
                  .run(bars, strategy::StrategyBuilder(), hold_domain()).status.code,
              core::ErrorCode::InvalidConfiguration);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
