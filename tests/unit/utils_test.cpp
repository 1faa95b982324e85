#include <gtest/gtest.h>
#include <tundra/core/time_utils.hpp>
#include <tundra/utils/config.hpp>
#include <tundra/utils/logger.hpp>
#include <tundra/utils/settings.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace tundra;

// Test logger
TEST(LoggerTest, BasicLogging) {
    // Redirect cout to capture log output
    std::stringstream buffer;
    std::streambuf* old = std::cout.rdbuf(buffer.rdbuf());

    // Set log level to INFO
    utils::Logger::set_level(utils::LogLevel::INFO);

    // Log messages at different levels
    utils::Logger::debug() << "Debug message" << utils::Logger::endl;
    utils::Logger::info() << "Info message " << 42 << utils::Logger::endl;
    utils::Logger::warn() << "Warning message" << utils::Logger::endl;
    utils::Logger::error() << "Error message" << utils::Logger::endl;

    // Restore cout
    std::cout.rdbuf(old);

    // Check log output
    std::string output = buffer.str();
    EXPECT_EQ(output.find("Debug message"), std::string::npos); // Debug should not be logged
    EXPECT_NE(output.find("[INFO] Info message 42"), std::string::npos);
    EXPECT_NE(output.find("[WARN] Warning message"), std::string::npos);
    EXPECT_NE(output.find("[ERROR] Error message"), std::string::npos);
}

TEST(LoggerTest, LevelThreshold) {
    std::stringstream buffer;
    std::streambuf* old = std::cout.rdbuf(buffer.rdbuf());

    utils::Logger::set_level(utils::LogLevel::WARN);
    utils::Logger::info() << "quiet" << utils::Logger::endl;
    utils::Logger::warn() << "loud" << utils::Logger::endl;
    utils::Logger::set_level(utils::LogLevel::INFO);

    std::cout.rdbuf(old);

    EXPECT_EQ(buffer.str().find("quiet"), std::string::npos);
    EXPECT_NE(buffer.str().find("loud"), std::string::npos);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(utils::Logger::parse_level("DEBUG"), utils::LogLevel::DEBUG);
    EXPECT_EQ(utils::Logger::parse_level("warning"), utils::LogLevel::WARN);
    EXPECT_EQ(utils::Logger::parse_level("error"), utils::LogLevel::LOG_ERROR);
    EXPECT_EQ(utils::Logger::parse_level("verbose"), utils::LogLevel::INFO);
}

// Test configuration
TEST(ConfigTest, TypedValues) {
    utils::Config config;
    config.load_from_string(
        "# comment\n"
        "name = breakout\n"
        "balance = 25000.5\n"
        "count = 7\n"
        "enabled = yes\n"
        "broken line without separator\n");

    EXPECT_EQ(config.get("name", "none"), "breakout");
    EXPECT_DOUBLE_EQ(config.get<double>("balance", 0.0), 25000.5);
    EXPECT_EQ(config.get<int>("count", 0), 7);
    EXPECT_EQ(config.get<int>("name", -1), -1);  // not a number
    EXPECT_EQ(config.get<int>("missing", 3), 3);
    EXPECT_TRUE(config.get_bool("enabled", false));
    EXPECT_FALSE(config.has("broken line without separator"));

    config.set("count", 9);
    EXPECT_EQ(config.get<int>("count", 0), 9);
}

TEST(ConfigTest, PrefixKeysKeepFileOrder) {
    utils::Config config;
    config.load_from_string("param.slow = 1\nother = 2\nparam.fast = 3\nparam.mode = a\n");

    std::vector<std::string> keys = config.keys_with_prefix("param.");
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], "param.slow");
    EXPECT_EQ(keys[1], "param.fast");
    EXPECT_EQ(keys[2], "param.mode");
}

TEST(ConfigTest, MissingFile) {
    utils::Config config;
    EXPECT_FALSE(config.load_from_file("/nonexistent/tundra.conf"));
}

// Test engine settings
TEST(SettingsTest, ReadsEverySection) {
    utils::Config config;
    config.load_from_string(
        "strategy.type = Threshold\n"
        "output.directory = out\n"
        "log_level = warn\n"
        "data.EURUSD = eurusd.csv\n"
        "data.GBPUSD = gbpusd.csv\n"
        "cost.spread = 0.0002\n"
        "cost.commission_per_lot = 7\n"
        "simulation.initial_balance = 50000\n"
        "simulation.risk_fraction = 0.02\n"
        "simulation.intrabar_policy = take_profit_first\n"
        "sizing.max_volume = 5\n"
        "optimizer.metric = net_profit\n"
        "optimizer.direction = min\n"
        "optimizer.min_trades = 3\n"
        "optimizer.parallel = false\n"
        "walk_forward.start = 2024-01-01\n"
        "walk_forward.end = 2024-07-01\n"
        "walk_forward.window_days = 60\n"
        "walk_forward.oos_days = 20\n"
        "walk_forward.step_days = 10\n"
        "monte_carlo.simulations = 250\n"
        "monte_carlo.seed = 7\n"
        "compliance.profit_target = 0.08\n"
        "compliance.min_trading_days = 5\n"
        "param.entry_period = 10, 20, 30\n"
        "param.mode = fast, slow\n");

    utils::EngineSettings settings;
    core::Status status = utils::load_settings(config, settings);
    ASSERT_TRUE(status.is_ok()) << status.reason;

    EXPECT_EQ(settings.strategy_type, "Threshold");
    EXPECT_EQ(settings.output_dir, "out");
    EXPECT_EQ(settings.log_level, utils::LogLevel::WARN);
    ASSERT_EQ(settings.data_files.size(), 2u);
    EXPECT_EQ(settings.data_files[0].first, "EURUSD");
    EXPECT_EQ(settings.data_files[0].second, "eurusd.csv");

    EXPECT_DOUBLE_EQ(settings.cost.spread, 0.0002);
    EXPECT_DOUBLE_EQ(settings.cost.slippage, 0.0);
    EXPECT_DOUBLE_EQ(settings.cost.commission_per_lot, 7.0);
    EXPECT_DOUBLE_EQ(settings.simulation.initial_balance, 50000.0);
    EXPECT_DOUBLE_EQ(settings.simulation.risk_fraction, 0.02);
    EXPECT_EQ(settings.simulation.intrabar_policy, backtest::IntrabarPolicy::TakeProfitFirst);
    ASSERT_TRUE(static_cast<bool>(settings.simulation.sizer));
    EXPECT_DOUBLE_EQ(settings.simulation.sizer(100.0, 99.0, 50000.0, 0.02), 5.0);

    EXPECT_EQ(settings.optimizer.metric, "net_profit");
    EXPECT_EQ(settings.optimizer.direction, optimize::OptimizationDirection::MINIMIZE);
    EXPECT_EQ(settings.optimizer.min_trades, 3);
    EXPECT_FALSE(settings.optimizer.parallel);

    EXPECT_EQ(settings.monte_carlo.num_simulations, 250);
    EXPECT_EQ(settings.monte_carlo.seed, 7u);
    EXPECT_DOUBLE_EQ(settings.compliance.profit_target, 0.08);
    EXPECT_DOUBLE_EQ(settings.compliance.max_daily_loss, 0.05);
    EXPECT_EQ(settings.compliance.min_trading_days, 5);

    ASSERT_EQ(settings.domains.size(), 2u);
    EXPECT_EQ(settings.domains[0].name, "entry_period");
    EXPECT_TRUE(settings.domains[0].all_numeric());
    EXPECT_EQ(settings.domains[0].values.size(), 3u);
    EXPECT_EQ(settings.domains[1].name, "mode");
    EXPECT_FALSE(settings.domains[1].all_numeric());

    optimize::WalkForwardConfig wf = settings.walk_forward_config();
    EXPECT_EQ(wf.range_start, 1704067200);
    EXPECT_EQ(wf.range_end, 1719792000);
    EXPECT_EQ(wf.window_size, core::days(60));
    EXPECT_EQ(wf.oos_size, core::days(20));
    EXPECT_EQ(wf.step_size, core::days(10));
    EXPECT_EQ(wf.optimizer.metric, "net_profit");
    EXPECT_DOUBLE_EQ(wf.simulation.initial_balance, 50000.0);
}

TEST(SettingsTest, DefaultsWithEmptyConfig) {
    utils::Config config;
    utils::EngineSettings settings;
    ASSERT_TRUE(utils::load_settings(config, settings).is_ok());

    EXPECT_EQ(settings.optimizer.metric, "sharpe_ratio");
    EXPECT_EQ(settings.optimizer.min_trades, 10);
    EXPECT_EQ(settings.simulation.intrabar_policy, backtest::IntrabarPolicy::StopLossFirst);
    EXPECT_TRUE(settings.domains.empty());
    EXPECT_TRUE(settings.data_files.empty());
}

TEST(SettingsTest, RejectsInvalidValues) {
    utils::EngineSettings settings;

    utils::Config bad_policy;
    bad_policy.load_from_string("simulation.intrabar_policy = coin_flip\n");
    EXPECT_EQ(utils::load_settings(bad_policy, settings).code, core::ErrorCode::InvalidConfiguration);

    utils::Config bad_direction;
    bad_direction.load_from_string("optimizer.direction = sideways\n");
    EXPECT_EQ(utils::load_settings(bad_direction, settings).code, core::ErrorCode::InvalidConfiguration);

    utils::Config bad_date;
    bad_date.load_from_string("walk_forward.start = someday\n");
    EXPECT_EQ(utils::load_settings(bad_date, settings).code, core::ErrorCode::InvalidConfiguration);
}

TEST(SettingsTest, RejectsOutOfRangeLimits) {
    auto load = [](const std::string& text) {
        utils::Config config;
        config.load_from_string(text);
        utils::EngineSettings settings;
        return utils::load_settings(config, settings);
    };

    const char* invalid[] = {
        "compliance.max_daily_loss = -0.05\n",
        "compliance.max_total_drawdown = -0.1\n",
        "compliance.profit_target = -0.1\n",
        "compliance.min_trading_days = -1\n",
        "simulation.risk_fraction = 0\n",
        "simulation.risk_fraction = 1.5\n",
        "simulation.initial_balance = 0\n",
        "monte_carlo.simulations = 0\n",
    };
    for (const char* text : invalid) {
        core::Status status = load(text);
        EXPECT_EQ(status.code, core::ErrorCode::InvalidConfiguration) << text;
        EXPECT_FALSE(status.reason.empty()) << text;
    }

    // Boundaries are accepted
    EXPECT_TRUE(load("simulation.risk_fraction = 1\n"
                     "compliance.profit_target = 0\n"
                     "compliance.min_trading_days = 0\n").is_ok());
}

TEST(SettingsTest, MixedDomainIsCategorical) {
    core::ParameterDomain domain = utils::parse_domain("mode", "10, fast");
    EXPECT_FALSE(domain.all_numeric());
    ASSERT_EQ(domain.values.size(), 2u);
    EXPECT_EQ(core::to_string(domain.values[0]), "10");

    EXPECT_EQ(utils::split_list(" a , ,b ").size(), 2u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
