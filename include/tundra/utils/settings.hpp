// include/tundra/utils/settings.hpp
#pragma once
#include <tundra/analysis/monte_carlo.hpp>
#include <tundra/backtest/cost_model.hpp>
#include <tundra/backtest/simulation_engine.hpp>
#include <tundra/compliance/compliance_checker.hpp>
#include <tundra/core/error.hpp>
#include <tundra/core/parameter_set.hpp>
#include <tundra/optimize/grid_optimizer.hpp>
#include <tundra/optimize/walk_forward.hpp>
#include <tundra/risk/position_sizer.hpp>
#include <tundra/utils/config.hpp>
#include <tundra/utils/logger.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tundra {
namespace utils {

/**
 * @struct EngineSettings
 * @brief Typed view of a Config.
 *
 * Missing keys keep the defaults below. Dates accept the same formats as bar
 * timestamps. Walk-forward sizes are given in days.
 */
struct EngineSettings {
    std::string strategy_type = "ChannelBreakout";
    std::string output_dir = ".";
    LogLevel log_level = LogLevel::INFO;

    // data.<SYMBOL> = path, file order
    std::vector<std::pair<std::string, std::string>> data_files;

    backtest::CostModel cost;
    backtest::SimulationConfig simulation;
    risk::SizingConfig sizing;
    optimize::OptimizerConfig optimizer;

    int64_t walk_forward_start = 0;
    int64_t walk_forward_end = 0;
    int walk_forward_window_days = 90;
    int walk_forward_oos_days = 30;
    int walk_forward_step_days = 30;

    analysis::MonteCarloConfig monte_carlo;
    compliance::ComplianceRules compliance;

    // param.<name> = v1, v2, ... in file order
    std::vector<core::ParameterDomain> domains;

    optimize::WalkForwardConfig walk_forward_config() const;
};

// Splits "a, b, c" into trimmed, non-empty items.
std::vector<std::string> split_list(const std::string& text);

// A domain is numeric when every value parses as a number, categorical
// otherwise.
core::ParameterDomain parse_domain(const std::string& name, const std::string& values);

// Fails with InvalidConfiguration on unknown enum names or unparseable dates.
core::Status load_settings(const Config& config, EngineSettings& settings);

} // namespace utils
} // namespace tundra
