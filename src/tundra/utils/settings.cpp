// src/tundra/utils/settings.cpp
#include "tundra/utils/settings.hpp"
#include "tundra/core/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace tundra {
namespace utils {

namespace {

const std::string kParamPrefix = "param.";
const std::string kDataPrefix = "data.";

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

core::Status invalid(const std::string& reason) {
    return core::Status::failure(core::ErrorCode::InvalidConfiguration, reason);
}

bool read_date(const Config& config, const std::string& key, int64_t& target, core::Status& status) {
    std::string text = config.get(key, "");
    if (text.empty()) {
        return true;
    }
    auto parsed = core::parse_timestamp(text);
    if (!parsed) {
        status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                       "invalid date for " + key + ": " + text);
        return false;
    }
    target = *parsed;
    return true;
}

} // namespace

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

core::ParameterDomain parse_domain(const std::string& name, const std::string& values) {
    std::vector<std::string> items = split_list(values);
    std::vector<core::ParameterValue> parsed;
    parsed.reserve(items.size());
    bool numeric = true;
    for (const auto& item : items) {
        parsed.push_back(core::parse_parameter_value(item));
        numeric = numeric && core::is_numeric(parsed.back());
    }
    if (numeric) {
        return core::ParameterDomain(name, std::move(parsed));
    }
    // Mixed lists are categorical throughout, "10" stays the text "10"
    return core::ParameterDomain::categorical(name, items);
}

core::Status load_settings(const Config& config, EngineSettings& settings) {
    settings.strategy_type = config.get("strategy.type", settings.strategy_type);
    settings.output_dir = config.get("output.directory", settings.output_dir);
    if (config.has("log_level")) {
        settings.log_level = Logger::parse_level(config.get("log_level", "info"));
    }

    settings.data_files.clear();
    for (const auto& key : config.keys_with_prefix(kDataPrefix)) {
        settings.data_files.emplace_back(key.substr(kDataPrefix.size()), config.get(key, ""));
    }

    settings.cost.spread = config.get<double>("cost.spread", settings.cost.spread);
    settings.cost.slippage = config.get<double>("cost.slippage", settings.cost.slippage);
    settings.cost.commission_per_lot =
        config.get<double>("cost.commission_per_lot", settings.cost.commission_per_lot);

    settings.simulation.initial_balance =
        config.get<double>("simulation.initial_balance", settings.simulation.initial_balance);
    settings.simulation.risk_fraction =
        config.get<double>("simulation.risk_fraction", settings.simulation.risk_fraction);
    if (settings.simulation.initial_balance <= 0.0) {
        return invalid("simulation.initial_balance must be positive");
    }
    if (!(settings.simulation.risk_fraction > 0.0 && settings.simulation.risk_fraction <= 1.0)) {
        return invalid("simulation.risk_fraction must be in (0, 1]");
    }
    if (config.has("simulation.intrabar_policy")) {
        std::string policy = lowercase(config.get("simulation.intrabar_policy", ""));
        if (policy == "stop_loss_first") {
            settings.simulation.intrabar_policy = backtest::IntrabarPolicy::StopLossFirst;
        } else if (policy == "take_profit_first") {
            settings.simulation.intrabar_policy = backtest::IntrabarPolicy::TakeProfitFirst;
        } else {
            return core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                         "unknown intrabar policy: " + policy);
        }
    }

    settings.sizing.min_volume = config.get<double>("sizing.min_volume", settings.sizing.min_volume);
    settings.sizing.max_volume = config.get<double>("sizing.max_volume", settings.sizing.max_volume);
    settings.sizing.volume_step = config.get<double>("sizing.volume_step", settings.sizing.volume_step);
    if (settings.sizing.min_volume < 0.0 || settings.sizing.max_volume < settings.sizing.min_volume) {
        return core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                     "sizing limits must satisfy 0 <= min_volume <= max_volume");
    }
    settings.simulation.sizer = risk::PositionSizer(settings.sizing).as_function();

    settings.optimizer.metric = config.get("optimizer.metric", settings.optimizer.metric);
    if (config.has("optimizer.direction")) {
        std::string text = config.get("optimizer.direction", "");
        auto direction = optimize::parse_direction(text);
        if (!direction) {
            return core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                         "unknown optimization direction: " + text);
        }
        settings.optimizer.direction = *direction;
    }
    settings.optimizer.min_trades = config.get<int>("optimizer.min_trades", settings.optimizer.min_trades);
    settings.optimizer.parallel = config.get_bool("optimizer.parallel", settings.optimizer.parallel);

    core::Status status;
    if (!read_date(config, "walk_forward.start", settings.walk_forward_start, status) ||
        !read_date(config, "walk_forward.end", settings.walk_forward_end, status)) {
        return status;
    }
    settings.walk_forward_window_days =
        config.get<int>("walk_forward.window_days", settings.walk_forward_window_days);
    settings.walk_forward_oos_days = config.get<int>("walk_forward.oos_days", settings.walk_forward_oos_days);
    settings.walk_forward_step_days =
        config.get<int>("walk_forward.step_days", settings.walk_forward_step_days);

    settings.monte_carlo.num_simulations =
        config.get<int>("monte_carlo.simulations", settings.monte_carlo.num_simulations);
    settings.monte_carlo.seed = config.get<uint64_t>("monte_carlo.seed", settings.monte_carlo.seed);
    if (settings.monte_carlo.num_simulations <= 0) {
        return invalid("monte_carlo.simulations must be positive");
    }

    settings.compliance.profit_target =
        config.get<double>("compliance.profit_target", settings.compliance.profit_target);
    settings.compliance.max_daily_loss =
        config.get<double>("compliance.max_daily_loss", settings.compliance.max_daily_loss);
    settings.compliance.max_total_drawdown =
        config.get<double>("compliance.max_total_drawdown", settings.compliance.max_total_drawdown);
    settings.compliance.min_trading_days =
        config.get<int>("compliance.min_trading_days", settings.compliance.min_trading_days);
    if (settings.compliance.profit_target < 0.0 || settings.compliance.max_daily_loss < 0.0 ||
        settings.compliance.max_total_drawdown < 0.0) {
        return invalid("compliance limits must not be negative");
    }
    if (settings.compliance.min_trading_days < 0) {
        return invalid("compliance.min_trading_days must not be negative");
    }

    settings.domains.clear();
    for (const auto& key : config.keys_with_prefix(kParamPrefix)) {
        settings.domains.push_back(parse_domain(key.substr(kParamPrefix.size()), config.get(key, "")));
    }

    return core::Status::ok();
}

optimize::WalkForwardConfig EngineSettings::walk_forward_config() const {
    optimize::WalkForwardConfig config;
    config.range_start = walk_forward_start;
    config.range_end = walk_forward_end;
    config.window_size = core::days(walk_forward_window_days);
    config.oos_size = core::days(walk_forward_oos_days);
    config.step_size = core::days(walk_forward_step_days);
    config.optimizer = optimizer;
    config.cost_model = cost;
    config.simulation = simulation;
    return config;
}

} // namespace utils
} // namespace tundra
