#include <tundra/optimize/walk_forward.hpp>
#include <tundra/core/time_utils.hpp>
#include <tundra/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace tundra::optimize {

std::vector<WindowSpec> generate_windows(int64_t range_start, int64_t range_end,
                                         int64_t window_size, int64_t oos_size,
                                         int64_t step_size) {
    std::vector<WindowSpec> windows;
    if (window_size <= 0 || oos_size <= 0 || step_size <= 0 || range_start >= range_end) {
        return windows;
    }

    int64_t is_start = range_start;
    size_t index = 1;
    while (true) {
        WindowSpec window;
        window.window_index = index;
        window.is_start = is_start;
        window.is_end = is_start + window_size;
        window.oos_start = window.is_end;
        window.oos_end = window.oos_start + oos_size;

        if (window.oos_end > range_end) {
            break;
        }
        windows.push_back(window);

        is_start += step_size;
        ++index;
    }
    return windows;
}

core::Status validate_config(const WalkForwardConfig& config) {
    auto invalid = [](const std::string& reason) {
        return core::Status::failure(core::ErrorCode::InvalidConfiguration, reason);
    };

    if (config.range_start >= config.range_end) {
        return invalid("date range start must be before its end");
    }
    if (config.window_size <= 0 || config.oos_size <= 0 || config.step_size <= 0) {
        return invalid("window, out-of-sample and step sizes must be positive");
    }
    if (config.simulation.initial_balance <= 0.0) {
        return invalid("initial balance must be positive");
    }
    if (!backtest::PerformanceMetrics().get(config.optimizer.metric)) {
        return invalid("unknown metric '" + config.optimizer.metric + "'");
    }
    return core::Status::ok();
}

core::ParameterSet find_robust_parameters(const std::vector<core::ParameterSet>& window_best,
                                          const std::vector<core::ParameterDomain>& domains) {
    std::vector<core::ParameterSet::Entry> robust;

    for (const auto& domain : domains) {
        std::vector<core::ParameterValue> values;
        for (const auto& params : window_best) {
            if (const core::ParameterValue* value = params.find(domain.name)) {
                values.push_back(*value);
            }
        }
        if (values.empty()) {
            continue;
        }

        bool numeric = std::all_of(values.begin(), values.end(),
                                   [](const core::ParameterValue& v) { return core::is_numeric(v); });

        if (numeric) {
            double sum = 0.0;
            for (const auto& value : values) {
                sum += std::get<double>(value);
            }
            double mean = sum / static_cast<double>(values.size());

            // Snap to the closest value the domain actually offers
            std::optional<double> closest;
            for (const auto& candidate : domain.values) {
                if (!core::is_numeric(candidate)) {
                    continue;
                }
                double v = std::get<double>(candidate);
                if (!closest || std::fabs(v - mean) < std::fabs(*closest - mean)) {
                    closest = v;
                }
            }
            robust.emplace_back(domain.name, closest ? *closest : mean);
        } else {
            // Mode, first seen wins ties
            std::vector<std::pair<core::ParameterValue, int>> counts;
            for (const auto& value : values) {
                auto it = std::find_if(counts.begin(), counts.end(),
                    [&value](const auto& entry) { return entry.first == value; });
                if (it != counts.end()) {
                    it->second++;
                } else {
                    counts.emplace_back(value, 1);
                }
            }
            auto best = counts.begin();
            for (auto it = counts.begin(); it != counts.end(); ++it) {
                if (it->second > best->second) {
                    best = it;
                }
            }
            robust.emplace_back(domain.name, best->first);
        }
    }

    return core::ParameterSet(std::move(robust));
}

backtest::SimulationResult WalkForwardOrchestrator::simulate_range(
        const core::BarSeriesMap& bars, const strategy::StrategyBuilder& builder,
        const core::ParameterSet& params, int64_t start, int64_t end) const {
    strategy::StrategyPtr strategy = builder(params);
    if (!strategy) {
        backtest::SimulationResult result;
        result.status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                              "strategy builder returned no strategy for " +
                                              params.to_string());
        return result;
    }

    core::BarSeriesMap sliced = core::slice_bars(bars, start, end);
    backtest::SimulationEngine engine(config_.cost_model, config_.simulation);
    return engine.run(sliced, *strategy);
}

WindowResult WalkForwardOrchestrator::run_window(const core::BarSeriesMap& bars,
                                                 const strategy::StrategyBuilder& builder,
                                                 const std::vector<core::ParameterDomain>& domains,
                                                 const WindowSpec& window) const {
    WindowResult result;
    result.window = window;

    utils::Logger::info() << "Window " << window.window_index << ": IS "
                          << core::format_date(window.is_start) << " - " << core::format_date(window.is_end)
                          << ", OOS " << core::format_date(window.oos_start) << " - "
                          << core::format_date(window.oos_end) << utils::Logger::endl;

    core::BarSeriesMap in_sample = core::slice_bars(bars, window.is_start, window.is_end);
    if (in_sample.empty()) {
        result.error = "no in-sample data";
        utils::Logger::warn() << "Window " << window.window_index << " failed: " << result.error
                              << utils::Logger::endl;
        return result;
    }

    EvaluateFn evaluate = [&](const core::ParameterSet& params) {
        backtest::SimulationResult sim = simulate_range(in_sample, builder, params,
                                                        window.is_start, window.is_end);
        if (!sim.success()) {
            throw std::runtime_error(sim.status.reason);
        }
        return backtest::compute_metrics(sim);
    };

    GridOptimizer optimizer(config_.optimizer);
    OptimizationReport is_report = optimizer.optimize(domains, evaluate);
    result.combinations_evaluated = is_report.evaluated();
    result.combinations_valid = is_report.valid_count();

    if (!is_report.success()) {
        result.error = is_report.status.reason;
        utils::Logger::warn() << "Optimization failed for window " << window.window_index << ": "
                              << result.error << utils::Logger::endl;
        return result;
    }

    const OptimizationResult& best = *is_report.best();
    result.best_parameters = best.parameters;
    result.is_metrics = best.metrics;
    result.is_metric = best.metric_value;

    utils::Logger::info() << "Best parameters: " << best.parameters.to_string() << ", IS "
                          << config_.optimizer.metric << ": " << result.is_metric << utils::Logger::endl;

    backtest::SimulationResult oos = simulate_range(bars, builder, best.parameters,
                                                    window.oos_start, window.oos_end);
    if (!oos.success()) {
        result.error = "out-of-sample validation failed: " + oos.status.reason;
        utils::Logger::warn() << "Window " << window.window_index << " " << result.error
                              << utils::Logger::endl;
        return result;
    }

    result.oos_metrics = backtest::compute_metrics(oos);
    result.oos_metric = result.oos_metrics.get(config_.optimizer.metric).value_or(0.0);
    result.success = true;

    utils::Logger::info() << "OOS " << config_.optimizer.metric << ": " << result.oos_metric
                          << ", OOS return: " << result.oos_metrics.total_return * 100.0 << "%"
                          << utils::Logger::endl;
    return result;
}

WalkForwardReport WalkForwardOrchestrator::run(const core::BarSeriesMap& bars,
                                               const strategy::StrategyBuilder& builder,
                                               const std::vector<core::ParameterDomain>& domains) const {
    WalkForwardReport report;
    report.metric = config_.optimizer.metric;

    report.status = validate_config(config_);
    if (report.status.is_ok()) {
        report.status = validate_domains(domains);
    }
    if (report.status.is_ok() && !builder) {
        report.status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                              "no strategy builder given");
    }
    if (!report.status.is_ok()) {
        utils::Logger::error() << "Walk-forward rejected: " << report.status.reason << utils::Logger::endl;
        return report;
    }

    std::vector<WindowSpec> windows = generate_windows(config_.range_start, config_.range_end,
                                                       config_.window_size, config_.oos_size,
                                                       config_.step_size);
    if (windows.empty()) {
        report.status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                              "date range too short for one in-sample plus out-of-sample window");
        utils::Logger::error() << "Walk-forward rejected: " << report.status.reason << utils::Logger::endl;
        return report;
    }

    utils::Logger::info() << "Walk-forward over " << core::format_date(config_.range_start) << " - "
                          << core::format_date(config_.range_end) << ": " << windows.size()
                          << " windows" << utils::Logger::endl;

    std::vector<core::ParameterSet> window_best;
    double is_sum = 0.0;
    double oos_sum = 0.0;

    for (const auto& window : windows) {
        if (config_.optimizer.cancel_flag != nullptr && config_.optimizer.cancel_flag->load()) {
            WindowResult cancelled;
            cancelled.window = window;
            cancelled.error = "cancelled";
            report.windows.push_back(cancelled);
            continue;
        }

        WindowResult result = run_window(bars, builder, domains, window);
        if (result.success) {
            window_best.push_back(result.best_parameters);
            is_sum += result.is_metric;
            oos_sum += result.oos_metric;
            report.successful_windows++;
        }
        report.windows.push_back(std::move(result));
    }

    if (report.successful_windows == 0) {
        bool cancelled = config_.optimizer.cancel_flag != nullptr && config_.optimizer.cancel_flag->load();
        report.status = core::Status::failure(
            cancelled ? core::ErrorCode::Cancelled : core::ErrorCode::NoValidResults,
            "no window was optimized successfully");
        utils::Logger::error() << "Walk-forward failed: " << report.status.reason << utils::Logger::endl;
        return report;
    }

    report.mean_is_metric = is_sum / static_cast<double>(report.successful_windows);
    report.mean_oos_metric = oos_sum / static_cast<double>(report.successful_windows);
    // Unbounded metrics (profit factor without losers) have no meaningful ratio
    bool finite = std::isfinite(report.mean_is_metric) && std::isfinite(report.mean_oos_metric);
    report.efficiency = finite && report.mean_is_metric != 0.0
        ? report.mean_oos_metric / report.mean_is_metric : 0.0;

    report.robust_parameters = find_robust_parameters(window_best, domains);
    utils::Logger::info() << "Robust parameters: " << report.robust_parameters.to_string()
                          << utils::Logger::endl;

    report.full_range = simulate_range(bars, builder, report.robust_parameters,
                                       config_.range_start, config_.range_end);
    if (report.full_range.success()) {
        report.full_range_metrics = backtest::compute_metrics(report.full_range);
        utils::Logger::info() << "Full range " << report.metric << ": "
                              << report.full_range_metrics.get(report.metric).value_or(0.0)
                              << ", trades: " << report.full_range_metrics.total_trades
                              << utils::Logger::endl;
    } else {
        utils::Logger::warn() << "Full range validation failed: " << report.full_range.status.reason
                              << utils::Logger::endl;
    }

    report.status = core::Status::ok();
    return report;
}

} // namespace tundra::optimize
