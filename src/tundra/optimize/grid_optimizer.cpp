#include <tundra/optimize/grid_optimizer.hpp>
#include <tundra/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <exception>
#include <execution>
#include <set>

namespace tundra::optimize {

const char* to_string(OptimizationDirection direction) {
    return direction == OptimizationDirection::MAXIMIZE ? "maximize" : "minimize";
}

std::optional<OptimizationDirection> parse_direction(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "max" || lower == "maximize") {
        return OptimizationDirection::MAXIMIZE;
    }
    if (lower == "min" || lower == "minimize") {
        return OptimizationDirection::MINIMIZE;
    }
    return std::nullopt;
}

core::Status validate_domains(const std::vector<core::ParameterDomain>& domains) {
    if (domains.empty()) {
        return core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                     "no parameter domains given");
    }
    std::set<std::string> names;
    for (const auto& domain : domains) {
        if (domain.name.empty()) {
            return core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                         "parameter domain without a name");
        }
        if (domain.values.empty()) {
            return core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                         "parameter domain '" + domain.name + "' is empty");
        }
        if (!names.insert(domain.name).second) {
            return core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                         "parameter domain '" + domain.name + "' declared twice");
        }
    }
    return core::Status::ok();
}

std::vector<core::ParameterSet> enumerate_combinations(const std::vector<core::ParameterDomain>& domains) {
    std::vector<core::ParameterSet> combinations;
    if (domains.empty()) {
        return combinations;
    }

    std::vector<core::ParameterSet::Entry> current;
    current.reserve(domains.size());

    auto generate = [&](auto&& self, size_t index) -> void {
        if (index == domains.size()) {
            combinations.emplace_back(current);
            return;
        }
        for (const auto& value : domains[index].values) {
            current.emplace_back(domains[index].name, value);
            self(self, index + 1);
            current.pop_back();
        }
    };
    generate(generate, 0);

    return combinations;
}

void GridOptimizer::evaluate_one(const EvaluateFn& evaluate, OptimizationResult& result) const {
    if (config_.cancel_flag != nullptr && config_.cancel_flag->load()) {
        result.valid = false;
        result.invalid_reason = "cancelled";
        return;
    }

    try {
        result.metrics = evaluate(result.parameters);
    } catch (const std::exception& e) {
        result.valid = false;
        result.invalid_reason = std::string("evaluation failed: ") + e.what();
        utils::Logger::warn() << "Evaluation of " << result.parameters.to_string()
                              << " failed: " << e.what() << utils::Logger::endl;
        return;
    }

    result.metric_value = result.metrics.get(config_.metric).value_or(0.0);

    if (result.metrics.total_trades < config_.min_trades) {
        result.valid = false;
        result.invalid_reason = "too few trades: " + std::to_string(result.metrics.total_trades) +
                                " (minimum " + std::to_string(config_.min_trades) + ")";
    } else if (std::isnan(result.metric_value)) {
        result.valid = false;
        result.invalid_reason = config_.metric + " is not a number";
    } else {
        result.valid = true;
    }
}

OptimizationReport GridOptimizer::optimize(const std::vector<core::ParameterDomain>& domains,
                                           const EvaluateFn& evaluate) const {
    OptimizationReport report;
    report.metric = config_.metric;
    report.direction = config_.direction;

    report.status = validate_domains(domains);
    if (report.status.is_ok() && !backtest::PerformanceMetrics().get(config_.metric)) {
        report.status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                              "unknown metric '" + config_.metric + "'");
    }
    if (report.status.is_ok() && !evaluate) {
        report.status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                              "no evaluation function given");
    }
    if (!report.status.is_ok()) {
        utils::Logger::error() << "Optimization rejected: " << report.status.reason << utils::Logger::endl;
        return report;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<core::ParameterSet> combinations = enumerate_combinations(domains);
    report.all_results.resize(combinations.size());
    for (size_t i = 0; i < combinations.size(); ++i) {
        report.all_results[i].parameters = std::move(combinations[i]);
        report.all_results[i].enumeration_index = i;
    }

    utils::Logger::info() << "Evaluating " << report.all_results.size() << " parameter combinations ("
                          << config_.metric << ", " << to_string(config_.direction) << ")"
                          << utils::Logger::endl;

    auto run = [this, &evaluate](OptimizationResult& result) { evaluate_one(evaluate, result); };
    if (config_.parallel) {
        std::for_each(std::execution::par, report.all_results.begin(), report.all_results.end(), run);
    } else {
        std::for_each(std::execution::seq, report.all_results.begin(), report.all_results.end(), run);
    }

    for (const auto& result : report.all_results) {
        if (result.valid) {
            report.ranked.push_back(result);
        }
    }

    bool maximize = config_.direction == OptimizationDirection::MAXIMIZE;
    std::stable_sort(report.ranked.begin(), report.ranked.end(),
        [maximize](const OptimizationResult& a, const OptimizationResult& b) {
            return maximize ? a.metric_value > b.metric_value : a.metric_value < b.metric_value;
        });

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    if (report.ranked.empty()) {
        bool cancelled = config_.cancel_flag != nullptr && config_.cancel_flag->load();
        report.status = core::Status::failure(
            cancelled ? core::ErrorCode::Cancelled : core::ErrorCode::NoValidResults,
            "no valid combination out of " + std::to_string(report.all_results.size()) +
            (cancelled ? " (cancelled)" : ""));
        utils::Logger::error() << "Optimization failed: " << report.status.reason << utils::Logger::endl;
        return report;
    }

    const OptimizationResult& best = report.ranked.front();
    utils::Logger::info() << "Best of " << report.ranked.size() << " valid combinations: "
                          << best.parameters.to_string() << " " << config_.metric << "="
                          << best.metric_value << " (" << duration << "ms)" << utils::Logger::endl;

    return report;
}

OptimizationReport optimize(const std::vector<core::ParameterDomain>& domains,
                            const EvaluateFn& evaluate,
                            const std::string& metric_name,
                            OptimizationDirection direction) {
    OptimizerConfig config;
    config.metric = metric_name;
    config.direction = direction;
    return GridOptimizer(config).optimize(domains, evaluate);
}

} // namespace tundra::optimize
