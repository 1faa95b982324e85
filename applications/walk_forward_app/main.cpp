// applications/walk_forward_app/main.cpp
#include "tundra/analysis/monte_carlo.hpp"
#include "tundra/backtest/performance_analyzer.hpp"
#include "tundra/compliance/compliance_checker.hpp"
#include "tundra/core/time_utils.hpp"
#include "tundra/data/csv_bar_loader.hpp"
#include "tundra/optimize/walk_forward.hpp"
#include "tundra/report/report_writer.hpp"
#include "tundra/strategy/strategy_factory.hpp"
#include "tundra/utils/config.hpp"
#include "tundra/utils/logger.hpp"
#include "tundra/utils/settings.hpp"
#include "channel_breakout/channel_breakout_strategy.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace {

// Whole range covered by the loaded data, end exclusive
std::pair<int64_t, int64_t> data_range(const tundra::core::BarSeriesMap& bars) {
    int64_t first = std::numeric_limits<int64_t>::max();
    int64_t last = std::numeric_limits<int64_t>::min();
    for (const auto& [symbol, series] : bars) {
        if (!series.empty()) {
            first = std::min(first, series.front().timestamp);
            last = std::max(last, series.back().timestamp);
        }
    }
    return {first, last + 1};
}

std::string output_path(const std::string& dir, const std::string& file) {
    return (std::filesystem::path(dir) / file).string();
}

} // namespace

int main(int argc, char** argv) {
    using namespace tundra;
    try {
        // Load configuration
        std::string config_file = argc > 1 ? argv[1] : "tundra.conf";
        auto config = utils::Config::instance();
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << std::endl;
            return 1;
        }

        utils::EngineSettings settings;
        core::Status status = utils::load_settings(*config, settings);
        if (!status) {
            std::cerr << "Invalid configuration: " << status.reason << std::endl;
            return 1;
        }
        utils::Logger::set_level(settings.log_level);

        // Load data
        core::BarSeriesMap bars;
        for (const auto& [symbol, path] : settings.data_files) {
            if (!data::load_symbol(symbol, path, bars)) {
                utils::Logger::warn() << "No data loaded for " << symbol << utils::Logger::endl;
            }
        }
        if (bars.empty()) {
            utils::Logger::error() << "No market data loaded, add data.<SYMBOL> = <file> entries to "
                                   << config_file << utils::Logger::endl;
            return 1;
        }

        if (!strategy::StrategyFactory::has_type(settings.strategy_type)) {
            utils::Logger::error() << "Unknown strategy type " << settings.strategy_type << utils::Logger::endl;
            return 1;
        }

        optimize::WalkForwardConfig wf_config = settings.walk_forward_config();
        if (wf_config.range_start == 0 && wf_config.range_end == 0) {
            auto [first, last] = data_range(bars);
            wf_config.range_start = first;
            wf_config.range_end = last;
        }

        utils::Logger::info() << "Walk-forward " << settings.strategy_type << " over "
                              << core::format_date(wf_config.range_start) << " to "
                              << core::format_date(wf_config.range_end) << utils::Logger::endl;

        optimize::WalkForwardOrchestrator orchestrator(wf_config);
        optimize::WalkForwardReport wf_report = orchestrator.run(
            bars, strategy::StrategyFactory::builder_for(settings.strategy_type), settings.domains);

        std::filesystem::create_directories(settings.output_dir);
        bool written = report::write_walk_forward(
            output_path(settings.output_dir, "walk_forward_windows.csv"), wf_report);

        if (!wf_report.success()) {
            std::cerr << "Walk-forward failed (" << core::to_string(wf_report.status.code) << "): "
                      << wf_report.status.reason << std::endl;
            return 2;
        }

        const auto& full = wf_report.full_range;
        written = report::write_trades(output_path(settings.output_dir, "trades.csv"), full.trades) && written;
        written = report::write_equity_curve(output_path(settings.output_dir, "equity_curve.csv"),
                                             full.equity_curve) && written;
        written = report::write_metrics(output_path(settings.output_dir, "metrics.csv"),
                                        wf_report.full_range_metrics) && written;

        analysis::MonteCarloDistribution distribution =
            analysis::MonteCarloResampler(settings.monte_carlo).resample(full.trades, full.initial_balance);
        if (distribution.success()) {
            written = report::write_monte_carlo(output_path(settings.output_dir, "monte_carlo.csv"),
                                                distribution) && written;
        }

        compliance::ComplianceVerdict verdict =
            compliance::ComplianceChecker(settings.compliance).check(full);
        written = report::write_compliance(output_path(settings.output_dir, "compliance.csv"), verdict) && written;

        // Display results
        const auto& metrics = wf_report.full_range_metrics;
        std::cout << "Walk-forward completed." << std::endl;
        std::cout << "Windows: " << wf_report.successful_windows << "/" << wf_report.windows.size() << std::endl;
        std::cout << "Robust parameters: " << wf_report.robust_parameters.to_string() << std::endl;
        std::cout << "Mean IS " << wf_report.metric << ": " << wf_report.mean_is_metric << std::endl;
        std::cout << "Mean OOS " << wf_report.metric << ": " << wf_report.mean_oos_metric << std::endl;
        std::cout << "Efficiency: " << wf_report.efficiency << std::endl;
        std::cout << "Total trades: " << metrics.total_trades << std::endl;
        std::cout << "Win rate: " << (metrics.win_rate * 100.0) << "%" << std::endl;
        std::cout << "Profit factor: " << metrics.profit_factor << std::endl;
        std::cout << "Sharpe ratio: " << metrics.sharpe_ratio << std::endl;
        std::cout << "Max drawdown: " << (metrics.max_drawdown * 100.0) << "%" << std::endl;
        if (distribution.success()) {
            std::cout << "Monte Carlo median final balance: " << distribution.median_final << std::endl;
            std::cout << "Probability of loss: " << (distribution.probability_of_loss * 100.0) << "%" << std::endl;
        }
        std::cout << "Compliant: " << (verdict.is_compliant ? "yes" : "no") << std::endl;
        for (const auto& reason : verdict.reasons) {
            std::cout << "  " << reason << std::endl;
        }

        if (!written) {
            std::cerr << "Some reports could not be written to " << settings.output_dir << std::endl;
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
