#include <tundra/report/report_writer.hpp>
#include <tundra/core/time_utils.hpp>
#include <tundra/utils/logger.hpp>
#include <fstream>
#include <iomanip>

namespace tundra::report {

namespace {

// Parameter sets contain ", " so they are quoted
std::string quoted(const std::string& text) {
    std::string escaped = "\"";
    for (char c : text) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

template<typename Writer>
bool write_file(const std::string& path, const char* what, Writer writer) {
    std::ofstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to create " << what << " file: " << path << utils::Logger::endl;
        return false;
    }
    writer(file);
    file.close();
    if (file.fail()) {
        utils::Logger::error() << "Failed to write " << what << " file: " << path << utils::Logger::endl;
        return false;
    }
    utils::Logger::info() << "Exported " << what << " to CSV: " << path << utils::Logger::endl;
    return true;
}

} // namespace

void write_trades(std::ostream& out, const std::vector<core::Trade>& trades) {
    out << "symbol,direction,entry_time,exit_time,entry_price,exit_price,volume,commission,profit_loss,exit_reason\n";
    out << std::fixed;
    for (const auto& trade : trades) {
        out << trade.symbol << ","
            << core::to_string(trade.direction) << ","
            << core::format_datetime(trade.entry_time) << ","
            << core::format_datetime(trade.exit_time) << ","
            << std::setprecision(5) << trade.entry_price << ","
            << trade.exit_price << ","
            << std::setprecision(2) << trade.volume << ","
            << trade.commission << ","
            << trade.profit_loss << ","
            << core::to_string(trade.exit_reason) << "\n";
    }
}

void write_equity_curve(std::ostream& out, const std::vector<core::EquityPoint>& equity_curve) {
    out << "timestamp,balance,equity,open_positions\n";
    out << std::fixed << std::setprecision(2);
    for (const auto& point : equity_curve) {
        out << core::format_datetime(point.timestamp) << ","
            << point.balance << ","
            << point.equity << ","
            << point.open_position_count << "\n";
    }
}

void write_metrics(std::ostream& out, const backtest::PerformanceMetrics& metrics) {
    out << "metric,value\n";
    out << std::setprecision(10);
    for (const auto& [name, value] : metrics.to_list()) {
        out << name << "," << value << "\n";
    }
}

void write_walk_forward(std::ostream& out, const optimize::WalkForwardReport& report) {
    out << "window,is_start,is_end,oos_start,oos_end,parameters,is_" << report.metric
        << ",oos_" << report.metric << ",is_trades,oos_trades,combinations,valid_combinations,status\n";
    out << std::setprecision(6);
    for (const auto& w : report.windows) {
        out << w.window.window_index << ","
            << core::format_date(w.window.is_start) << ","
            << core::format_date(w.window.is_end) << ","
            << core::format_date(w.window.oos_start) << ","
            << core::format_date(w.window.oos_end) << ","
            << quoted(w.best_parameters.to_string()) << ","
            << w.is_metric << ","
            << w.oos_metric << ","
            << w.is_metrics.total_trades << ","
            << w.oos_metrics.total_trades << ","
            << w.combinations_evaluated << ","
            << w.combinations_valid << ","
            << (w.success ? std::string("ok") : quoted(w.error)) << "\n";
    }
}

void write_optimization(std::ostream& out, const optimize::OptimizationReport& report) {
    out << "index,parameters," << report.metric << ",total_trades,valid,reason\n";
    out << std::setprecision(6);
    for (const auto& result : report.all_results) {
        out << result.enumeration_index << ","
            << quoted(result.parameters.to_string()) << ","
            << result.metric_value << ","
            << result.metrics.total_trades << ","
            << (result.valid ? "true" : "false") << ","
            << quoted(result.invalid_reason) << "\n";
    }
}

void write_monte_carlo(std::ostream& out, const analysis::MonteCarloDistribution& distribution) {
    out << "statistic,value\n";
    out << std::setprecision(10);
    out << "simulations," << distribution.num_simulations << "\n";
    out << "trades_per_path," << distribution.trades_per_path << "\n";
    out << "initial_balance," << distribution.initial_balance << "\n";
    out << "mean_final," << distribution.mean_final << "\n";
    out << "median_final," << distribution.median_final << "\n";
    out << "stdev_final," << distribution.stdev_final << "\n";
    out << "min_final," << distribution.min_final << "\n";
    out << "max_final," << distribution.max_final << "\n";
    for (const auto& [pct, value] : distribution.percentiles) {
        out << "p" << pct << "_final," << value << "\n";
    }
    out << "worst_drawdown," << distribution.worst_drawdown << "\n";
    out << "mean_drawdown," << distribution.mean_drawdown << "\n";
    out << "p95_drawdown," << distribution.drawdown_p95 << "\n";
    out << "probability_of_loss," << distribution.probability_of_loss << "\n";
}

void write_compliance(std::ostream& out, const compliance::ComplianceVerdict& verdict) {
    out << "rule,passed,reason\n";
    auto reason_for = [&verdict](const char* rule) {
        for (size_t i = 0; i < verdict.violated_rules.size(); ++i) {
            if (verdict.violated_rules[i] == rule) {
                return quoted(verdict.reasons[i]);
            }
        }
        return std::string();
    };
    out << compliance::kProfitTargetRule << "," << (verdict.profit_target_met ? "true" : "false") << ","
        << reason_for(compliance::kProfitTargetRule) << "\n";
    out << compliance::kDailyLossRule << "," << (verdict.daily_loss_compliant ? "true" : "false") << ","
        << reason_for(compliance::kDailyLossRule) << "\n";
    out << compliance::kTotalDrawdownRule << "," << (verdict.total_drawdown_compliant ? "true" : "false") << ","
        << reason_for(compliance::kTotalDrawdownRule) << "\n";
    out << compliance::kTradingDaysRule << "," << (verdict.trading_days_compliant ? "true" : "false") << ","
        << reason_for(compliance::kTradingDaysRule) << "\n";
}

bool write_trades(const std::string& path, const std::vector<core::Trade>& trades) {
    return write_file(path, "trades", [&](std::ostream& out) { write_trades(out, trades); });
}

bool write_equity_curve(const std::string& path, const std::vector<core::EquityPoint>& equity_curve) {
    return write_file(path, "equity curve", [&](std::ostream& out) { write_equity_curve(out, equity_curve); });
}

bool write_metrics(const std::string& path, const backtest::PerformanceMetrics& metrics) {
    return write_file(path, "metrics", [&](std::ostream& out) { write_metrics(out, metrics); });
}

bool write_walk_forward(const std::string& path, const optimize::WalkForwardReport& report) {
    return write_file(path, "walk-forward windows", [&](std::ostream& out) { write_walk_forward(out, report); });
}

bool write_optimization(const std::string& path, const optimize::OptimizationReport& report) {
    return write_file(path, "optimization results", [&](std::ostream& out) { write_optimization(out, report); });
}

bool write_monte_carlo(const std::string& path, const analysis::MonteCarloDistribution& distribution) {
    return write_file(path, "Monte Carlo", [&](std::ostream& out) { write_monte_carlo(out, distribution); });
}

bool write_compliance(const std::string& path, const compliance::ComplianceVerdict& verdict) {
    return write_file(path, "compliance", [&](std::ostream& out) { write_compliance(out, verdict); });
}

} // namespace tundra::report
