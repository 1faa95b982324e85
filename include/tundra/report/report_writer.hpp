#pragma once
#include <tundra/analysis/monte_carlo.hpp>
#include <tundra/backtest/performance_analyzer.hpp>
#include <tundra/compliance/compliance_checker.hpp>
#include <tundra/core/position.hpp>
#include <tundra/optimize/grid_optimizer.hpp>
#include <tundra/optimize/walk_forward.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace tundra::report {

// Plain CSV exports of run results. The write_* functions return false and
// log the cause when the file cannot be written.

void write_trades(std::ostream& out, const std::vector<core::Trade>& trades);
void write_equity_curve(std::ostream& out, const std::vector<core::EquityPoint>& equity_curve);
void write_metrics(std::ostream& out, const backtest::PerformanceMetrics& metrics);
void write_walk_forward(std::ostream& out, const optimize::WalkForwardReport& report);
void write_optimization(std::ostream& out, const optimize::OptimizationReport& report);
void write_monte_carlo(std::ostream& out, const analysis::MonteCarloDistribution& distribution);
void write_compliance(std::ostream& out, const compliance::ComplianceVerdict& verdict);

bool write_trades(const std::string& path, const std::vector<core::Trade>& trades);
bool write_equity_curve(const std::string& path, const std::vector<core::EquityPoint>& equity_curve);
bool write_metrics(const std::string& path, const backtest::PerformanceMetrics& metrics);
bool write_walk_forward(const std::string& path, const optimize::WalkForwardReport& report);
bool write_optimization(const std::string& path, const optimize::OptimizationReport& report);
bool write_monte_carlo(const std::string& path, const analysis::MonteCarloDistribution& distribution);
bool write_compliance(const std::string& path, const compliance::ComplianceVerdict& verdict);

} // namespace tundra::report
