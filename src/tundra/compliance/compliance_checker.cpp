#include <tundra/compliance/compliance_checker.hpp>
#include <tundra/backtest/simulation_engine.hpp>
#include <tundra/core/time_utils.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tundra::compliance {

namespace {

std::string pct(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return oss.str();
}

} // namespace

ComplianceVerdict ComplianceChecker::check(const DailyEquitySeries& series,
                                           const std::set<int64_t>& trade_days) const {
    ComplianceVerdict verdict;
    ComplianceMetrics& m = verdict.metrics;
    m.initial_balance = series.initial_balance;
    m.final_balance = series.days.empty() ? series.initial_balance : series.days.back().close_balance;
    m.trading_days = static_cast<int>(trade_days.size());

    if (series.initial_balance > 0.0) {
        m.total_return = (m.final_balance - series.initial_balance) / series.initial_balance;
    }

    double previous_close = series.initial_balance;
    double peak = 0.0;
    bool first = true;
    for (const auto& day : series.days) {
        DailyStat stat;
        stat.day = day.day;
        if (previous_close > 0.0) {
            stat.daily_pnl_pct = (day.close_balance - previous_close) / previous_close;
            stat.daily_drawdown = (day.min_balance - previous_close) / previous_close;
        }

        peak = first ? day.close_balance : std::max(peak, day.close_balance);
        first = false;
        if (peak > 0.0) {
            stat.total_drawdown = (day.close_balance - peak) / peak;
        }

        m.worst_daily_drawdown = std::min(m.worst_daily_drawdown, stat.daily_drawdown);
        m.worst_daily_pnl = std::min(m.worst_daily_pnl, stat.daily_pnl_pct);
        m.max_total_drawdown = std::min(m.max_total_drawdown, stat.total_drawdown);
        m.daily.push_back(stat);

        previous_close = day.close_balance;
    }

    verdict.profit_target_met = m.total_return >= rules_.profit_target;
    verdict.daily_loss_compliant = m.worst_daily_drawdown >= -rules_.max_daily_loss;
    verdict.total_drawdown_compliant = m.max_total_drawdown >= -rules_.max_total_drawdown;
    verdict.trading_days_compliant = m.trading_days >= rules_.min_trading_days;

    if (!verdict.profit_target_met) {
        verdict.violated_rules.push_back(kProfitTargetRule);
        verdict.reasons.push_back("profit target not reached: " + pct(m.total_return) +
                                  " (target " + pct(rules_.profit_target) + ")");
    }
    if (!verdict.daily_loss_compliant) {
        std::string when;
        if (!m.daily.empty()) {
            auto worst = std::min_element(m.daily.begin(), m.daily.end(),
                [](const DailyStat& a, const DailyStat& b) { return a.daily_drawdown < b.daily_drawdown; });
            when = " on " + core::format_date(core::days(worst->day));
        }
        verdict.violated_rules.push_back(kDailyLossRule);
        verdict.reasons.push_back("daily loss limit exceeded: " + pct(m.worst_daily_drawdown) + when +
                                  " (limit " + pct(rules_.max_daily_loss) + ")");
    }
    if (!verdict.total_drawdown_compliant) {
        verdict.violated_rules.push_back(kTotalDrawdownRule);
        verdict.reasons.push_back("maximum drawdown exceeded: " + pct(m.max_total_drawdown) +
                                  " (limit " + pct(rules_.max_total_drawdown) + ")");
    }
    if (!verdict.trading_days_compliant) {
        verdict.violated_rules.push_back(kTradingDaysRule);
        verdict.reasons.push_back("not enough trading days: " + std::to_string(m.trading_days) +
                                  " (minimum " + std::to_string(rules_.min_trading_days) + ")");
    }

    verdict.is_compliant = verdict.violated_rules.empty();
    return verdict;
}

ComplianceVerdict ComplianceChecker::check(const backtest::SimulationResult& result) const {
    return check(build_daily_series(result.equity_curve, result.initial_balance),
                 collect_trade_days(result.trades));
}

ComplianceVerdict check(const DailyEquitySeries& series, const std::set<int64_t>& trade_days,
                        const ComplianceRules& rules) {
    return ComplianceChecker(rules).check(series, trade_days);
}

DailyEquitySeries build_daily_series(const std::vector<core::EquityPoint>& equity_curve,
                                     double initial_balance) {
    DailyEquitySeries series;
    series.initial_balance = initial_balance;

    for (const auto& point : equity_curve) {
        int64_t day = core::day_index(point.timestamp);
        if (series.days.empty() || series.days.back().day != day) {
            series.days.push_back(DailyBalance{day, point.equity, point.equity});
        } else {
            DailyBalance& current = series.days.back();
            current.min_balance = std::min(current.min_balance, point.equity);
            current.close_balance = point.equity;
        }
    }
    return series;
}

std::set<int64_t> collect_trade_days(const std::vector<core::Trade>& trades) {
    std::set<int64_t> days;
    for (const auto& trade : trades) {
        days.insert(core::day_index(trade.entry_time));
        days.insert(core::day_index(trade.exit_time));
    }
    return days;
}

} // namespace tundra::compliance
