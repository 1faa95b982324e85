#pragma once
#include <tundra/core/position.hpp>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tundra::backtest {
struct SimulationResult;
}

namespace tundra::compliance {

// Rule names as they appear in ComplianceVerdict::violated_rules
inline constexpr const char* kProfitTargetRule = "profit_target_met";
inline constexpr const char* kDailyLossRule = "daily_loss_compliant";
inline constexpr const char* kTotalDrawdownRule = "total_drawdown_compliant";
inline constexpr const char* kTradingDaysRule = "trading_days_compliant";

struct DailyBalance {
    int64_t day = 0;  // UTC day index, see core::day_index
    double min_balance = 0.0;
    double close_balance = 0.0;
};

struct DailyEquitySeries {
    double initial_balance = 0.0;
    std::vector<DailyBalance> days;  // ascending by day
};

// Fractions except min_trading_days. Defaults are the usual funded-account
// challenge limits.
struct ComplianceRules {
    double profit_target = 0.10;
    double max_daily_loss = 0.05;
    double max_total_drawdown = 0.10;
    int min_trading_days = 4;
};

struct DailyStat {
    int64_t day = 0;
    double daily_pnl_pct = 0.0;    // close vs previous close
    double daily_drawdown = 0.0;   // intraday low vs previous close, <= 0 when losing
    double total_drawdown = 0.0;   // close vs running peak of closes, <= 0
};

struct ComplianceMetrics {
    double initial_balance = 0.0;
    double final_balance = 0.0;
    double total_return = 0.0;
    double worst_daily_drawdown = 0.0;
    double worst_daily_pnl = 0.0;
    double max_total_drawdown = 0.0;  // most negative drawdown from peak
    int trading_days = 0;
    std::vector<DailyStat> daily;
};

struct ComplianceVerdict {
    bool is_compliant = false;
    bool profit_target_met = false;
    bool daily_loss_compliant = false;
    bool total_drawdown_compliant = false;
    bool trading_days_compliant = false;
    std::vector<std::string> violated_rules;
    std::vector<std::string> reasons;  // one per violated rule, same order
    ComplianceMetrics metrics;
};

/**
 * @class ComplianceChecker
 * @brief Evaluates a daily balance series against account-level rules.
 *
 * The four rules are independent: every violated rule is reported, not just
 * the first. Daily figures are relative to the previous day's close (the
 * initial balance for the first day). Stateless, no I/O.
 */
class ComplianceChecker {
public:
    ComplianceChecker() = default;
    explicit ComplianceChecker(const ComplianceRules& rules) : rules_(rules) {}

    ComplianceVerdict check(const DailyEquitySeries& series, const std::set<int64_t>& trade_days) const;
    ComplianceVerdict check(const backtest::SimulationResult& result) const;

    const ComplianceRules& rules() const { return rules_; }

private:
    ComplianceRules rules_;
};

ComplianceVerdict check(const DailyEquitySeries& series, const std::set<int64_t>& trade_days,
                        const ComplianceRules& rules);

// Lowest and last equity of each UTC day of the curve.
DailyEquitySeries build_daily_series(const std::vector<core::EquityPoint>& equity_curve,
                                     double initial_balance);

// UTC days on which a trade was entered or exited.
std::set<int64_t> collect_trade_days(const std::vector<core::Trade>& trades);

} // namespace tundra::compliance
