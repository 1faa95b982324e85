#include <tundra/backtest/simulation_engine.hpp>
#include <tundra/core/time_utils.hpp>
#include <tundra/utils/logger.hpp>
#include <algorithm>
#include <limits>

namespace tundra::backtest {

const char* to_string(IntrabarPolicy policy) {
    return policy == IntrabarPolicy::StopLossFirst ? "stop_loss_first" : "take_profit_first";
}

SimulationEngine::SimulationEngine(const CostModel& cost_model, const SimulationConfig& config)
    : cost_model_(cost_model), config_(config) {
    sizer_ = config_.sizer ? config_.sizer : risk::PositionSizer().as_function();
}

std::vector<SimulationEngine::Cursor> SimulationEngine::prepare(const core::BarSeriesMap& bars,
                                                                SimulationResult& result) const {
    std::vector<Cursor> cursors;
    cursors.reserve(bars.size());

    for (const auto& [symbol, series] : bars) {
        if (series.empty()) {
            utils::Logger::warn() << "No data for " << symbol << ", skipping symbol" << utils::Logger::endl;
            result.skipped_symbols.push_back(symbol);
            continue;
        }

        Cursor cursor;
        cursor.symbol = symbol;
        cursor.bars.reserve(series.size());

        int64_t last_timestamp = std::numeric_limits<int64_t>::min();
        for (const auto& bar : series) {
            if (!bar.is_well_formed()) {
                utils::Logger::warn() << "Skipping malformed bar for " << symbol << " at "
                                      << core::format_datetime(bar.timestamp) << utils::Logger::endl;
                result.skipped_bars++;
                continue;
            }
            if (bar.timestamp <= last_timestamp) {
                utils::Logger::warn() << "Skipping out-of-order bar for " << symbol << " at "
                                      << core::format_datetime(bar.timestamp) << utils::Logger::endl;
                result.skipped_bars++;
                continue;
            }
            last_timestamp = bar.timestamp;
            cursor.bars.push_back(bar);
        }

        if (cursor.bars.empty()) {
            utils::Logger::warn() << "No usable bars for " << symbol << ", skipping symbol" << utils::Logger::endl;
            result.skipped_symbols.push_back(symbol);
            continue;
        }
        cursors.push_back(std::move(cursor));
    }

    // BarSeriesMap iterates in symbol order already
    return cursors;
}

bool SimulationEngine::check_exits(core::Portfolio& portfolio, const std::string& symbol,
                                   const core::Bar& bar) const {
    const core::Position* position = portfolio.get_position(symbol);
    if (position == nullptr) {
        return false;
    }

    bool is_long = position->direction == core::Direction::LONG;
    bool has_target = position->take_profit > 0.0;

    bool stop_hit = is_long ? bar.low <= position->stop_loss : bar.high >= position->stop_loss;
    bool target_hit = has_target &&
        (is_long ? bar.high >= position->take_profit : bar.low <= position->take_profit);

    if (!stop_hit && !target_hit) {
        return false;
    }

    bool take_stop = stop_hit &&
        (!target_hit || config_.intrabar_policy == IntrabarPolicy::StopLossFirst);

    double exit_price;
    core::ExitReason reason;
    if (take_stop) {
        // A gap through the stop fills at the open
        exit_price = is_long ? std::min(bar.open, position->stop_loss)
                             : std::max(bar.open, position->stop_loss);
        reason = core::ExitReason::STOP_LOSS;
    } else {
        exit_price = position->take_profit;
        reason = core::ExitReason::TAKE_PROFIT;
    }

    double commission = cost_model_.commission(position->volume);
    auto trade = portfolio.close_position(symbol, bar.timestamp, exit_price, commission, reason);
    if (trade && utils::Logger::level() <= utils::LogLevel::DEBUG) {
        utils::Logger::debug() << symbol << " " << core::to_string(reason) << " exit at "
                               << exit_price << " P&L " << trade->profit_loss << utils::Logger::endl;
    }
    return trade.has_value();
}

void SimulationEngine::handle_signal(core::Portfolio& portfolio, const std::string& symbol,
                                     const core::Bar& bar, const core::Signal& signal,
                                     SimulationResult& result) const {
    core::PositionState state = portfolio.position_state(symbol);

    if (signal.action == core::SignalAction::EXIT) {
        if (state == core::PositionState::FLAT) {
            return;
        }
        const core::Position* position = portfolio.get_position(symbol);
        double commission = cost_model_.commission(position->volume);
        portfolio.close_position(symbol, bar.timestamp, bar.close, commission,
                                 core::ExitReason::SIGNAL);
        return;
    }

    if (!signal.is_entry() || state != core::PositionState::FLAT) {
        return;
    }

    core::Direction direction = signal.action == core::SignalAction::ENTER_LONG
        ? core::Direction::LONG : core::Direction::SHORT;
    double entry = signal.entry_price > 0.0 ? signal.entry_price : bar.close;

    if (signal.entry_price < 0.0 || signal.stop_loss <= 0.0 || signal.stop_loss == entry) {
        utils::Logger::warn() << "Rejected " << core::to_string(signal.action) << " for " << symbol
                              << ": entry " << entry << ", stop " << signal.stop_loss
                              << utils::Logger::endl;
        result.rejected_fills++;
        return;
    }

    bool stop_on_wrong_side = direction == core::Direction::LONG ? signal.stop_loss > entry
                                                                 : signal.stop_loss < entry;
    if (stop_on_wrong_side) {
        utils::Logger::warn() << "Rejected " << core::to_string(signal.action) << " for " << symbol
                              << ": stop " << signal.stop_loss << " on the wrong side of entry "
                              << entry << utils::Logger::endl;
        result.rejected_fills++;
        return;
    }

    double fill = cost_model_.entry_fill(entry, direction);
    bool target_on_wrong_side = signal.take_profit > 0.0 &&
        (direction == core::Direction::LONG ? signal.take_profit <= fill : signal.take_profit >= fill);
    if (signal.take_profit < 0.0 || target_on_wrong_side) {
        utils::Logger::warn() << "Rejected " << core::to_string(signal.action) << " for " << symbol
                              << ": target " << signal.take_profit << " on the wrong side of fill "
                              << fill << utils::Logger::endl;
        result.rejected_fills++;
        return;
    }

    double volume = sizer_(fill, signal.stop_loss, portfolio.balance(), config_.risk_fraction);
    if (fill <= 0.0 || volume <= 0.0) {
        utils::Logger::warn() << "Rejected " << core::to_string(signal.action) << " for " << symbol
                              << ": fill " << fill << ", volume " << volume << utils::Logger::endl;
        result.rejected_fills++;
        return;
    }

    core::Position position;
    position.symbol = symbol;
    position.direction = direction;
    position.entry_time = bar.timestamp;
    position.entry_price = fill;
    position.volume = volume;
    position.stop_loss = signal.stop_loss;
    position.take_profit = signal.take_profit;
    portfolio.open_position(position);
}

SimulationResult SimulationEngine::run(const core::BarSeriesMap& bars,
                                       strategy::StrategyBase& strategy) const {
    SimulationResult result;
    result.initial_balance = config_.initial_balance;
    result.final_balance = config_.initial_balance;
    result.final_equity = config_.initial_balance;

    if (config_.initial_balance <= 0.0) {
        result.status = core::Status::failure(core::ErrorCode::InvalidConfiguration,
                                              "initial balance must be positive");
        utils::Logger::error() << result.status.reason << utils::Logger::endl;
        return result;
    }

    std::vector<Cursor> cursors = prepare(bars, result);
    if (cursors.empty()) {
        result.status = core::Status::failure(core::ErrorCode::NoData, "no bars to simulate");
        utils::Logger::warn() << "Simulation of " << strategy.name() << " has no data" << utils::Logger::endl;
        return result;
    }

    strategy.initialize();
    core::Portfolio portfolio(config_.initial_balance);
    size_t lookback = std::max<size_t>(strategy.min_lookback(), 1);
    bool debug_enabled = utils::Logger::level() <= utils::LogLevel::DEBUG;

    while (true) {
        int64_t now = std::numeric_limits<int64_t>::max();
        for (const auto& cursor : cursors) {
            if (cursor.next < cursor.bars.size()) {
                now = std::min(now, cursor.bars[cursor.next].timestamp);
            }
        }
        if (now == std::numeric_limits<int64_t>::max()) {
            break;
        }

        for (auto& cursor : cursors) {
            if (cursor.next >= cursor.bars.size() || cursor.bars[cursor.next].timestamp != now) {
                continue;
            }
            const core::Bar& bar = cursor.bars[cursor.next];
            size_t visible = ++cursor.next;
            result.bars_processed++;

            bool exited = check_exits(portfolio, cursor.symbol, bar);

            if (!exited) {
                if (visible < lookback) {
                    if (debug_enabled) {
                        utils::Logger::debug() << cursor.symbol << ": " << visible << " of " << lookback
                                               << " lookback bars, no signal" << utils::Logger::endl;
                    }
                } else {
                    core::BarHistory history(cursor.bars, visible);
                    core::Signal signal = strategy.generate_signal(
                        history, portfolio.position_state(cursor.symbol));
                    handle_signal(portfolio, cursor.symbol, bar, signal, result);
                }
            }

            portfolio.update_price(cursor.symbol, bar.close);
        }

        core::EquityPoint point;
        point.timestamp = now;
        point.balance = portfolio.balance();
        point.equity = portfolio.equity();
        point.open_position_count = portfolio.open_count();
        result.equity_curve.push_back(point);
    }

    result.trades = portfolio.get_trades();
    result.final_balance = portfolio.balance();
    result.final_equity = portfolio.equity();
    result.status = core::Status::ok();

    if (debug_enabled) {
        utils::Logger::debug() << "Simulated " << strategy.name() << " over " << result.bars_processed
                               << " bars: " << result.trades.size() << " trades, final equity "
                               << result.final_equity << utils::Logger::endl;
    }
    return result;
}

SimulationResult simulate(const core::BarSeriesMap& bars, strategy::StrategyBase& strategy,
                          const CostModel& cost_model, double initial_balance) {
    SimulationConfig config;
    config.initial_balance = initial_balance;
    return SimulationEngine(cost_model, config).run(bars, strategy);
}

} // namespace tundra::backtest
