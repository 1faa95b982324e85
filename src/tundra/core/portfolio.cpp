#include <tundra/core/portfolio.hpp>
#include <tundra/utils/logger.hpp>

namespace tundra::core {

Portfolio::Portfolio(double initial_balance) : balance_(initial_balance) {}

double Portfolio::balance() const {
    return balance_;
}

bool Portfolio::has_position(const std::string& symbol) const {
    return positions_.find(symbol) != positions_.end();
}

const Position* Portfolio::get_position(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    if (it != positions_.end()) {
        return &it->second;
    }
    return nullptr;
}

PositionState Portfolio::position_state(const std::string& symbol) const {
    const Position* position = get_position(symbol);
    if (position == nullptr) {
        return PositionState::FLAT;
    }
    return position->direction == Direction::LONG ? PositionState::LONG : PositionState::SHORT;
}

bool Portfolio::open_position(const Position& position) {
    if (has_position(position.symbol)) {
        utils::Logger::warn() << "Position already open for " << position.symbol
                              << ", ignoring new entry" << utils::Logger::endl;
        return false;
    }
    positions_.emplace(position.symbol, position);

    // Mark at the fill until the next close arrives
    if (last_prices_.find(position.symbol) == last_prices_.end()) {
        last_prices_[position.symbol] = position.entry_price;
    }
    return true;
}

std::optional<Trade> Portfolio::close_position(const std::string& symbol, int64_t exit_time,
                                               double exit_price, double commission,
                                               ExitReason reason) {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        utils::Logger::warn() << "No open position to close for " << symbol << utils::Logger::endl;
        return std::nullopt;
    }

    const Position& position = it->second;

    Trade trade;
    trade.symbol = symbol;
    trade.direction = position.direction;
    trade.entry_time = position.entry_time;
    trade.exit_time = exit_time;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit_price;
    trade.volume = position.volume;
    trade.commission = commission;
    trade.profit_loss = position.unrealized_pnl(exit_price) - commission;
    trade.exit_reason = reason;

    balance_ += trade.profit_loss;
    trades_.push_back(trade);
    positions_.erase(it);

    return trade;
}

void Portfolio::update_price(const std::string& symbol, double price) {
    last_prices_[symbol] = price;
}

double Portfolio::unrealized_pnl() const {
    double total = 0.0;
    for (const auto& [symbol, position] : positions_) {
        auto price = last_prices_.find(symbol);
        double mark = price != last_prices_.end() ? price->second : position.entry_price;
        total += position.unrealized_pnl(mark);
    }
    return total;
}

double Portfolio::equity() const {
    return balance_ + unrealized_pnl();
}

int Portfolio::open_count() const {
    return static_cast<int>(positions_.size());
}

} // namespace tundra::core
