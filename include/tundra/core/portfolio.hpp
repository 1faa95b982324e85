#pragma once
#include <tundra/core/position.hpp>
#include <tundra/core/signal.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tundra::core {

/**
 * @class Portfolio
 * @brief Account balance plus at most one open Position per symbol.
 *
 * The balance only moves when a position is closed. Equity is the balance
 * plus the unrealized P&L of every open position, valued at the last price
 * recorded for its symbol with update_price().
 */
class Portfolio {
private:
    double balance_;
    std::unordered_map<std::string, Position> positions_;
    std::unordered_map<std::string, double> last_prices_;
    std::vector<Trade> trades_;

public:
    explicit Portfolio(double initial_balance = 0.0);

    double balance() const;

    bool has_position(const std::string& symbol) const;
    const Position* get_position(const std::string& symbol) const;
    PositionState position_state(const std::string& symbol) const;

    // Returns false (and changes nothing) if the symbol already has a position.
    bool open_position(const Position& position);

    // Closes the symbol's position, books the trade and credits the net P&L.
    std::optional<Trade> close_position(const std::string& symbol, int64_t exit_time,
                                        double exit_price, double commission,
                                        ExitReason reason);

    void update_price(const std::string& symbol, double price);

    double unrealized_pnl() const;
    double equity() const;
    int open_count() const;

    const std::vector<Trade>& get_trades() const {
        return trades_;
    }
};

} // namespace tundra::core
