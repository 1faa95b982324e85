#pragma once
#include <cstdint>
#include <string>

namespace tundra::core {

enum class Direction {
    LONG,
    SHORT
};

enum class ExitReason {
    SIGNAL,
    STOP_LOSS,
    TAKE_PROFIT
};

inline double direction_sign(Direction d) {
    return d == Direction::LONG ? 1.0 : -1.0;
}

const char* to_string(Direction direction);
const char* to_string(ExitReason reason);

// An open position. One per symbol, owned by the Portfolio.
struct Position {
    std::string symbol;
    Direction direction = Direction::LONG;
    int64_t entry_time = 0;
    double entry_price = 0.0;
    double volume = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;  // 0 means no target

    double unrealized_pnl(double price) const {
        return (price - entry_price) * volume * direction_sign(direction);
    }
};

// A closed round trip.
struct Trade {
    std::string symbol;
    Direction direction = Direction::LONG;
    int64_t entry_time = 0;
    int64_t exit_time = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double volume = 0.0;
    double commission = 0.0;
    double profit_loss = 0.0;  // net of commission
    ExitReason exit_reason = ExitReason::SIGNAL;

    bool operator==(const Trade& other) const;
};

struct EquityPoint {
    int64_t timestamp = 0;
    double balance = 0.0;
    double equity = 0.0;
    int open_position_count = 0;

    bool operator==(const EquityPoint& other) const {
        return timestamp == other.timestamp && balance == other.balance &&
               equity == other.equity && open_position_count == other.open_position_count;
    }
};

} // namespace tundra::core
