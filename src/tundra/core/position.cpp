#include <tundra/core/position.hpp>

namespace tundra::core {

const char* to_string(Direction direction) {
    return direction == Direction::LONG ? "LONG" : "SHORT";
}

const char* to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::SIGNAL: return "signal";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
    }
    return "signal";
}

bool Trade::operator==(const Trade& other) const {
    return symbol == other.symbol &&
           direction == other.direction &&
           entry_time == other.entry_time &&
           exit_time == other.exit_time &&
           entry_price == other.entry_price &&
           exit_price == other.exit_price &&
           volume == other.volume &&
           commission == other.commission &&
           profit_loss == other.profit_loss &&
           exit_reason == other.exit_reason;
}

} // namespace tundra::core
