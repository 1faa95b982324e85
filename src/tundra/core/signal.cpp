// In src/tundra/core/signal.cpp
#include "tundra/core/signal.hpp"

namespace tundra::core {
    Signal::Signal()
        : action(SignalAction::NONE), entry_price(0.0), stop_loss(0.0), take_profit(0.0) {
    }

    Signal::Signal(SignalAction a, double entry, double stop, double target)
        : action(a), entry_price(entry), stop_loss(stop), take_profit(target) {
    }

    Signal Signal::none() {
        return Signal();
    }

    Signal Signal::exit() {
        return Signal(SignalAction::EXIT, 0.0, 0.0, 0.0);
    }

    Signal Signal::enter_long(double entry, double stop, double target) {
        return Signal(SignalAction::ENTER_LONG, entry, stop, target);
    }

    Signal Signal::enter_short(double entry, double stop, double target) {
        return Signal(SignalAction::ENTER_SHORT, entry, stop, target);
    }

    const char* to_string(SignalAction action) {
        switch (action) {
            case SignalAction::ENTER_LONG: return "ENTER_LONG";
            case SignalAction::ENTER_SHORT: return "ENTER_SHORT";
            case SignalAction::EXIT: return "EXIT";
            case SignalAction::NONE: return "NONE";
        }
        return "NONE";
    }

    const char* to_string(PositionState state) {
        switch (state) {
            case PositionState::FLAT: return "FLAT";
            case PositionState::LONG: return "LONG";
            case PositionState::SHORT: return "SHORT";
        }
        return "FLAT";
    }
}
