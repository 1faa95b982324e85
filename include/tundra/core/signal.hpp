#pragma once

namespace tundra::core {
    enum class SignalAction {
        ENTER_LONG,
        ENTER_SHORT,
        EXIT,
        NONE
    };

    enum class PositionState {
        FLAT,
        LONG,
        SHORT
    };

    struct Signal {
        SignalAction action;
        double entry_price = 0.0;  // 0 means "current close"
        double stop_loss = 0.0;
        double take_profit = 0.0;  // 0 means no target

        Signal();
        Signal(SignalAction a, double entry, double stop, double target = 0.0);

        static Signal none();
        static Signal exit();
        static Signal enter_long(double entry, double stop, double target = 0.0);
        static Signal enter_short(double entry, double stop, double target = 0.0);

        bool is_entry() const {
            return action == SignalAction::ENTER_LONG || action == SignalAction::ENTER_SHORT;
        }
    };

    const char* to_string(SignalAction action);
    const char* to_string(PositionState state);
}

 // namespace tundra::core
