#pragma once

#include <string>

#include "common/Types.h"

namespace regimegate {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_qty = 0.0;
    bool terminal = false;
};

// pending -> submitted -> {filled | partial -> {filled | cancelled} | rejected | cancelled}
// pending -> rejected
class OrderLifecycleStateMachine {
public:
    // Maps an adapter state string (wait, trade, done, cancel, ...) plus the
    // reported cumulative quantity onto a lifecycle status. filled_qty never
    // decreases.
    static OrderLifecycleTransitionResult transition(
        const std::string& event,
        double current_filled_qty,
        double order_qty,
        double executed_qty = 0.0,
        double remaining_qty = 0.0
    );

    // Re-reporting the current non-terminal status is allowed.
    static bool canTransition(OrderStatus from, OrderStatus to);

    // Moves the order to `next` if legal. Illegal moves are logged and refused.
    static bool apply(Order& order, OrderStatus next, TimestampMs timestamp);
};

} // namespace execution
} // namespace core
} // namespace regimegate
