#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/execution/ExecutionUpdateSchema.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>

namespace regimegate {
namespace core {
namespace execution {

namespace {
std::string normalizeEvent(std::string event) {
    std::transform(event.begin(), event.end(), event.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return event;
}

constexpr double kQtyEpsilon = 1e-9;
} // namespace

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    const std::string& event,
    double current_filled_qty,
    double order_qty,
    double executed_qty,
    double remaining_qty
) {
    OrderLifecycleTransitionResult result;
    result.filled_qty = current_filled_qty;
    if (executed_qty > 0.0) {
        result.filled_qty = std::max(result.filled_qty, executed_qty);
    }
    if (remaining_qty > 0.0 && order_qty > remaining_qty) {
        result.filled_qty = std::max(result.filled_qty, order_qty - remaining_qty);
    }
    result.filled_qty = std::min(result.filled_qty, order_qty);

    const std::string normalized_event = normalizeEvent(event);

    if (normalized_event == "filled" || normalized_event == "done") {
        result.status = OrderStatus::FILLED;
        result.filled_qty = (result.filled_qty > 0.0) ? result.filled_qty : order_qty;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "cancel" || normalized_event == "cancelled" || normalized_event == "expired") {
        result.status = OrderStatus::CANCELLED;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "rejected" || normalized_event == "reject" || normalized_event == "prevented") {
        result.status = OrderStatus::REJECTED;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "partially_filled" || normalized_event == "partial" ||
        normalized_event == "wait" || normalized_event == "watch" || normalized_event == "trade") {
        if (result.filled_qty >= order_qty - kQtyEpsilon) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else if (result.filled_qty > 0.0) {
            result.status = OrderStatus::PARTIALLY_FILLED;
        } else {
            result.status = OrderStatus::SUBMITTED;
        }
        return result;
    }

    result.status = (result.filled_qty > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
    return result;
}

bool OrderLifecycleStateMachine::canTransition(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::PENDING:
            return to == OrderStatus::PENDING ||
                   to == OrderStatus::SUBMITTED ||
                   to == OrderStatus::REJECTED;
        case OrderStatus::SUBMITTED:
            return to == OrderStatus::SUBMITTED ||
                   to == OrderStatus::PARTIALLY_FILLED ||
                   to == OrderStatus::FILLED ||
                   to == OrderStatus::CANCELLED ||
                   to == OrderStatus::REJECTED;
        case OrderStatus::PARTIALLY_FILLED:
            return to == OrderStatus::PARTIALLY_FILLED ||
                   to == OrderStatus::FILLED ||
                   to == OrderStatus::CANCELLED;
        case OrderStatus::FILLED:
        case OrderStatus::CANCELLED:
        case OrderStatus::REJECTED:
            return false;
    }
    return false;
}

bool OrderLifecycleStateMachine::apply(Order& order, OrderStatus next, TimestampMs timestamp) {
    if (!canTransition(order.status, next)) {
        LOG_WARN("Illegal order transition refused: {} {} -> {}",
                 order.order_id, orderStatusToString(order.status), orderStatusToString(next));
        return false;
    }
    if (order.status != next) {
        LOG_DEBUG("Order {} {} -> {}", order.order_id,
                  orderStatusToString(order.status), orderStatusToString(next));
    }
    order.status = next;
    order.updated_at = timestamp;
    return true;
}

} // namespace execution
} // namespace core
} // namespace regimegate
