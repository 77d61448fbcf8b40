#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace regimegate {
namespace core {
namespace execution {

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline const char* orderTypeToString(OrderType type) {
    return (type == OrderType::LIMIT) ? "LIMIT" : "MARKET";
}

inline bool isTerminalStatus(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED;
}

inline bool isActiveStatus(OrderStatus status) {
    return status == OrderStatus::PENDING ||
           status == OrderStatus::SUBMITTED ||
           status == OrderStatus::PARTIALLY_FILLED;
}

inline nlohmann::json toJson(const Order& order) {
    nlohmann::json line;
    line["order_id"] = order.order_id;
    line["symbol"] = order.symbol;
    line["exchange"] = order.exchange;
    line["side"] = orderSideToString(order.side);
    line["type"] = orderTypeToString(order.type);
    line["quantity"] = order.quantity;
    if (order.limit_price) {
        line["limit_price"] = *order.limit_price;
    } else {
        line["limit_price"] = nullptr;
    }
    line["status"] = orderStatusToString(order.status);
    line["filled_qty"] = order.filled_qty;
    line["avg_fill_price"] = order.avg_fill_price;
    line["fees"] = order.fees;
    line["created_at"] = order.created_at;
    line["updated_at"] = order.updated_at;
    line["signal_strength"] = order.signal_strength;
    line["signal_regime"] = regimeToString(order.signal_regime);
    line["reject_reason"] = order.reject_reason;
    return line;
}

inline nlohmann::json toJson(const Fill& fill) {
    nlohmann::json line;
    line["order_id"] = fill.order_id;
    line["fill_seq"] = fill.fill_seq;
    line["symbol"] = fill.symbol;
    line["side"] = orderSideToString(fill.side);
    line["quantity"] = fill.quantity;
    line["price"] = fill.price;
    line["fee"] = fill.fee;
    line["ts_ms"] = fill.timestamp;
    return line;
}

} // namespace execution
} // namespace core
} // namespace regimegate
