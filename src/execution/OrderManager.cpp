#include "execution/OrderManager.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "core/execution/ExecutionUpdateSchema.h"
#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace regimegate {
namespace execution {

using core::execution::OrderLifecycleStateMachine;
using core::execution::isActiveStatus;
using core::execution::orderSideToString;
using core::execution::orderStatusToString;

namespace {
constexpr double kQtyEpsilon = 1e-9;

void logExecutionLifecycle(const char* source, const Order& order) {
    LOG_INFO(
        "Execution lifecycle: source={}, order_id={}, symbol={}, side={}, status={}, filled={:.8f}, qty={:.8f}",
        source,
        order.order_id,
        order.symbol,
        orderSideToString(order.side),
        orderStatusToString(order.status),
        order.filled_qty,
        order.quantity
    );
}
}

OrderManager::OrderManager(
    OrderManagerConfig config,
    std::shared_ptr<risk::KillSwitch> kill_switch,
    std::shared_ptr<core::IExecutionAdapter> adapter
)
    : config_(std::move(config))
    , kill_switch_(std::move(kill_switch))
    , adapter_(std::move(adapter)) {
    if (!kill_switch_) {
        throw ConfigurationError("order manager requires a kill switch");
    }
    if (!config_.paper_mode && !adapter_) {
        throw ConfigurationError("live mode requires an execution adapter");
    }
    if (config_.session_id.empty()) {
        config_.session_id = std::to_string(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count());
    }
    LOG_INFO("OrderManager ready: mode={}, session={}",
             config_.paper_mode ? "paper" : "live", config_.session_id);
}

std::string OrderManager::nextOrderId() {
    return config_.id_prefix + "-" + config_.session_id + "-" + std::to_string(next_seq_++);
}

OrderSubmission OrderManager::submit(
    const SizedOrderIntent& intent,
    OrderType type,
    double reference_price,
    std::optional<double> limit_price,
    TimestampMs now
) {
    if (kill_switch_->isTripped()) {
        LOG_CRITICAL("Order for {} refused: kill switch is TRIPPED", intent.symbol);
        throw KillSwitchTripped("kill switch is TRIPPED, order for " + intent.symbol + " refused");
    }
    if (!(intent.quantity > 0.0) || !std::isfinite(intent.quantity)) {
        throw std::invalid_argument("order quantity must be positive");
    }
    if (type == OrderType::LIMIT && !limit_price) {
        throw std::invalid_argument("limit order requires a limit price");
    }

    std::lock_guard<std::recursive_mutex> lock(orders_mutex_);

    Order order;
    order.order_id = nextOrderId();
    order.symbol = intent.symbol;
    order.exchange = config_.paper_mode ? "paper" : config_.exchange;
    order.side = intent.side;
    order.type = type;
    order.quantity = intent.quantity;
    order.limit_price = limit_price;
    order.status = OrderStatus::PENDING;
    order.created_at = now;
    order.updated_at = now;
    order.signal_strength = intent.signal_strength;
    order.signal_regime = intent.signal_regime;

    LOG_INFO("Submitting Order: {} {} {} qty={:.8f} ref={:.4f}",
             order.order_id, order.symbol, orderSideToString(order.side), order.quantity, reference_price);

    OrderSubmission submission;
    if (config_.paper_mode) {
        submission.fills = simulatePaperFill(order, reference_price, now);
        orders_[order.order_id] = order;
        submission.order = order;
        return submission;
    }

    core::ExecutionAck ack;
    try {
        ack = adapter_->submit(order);
    } catch (const std::exception& e) {
        ack.accepted = false;
        ack.reject_reason = std::string("adapter error: ") + e.what();
    }

    if (!ack.accepted) {
        order.reject_reason = ack.reject_reason.empty() ? "rejected by adapter" : ack.reject_reason;
        OrderLifecycleStateMachine::apply(order, OrderStatus::REJECTED, now);
        LOG_WARN("Order {} rejected: {}", order.order_id, order.reject_reason);
    } else {
        OrderLifecycleStateMachine::apply(order, OrderStatus::SUBMITTED, now);
        if (!ack.exchange_order_id.empty()) {
            exchange_ids_[order.order_id] = ack.exchange_order_id;
        }
    }
    logExecutionLifecycle("live_submit", order);

    orders_[order.order_id] = order;
    submission.order = order;
    return submission;
}

std::vector<Fill> OrderManager::simulatePaperFill(Order& order, double reference_price, TimestampMs now) {
    std::vector<Fill> fills;
    if (!(reference_price > 0.0) || !std::isfinite(reference_price)) {
        order.reject_reason = "no reference price for paper fill";
        OrderLifecycleStateMachine::apply(order, OrderStatus::REJECTED, now);
        LOG_WARN("Paper order {} rejected: {}", order.order_id, order.reject_reason);
        return fills;
    }

    const double slip = config_.paper_slippage_bps / 10000.0;
    const double fill_price = (order.side == OrderSide::BUY)
        ? reference_price * (1.0 + slip)
        : reference_price * (1.0 - slip);
    const double fee = fill_price * order.quantity * config_.paper_fee_rate;

    OrderLifecycleStateMachine::apply(order, OrderStatus::SUBMITTED, now);
    OrderLifecycleStateMachine::apply(order, OrderStatus::FILLED, now);
    order.filled_qty = order.quantity;
    order.avg_fill_price = fill_price;
    order.fees = fee;
    order.fill_count = 1;

    Fill fill;
    fill.order_id = order.order_id;
    fill.fill_seq = 1;
    fill.symbol = order.symbol;
    fill.side = order.side;
    fill.quantity = order.quantity;
    fill.price = fill_price;
    fill.fee = fee;
    fill.timestamp = now;
    fills.push_back(fill);

    logExecutionLifecycle("paper", order);
    return fills;
}

std::optional<Fill> OrderManager::applyReport(Order& order, const core::ExecutionReport& report, TimestampMs now) {
    const double prev_qty = order.filled_qty;
    const double prev_notional = order.filled_qty * order.avg_fill_price;
    const double prev_fee = order.fees;

    const auto mapped = OrderLifecycleStateMachine::transition(
        report.state, order.filled_qty, order.quantity, report.cumulative_filled_qty, 0.0);

    if (!OrderLifecycleStateMachine::apply(order, mapped.status, now)) {
        return std::nullopt;
    }

    const double delta_qty = mapped.filled_qty - prev_qty;
    if (delta_qty <= kQtyEpsilon) {
        return std::nullopt;
    }

    // Cumulative average price -> price of the new slice
    const double avg_price = (report.avg_fill_price > 0.0) ? report.avg_fill_price : order.avg_fill_price;
    const double notional = mapped.filled_qty * avg_price;
    double slice_price = (notional - prev_notional) / delta_qty;
    if (!(slice_price > 0.0) || !std::isfinite(slice_price)) {
        slice_price = avg_price;
    }
    const double slice_fee = std::max(0.0, report.cumulative_fee - prev_fee);

    order.filled_qty = mapped.filled_qty;
    order.avg_fill_price = avg_price;
    order.fees = std::max(prev_fee, report.cumulative_fee);
    order.fill_count += 1;

    Fill fill;
    fill.order_id = order.order_id;
    fill.fill_seq = order.fill_count;
    fill.symbol = order.symbol;
    fill.side = order.side;
    fill.quantity = delta_qty;
    fill.price = slice_price;
    fill.fee = slice_fee;
    fill.timestamp = (report.timestamp > 0) ? report.timestamp : now;
    return fill;
}

std::vector<Fill> OrderManager::pollFills(TimestampMs now) {
    std::vector<Fill> fills;
    if (config_.paper_mode) {
        return fills;
    }

    std::lock_guard<std::recursive_mutex> lock(orders_mutex_);
    for (auto& [order_id, order] : orders_) {
        if (!isActiveStatus(order.status) || order.status == OrderStatus::PENDING) {
            continue;
        }

        try {
            auto exchange_it = exchange_ids_.find(order_id);
            const std::string& poll_id = (exchange_it != exchange_ids_.end()) ? exchange_it->second : order_id;
            auto report = adapter_->poll(poll_id);
            if (report) {
                auto fill = applyReport(order, *report, now);
                if (fill) {
                    fills.push_back(*fill);
                }
                logExecutionLifecycle("live_poll", order);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Error polling order {}: {}", order_id, e.what());
            continue;
        }

        const long long age_ms = now - order.created_at;
        if (isActiveStatus(order.status) &&
            age_ms >= static_cast<long long>(config_.order_timeout_seconds) * 1000LL) {
            LOG_WARN("Order {} timed out after {}s, cancelling", order_id, age_ms / 1000);
            cancelLocked(order, now);
        }
    }
    return fills;
}

bool OrderManager::cancelLocked(Order& order, TimestampMs now) {
    if (!isActiveStatus(order.status)) {
        return false;
    }
    if (!config_.paper_mode) {
        auto exchange_it = exchange_ids_.find(order.order_id);
        const std::string& cancel_id =
            (exchange_it != exchange_ids_.end()) ? exchange_it->second : order.order_id;
        bool cancelled = false;
        try {
            cancelled = adapter_->cancel(cancel_id);
        } catch (const std::exception& e) {
            LOG_ERROR("Exception in cancel: {} - OrderID: {}", e.what(), order.order_id);
            return false;
        }
        if (!cancelled) {
            LOG_WARN("Cancel not acknowledged for {}", order.order_id);
            return false;
        }
    }

    const OrderStatus next = (order.status == OrderStatus::PENDING) ? OrderStatus::REJECTED : OrderStatus::CANCELLED;
    if (!OrderLifecycleStateMachine::apply(order, next, now)) {
        return false;
    }
    if (next == OrderStatus::REJECTED) {
        order.reject_reason = "cancelled before submit";
    }
    logExecutionLifecycle("cancel", order);
    return true;
}

bool OrderManager::cancel(const std::string& order_id, TimestampMs now) {
    std::lock_guard<std::recursive_mutex> lock(orders_mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        LOG_WARN("Cancel requested for unknown order {}", order_id);
        return false;
    }
    return cancelLocked(it->second, now);
}

bool OrderManager::hasActiveOrder(const std::string& symbol) const {
    std::lock_guard<std::recursive_mutex> lock(orders_mutex_);
    for (const auto& pair : orders_) {
        if (pair.second.symbol == symbol && isActiveStatus(pair.second.status)) {
            return true;
        }
    }
    return false;
}

size_t OrderManager::activeOrderCount() const {
    std::lock_guard<std::recursive_mutex> lock(orders_mutex_);
    size_t count = 0;
    for (const auto& pair : orders_) {
        if (isActiveStatus(pair.second.status)) {
            ++count;
        }
    }
    return count;
}

std::optional<Order> OrderManager::order(const std::string& order_id) const {
    std::lock_guard<std::recursive_mutex> lock(orders_mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Order> OrderManager::orders() const {
    std::lock_guard<std::recursive_mutex> lock(orders_mutex_);
    std::vector<Order> out;
    out.reserve(orders_.size());
    for (const auto& pair : orders_) {
        out.push_back(pair.second);
    }
    return out;
}

} // namespace execution
} // namespace regimegate
