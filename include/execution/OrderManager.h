#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IExecutionAdapter.h"
#include "risk/KillSwitch.h"

namespace regimegate {
namespace execution {

struct OrderManagerConfig {
    bool paper_mode = true;
    std::string id_prefix = "ord";
    std::string session_id;              // empty: seconds since epoch at construction
    std::string exchange = "paper";
    double paper_slippage_bps = 5.0;     // half spread applied to paper fills
    double paper_fee_rate = 0.001;
    int order_timeout_seconds = 120;
};

struct OrderSubmission {
    Order order;
    std::vector<Fill> fills;             // paper mode fills immediately
};

// Owns the order book. Ids are <prefix>-<session>-<seq> and never reused.
// Paper mode fills every order at submit time; live mode goes through an
// IExecutionAdapter and turns cumulative execution reports into sequenced
// fills on pollFills().
class OrderManager {
public:
    OrderManager(OrderManagerConfig config,
                 std::shared_ptr<risk::KillSwitch> kill_switch,
                 std::shared_ptr<core::IExecutionAdapter> adapter = nullptr);

    // Throws KillSwitchTripped when the kill switch is tripped.
    // reference_price is the price paper fills are slipped from.
    OrderSubmission submit(const SizedOrderIntent& intent,
                           OrderType type,
                           double reference_price,
                           std::optional<double> limit_price,
                           TimestampMs now);

    // Polls every active live order and returns new fills in order. Orders
    // older than order_timeout_seconds are cancelled.
    std::vector<Fill> pollFills(TimestampMs now);

    bool cancel(const std::string& order_id, TimestampMs now);

    // Pending, submitted or partially filled order on the symbol
    bool hasActiveOrder(const std::string& symbol) const;
    size_t activeOrderCount() const;

    std::optional<Order> order(const std::string& order_id) const;
    std::vector<Order> orders() const;

private:
    std::string nextOrderId();
    std::vector<Fill> simulatePaperFill(Order& order, double reference_price, TimestampMs now);
    std::optional<Fill> applyReport(Order& order, const core::ExecutionReport& report, TimestampMs now);
    bool cancelLocked(Order& order, TimestampMs now);

    OrderManagerConfig config_;
    std::shared_ptr<risk::KillSwitch> kill_switch_;
    std::shared_ptr<core::IExecutionAdapter> adapter_;

    mutable std::recursive_mutex orders_mutex_;
    std::map<std::string, Order> orders_;                  // Key: order_id
    std::map<std::string, std::string> exchange_ids_;      // order_id -> exchange order id
    long long next_seq_ = 1;
};

} // namespace execution
} // namespace regimegate
