#include "execution/OrderManager.h"
#include "core/state/InMemoryKillSwitchStore.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <set>

using namespace regimegate;
using execution::OrderManager;
using execution::OrderManagerConfig;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

SizedOrderIntent intent(const std::string& symbol, OrderSide side, double qty) {
    SizedOrderIntent i;
    i.symbol = symbol;
    i.side = side;
    i.quantity = qty;
    i.signal_strength = 0.4;
    i.signal_regime = Regime::TRENDING;
    return i;
}

// Scripted exchange: reports are set by the test.
class ScriptedAdapter : public core::IExecutionAdapter {
public:
    core::ExecutionAck submit(const Order& order) override {
        core::ExecutionAck ack;
        if (order.symbol == "BAD-USD") {
            ack.reject_reason = "unknown market";
            return ack;
        }
        ack.accepted = true;
        ack.exchange_order_id = "ex-" + order.order_id;
        submitted.push_back(order.order_id);
        return ack;
    }

    std::optional<core::ExecutionReport> poll(const std::string& exchange_id) override {
        auto it = reports.find(exchange_id);
        if (it == reports.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool cancel(const std::string& exchange_id) override {
        cancelled.insert(exchange_id);
        return true;
    }

    std::map<std::string, core::ExecutionReport> reports;
    std::vector<std::string> submitted;
    std::set<std::string> cancelled;
};
}

int main() {
    std::cout << "[TEST] Starting OrderManager Test..." << std::endl;

    auto store = std::make_shared<core::InMemoryKillSwitchStore>();
    auto kill_switch = std::make_shared<risk::KillSwitch>(store, 0.15);

    // 1. Paper fills and id uniqueness
    {
        OrderManagerConfig config;
        config.id_prefix = "rg";
        config.session_id = "s1";
        OrderManager manager(config, kill_switch);

        const auto buy = manager.submit(intent("BTC-USD", OrderSide::BUY, 0.5), OrderType::MARKET, 100.0,
                                        std::nullopt, 1000);
        assert(buy.order.order_id == "rg-s1-1");
        assert(buy.order.status == OrderStatus::FILLED);
        assert(buy.fills.size() == 1);
        assert(near(buy.fills[0].price, 100.05));
        assert(near(buy.fills[0].fee, 100.05 * 0.5 * 0.001));
        assert(buy.fills[0].fill_seq == 1);
        assert(buy.order.signal_regime == Regime::TRENDING);

        const auto sell = manager.submit(intent("BTC-USD", OrderSide::SELL, 0.5), OrderType::MARKET, 100.0,
                                         std::nullopt, 2000);
        assert(near(sell.fills[0].price, 99.95));

        std::set<std::string> ids;
        for (int i = 0; i < 200; ++i) {
            ids.insert(manager.submit(intent("ETH-USD", OrderSide::BUY, 1.0), OrderType::MARKET, 10.0,
                                      std::nullopt, 3000 + i).order.order_id);
        }
        assert(ids.size() == 200);
        assert(ids.count("rg-s1-1") == 0);
        assert(manager.orders().size() == 202);
        assert(manager.activeOrderCount() == 0);

        const auto unpriced = manager.submit(intent("BTC-USD", OrderSide::BUY, 0.5), OrderType::MARKET, 0.0,
                                             std::nullopt, 4000);
        assert(unpriced.order.status == OrderStatus::REJECTED);
        assert(unpriced.fills.empty());

        // a second manager in another session never collides
        OrderManagerConfig other = config;
        other.session_id = "s2";
        OrderManager second(other, kill_switch);
        const auto next = second.submit(intent("BTC-USD", OrderSide::BUY, 0.1), OrderType::MARKET, 100.0,
                                        std::nullopt, 5000);
        assert(next.order.order_id == "rg-s2-1");

        bool threw = false;
        try {
            manager.submit(intent("BTC-USD", OrderSide::BUY, 1.0), OrderType::LIMIT, 100.0, std::nullopt, 6000);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // 2. Live: cumulative reports become sequenced slice fills
    {
        auto adapter = std::make_shared<ScriptedAdapter>();
        OrderManagerConfig config;
        config.paper_mode = false;
        config.session_id = "live";
        config.exchange = "scripted";
        OrderManager manager(config, kill_switch, adapter);

        const auto submitted = manager.submit(intent("BTC-USD", OrderSide::BUY, 1.0), OrderType::LIMIT, 100.0,
                                              100.0, 1000);
        const std::string id = submitted.order.order_id;
        assert(submitted.order.status == OrderStatus::SUBMITTED);
        assert(submitted.fills.empty());
        assert(manager.hasActiveOrder("BTC-USD"));
        assert(!manager.hasActiveOrder("ETH-USD"));

        core::ExecutionReport report;
        report.order_id = "ex-" + id;
        report.state = "trade";
        report.cumulative_filled_qty = 0.4;
        report.avg_fill_price = 100.0;
        report.cumulative_fee = 0.04;
        adapter->reports["ex-" + id] = report;

        auto fills = manager.pollFills(2000);
        assert(fills.size() == 1);
        assert(near(fills[0].quantity, 0.4));
        assert(near(fills[0].price, 100.0));
        assert(near(fills[0].fee, 0.04));
        assert(fills[0].fill_seq == 1);
        assert(manager.order(id)->status == OrderStatus::PARTIALLY_FILLED);

        // same cumulative report again: nothing new
        assert(manager.pollFills(2500).empty());

        report.state = "done";
        report.cumulative_filled_qty = 1.0;
        report.avg_fill_price = 102.0;
        report.cumulative_fee = 0.1;
        adapter->reports["ex-" + id] = report;
        fills = manager.pollFills(3000);
        assert(fills.size() == 1);
        assert(near(fills[0].quantity, 0.6));
        assert(near(fills[0].price, (102.0 - 40.0) / 0.6));
        assert(near(fills[0].fee, 0.06));
        assert(fills[0].fill_seq == 2);
        const auto done = manager.order(id);
        assert(done->status == OrderStatus::FILLED);
        assert(near(done->filled_qty, 1.0));
        assert(!manager.hasActiveOrder("BTC-USD"));

        // a late report after the terminal state is ignored
        report.state = "cancel";
        adapter->reports["ex-" + id] = report;
        assert(manager.pollFills(3500).empty());
        assert(manager.order(id)->status == OrderStatus::FILLED);

        // adapter rejection
        const auto rejected = manager.submit(intent("BAD-USD", OrderSide::BUY, 1.0), OrderType::MARKET, 1.0,
                                             std::nullopt, 4000);
        assert(rejected.order.status == OrderStatus::REJECTED);
        assert(rejected.order.reject_reason == "unknown market");

        // timeout cancels orders that never report
        const auto stuck = manager.submit(intent("ETH-USD", OrderSide::SELL, 2.0), OrderType::MARKET, 10.0,
                                          std::nullopt, 10000);
        assert(manager.pollFills(10000 + 119000).empty());
        assert(manager.order(stuck.order.order_id)->status == OrderStatus::SUBMITTED);
        manager.pollFills(10000 + 120000);
        assert(manager.order(stuck.order.order_id)->status == OrderStatus::CANCELLED);
        assert(adapter->cancelled.count("ex-" + stuck.order.order_id) == 1);
        assert(!manager.cancel(stuck.order.order_id, 200000));
        assert(!manager.cancel("missing", 200000));
    }

    // 3. A tripped switch refuses every order
    {
        OrderManager manager(OrderManagerConfig(), kill_switch);
        kill_switch->trip("test", 0.2, 1);
        bool threw = false;
        try {
            manager.submit(intent("BTC-USD", OrderSide::SELL, 0.1), OrderType::MARKET, 100.0, std::nullopt, 1);
        } catch (const KillSwitchTripped&) {
            threw = true;
        }
        assert(threw);
        assert(manager.orders().empty());
    }

    std::cout << "[TEST] OrderManager Test PASSED!" << std::endl;
    return 0;
}
