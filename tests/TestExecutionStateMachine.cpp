#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/execution/ExecutionUpdateSchema.h"

#include <cassert>
#include <iostream>

using regimegate::Order;
using regimegate::OrderStatus;
using regimegate::core::execution::OrderLifecycleStateMachine;

int main() {
    {
        auto r = OrderLifecycleStateMachine::transition("wait", 0.0, 1.0, 0.0, 1.0);
        assert(r.status == OrderStatus::SUBMITTED);
        assert(!r.terminal);
        assert(r.filled_qty == 0.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("trade", 0.0, 2.0, 0.5, 1.5);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(!r.terminal);
        assert(r.filled_qty > 0.49 && r.filled_qty < 0.51);
    }

    {
        // cumulative never moves backwards, never past the order
        auto r = OrderLifecycleStateMachine::transition("trade", 1.2, 2.0, 0.5, 0.0);
        assert(r.filled_qty == 1.2);
        r = OrderLifecycleStateMachine::transition("TRADE", 0.0, 2.0, 3.0, 0.0);
        assert(r.filled_qty == 2.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("done", 0.0, 1.0, 0.0, 0.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
        assert(r.filled_qty == 1.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("cancel", 0.2, 1.0, 0.2, 0.8);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
        assert(r.filled_qty == 0.2);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("rejected", 0.0, 1.0, 0.0, 1.0);
        assert(r.status == OrderStatus::REJECTED);
        assert(r.terminal);
    }

    // legal / illegal moves
    {
        assert(OrderLifecycleStateMachine::canTransition(OrderStatus::PENDING, OrderStatus::SUBMITTED));
        assert(OrderLifecycleStateMachine::canTransition(OrderStatus::PENDING, OrderStatus::REJECTED));
        assert(!OrderLifecycleStateMachine::canTransition(OrderStatus::PENDING, OrderStatus::FILLED));
        assert(OrderLifecycleStateMachine::canTransition(OrderStatus::SUBMITTED, OrderStatus::PARTIALLY_FILLED));
        assert(OrderLifecycleStateMachine::canTransition(OrderStatus::PARTIALLY_FILLED, OrderStatus::CANCELLED));
        assert(!OrderLifecycleStateMachine::canTransition(OrderStatus::PARTIALLY_FILLED, OrderStatus::REJECTED));
        assert(!OrderLifecycleStateMachine::canTransition(OrderStatus::PARTIALLY_FILLED, OrderStatus::SUBMITTED));
        for (auto terminal : {OrderStatus::FILLED, OrderStatus::CANCELLED, OrderStatus::REJECTED}) {
            assert(regimegate::core::execution::isTerminalStatus(terminal));
            for (auto next : {OrderStatus::PENDING, OrderStatus::SUBMITTED, OrderStatus::PARTIALLY_FILLED,
                              OrderStatus::FILLED, OrderStatus::CANCELLED, OrderStatus::REJECTED}) {
                assert(!OrderLifecycleStateMachine::canTransition(terminal, next));
            }
        }
    }

    {
        Order order;
        order.order_id = "rg-test-1";
        assert(OrderLifecycleStateMachine::apply(order, OrderStatus::SUBMITTED, 10));
        assert(order.updated_at == 10);
        assert(OrderLifecycleStateMachine::apply(order, OrderStatus::FILLED, 20));
        assert(!OrderLifecycleStateMachine::apply(order, OrderStatus::CANCELLED, 30));
        assert(order.status == OrderStatus::FILLED);
        assert(order.updated_at == 20);
    }

    std::cout << "[TEST] ExecutionStateMachine PASSED\n";
    return 0;
}
