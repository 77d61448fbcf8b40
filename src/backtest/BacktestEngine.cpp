#include "backtest/BacktestEngine.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "core/execution/ExecutionUpdateSchema.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/state/InMemoryKillSwitchStore.h"
#include "portfolio/PortfolioState.h"
#include "risk/KillSwitch.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace regimegate {
namespace backtest {

using core::execution::OrderLifecycleStateMachine;
using core::execution::isActiveStatus;
using core::execution::orderSideToString;

namespace {
constexpr double kQtyEpsilon = 1e-12;

struct QueuedEvent {
    BacktestEventType type = BacktestEventType::BAR_CLOSE;
    std::optional<PolicyDecision> decision;
};

struct PendingOrder {
    std::string order_id;
    long long due_index = 0;   // first per-symbol bar index the order may fill on
    int attempts = 0;
};

// Mutable state of a single run.
class BacktestRun {
public:
    BacktestRun(const BacktestConfig& config, IDecisionPolicy& policy, BacktestResult& result)
        : config_(config)
        , policy_(policy)
        , result_(result)
        , simulator_(config.fills)
        , kill_switch_(std::make_shared<risk::KillSwitch>(
              std::make_shared<core::InMemoryKillSwitchStore>(), config.risk.max_drawdown_pct))
        , risk_checker_(config.risk, kill_switch_)
        , portfolio_(config.initial_capital, config.initial_capital) {}

    void processBar(const Bar& bar) {
        std::deque<QueuedEvent> queue;
        queue.push_back({BacktestEventType::BAR_CLOSE, std::nullopt});

        while (!queue.empty()) {
            QueuedEvent event = std::move(queue.front());
            queue.pop_front();

            switch (event.type) {
                case BacktestEventType::BAR_CLOSE:
                    onBarClose(bar, queue);
                    break;
                case BacktestEventType::SIGNAL:
                    onSignal(bar, queue);
                    break;
                case BacktestEventType::ORDER:
                    onOrder(bar, *event.decision);
                    break;
                case BacktestEventType::FILL:
                    onFill(bar);
                    break;
            }
        }
        ++result_.bars_processed;
    }

    void closeTimestamp(TimestampMs timestamp) {
        auto snapshot = portfolio_.recordSnapshot(timestamp);
        risk_checker_.onSnapshot(snapshot);
        result_.equity_curve.push_back(snapshot);
    }

    void finish() {
        for (const auto& [order_id, order] : orders_) {
            result_.orders.push_back(order);
        }
        std::sort(result_.orders.begin(), result_.orders.end(), [](const Order& a, const Order& b) {
            return a.created_at < b.created_at ||
                   (a.created_at == b.created_at && a.order_id < b.order_id);
        });
        result_.trades = portfolio_.closedTrades();
        result_.kill_switch_tripped = kill_switch_->isTripped();
    }

private:
    void log(BacktestEventType type, const Bar& bar, std::string detail = std::string()) {
        if (!config_.record_event_log) {
            return;
        }
        BacktestEvent event;
        event.type = type;
        event.timestamp = bar.timestamp;
        event.symbol = bar.symbol;
        event.detail = std::move(detail);
        result_.event_log.push_back(std::move(event));
    }

    bool hasActiveOrder(const std::string& symbol) const {
        auto it = pending_.find(symbol);
        return it != pending_.end() && !it->second.empty();
    }

    // BAR_CLOSE: market state and mark to market
    void onBarClose(const Bar& bar, std::deque<QueuedEvent>& queue) {
        bar_index_[bar.symbol] += 1;
        portfolio_.markToMarket(bar.symbol, bar.close);
        policy_.onBar(bar);
        log(BacktestEventType::BAR_CLOSE, bar);
        queue.push_back({BacktestEventType::SIGNAL, std::nullopt});
    }

    // SIGNAL: decision policy, skipped while the symbol has an order in flight
    void onSignal(const Bar& bar, std::deque<QueuedEvent>& queue) {
        if (hasActiveOrder(bar.symbol)) {
            log(BacktestEventType::SIGNAL, bar, "skipped: order in flight");
        } else {
            PolicyContext context;
            context.equity = portfolio_.equity();
            context.current_qty = portfolio_.positionQuantity(bar.symbol);
            context.now = bar.timestamp;

            auto decision = policy_.decide(bar, context);
            if (decision && decision->signal) {
                ++result_.signals_generated;
                std::ostringstream oss;
                oss << directionToString(decision->signal->direction)
                    << " strength=" << decision->signal->strength
                    << " regime=" << regimeToString(decision->signal->regime);
                log(BacktestEventType::SIGNAL, bar, oss.str());
            } else {
                log(BacktestEventType::SIGNAL, bar, decision ? "no signal" : "skipped");
            }
            if (decision && decision->order && decision->order->quantity > 0.0) {
                queue.push_back({BacktestEventType::ORDER, decision});
            }
        }
        queue.push_back({BacktestEventType::FILL, std::nullopt});
    }

    // ORDER: risk check, then the order enters the book
    void onOrder(const Bar& bar, const PolicyDecision& decision) {
        const SizedOrderIntent& intent = *decision.order;

        risk::ProposedOrder proposed;
        proposed.symbol = bar.symbol;
        proposed.side = intent.side;
        proposed.quantity = intent.quantity;
        proposed.price = decision.limit_price.value_or(bar.close);
        proposed.data_timestamp = bar.timestamp;
        proposed.now = bar.timestamp;

        auto verdict = risk_checker_.checkPreTrade(proposed, portfolio_.exposureView());
        if (!verdict.approved) {
            const std::string reason = risk::riskRejectReasonToString(verdict.reason);
            result_.rejection_counts[reason] += 1;
            log(BacktestEventType::ORDER, bar, "rejected: " + reason + " (" + verdict.message + ")");
            return;
        }

        Order order;
        order.order_id = "bt-" + std::to_string(++order_seq_);
        order.symbol = bar.symbol;
        order.exchange = "backtest";
        order.side = intent.side;
        order.type = decision.order_type;
        order.quantity = intent.quantity;
        order.limit_price = decision.limit_price;
        order.created_at = bar.timestamp;
        order.updated_at = bar.timestamp;
        order.signal_strength = intent.signal_strength;
        order.signal_regime = intent.signal_regime;
        OrderLifecycleStateMachine::apply(order, OrderStatus::SUBMITTED, bar.timestamp);

        PendingOrder pending;
        pending.order_id = order.order_id;
        pending.due_index = bar_index_[bar.symbol] + config_.fills.fill_latency_bars;
        pending_[bar.symbol].push_back(pending);
        orders_[order.order_id] = order;

        std::ostringstream oss;
        oss << order.order_id << " " << orderSideToString(order.side) << " qty=" << order.quantity;
        log(BacktestEventType::ORDER, bar, oss.str());
    }

    // FILL: every due order of the symbol against this bar
    void onFill(const Bar& bar) {
        auto it = pending_.find(bar.symbol);
        if (it == pending_.end() || it->second.empty()) {
            log(BacktestEventType::FILL, bar, "none due");
            return;
        }

        const long long index = bar_index_[bar.symbol];
        auto& queue = it->second;
        bool any_due = false;
        for (auto pending_it = queue.begin(); pending_it != queue.end();) {
            if (pending_it->due_index > index) {
                ++pending_it;
                continue;
            }
            any_due = true;

            Order& order = orders_.at(pending_it->order_id);
            auto simulated = simulator_.simulate(order, bar);
            if (simulated) {
                applySimulatedFill(order, *simulated, bar);
            } else {
                log(BacktestEventType::FILL, bar, order.order_id + " no fill");
            }

            pending_it->attempts += 1;
            if (isActiveStatus(order.status) && pending_it->attempts >= config_.fills.cancel_after_bars) {
                OrderLifecycleStateMachine::apply(order, OrderStatus::CANCELLED, bar.timestamp);
                log(BacktestEventType::FILL, bar, order.order_id + " remainder cancelled");
            }

            if (!isActiveStatus(order.status)) {
                pending_it = queue.erase(pending_it);
            } else {
                ++pending_it;
            }
        }
        if (!any_due) {
            log(BacktestEventType::FILL, bar, "none due");
        }
    }

    void applySimulatedFill(Order& order, const SimulatedFill& simulated, const Bar& bar) {
        Fill fill;
        fill.order_id = order.order_id;
        fill.fill_seq = order.fill_count + 1;
        fill.symbol = order.symbol;
        fill.side = order.side;
        fill.quantity = simulated.quantity;
        fill.price = simulated.price;
        fill.fee = simulated.fee;
        fill.timestamp = bar.timestamp;

        auto applied = portfolio_.applyFill(fill, order.quantity);
        if (!applied.applied) {
            return;
        }

        const double notional = order.avg_fill_price * order.filled_qty + fill.price * fill.quantity;
        order.filled_qty += fill.quantity;
        order.avg_fill_price = notional / order.filled_qty;
        order.fees += fill.fee;
        order.fill_count = fill.fill_seq;

        const OrderStatus next = (order.remainingQty() <= kQtyEpsilon * std::max(1.0, order.quantity))
            ? OrderStatus::FILLED
            : OrderStatus::PARTIALLY_FILLED;
        OrderLifecycleStateMachine::apply(order, next, bar.timestamp);

        result_.fills.push_back(fill);
        risk_checker_.checkPostTrade(order.symbol, portfolio_.exposureView());

        std::ostringstream oss;
        oss << order.order_id << "#" << fill.fill_seq << " qty=" << fill.quantity << " px=" << fill.price;
        log(BacktestEventType::FILL, bar, oss.str());
    }

    const BacktestConfig& config_;
    IDecisionPolicy& policy_;
    BacktestResult& result_;
    FillSimulator simulator_;
    std::shared_ptr<risk::KillSwitch> kill_switch_;
    risk::RiskChecker risk_checker_;
    portfolio::PortfolioState portfolio_;

    std::map<std::string, Order> orders_;
    std::map<std::string, std::vector<PendingOrder>> pending_;
    std::map<std::string, long long> bar_index_;
    long long order_seq_ = 0;
};
}

const char* backtestEventTypeToString(BacktestEventType type) {
    switch (type) {
        case BacktestEventType::BAR_CLOSE: return "BAR_CLOSE";
        case BacktestEventType::SIGNAL: return "SIGNAL";
        case BacktestEventType::ORDER: return "ORDER";
        case BacktestEventType::FILL: return "FILL";
    }
    return "BAR_CLOSE";
}

void BacktestConfig::validate() const {
    if (!(initial_capital > 0.0)) {
        throw ConfigurationError("backtest.initial_capital must be positive");
    }
    if (!(periods_per_year > 0.0)) {
        throw ConfigurationError("backtest.periods_per_year must be positive");
    }
    fills.validate();
    risk.validate();
}

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(config) {
    config_.validate();
}

BacktestResult BacktestEngine::run(const std::vector<Bar>& bars, IDecisionPolicy& policy) const {
    BacktestResult result;
    result.policy_name = policy.name();

    std::vector<Bar> ordered;
    ordered.reserve(bars.size());
    int skipped = 0;
    for (const auto& bar : bars) {
        if (!(bar.close > 0.0) || !std::isfinite(bar.close) || bar.symbol.empty()) {
            ++skipped;
            continue;
        }
        ordered.push_back(bar);
    }
    if (skipped > 0) {
        LOG_WARN("Backtest: skipped {} unusable bars", skipped);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Bar& a, const Bar& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp < b.timestamp;
        }
        return a.symbol < b.symbol;
    });

    LOG_INFO("Backtest start: policy={}, bars={}, capital={:.2f}",
             result.policy_name, ordered.size(), config_.initial_capital);

    BacktestRun run(config_, policy, result);
    for (size_t i = 0; i < ordered.size(); ++i) {
        run.processBar(ordered[i]);
        const bool last_of_timestamp = (i + 1 == ordered.size()) ||
                                       (ordered[i + 1].timestamp != ordered[i].timestamp);
        if (last_of_timestamp) {
            run.closeTimestamp(ordered[i].timestamp);
        }
    }
    run.finish();

    std::vector<double> equity;
    equity.reserve(result.equity_curve.size());
    for (const auto& snapshot : result.equity_curve) {
        equity.push_back(snapshot.equity);
    }
    result.returns = PerformanceMetrics::periodReturns(equity);
    result.metrics = PerformanceMetrics::compute(equity, result.returns, result.trades, config_.periods_per_year);

    LOG_INFO("Backtest done: policy={}, return={:.2f}%, sharpe={:.3f}, max_dd={:.2f}%, trades={}, kill_switch={}",
             result.policy_name,
             result.metrics.total_return * 100.0,
             result.metrics.sharpe_ratio,
             result.metrics.max_drawdown * 100.0,
             result.metrics.total_trades,
             result.kill_switch_tripped ? "TRIPPED" : "ARMED");
    return result;
}

} // namespace backtest
} // namespace regimegate
