#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

using namespace regimegate;
using namespace regimegate::backtest;

namespace {
constexpr long long kBarMs = 4LL * 3600 * 1000;
constexpr TimestampMs kStart = 1700000000000LL;

std::vector<Bar> series(const std::string& symbol, int count, double start, double step_pct, double volume) {
    std::vector<Bar> bars;
    double price = start;
    for (int i = 0; i < count; ++i) {
        bars.emplace_back(kStart + i * kBarMs, symbol, price, price * 1.001, price * 0.999, price, volume);
        price *= 1.0 + step_pct;
    }
    return bars;
}

BacktestConfig frictionless() {
    BacktestConfig config;
    config.fills.fill_latency_bars = 0;
    config.fills.spread_bps = 0.0;
    config.fills.impact_bps = 0.0;
    config.fills.maker_fee_bps = 0.0;
    config.fills.taker_fee_bps = 0.0;
    config.risk.max_position_pct = 1.0;
    config.risk.max_concentration_pct = 1.0;
    config.risk.max_portfolio_leverage = 1.0;
    config.risk.min_trade_usd = 0.0;
    return config;
}

// One buy on the first bar, then a fixed action afterwards.
class ScriptedPolicy : public IDecisionPolicy {
public:
    ScriptedPolicy(double first_qty, double later_sell_qty)
        : first_qty_(first_qty), later_sell_qty_(later_sell_qty) {}

    std::string name() const override { return "scripted"; }
    void onBar(const Bar& bar) override { (void)bar; ++bars_; }

    std::optional<PolicyDecision> decide(const Bar& bar, const PolicyContext& context) override {
        (void)context;
        ++decisions_;
        SizedOrderIntent intent;
        intent.symbol = bar.symbol;
        if (bars_ == 1) {
            intent.side = OrderSide::BUY;
            intent.quantity = first_qty_;
        } else if (later_sell_qty_ > 0.0) {
            intent.side = OrderSide::SELL;
            intent.quantity = later_sell_qty_;
        } else {
            return PolicyDecision();
        }
        PolicyDecision decision;
        decision.order = intent;
        return decision;
    }

    int decisions() const { return decisions_; }

private:
    double first_qty_;
    double later_sell_qty_;
    int bars_ = 0;
    int decisions_ = 0;
};
}

int main() {
    std::cout << "[TEST] Starting BacktestEngine Test..." << std::endl;

    // 1. Frictionless buy and hold reproduces the price return
    {
        const auto bars = series("BTC-USD", 200, 100.0, 0.003, 1e12);
        BacktestEngine engine(frictionless());
        BuyAndHoldPolicy policy(1.0);
        const auto result = engine.run(bars, policy);

        const double expected = bars.back().close / bars.front().close - 1.0;
        std::cout << "  buy and hold: " << result.metrics.total_return << " vs " << expected << std::endl;
        assert(std::abs(result.metrics.total_return - expected) < 1e-9);
        assert(result.equity_curve.size() == bars.size());
        assert(result.returns.size() == bars.size() - 1);
        assert(result.fills.size() == 1);
        assert(result.orders.size() == 1);
        assert(result.orders[0].order_id == "bt-1");
        assert(result.orders[0].status == OrderStatus::FILLED);
        assert(result.metrics.max_drawdown == 0.0);
        assert(!result.kill_switch_tripped);
        assert(result.bars_processed == bars.size());
    }

    // 2. Dispatcher order and fill latency
    {
        const auto bars = series("BTC-USD", 5, 100.0, 0.0, 1e9);
        BacktestConfig config;   // latency 1
        config.risk.min_trade_usd = 0.0;
        BacktestEngine engine(config);
        ScriptedPolicy policy(10.0, 0.0);
        const auto result = engine.run(bars, policy);

        const auto& log = result.event_log;
        assert(log.size() >= 4);
        assert(log[0].type == BacktestEventType::BAR_CLOSE);
        assert(log[1].type == BacktestEventType::SIGNAL);
        assert(log[2].type == BacktestEventType::ORDER);
        assert(log[3].type == BacktestEventType::FILL);
        assert(log[3].detail == "none due");

        // bar 2: order still in flight, fills at the end of the bar
        assert(log[4].type == BacktestEventType::BAR_CLOSE);
        assert(log[5].type == BacktestEventType::SIGNAL);
        assert(log[5].detail == "skipped: order in flight");
        assert(log[6].type == BacktestEventType::FILL);
        assert(result.fills.size() == 1);
        assert(result.fills[0].timestamp == bars[1].timestamp);
        // half spread + tiny impact paid on the buy
        assert(result.fills[0].price > 100.0);
        assert(std::abs(result.fills[0].fee - result.fills[0].price * 10.0 * 0.001) < 1e-9);
        assert(policy.decisions() == 4);
    }

    // 3. Thin volume: partial fills, remainder cancelled
    {
        auto config = frictionless();
        config.fills.fill_latency_bars = 1;
        const auto bars = series("BTC-USD", 10, 100.0, 0.0, 100.0);   // participation cap 10
        BacktestEngine engine(config);
        ScriptedPolicy policy(80.0, 0.0);
        const auto result = engine.run(bars, policy);

        assert(result.orders.size() == 1);
        const auto& order = result.orders[0];
        assert(order.status == OrderStatus::CANCELLED);
        assert(result.fills.size() == 3);
        assert(std::abs(result.fills[0].quantity - 40.0) < 1e-9);
        assert(std::abs(result.fills[1].quantity - 20.0) < 1e-9);
        assert(std::abs(result.fills[2].quantity - 10.0) < 1e-9);
        assert(result.fills[2].fill_seq == 3);
        assert(std::abs(order.filled_qty - 70.0) < 1e-9);
    }

    // 4. Risk rejections are counted by reason
    {
        BacktestConfig config;   // 25% position cap
        const auto bars = series("BTC-USD", 20, 100.0, 0.001, 1e12);
        BacktestEngine engine(config);
        BuyAndHoldPolicy policy(1.0);
        const auto result = engine.run(bars, policy);
        assert(result.orders.empty());
        assert(result.rejection_counts.at("position_limit") == static_cast<int>(bars.size()));
        assert(std::abs(result.metrics.total_return) < 1e-12);
    }

    // 5. Drawdown trips the kill switch; later orders are refused
    {
        const auto bars = series("BTC-USD", 30, 100.0, -0.03, 1e12);
        BacktestEngine engine(frictionless());
        ScriptedPolicy policy(1000.0, 0.5);
        const auto result = engine.run(bars, policy);
        assert(result.kill_switch_tripped);
        assert(result.metrics.max_drawdown >= 0.15);
        assert(result.rejection_counts.count("kill_switch") == 1);
        assert(result.rejection_counts.at("kill_switch") > 0);
        const auto last_fill = result.fills.back().timestamp;
        for (const auto& snapshot : result.equity_curve) {
            if (snapshot.drawdown_pct >= 0.15) {
                assert(last_fill <= snapshot.timestamp);
                break;
            }
        }
        assert(!result.trades.empty());
    }

    // 6. Multi-symbol: one snapshot per timestamp, deterministic reruns
    {
        auto bars = series("ETH-USD", 50, 2000.0, 0.002, 1e12);
        const auto btc = series("BTC-USD", 50, 40000.0, -0.001, 1e12);
        bars.insert(bars.end(), btc.begin(), btc.end());
        bars.emplace_back(kStart, "", 1, 1, 1, 1, 1);              // no symbol
        bars.emplace_back(kStart, "SOL-USD", 1, 1, 1, -5.0, 1);    // bad close

        BacktestConfig config;
        config.risk.max_position_pct = 0.5;
        config.risk.max_concentration_pct = 0.5;
        BacktestEngine engine(config);
        BuyAndHoldPolicy first_policy(0.4);
        BuyAndHoldPolicy second_policy(0.4);
        const auto first = engine.run(bars, first_policy);
        const auto second = engine.run(bars, second_policy);

        assert(first.equity_curve.size() == 50);
        assert(first.bars_processed == 100);
        assert(first.equity_curve.size() == second.equity_curve.size());
        for (size_t i = 0; i < first.equity_curve.size(); ++i) {
            assert(first.equity_curve[i].equity == second.equity_curve[i].equity);
        }
        // one order per symbol, both inside the caps
        assert(first.orders.size() == 2);
        assert(first.orders[0].symbol == "BTC-USD");
        assert(first.orders[1].symbol == "ETH-USD");
        assert(first.fills.size() == 2);
    }

    // 7. Metrics helpers
    {
        assert(PerformanceMetrics::sharpe({0.01, 0.01, 0.01}) == 0.0);
        assert(PerformanceMetrics::sharpe({}) == 0.0);
        assert(PerformanceMetrics::profitFactor({5.0, 2.0}) == std::numeric_limits<double>::infinity());
        assert(PerformanceMetrics::profitFactor({}) == 0.0);
        assert(std::abs(PerformanceMetrics::profitFactor({6.0, -2.0, -1.0}) - 2.0) < 1e-12);
        assert(std::abs(PerformanceMetrics::hitRate({1.0, -1.0, 2.0, 0.0}) - 0.5) < 1e-12);

        const auto dd = PerformanceMetrics::maxDrawdown({100, 120, 90, 95, 130, 125});
        assert(std::abs(dd.first - 0.25) < 1e-12);
        assert(dd.second == 2);

        const auto report = PerformanceMetrics::compute({100, 110}, {0.1}, {}, 2.0);
        assert(std::abs(report.total_return - 0.1) < 1e-12);
        assert(std::abs(report.annualized_return - 0.1) < 1e-12);   // two points, two per year
    }

    // 8. CSV loading
    {
        const auto dir = std::filesystem::temp_directory_path() / "regimegate_test_backtest";
        std::filesystem::create_directories(dir);
        const auto path = dir / "bars.csv";
        {
            std::ofstream out(path);
            out << "timestamp,open,high,low,close,volume\n";
            out << "1700000000,100,101,99,100.5,10\n";
            out << "1700014400,100.5,102,100,101.5,12\n";
        }
        const auto loaded = DataHistory::loadCSV(path.string(), "BTC-USD");
        assert(loaded.size() == 2);
        assert(loaded[0].symbol == "BTC-USD");
        assert(loaded[0].timestamp == 1700000000000LL);
        assert(std::abs(loaded[1].close - 101.5) < 1e-12);
        std::filesystem::remove_all(dir);
    }

    // 9. Config validation
    {
        BacktestConfig bad;
        bad.initial_capital = 0.0;
        bool threw = false;
        try {
            BacktestEngine invalid(bad);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] BacktestEngine Test PASSED!" << std::endl;
    return 0;
}
