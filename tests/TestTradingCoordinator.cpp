#include "core/orchestration/TradingCycleCoordinator.h"
#include "core/state/InMemoryKillSwitchStore.h"
#include "core/state/InMemoryPersistenceStore.h"
#include "engine/TradingEngine.h"
#include "common/Errors.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <random>
#include <thread>

using namespace regimegate;

namespace {
constexpr long long kBarMs = 4LL * 3600 * 1000;
constexpr TimestampMs kStart = 1700000000000LL;

std::vector<analytics::RegimeFeatureRow> syntheticRows(int count) {
    std::mt19937 rng(11);
    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<Bar> bars;
    double price = 100.0;
    for (int i = 0; i < count + 21; ++i) {
        const double sigma = ((i / 100) % 2 == 0) ? 0.004 : 0.025;
        price *= std::exp(sigma * noise(rng));
        bars.emplace_back(kStart + i * kBarMs, "BTC-USD", price, price, price, price, 1.0);
    }
    return analytics::RegimeFeatures::fromBars(bars, 20, 2190.0);
}

// Bullish fixed features, fresh at every call.
class StaticFeatureProvider : public core::IFeatureProvider {
public:
    explicit StaticFeatureProvider(int regime_delay_ms = 0)
        : rows_(syntheticRows(400))
        , regime_delay_ms_(regime_delay_ms) {}

    std::optional<core::FeatureVector> getFeatures(const std::string& symbol, TimestampMs timestamp) override {
        if (symbol == "NODATA-USD") {
            return std::nullopt;
        }
        core::FeatureVector f;
        f.symbol = symbol;
        f.timestamp = timestamp;
        f.close = 100.0;
        f.realized_vol = 0.5;
        f.rsi = 20.0;
        f.bb_pctb = 0.0;
        f.vwap_dev = -0.05;
        return f;
    }

    std::vector<analytics::RegimeFeatureRow> regimeFeatures(
        const std::string&, TimestampMs, size_t count) override {
        if (regime_delay_ms_ > 0 && count > 100) {
            std::this_thread::sleep_for(std::chrono::milliseconds(regime_delay_ms_));
        }
        if (count >= rows_.size()) {
            return rows_;
        }
        return std::vector<analytics::RegimeFeatureRow>(rows_.end() - count, rows_.end());
    }

private:
    std::vector<analytics::RegimeFeatureRow> rows_;
    int regime_delay_ms_;
};

class FixedPredictor : public core::IModelPredictor {
public:
    explicit FixedPredictor(int delay_ms = 0) : delay_ms_(delay_ms) {}

    std::optional<core::QuantilePrediction> predict(const std::string&, const core::FeatureVector&) override {
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
        core::QuantilePrediction p;
        p.quantiles = {-0.02, -0.01, 0.0, 0.01, 0.02};   // tight spread
        p.label = 2;
        return p;
    }

private:
    int delay_ms_;
};

class FixedSentiment : public core::ISentimentProvider {
public:
    std::optional<double> getScore(const std::string&) override { return 0.5; }
};

// Accepts every order and never reports a fill.
class SilentAdapter : public core::IExecutionAdapter {
public:
    core::ExecutionAck submit(const Order&) override {
        core::ExecutionAck ack;
        ack.accepted = true;
        return ack;
    }
    std::optional<core::ExecutionReport> poll(const std::string&) override { return std::nullopt; }
    bool cancel(const std::string&) override { return true; }
};

struct Harness {
    std::shared_ptr<core::InMemoryKillSwitchStore> ks_store = std::make_shared<core::InMemoryKillSwitchStore>();
    std::shared_ptr<risk::KillSwitch> kill_switch;
    std::shared_ptr<risk::RiskChecker> risk_checker;
    std::shared_ptr<execution::OrderManager> orders;
    std::shared_ptr<portfolio::PortfolioState> portfolio;
    std::shared_ptr<core::InMemoryPersistenceStore> store = std::make_shared<core::InMemoryPersistenceStore>();
    std::shared_ptr<core::TradingCycleCoordinator> coordinator;

    Harness(std::vector<std::string> symbols,
            std::shared_ptr<core::IModelPredictor> predictor,
            std::shared_ptr<core::IExecutionAdapter> adapter = nullptr,
            int timeout_ms = 2000) {
        kill_switch = std::make_shared<risk::KillSwitch>(ks_store, 0.15);
        risk_checker = std::make_shared<risk::RiskChecker>(risk::RiskCheckerConfig(), kill_switch);
        execution::OrderManagerConfig om;
        om.paper_mode = (adapter == nullptr);
        om.session_id = "test";
        orders = std::make_shared<execution::OrderManager>(om, kill_switch, adapter);
        portfolio = std::make_shared<portfolio::PortfolioState>(100000.0);
        auto pipeline = std::make_shared<core::DecisionPipeline>(
            core::DecisionPipelineConfig(), signals::SignalFusion(), risk::PositionSizer());

        core::TradingCycleConfig config;
        config.symbols = std::move(symbols);
        config.collaborator_timeout_ms = timeout_ms;
        coordinator = std::make_shared<core::TradingCycleCoordinator>(
            config, std::make_shared<StaticFeatureProvider>(), predictor, std::make_shared<FixedSentiment>(),
            pipeline, risk_checker, orders, portfolio, store);
    }
};
}

int main() {
    std::cout << "[TEST] Starting TradingCoordinator Test..." << std::endl;

    // 1. Unfitted detector: cycle skipped, snapshot still recorded
    {
        Harness h({"BTC-USD", "NODATA-USD"}, std::make_shared<FixedPredictor>());
        const auto report = h.coordinator->runTick(kStart);
        assert(report.symbols.size() == 2);
        assert(report.symbols[0].outcome == core::CycleOutcome::NO_REGIME);
        assert(report.symbols[1].outcome == core::CycleOutcome::NO_DATA);
        assert(report.snapshot.has_value());
        assert(h.store->snapshots().size() == 1);
    }

    // 2. Paper cycle trades once, then holds inside the rebalance band
    {
        Harness h({"BTC-USD"}, std::make_shared<FixedPredictor>());
        h.coordinator->retrainSymbol("BTC-USD", kStart);
        assert(h.coordinator->detector("BTC-USD")->isFitted());

        const auto first = h.coordinator->runTick(kStart);
        assert(first.symbols[0].outcome == core::CycleOutcome::SUBMITTED);
        assert(first.symbols[0].order_id.has_value());
        assert(first.fills.size() == 1);
        assert(h.portfolio->positionQuantity("BTC-USD") > 0.0);
        assert(h.store->fills().size() == 1);
        assert(h.store->positions().size() == 1);

        const auto signal = h.coordinator->latestSignal("BTC-USD");
        assert(signal.has_value());
        assert(signal->direction == Direction::LONG);
        assert(std::abs(signal->confidence - 1.0) < 1e-12);   // IQR below min_iqr
        assert(h.coordinator->latestRegime("BTC-USD").has_value());

        const auto second = h.coordinator->runTick(kStart + kBarMs);
        assert(second.symbols[0].outcome == core::CycleOutcome::NO_TRADE);
        assert(second.fills.empty());
        assert(!second.kill_switch_tripped);
    }

    // 3. Slow predictor counts as missing: default confidence
    {
        Harness h({"BTC-USD"}, std::make_shared<FixedPredictor>(400), nullptr, 50);
        h.coordinator->retrainSymbol("BTC-USD", kStart);
        const auto report = h.coordinator->runTick(kStart);
        assert(report.symbols[0].outcome != core::CycleOutcome::ERROR);
        const auto signal = h.coordinator->latestSignal("BTC-USD");
        assert(signal.has_value());
        assert(std::abs(signal->confidence - 0.5) < 1e-12);
        assert(signal->weights.at(SignalSource::ML) == 0.0);
        // let the detached predictor finish before the harness goes away
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    // 4. Live order in flight: the symbol is skipped until it resolves
    {
        Harness h({"BTC-USD"}, std::make_shared<FixedPredictor>(), std::make_shared<SilentAdapter>());
        h.coordinator->retrainSymbol("BTC-USD", kStart);
        const auto first = h.coordinator->runTick(kStart);
        assert(first.symbols[0].outcome == core::CycleOutcome::SUBMITTED);
        assert(first.fills.empty());
        assert(h.orders->hasActiveOrder("BTC-USD"));

        const auto second = h.coordinator->runTick(kStart + 1000);
        assert(second.symbols[0].outcome == core::CycleOutcome::SKIPPED_IN_FLIGHT);
        assert(h.orders->orders().size() == 1);
    }

    // 5. Tripped kill switch blocks the cycle's orders
    {
        Harness h({"BTC-USD"}, std::make_shared<FixedPredictor>());
        h.coordinator->retrainSymbol("BTC-USD", kStart);
        h.kill_switch->trip("test", 0.2, kStart);
        const auto report = h.coordinator->runTick(kStart);
        assert(report.symbols[0].outcome == core::CycleOutcome::REJECTED);
        assert(report.symbols[0].reject_reason == risk::RiskRejectReason::KILL_SWITCH);
        assert(report.kill_switch_tripped);
        assert(h.orders->orders().empty());
    }

    // 6. Engine: one retrain at a time, operator reset, mode guard
    {
        engine::EngineConfig config;
        config.symbols = {"BTC-USD"};
        config.regime.min_train_bars = 200;

        engine::EngineDependencies deps;
        deps.feature_provider = std::make_shared<StaticFeatureProvider>(300);
        deps.predictor = std::make_shared<FixedPredictor>();
        deps.store = std::make_shared<core::InMemoryPersistenceStore>();
        auto ks_store = std::make_shared<core::InMemoryKillSwitchStore>();
        deps.kill_switch_store = ks_store;

        std::atomic<TimestampMs> clock{kStart};
        engine::TradingEngine engine(config, deps, [&clock]() { return clock.load(); });

        assert(engine.requestRetrain() == engine::RetrainStatus::STARTED);
        assert(engine.requestRetrain() == engine::RetrainStatus::ALREADY_RUNNING);
        assert(engine.isRetraining());
        engine.waitForRetrain();
        assert(!engine.isRetraining());
        assert(engine.coordinator()->detector("BTC-USD")->isFitted());
        assert(engine.requestRetrain() == engine::RetrainStatus::STARTED);
        engine.waitForRetrain();

        const auto report = engine.runOnce();
        assert(report.symbols[0].outcome == core::CycleOutcome::SUBMITTED);
        assert(engine.currentRegime("BTC-USD").has_value());

        clock = kStart + kBarMs;
        engine.runOnce();
        const auto metrics = engine.updateHealth();
        assert(!metrics.kill_switch_active);
        assert(engine.latestRiskMetrics().has_value());

        const auto status = engine.status();
        assert(status.ticks == 2);
        assert(status.positions.size() == 1);
        assert(status.kill_switch.state == core::KillSwitchState::ARMED);

        engine.riskChecker()->killSwitch()->trip("test", 0.2, clock.load());
        assert(engine.killSwitchState().state == core::KillSwitchState::TRIPPED);
        engine.resetKillSwitch("ops", "verified");
        assert(engine.killSwitchState().state == core::KillSwitchState::ARMED);
        assert(engine.killSwitchState().actor == "ops");
        assert(std::abs(engine.portfolio()->peakEquity() - engine.portfolio()->equity()) < 1e-9);

        engine::EngineConfig backtest = config;
        backtest.mode = engine::TradingMode::BACKTEST;
        bool threw = false;
        try {
            engine::TradingEngine invalid(backtest, deps);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] TradingCoordinator Test PASSED!" << std::endl;
    return 0;
}
