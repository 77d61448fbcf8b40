#include "backtest/BacktestEngine.h"
#include "backtest/BarFeatureProvider.h"
#include "backtest/DecisionPolicy.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using namespace regimegate;
using namespace regimegate::backtest;

namespace {
constexpr long long kBarMs = 4LL * 3600 * 1000;
constexpr TimestampMs kStart = 1700000000000LL;

std::vector<Bar> makeSeries(int segments, int segment, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<Bar> bars;
    double price = 100.0;
    long long ts = kStart;
    for (int s = 0; s < segments; ++s) {
        const double sigma = (s % 2 == 0) ? 0.004 : 0.025;
        const double drift = (s % 2 == 0) ? 0.001 : 0.0;
        for (int i = 0; i < segment; ++i) {
            price *= std::exp(drift + sigma * noise(rng));
            bars.emplace_back(ts, "BTC-USD", price, price * 1.002, price * 0.998, price, 1e9);
            ts += kBarMs;
        }
    }
    return bars;
}

std::shared_ptr<core::DecisionPipeline> makePipeline() {
    return std::make_shared<core::DecisionPipeline>(
        core::DecisionPipelineConfig(),
        signals::SignalFusion(signals::SignalFusionConfig()),
        risk::PositionSizer(risk::PositionSizerConfig()));
}

PipelinePolicyConfig smallConfig() {
    PipelinePolicyConfig config;
    config.detector.min_train_bars = 100;
    config.detector.train_window = 300;
    config.detector.classify_window = 30;
    config.refit_interval_bars = 50;
    return config;
}
}

int main() {
    std::cout << "[TEST] Starting PipelinePolicy Test..." << std::endl;

    const auto bars = makeSeries(4, 150, 11);

    // 1. Feature provider never looks past the query time
    {
        BarFeatureProvider provider;
        std::vector<Bar> first(bars.begin(), bars.begin() + 60);
        provider.append(first);
        assert(provider.barCount("BTC-USD") == 60);
        assert(provider.barCount("ETH-USD") == 0);

        // Out-of-order bar is dropped.
        provider.append(bars[10]);
        assert(provider.barCount("BTC-USD") == 60);

        auto features = provider.getFeatures("BTC-USD", bars[30].timestamp);
        assert(features.has_value());
        assert(features->timestamp == bars[30].timestamp);
        assert(features->close == bars[30].close);
        assert(std::abs(features->log_return - std::log(bars[30].close / bars[29].close)) < 1e-12);
        assert(features->rsi >= 0.0 && features->rsi <= 100.0);
        assert(std::isfinite(features->realized_vol) && features->realized_vol > 0.0);

        // Between two bars: the earlier one
        auto between = provider.getFeatures("BTC-USD", bars[30].timestamp + kBarMs / 2);
        assert(between && between->timestamp == bars[30].timestamp);

        assert(!provider.getFeatures("BTC-USD", bars[0].timestamp));
        assert(!provider.getFeatures("BTC-USD", kStart - kBarMs));
        assert(!provider.getFeatures("ETH-USD", bars[59].timestamp));

        auto rows = provider.regimeFeatures("BTC-USD", bars[59].timestamp, 10);
        assert(rows.size() == 10);
        assert(rows.back().timestamp == bars[59].timestamp);
        for (size_t i = 1; i < rows.size(); ++i) {
            assert(rows[i].timestamp > rows[i - 1].timestamp);
        }

        auto early = provider.regimeFeatures("BTC-USD", bars[25].timestamp, 100);
        assert(!early.empty() && early.size() < 100);
        assert(early.back().timestamp == bars[25].timestamp);
    }

    // 2. Policy configuration
    {
        bool threw = false;
        try {
            PipelinePolicy policy(smallConfig(), nullptr);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        auto config = smallConfig();
        config.refit_interval_bars = 0;
        try {
            PipelinePolicy policy(config, makePipeline());
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // 3. Not enough history: the policy stays silent
    {
        PipelinePolicy policy(smallConfig(), makePipeline());
        std::vector<Bar> short_run(bars.begin(), bars.begin() + 80);
        BacktestEngine engine;
        auto result = engine.run(short_run, policy);
        assert(policy.fitCount() == 0);
        assert(result.signals_generated == 0);
        assert(result.orders.empty());
        assert(result.bars_processed == 80);
        assert(std::string(backtestEventTypeToString(result.event_log[0].type)) == "BAR_CLOSE");
        assert(std::string(backtestEventTypeToString(result.event_log[1].type)) == "SIGNAL");
        assert(result.event_log[1].detail == "skipped");
    }

    // 4. Train on the first half, trade the second half with periodic refits
    {
        PipelinePolicy policy(smallConfig(), makePipeline());
        std::vector<Bar> train(bars.begin(), bars.begin() + 300);
        std::vector<Bar> test(bars.begin() + 300, bars.end());

        policy.prepare(train);
        assert(policy.fitCount() == 1);
        auto detector = policy.detector("BTC-USD");
        assert(detector && detector->isFitted());
        assert(detector->model()->trained_through == train.back().timestamp);

        BacktestEngine engine;
        auto result = engine.run(test, policy);
        assert(result.bars_processed == test.size());
        assert(result.signals_generated > 0);
        assert(policy.fitCount() >= 2);
        assert(policy.detector("BTC-USD")->model()->trained_through > train.back().timestamp);
        assert(result.equity_curve.size() == test.size());
    }

    std::cout << "[TEST] PipelinePolicy Test PASSED!" << std::endl;
    return 0;
}
