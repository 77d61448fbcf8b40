#include "analytics/RegimeDetector.h"
#include "analytics/RegimeFeatures.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using namespace regimegate;
using analytics::RegimeDetector;
using analytics::RegimeDetectorConfig;
using analytics::RegimeFeatures;

namespace {
constexpr long long kBarMs = 4LL * 3600 * 1000;

// Alternating calm / turbulent segments of `segment` bars each.
std::vector<Bar> makeRegimeSeries(int segments, int segment, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<Bar> bars;
    double price = 100.0;
    long long ts = 1700000000000LL;
    for (int s = 0; s < segments; ++s) {
        const double sigma = (s % 2 == 0) ? 0.003 : 0.03;
        for (int i = 0; i < segment; ++i) {
            price *= std::exp(sigma * noise(rng));
            bars.emplace_back(ts, "BTC-USD", price, price * 1.001, price * 0.999, price, 10.0);
            ts += kBarMs;
        }
    }
    return bars;
}

int rank(Regime regime) {
    switch (regime) {
        case Regime::TRENDING: return 0;
        case Regime::MEAN_REVERTING: return 1;
        case Regime::CHOPPY: return 2;
    }
    return -1;
}
}

int main() {
    std::cout << "[TEST] Starting RegimeDetector Test..." << std::endl;

    // 1. Only the 3-state model is supported
    {
        RegimeDetectorConfig bad;
        bad.n_states = 4;
        bool threw = false;
        try {
            RegimeDetector detector(bad);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // 2. States map to regimes by ascending mean volatility
    {
        analytics::HmmParameters params;
        params.means[0] = {0.0, 0.5};
        params.means[1] = {0.0, 0.1};
        params.means[2] = {0.0, 0.9};
        const auto mapping = RegimeDetector::mapStatesByVolatility(params);
        assert(mapping[1] == Regime::TRENDING);
        assert(mapping[0] == Regime::MEAN_REVERTING);
        assert(mapping[2] == Regime::CHOPPY);
    }

    // 3. Feature rows: bad bars skipped, gaps rescaled
    {
        std::vector<Bar> bars;
        long long ts = 0;
        for (int i = 0; i < 6; ++i) {
            bars.emplace_back(ts, "X", 100, 100, 100, 100.0 * std::pow(1.01, i), 1.0);
            ts += kBarMs;
        }
        bars.emplace_back(ts - kBarMs, "X", 1, 1, 1, 120.0, 1.0);   // non-increasing timestamp
        bars.emplace_back(ts + kBarMs, "X", 1, 1, 1, 0.0, 1.0);     // non-positive close
        ts += kBarMs;   // one missing bar
        bars.emplace_back(ts, "X", 1, 1, 1, 100.0 * std::pow(1.01, 6), 1.0);

        const auto rows = RegimeFeatures::fromBars(bars, 2, 2190.0);
        assert(!rows.empty());
        const auto& last = rows.back();
        assert(last.timestamp == ts);
        // spacing doubled: log return scaled by sqrt(1/2)
        assert(std::abs(last.log_return - std::log(1.01) * std::sqrt(0.5)) < 1e-12);
        for (const auto& row : rows) {
            assert(std::isfinite(row.realized_vol) && row.realized_vol >= 0.0);
        }
    }

    RegimeDetectorConfig config;
    config.min_train_bars = 200;
    RegimeDetector detector(config);

    // 4. Unfitted / undersized inputs
    {
        bool threw = false;
        try {
            analytics::RegimeFeatureRow row;
            row.timestamp = 1;
            row.realized_vol = 0.1;
            detector.classify(std::vector<analytics::RegimeFeatureRow>{row});
        } catch (const InsufficientDataError&) {
            threw = true;
        }
        assert(threw);

        const auto few = RegimeFeatures::fromBars(makeRegimeSeries(1, 100, 3), config.vol_window, config.bars_per_year);
        threw = false;
        try {
            detector.fit(few);
        } catch (const InsufficientDataError&) {
            threw = true;
        }
        assert(threw);
        assert(!detector.isFitted());
    }

    // 5. Fit and classify calm vs turbulent windows
    const int segment = 150;
    const auto bars = makeRegimeSeries(6, segment, 7);
    const auto rows = RegimeFeatures::fromBars(bars, config.vol_window, config.bars_per_year);
    detector.fit(rows);
    assert(detector.isFitted());

    const auto model = detector.model();
    assert(model->n_samples == rows.size());
    assert(model->trained_through == rows.back().timestamp);
    int seen[3] = {0, 0, 0};
    for (Regime r : model->state_regime) {
        seen[rank(r)]++;
    }
    assert(seen[0] == 1 && seen[1] == 1 && seen[2] == 1);
    for (int k = 0; k < 3; ++k) {
        double row_sum = 0.0;
        for (int j = 0; j < 3; ++j) {
            row_sum += model->params.transition[k][j];
        }
        assert(std::abs(row_sum - 1.0) < 1e-6);
    }

    // rows start `vol_window` bars into the series
    auto window_ending = [&](int bar_index, int length) {
        std::vector<analytics::RegimeFeatureRow> window;
        const long long end_ts = bars[bar_index].timestamp;
        for (const auto& row : rows) {
            if (row.timestamp <= end_ts) window.push_back(row);
        }
        if (window.size() > static_cast<size_t>(length)) {
            window.erase(window.begin(), window.end() - length);
        }
        return window;
    };

    const auto calm = detector.classify(window_ending(2 * segment + segment - 1, 40), "BTC-USD");
    const auto turbulent = detector.classify(window_ending(3 * segment + segment - 1, 40), "BTC-USD");
    std::cout << "  calm=" << regimeToString(calm.regime) << " (" << calm.confidence << ")"
              << " turbulent=" << regimeToString(turbulent.regime) << " (" << turbulent.confidence << ")"
              << std::endl;
    assert(calm.symbol == "BTC-USD");
    assert(calm.confidence >= 0.0 && calm.confidence <= 1.0);
    assert(turbulent.confidence >= 0.0 && turbulent.confidence <= 1.0);
    assert(rank(turbulent.regime) > rank(calm.regime));

    // 6. Classification never reads past the window it is given
    {
        const auto window = window_ending(2 * segment + segment - 1, 40);
        const auto first = detector.classify(window);
        const auto second = detector.classify(window);
        assert(first.regime == second.regime);
        assert(first.confidence == second.confidence);
        assert(first.timestamp == window.back().timestamp);
    }

    std::cout << "[TEST] RegimeDetector Test PASSED!" << std::endl;
    return 0;
}
