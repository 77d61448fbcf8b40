#include "risk/PositionSizer.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace regimegate;
using risk::PositionSizer;
using risk::PositionSizerConfig;

namespace {
FusedSignal signal(Direction direction, double strength, double confidence) {
    FusedSignal s;
    s.symbol = "BTC-USD";
    s.direction = direction;
    s.strength = strength;
    s.confidence = confidence;
    s.regime = Regime::TRENDING;
    return s;
}
}

int main() {
    std::cout << "[TEST] Starting PositionSizer Test..." << std::endl;

    PositionSizer sizer;   // vol_target 0.15, max 0.25

    // 1. Literal formula below the cap
    {
        // (0.15 / 0.6) * 0.5 * 0.8 = 0.1
        const auto intent = sizer.size(signal(Direction::LONG, 0.5, 0.8), 0.6, 100000.0, 50000.0);
        assert(std::abs(intent.notional_pct_of_equity - 0.1) < 1e-12);
        assert(std::abs(intent.quantity - 0.2) < 1e-12);
        assert(intent.side == OrderSide::BUY);
        assert(intent.symbol == "BTC-USD");
        assert(intent.signal_regime == Regime::TRENDING);
    }

    // 2. Capped at max_position_pct
    {
        const auto intent = sizer.size(signal(Direction::LONG, 0.9, 1.0), 0.05, 100000.0, 100.0);
        assert(std::abs(intent.notional_pct_of_equity - 0.25) < 1e-12);
        assert(std::abs(intent.quantity - 250.0) < 1e-9);
    }

    // 3. Monotone non-increasing in volatility, always within [0, cap]
    {
        double previous = std::numeric_limits<double>::infinity();
        for (double vol = 0.0; vol <= 3.0; vol += 0.05) {
            const double fraction = sizer.targetFraction(-0.7, 0.9, vol);
            assert(fraction >= 0.0 && fraction <= 0.25 + 1e-15);
            assert(fraction <= previous + 1e-15);
            previous = fraction;
        }
        // zero vol is floored, not divided by
        assert(std::abs(sizer.targetFraction(0.7, 0.9, 0.0) - 0.25) < 1e-12);
    }

    // 4. Short signals carry the side, quantity stays non-negative
    {
        const auto intent = sizer.size(signal(Direction::SHORT, -0.5, 0.8), 0.6, 100000.0, 50000.0);
        assert(intent.side == OrderSide::SELL);
        assert(intent.quantity > 0.0);
    }

    // 5. Degenerate inputs size to zero
    {
        assert(sizer.size(signal(Direction::FLAT, 0.01, 1.0), 0.5, 1e5, 100.0).quantity == 0.0);
        assert(sizer.size(signal(Direction::LONG, 0.5, 1.0), 0.5, 1e5, 0.0).quantity == 0.0);
        assert(sizer.size(signal(Direction::LONG, 0.5, 1.0), 0.5, -1.0, 100.0).quantity == 0.0);
        assert(sizer.size(signal(Direction::LONG, 0.5, 1.0), std::nan(""), 1e5, 100.0).quantity == 0.0);
        assert(sizer.size(signal(Direction::LONG, 0.5, 0.0), 0.5, 1e5, 100.0).quantity == 0.0);
    }

    // 6. Config validation
    {
        PositionSizerConfig bad;
        bad.max_position_pct = 1.5;
        bool threw = false;
        try {
            PositionSizer invalid(bad);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);

        bad = PositionSizerConfig();
        bad.vol_target = 0.0;
        threw = false;
        try {
            bad.validate();
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] PositionSizer Test PASSED!" << std::endl;
    return 0;
}
