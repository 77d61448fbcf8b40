#include "risk/PositionSizer.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace regimegate {
namespace risk {

void PositionSizerConfig::validate() const {
    if (!(vol_target > 0.0) || !std::isfinite(vol_target)) {
        throw ConfigurationError("sizing.vol_target must be positive");
    }
    if (!(max_position_pct > 0.0) || max_position_pct > 1.0) {
        throw ConfigurationError("sizing.max_position_pct must be in (0, 1]");
    }
    if (!(vol_floor > 0.0)) {
        throw ConfigurationError("sizing.vol_floor must be positive");
    }
}

PositionSizer::PositionSizer(PositionSizerConfig config)
    : config_(config) {
    config_.validate();
}

double PositionSizer::targetFraction(double strength, double confidence, double realized_vol) const {
    if (!std::isfinite(strength) || !std::isfinite(confidence) || !std::isfinite(realized_vol)) {
        return 0.0;
    }
    const double vol = std::max(realized_vol, config_.vol_floor);
    const double raw_size = (config_.vol_target / vol) * std::abs(strength);
    const double sized = raw_size * std::clamp(confidence, 0.0, 1.0);
    return std::clamp(sized, 0.0, config_.max_position_pct);
}

SizedOrderIntent PositionSizer::size(
    const FusedSignal& signal,
    double realized_vol,
    double equity,
    double price
) const {
    SizedOrderIntent intent;
    intent.symbol = signal.symbol;
    intent.side = (signal.direction == Direction::SHORT) ? OrderSide::SELL : OrderSide::BUY;
    intent.signal_strength = signal.strength;
    intent.signal_regime = signal.regime;

    if (signal.direction == Direction::FLAT) {
        return intent;
    }
    if (!(price > 0.0) || !std::isfinite(price) || !(equity > 0.0) || !std::isfinite(equity)) {
        LOG_WARN("PositionSizer: zero size for {} (price={}, equity={})", signal.symbol, price, equity);
        return intent;
    }
    if (!std::isfinite(realized_vol)) {
        LOG_WARN("PositionSizer: non-finite realized vol for {}, zero size", signal.symbol);
        return intent;
    }

    const double fraction = targetFraction(signal.strength, signal.confidence, realized_vol);

    intent.notional_pct_of_equity = fraction;
    intent.quantity = fraction * equity / price;
    return intent;
}

} // namespace risk
} // namespace regimegate
