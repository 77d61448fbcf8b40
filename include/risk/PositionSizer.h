#pragma once

#include "common/Types.h"

namespace regimegate {
namespace risk {

struct PositionSizerConfig {
    double vol_target = 0.15;          // annualized
    double max_position_pct = 0.25;
    double vol_floor = 1e-4;

    // Throws ConfigurationError.
    void validate() const;
};

// Volatility-targeted sizing:
//   fraction = min((vol_target / max(vol, floor)) * |strength| * confidence, max_position_pct)
//   quantity = fraction * equity / price
class PositionSizer {
public:
    explicit PositionSizer(PositionSizerConfig config = PositionSizerConfig());

    // Zero-quantity intent for a FLAT signal, price <= 0, equity <= 0 or a
    // non-finite volatility. Quantity is never negative; side carries direction.
    SizedOrderIntent size(const FusedSignal& signal,
                          double realized_vol,
                          double equity,
                          double price) const;

    // Fraction of equity in [0, max_position_pct].
    double targetFraction(double strength, double confidence, double realized_vol) const;

    const PositionSizerConfig& config() const { return config_; }

private:
    PositionSizerConfig config_;
};

} // namespace risk
} // namespace regimegate
