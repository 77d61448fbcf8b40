#pragma once

#include <optional>

#include "common/Types.h"

namespace regimegate {
namespace backtest {

struct FillSimulatorConfig {
    int fill_latency_bars = 1;           // order at bar N first fills at bar N + latency
    double partial_fill_fraction = 0.5;  // share of the remainder filled when above participation
    double max_participation = 0.1;      // liquidity proxy: share of bar volume
    int cancel_after_bars = 3;           // fill attempts before the remainder is cancelled
    double spread_bps = 5.0;             // full spread; half is paid per side
    double impact_bps = 2.0;             // per unit of qty / bar volume
    double maker_fee_bps = 10.0;
    double taker_fee_bps = 10.0;

    // Throws ConfigurationError.
    void validate() const;
};

struct SimulatedFill {
    double quantity = 0.0;
    double price = 0.0;
    double fee = 0.0;
};

// Deterministic fill model for one order against one bar.
class FillSimulator {
public:
    explicit FillSimulator(FillSimulatorConfig config = FillSimulatorConfig());

    // nullopt when nothing fills on this bar (no volume, limit not touched).
    std::optional<SimulatedFill> simulate(const Order& order, const Bar& bar) const;

    double fillQuantity(double remaining, double bar_volume) const;
    // Market orders: close * (1 +/- (half_spread + impact)). Buys pay up.
    double marketPrice(OrderSide side, double close, double quantity, double bar_volume) const;
    double feeRate(OrderType type) const;
    static bool limitTouched(const Order& order, const Bar& bar);

    const FillSimulatorConfig& config() const { return config_; }

private:
    FillSimulatorConfig config_;
};

} // namespace backtest
} // namespace regimegate
