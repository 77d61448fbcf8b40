#include "backtest/FillSimulator.h"

#include "common/Errors.h"

#include <algorithm>
#include <cmath>

namespace regimegate {
namespace backtest {

void FillSimulatorConfig::validate() const {
    if (fill_latency_bars < 0) {
        throw ConfigurationError("fill_latency_bars must be >= 0");
    }
    if (!(partial_fill_fraction > 0.0) || partial_fill_fraction > 1.0) {
        throw ConfigurationError("partial_fill_fraction must be in (0, 1]");
    }
    if (!(max_participation > 0.0)) {
        throw ConfigurationError("max_participation must be positive");
    }
    if (cancel_after_bars < 1) {
        throw ConfigurationError("cancel_after_bars must be >= 1");
    }
    if (spread_bps < 0.0 || impact_bps < 0.0 || maker_fee_bps < 0.0 || taker_fee_bps < 0.0) {
        throw ConfigurationError("spread, impact and fee settings must be >= 0");
    }
}

FillSimulator::FillSimulator(FillSimulatorConfig config)
    : config_(config) {
    config_.validate();
}

double FillSimulator::fillQuantity(double remaining, double bar_volume) const {
    if (!(remaining > 0.0) || !(bar_volume > 0.0)) {
        return 0.0;
    }
    if (remaining > config_.max_participation * bar_volume) {
        return remaining * config_.partial_fill_fraction;
    }
    return remaining;
}

double FillSimulator::marketPrice(OrderSide side, double close, double quantity, double bar_volume) const {
    const double half_spread = config_.spread_bps / 2.0 / 10000.0;
    const double impact = (bar_volume > 0.0)
        ? config_.impact_bps / 10000.0 * (quantity / bar_volume)
        : 0.0;
    const double cost = half_spread + impact;
    return (side == OrderSide::BUY) ? close * (1.0 + cost) : close * (1.0 - cost);
}

double FillSimulator::feeRate(OrderType type) const {
    const double bps = (type == OrderType::LIMIT) ? config_.maker_fee_bps : config_.taker_fee_bps;
    return bps / 10000.0;
}

bool FillSimulator::limitTouched(const Order& order, const Bar& bar) {
    if (!order.limit_price) {
        return true;
    }
    const double limit = *order.limit_price;
    return (order.side == OrderSide::BUY) ? bar.low <= limit : bar.high >= limit;
}

std::optional<SimulatedFill> FillSimulator::simulate(const Order& order, const Bar& bar) const {
    const double remaining = order.remainingQty();
    if (remaining <= 1e-12 || !(bar.close > 0.0)) {
        return std::nullopt;
    }
    if (order.type == OrderType::LIMIT && !limitTouched(order, bar)) {
        return std::nullopt;
    }

    SimulatedFill fill;
    fill.quantity = fillQuantity(remaining, bar.volume);
    if (fill.quantity <= 0.0) {
        return std::nullopt;
    }

    if (order.type == OrderType::LIMIT && order.limit_price) {
        fill.price = *order.limit_price;
    } else {
        fill.price = marketPrice(order.side, bar.close, fill.quantity, bar.volume);
    }
    fill.fee = fill.price * fill.quantity * feeRate(order.type);
    return fill;
}

} // namespace backtest
} // namespace regimegate
