#pragma once

#include <array>
#include <string>

#include "common/Types.h"

namespace regimegate {
namespace core {

struct FeatureVector {
    std::string symbol;
    TimestampMs timestamp = 0;   // close time of the bar the features describe
    double close = 0.0;
    double log_return = 0.0;
    double realized_vol = 0.0;
    double rsi = 50.0;
    double atr = 0.0;
    double bb_pctb = 0.5;
    double vwap_dev = 0.0;       // (close - vwap) / vwap
};

struct QuantilePrediction {
    std::array<double, 5> quantiles{};   // q10, q25, q50, q75, q90
    int label = 1;                       // 0 down, 1 flat, 2 up
    double label_confidence = 0.0;

    double iqr() const { return quantiles[3] - quantiles[1]; }
};

struct ExecutionAck {
    bool accepted = false;
    std::string exchange_order_id;
    std::string reject_reason;
};

// Cumulative state reported by an exchange adapter for one order.
struct ExecutionReport {
    std::string order_id;
    std::string state;                   // adapter vocabulary: wait, trade, done, cancel, ...
    double cumulative_filled_qty = 0.0;
    double avg_fill_price = 0.0;
    double cumulative_fee = 0.0;
    TimestampMs timestamp = 0;
};

enum class KillSwitchState { ARMED, TRIPPED };

inline const char* killSwitchStateToString(KillSwitchState state) {
    return (state == KillSwitchState::TRIPPED) ? "TRIPPED" : "ARMED";
}

struct KillSwitchRecord {
    int schema_version = 1;
    KillSwitchState state = KillSwitchState::ARMED;
    TimestampMs changed_at = 0;
    std::string reason;
    std::string actor;           // "system" for trips, operator name for resets
    std::string note;
    double trip_drawdown_pct = 0.0;
    TimestampMs last_reset_at = 0;   // drawdown peak is seeded from snapshots after this
};

} // namespace core
} // namespace regimegate
