#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace regimegate {

// All timestamps are epoch milliseconds.
using TimestampMs = long long;

enum class OrderSide { BUY, SELL };
enum class OrderType { LIMIT, MARKET };
enum class OrderStatus { PENDING, SUBMITTED, FILLED, PARTIALLY_FILLED, CANCELLED, REJECTED };

enum class Regime { TRENDING, MEAN_REVERTING, CHOPPY };
enum class Direction { LONG, SHORT, FLAT };
enum class SignalSource { TECHNICAL, ML, SENTIMENT };
enum class PositionSide { LONG, SHORT, FLAT };

struct Bar {
    TimestampMs timestamp = 0;
    std::string symbol;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    Bar() = default;
    Bar(TimestampMs ts, std::string sym, double o, double h, double l, double c, double v)
        : timestamp(ts), symbol(std::move(sym)), open(o), high(h), low(l), close(c), volume(v) {}
};

struct RegimeState {
    Regime regime = Regime::CHOPPY;
    double confidence = 0.0;   // posterior probability of the current state
    TimestampMs timestamp = 0;
    std::string symbol;
};

struct ComponentSignal {
    SignalSource source = SignalSource::TECHNICAL;
    double score = 0.0;        // [-1, 1]
    TimestampMs timestamp = 0;
};

struct FusedSignal {
    std::string symbol;
    Direction direction = Direction::FLAT;
    double strength = 0.0;     // [-1, 1]
    double confidence = 0.0;   // [0, 1]
    Regime regime = Regime::CHOPPY;
    std::map<SignalSource, double> components;
    std::map<SignalSource, double> weights;   // effective weights after redistribution
    TimestampMs timestamp = 0;
};

struct SizedOrderIntent {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double notional_pct_of_equity = 0.0;
    double signal_strength = 0.0;
    Regime signal_regime = Regime::CHOPPY;
};

struct Order {
    std::string order_id;
    std::string symbol;
    std::string exchange;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    double quantity = 0.0;
    std::optional<double> limit_price;
    OrderStatus status = OrderStatus::PENDING;
    double filled_qty = 0.0;
    double avg_fill_price = 0.0;
    double fees = 0.0;
    TimestampMs created_at = 0;
    TimestampMs updated_at = 0;
    double signal_strength = 0.0;
    Regime signal_regime = Regime::CHOPPY;
    std::string reject_reason;
    int fill_count = 0;

    double remainingQty() const { return quantity - filled_qty; }
};

struct Fill {
    std::string order_id;
    int fill_seq = 0;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;
    double fee = 0.0;
    TimestampMs timestamp = 0;

    std::string dedupeKey() const { return order_id + "#" + std::to_string(fill_seq); }
};

struct Position {
    std::string symbol;
    PositionSide side = PositionSide::FLAT;
    double quantity = 0.0;          // signed, negative when short
    double avg_entry_price = 0.0;
    double unrealized_pnl = 0.0;
    double realized_pnl = 0.0;
    double last_price = 0.0;
    TimestampMs updated_at = 0;
};

struct PortfolioSnapshot {
    TimestampMs timestamp = 0;
    double equity = 0.0;
    double cash = 0.0;
    double positions_value = 0.0;
    double unrealized_pnl = 0.0;
    double realized_pnl = 0.0;
    double drawdown_pct = 0.0;
};

// One reducing fill, entry to exit.
struct ClosedTrade {
    std::string symbol;
    std::string order_id;
    PositionSide side = PositionSide::LONG;
    double quantity = 0.0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double pnl = 0.0;
    double return_pct = 0.0;
    TimestampMs entry_time = 0;
    TimestampMs exit_time = 0;
};

struct RiskMetrics {
    TimestampMs timestamp = 0;
    double current_drawdown_pct = 0.0;
    double max_drawdown_pct = 0.0;
    double portfolio_vol = 0.0;
    std::optional<double> sharpe_ratio;
    double concentration_pct = 0.0;
    bool kill_switch_active = false;
};

inline const char* regimeToString(Regime regime) {
    switch (regime) {
        case Regime::TRENDING: return "TRENDING";
        case Regime::MEAN_REVERTING: return "MEAN_REVERTING";
        case Regime::CHOPPY: return "CHOPPY";
    }
    return "CHOPPY";
}

inline const char* directionToString(Direction direction) {
    switch (direction) {
        case Direction::LONG: return "LONG";
        case Direction::SHORT: return "SHORT";
        case Direction::FLAT: return "FLAT";
    }
    return "FLAT";
}

inline const char* signalSourceToString(SignalSource source) {
    switch (source) {
        case SignalSource::TECHNICAL: return "technical";
        case SignalSource::ML: return "ml";
        case SignalSource::SENTIMENT: return "sentiment";
    }
    return "technical";
}

inline const char* positionSideToString(PositionSide side) {
    switch (side) {
        case PositionSide::LONG: return "long";
        case PositionSide::SHORT: return "short";
        case PositionSide::FLAT: return "flat";
    }
    return "flat";
}

} // namespace regimegate
