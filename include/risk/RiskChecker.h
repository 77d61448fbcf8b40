#pragma once

#include "common/Types.h"
#include "portfolio/PortfolioState.h"
#include "risk/KillSwitch.h"
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace regimegate {
namespace risk {

enum class RiskRejectReason {
    NONE,
    KILL_SWITCH,
    MIN_SIZE,
    POSITION_LIMIT,
    CONCENTRATION_LIMIT,
    STALE_DATA,
    LEVERAGE_LIMIT,
    INVALID_ORDER
};

const char* riskRejectReasonToString(RiskRejectReason reason);

struct RiskCheckerConfig {
    double max_position_pct = 0.25;
    double max_concentration_pct = 0.30;
    double max_portfolio_leverage = 1.0;
    double min_trade_usd = 10.0;
    int staleness_threshold_minutes = 30;
    double max_drawdown_pct = 0.15;
    int metrics_lookback = 60;                  // snapshots used for vol / Sharpe
    double metrics_periods_per_year = 6.0 * 365.0;

    // Throws ConfigurationError.
    void validate() const;
};

struct ProposedOrder {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;
    TimestampMs data_timestamp = 0;   // close time of the bar the decision used
    TimestampMs now = 0;
};

// Rejections are values, not exceptions.
struct RiskDecision {
    bool approved = true;
    RiskRejectReason reason = RiskRejectReason::NONE;
    std::string message;
};

struct PostTradeResult {
    bool breach = false;
    std::string message;
};

// Risk Checker - 주문 전/후 리스크 검증
class RiskChecker {
public:
    RiskChecker(RiskCheckerConfig config, std::shared_ptr<KillSwitch> kill_switch);

    // ===== 주문 전 검증 =====
    // Order: kill switch (short-circuit), min size, position limit,
    // concentration, stale data, leverage. First failure wins.
    RiskDecision checkPreTrade(const ProposedOrder& order, const portfolio::ExposureView& view) const;

    // ===== 체결 후 검증 =====
    // A breach restricts further exposure-increasing orders on the symbol
    // until a later post-trade check on it passes. Nothing is unwound.
    PostTradeResult checkPostTrade(const std::string& symbol, const portfolio::ExposureView& view);

    // Evaluates the kill switch against the snapshot's drawdown. Returns the
    // tripped flag.
    bool onSnapshot(const PortfolioSnapshot& snapshot);

    bool isRestricted(const std::string& symbol) const;
    std::vector<std::string> restrictedSymbols() const;

    // ===== 리스크 메트릭 =====
    RiskMetrics computeMetrics(const std::vector<PortfolioSnapshot>& history,
                               const portfolio::ExposureView& view,
                               double max_drawdown_pct) const;

    std::shared_ptr<KillSwitch> killSwitch() const { return kill_switch_; }
    const RiskCheckerConfig& config() const { return config_; }

private:
    static RiskDecision reject(RiskRejectReason reason, std::string message);

    RiskCheckerConfig config_;
    std::shared_ptr<KillSwitch> kill_switch_;
    mutable std::mutex mutex_;
    std::set<std::string> restricted_;
};

} // namespace risk
} // namespace regimegate
