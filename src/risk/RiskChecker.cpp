#include "risk/RiskChecker.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace regimegate {
namespace risk {

namespace {
constexpr double kLimitTolerance = 1e-9;

std::string pct(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value * 100.0 << "%";
    return oss.str();
}
}

const char* riskRejectReasonToString(RiskRejectReason reason) {
    switch (reason) {
        case RiskRejectReason::NONE: return "none";
        case RiskRejectReason::KILL_SWITCH: return "kill_switch";
        case RiskRejectReason::MIN_SIZE: return "min_size";
        case RiskRejectReason::POSITION_LIMIT: return "position_limit";
        case RiskRejectReason::CONCENTRATION_LIMIT: return "concentration_limit";
        case RiskRejectReason::STALE_DATA: return "stale_data";
        case RiskRejectReason::LEVERAGE_LIMIT: return "leverage_limit";
        case RiskRejectReason::INVALID_ORDER: return "invalid_order";
    }
    return "none";
}

void RiskCheckerConfig::validate() const {
    if (!(max_position_pct > 0.0) || max_position_pct > 1.0) {
        throw ConfigurationError("risk.max_position_pct must be in (0, 1]");
    }
    if (!(max_concentration_pct > 0.0) || max_concentration_pct > 1.0) {
        throw ConfigurationError("risk.max_concentration_pct must be in (0, 1]");
    }
    if (!(max_portfolio_leverage > 0.0)) {
        throw ConfigurationError("risk.max_portfolio_leverage must be positive");
    }
    if (min_trade_usd < 0.0 || staleness_threshold_minutes <= 0) {
        throw ConfigurationError("risk.min_trade_usd / staleness_threshold_minutes out of range");
    }
    if (!(max_drawdown_pct > 0.0) || max_drawdown_pct > 1.0) {
        throw ConfigurationError("risk.max_drawdown_pct must be in (0, 1]");
    }
    if (metrics_lookback < 2 || !(metrics_periods_per_year > 0.0)) {
        throw ConfigurationError("risk metrics lookback settings out of range");
    }
}

RiskChecker::RiskChecker(RiskCheckerConfig config, std::shared_ptr<KillSwitch> kill_switch)
    : config_(config)
    , kill_switch_(std::move(kill_switch)) {
    config_.validate();
    if (!kill_switch_) {
        throw ConfigurationError("risk checker requires a kill switch");
    }
}

RiskDecision RiskChecker::reject(RiskRejectReason reason, std::string message) {
    RiskDecision decision;
    decision.approved = false;
    decision.reason = reason;
    decision.message = std::move(message);
    return decision;
}

RiskDecision RiskChecker::checkPreTrade(const ProposedOrder& order, const portfolio::ExposureView& view) const {
    // 1. Kill switch first; nothing else matters once tripped.
    if (kill_switch_->isTripped()) {
        return reject(RiskRejectReason::KILL_SWITCH, "kill switch is TRIPPED, all trading halted");
    }

    if (!(order.quantity > 0.0) || !std::isfinite(order.quantity) ||
        !(order.price > 0.0) || !std::isfinite(order.price)) {
        return reject(RiskRejectReason::INVALID_ORDER, "order quantity and price must be positive");
    }

    // 2. Minimum trade size
    const double notional = order.quantity * order.price;
    if (notional < config_.min_trade_usd) {
        std::ostringstream oss;
        oss << "notional " << std::fixed << std::setprecision(2) << notional
            << " below minimum " << config_.min_trade_usd;
        return reject(RiskRejectReason::MIN_SIZE, oss.str());
    }

    const double current_qty = view.quantity(order.symbol);
    const double delta = (order.side == OrderSide::BUY) ? order.quantity : -order.quantity;
    const double resulting_qty = current_qty + delta;
    const bool increases_exposure = std::abs(resulting_qty) > std::abs(current_qty) + 1e-12;

    if (increases_exposure) {
        const double equity = view.equity;
        if (!(equity > 0.0)) {
            return reject(RiskRejectReason::POSITION_LIMIT, "non-positive equity");
        }

        // 3. Resulting position size
        const double resulting_exposure = std::abs(resulting_qty) * order.price;
        const double position_pct = resulting_exposure / equity;
        if (position_pct > config_.max_position_pct + kLimitTolerance) {
            return reject(RiskRejectReason::POSITION_LIMIT,
                          "position " + pct(position_pct) + " exceeds max " + pct(config_.max_position_pct));
        }
        if (isRestricted(order.symbol)) {
            return reject(RiskRejectReason::POSITION_LIMIT,
                          order.symbol + " restricted after a post-trade limit breach");
        }

        // 4. Largest single-symbol exposure after the trade
        double largest = resulting_exposure;
        double gross = resulting_exposure;
        for (const auto& [symbol, qty] : view.quantities) {
            if (symbol == order.symbol) continue;
            const double exposure = std::abs(qty) * view.price(symbol);
            largest = std::max(largest, exposure);
            gross += exposure;
        }
        const double concentration = largest / equity;
        if (concentration > config_.max_concentration_pct + kLimitTolerance) {
            return reject(RiskRejectReason::CONCENTRATION_LIMIT,
                          "concentration " + pct(concentration) + " exceeds max " +
                          pct(config_.max_concentration_pct));
        }

        // 5. Data age
        const double age_minutes = static_cast<double>(order.now - order.data_timestamp) / 60000.0;
        if (age_minutes > config_.staleness_threshold_minutes) {
            std::ostringstream oss;
            oss << "data is " << std::fixed << std::setprecision(0) << age_minutes
                << " min old, exceeds " << config_.staleness_threshold_minutes << " min";
            return reject(RiskRejectReason::STALE_DATA, oss.str());
        }

        // 6. Gross leverage
        const double leverage = gross / equity;
        if (leverage > config_.max_portfolio_leverage + kLimitTolerance) {
            return reject(RiskRejectReason::LEVERAGE_LIMIT,
                          "gross leverage " + pct(leverage) + " exceeds max " +
                          pct(config_.max_portfolio_leverage));
        }
        return RiskDecision();
    }

    // Reducing orders are still subject to the data age check.
    const double age_minutes = static_cast<double>(order.now - order.data_timestamp) / 60000.0;
    if (age_minutes > config_.staleness_threshold_minutes) {
        std::ostringstream oss;
        oss << "data is " << std::fixed << std::setprecision(0) << age_minutes
            << " min old, exceeds " << config_.staleness_threshold_minutes << " min";
        return reject(RiskRejectReason::STALE_DATA, oss.str());
    }
    return RiskDecision();
}

PostTradeResult RiskChecker::checkPostTrade(const std::string& symbol, const portfolio::ExposureView& view) {
    PostTradeResult result;
    const double equity = view.equity;
    if (!(equity > 0.0)) {
        result.breach = true;
        result.message = "non-positive equity after fill";
    } else {
        const double position_pct = view.exposure(symbol) / equity;
        const double concentration = view.largestExposure() / equity;
        if (position_pct > config_.max_position_pct + kLimitTolerance) {
            result.breach = true;
            result.message = "position " + pct(position_pct) + " exceeds max " + pct(config_.max_position_pct);
        } else if (concentration > config_.max_concentration_pct + kLimitTolerance) {
            result.breach = true;
            result.message = "concentration " + pct(concentration) + " exceeds max " +
                             pct(config_.max_concentration_pct);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (result.breach) {
        restricted_.insert(symbol);
        LOG_WARN("Post-trade breach on {}: {} (new exposure blocked)", symbol, result.message);
    } else if (restricted_.erase(symbol) > 0) {
        LOG_INFO("Post-trade restriction cleared for {}", symbol);
    }
    return result;
}

bool RiskChecker::onSnapshot(const PortfolioSnapshot& snapshot) {
    return kill_switch_->evaluate(snapshot.drawdown_pct, snapshot.timestamp);
}

bool RiskChecker::isRestricted(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return restricted_.count(symbol) > 0;
}

std::vector<std::string> RiskChecker::restrictedSymbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(restricted_.begin(), restricted_.end());
}

RiskMetrics RiskChecker::computeMetrics(
    const std::vector<PortfolioSnapshot>& history,
    const portfolio::ExposureView& view,
    double max_drawdown_pct
) const {
    RiskMetrics metrics;
    metrics.kill_switch_active = kill_switch_->isTripped();
    metrics.max_drawdown_pct = max_drawdown_pct;
    if (view.equity > 0.0) {
        metrics.concentration_pct = view.largestExposure() / view.equity;
    }
    if (history.empty()) {
        return metrics;
    }

    metrics.timestamp = history.back().timestamp;
    metrics.current_drawdown_pct = history.back().drawdown_pct;
    for (const auto& snapshot : history) {
        metrics.max_drawdown_pct = std::max(metrics.max_drawdown_pct, snapshot.drawdown_pct);
    }

    const size_t lookback = static_cast<size_t>(config_.metrics_lookback);
    const size_t start = (history.size() > lookback) ? history.size() - lookback : 0;
    std::vector<double> returns;
    for (size_t i = start + 1; i < history.size(); ++i) {
        const double prev = history[i - 1].equity;
        if (prev > 0.0) {
            returns.push_back(history[i].equity / prev - 1.0);
        }
    }
    if (returns.size() < 2) {
        return metrics;
    }

    const double mean = analytics::TechnicalIndicators::calculateMean(returns);
    const double std_dev = analytics::TechnicalIndicators::calculateStandardDeviation(returns, mean, true);
    const double annualize = std::sqrt(config_.metrics_periods_per_year);
    metrics.portfolio_vol = std_dev * annualize;
    if (returns.size() >= 5 && std_dev > 0.0) {
        metrics.sharpe_ratio = mean / std_dev * annualize;
    }
    return metrics;
}

} // namespace risk
} // namespace regimegate
