#pragma once

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backtest/DecisionPolicy.h"
#include "backtest/FillSimulator.h"
#include "backtest/PerformanceMetrics.h"
#include "common/Types.h"
#include "risk/RiskChecker.h"

namespace regimegate {
namespace backtest {

struct BacktestConfig {
    double initial_capital = 100000.0;
    FillSimulatorConfig fills;
    risk::RiskCheckerConfig risk;
    double periods_per_year = PerformanceMetrics::kDefaultPeriodsPerYear;
    bool record_event_log = true;

    // Throws ConfigurationError.
    void validate() const;
};

enum class BacktestEventType { BAR_CLOSE, SIGNAL, ORDER, FILL };

const char* backtestEventTypeToString(BacktestEventType type);

struct BacktestEvent {
    BacktestEventType type = BacktestEventType::BAR_CLOSE;
    TimestampMs timestamp = 0;
    std::string symbol;
    std::string detail;
};

struct BacktestResult {
    std::string policy_name;
    std::vector<PortfolioSnapshot> equity_curve;     // one per distinct timestamp
    std::vector<double> returns;
    std::vector<ClosedTrade> trades;
    std::vector<Order> orders;
    std::vector<Fill> fills;
    std::map<std::string, int> rejection_counts;     // by reason code
    std::vector<BacktestEvent> event_log;
    PerformanceReport metrics;
    bool kill_switch_tripped = false;
    size_t bars_processed = 0;
    size_t signals_generated = 0;
};

// Event-driven simulation. Bars are processed in (timestamp, symbol) order
// and every bar goes through one dispatcher in the fixed order
// BAR_CLOSE -> SIGNAL -> ORDER -> FILL. Each run() builds its own portfolio,
// kill switch and risk checker, so concurrent runs share nothing mutable.
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config = BacktestConfig());

    BacktestResult run(const std::vector<Bar>& bars, IDecisionPolicy& policy) const;

    const BacktestConfig& config() const { return config_; }

private:
    BacktestConfig config_;
};

} // namespace backtest
} // namespace regimegate
