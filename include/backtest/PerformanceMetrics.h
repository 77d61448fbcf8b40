#pragma once

#include <utility>
#include <vector>

#include "common/Types.h"

namespace regimegate {
namespace backtest {

struct PerformanceReport {
    double total_return = 0.0;
    double annualized_return = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double max_drawdown = 0.0;
    int max_drawdown_duration_bars = 0;
    double hit_rate = 0.0;
    double profit_factor = 0.0;          // +inf with gains and no losses
    int total_trades = 0;
    double calmar_ratio = 0.0;
};

// Annualization defaults to 4h bars: 6 per day, 365 days.
class PerformanceMetrics {
public:
    static constexpr double kDefaultPeriodsPerYear = 6.0 * 365.0;

    // mean / population std * sqrt(periods); 0 for empty or flat returns
    static double sharpe(const std::vector<double>& returns, double periods_per_year = kDefaultPeriodsPerYear);
    // mean / population std of negative returns * sqrt(periods)
    static double sortino(const std::vector<double>& returns, double periods_per_year = kDefaultPeriodsPerYear);
    // (max drawdown fraction, longest run of bars below the running peak)
    static std::pair<double, int> maxDrawdown(const std::vector<double>& equity);
    static double hitRate(const std::vector<double>& trade_pnls);
    static double profitFactor(const std::vector<double>& trade_pnls);

    static std::vector<double> periodReturns(const std::vector<double>& equity);

    static PerformanceReport compute(const std::vector<double>& equity,
                                     const std::vector<double>& returns,
                                     const std::vector<ClosedTrade>& trades,
                                     double periods_per_year = kDefaultPeriodsPerYear);
};

} // namespace backtest
} // namespace regimegate
