#include "backtest/PerformanceMetrics.h"

#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace regimegate {
namespace backtest {

using analytics::TechnicalIndicators;

double PerformanceMetrics::sharpe(const std::vector<double>& returns, double periods_per_year) {
    if (returns.empty()) {
        return 0.0;
    }
    const double mean = TechnicalIndicators::calculateMean(returns);
    const double std_dev = TechnicalIndicators::calculateStandardDeviation(returns, mean);
    if (std_dev <= 1e-15) {
        return 0.0;
    }
    return mean / std_dev * std::sqrt(periods_per_year);
}

double PerformanceMetrics::sortino(const std::vector<double>& returns, double periods_per_year) {
    std::vector<double> downside;
    for (double r : returns) {
        if (r < 0.0) {
            downside.push_back(r);
        }
    }
    if (downside.empty()) {
        return 0.0;
    }
    const double downside_mean = TechnicalIndicators::calculateMean(downside);
    const double downside_std = TechnicalIndicators::calculateStandardDeviation(downside, downside_mean);
    if (downside_std <= 1e-15) {
        return 0.0;
    }
    return TechnicalIndicators::calculateMean(returns) / downside_std * std::sqrt(periods_per_year);
}

std::pair<double, int> PerformanceMetrics::maxDrawdown(const std::vector<double>& equity) {
    if (equity.empty()) {
        return {0.0, 0};
    }
    double peak = equity.front();
    double max_dd = 0.0;
    int duration = 0;
    int max_duration = 0;
    for (double value : equity) {
        peak = std::max(peak, value);
        const double dd = (peak - value) / std::max(peak, 1e-10);
        max_dd = std::max(max_dd, dd);
        if (value < peak) {
            ++duration;
            max_duration = std::max(max_duration, duration);
        } else {
            duration = 0;
        }
    }
    return {max_dd, max_duration};
}

double PerformanceMetrics::hitRate(const std::vector<double>& trade_pnls) {
    if (trade_pnls.empty()) {
        return 0.0;
    }
    const auto wins = std::count_if(trade_pnls.begin(), trade_pnls.end(), [](double p) { return p > 0.0; });
    return static_cast<double>(wins) / static_cast<double>(trade_pnls.size());
}

double PerformanceMetrics::profitFactor(const std::vector<double>& trade_pnls) {
    double gains = 0.0;
    double losses = 0.0;
    for (double p : trade_pnls) {
        if (p > 0.0) gains += p;
        else if (p < 0.0) losses += -p;
    }
    if (losses == 0.0) {
        return (gains > 0.0) ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return gains / losses;
}

std::vector<double> PerformanceMetrics::periodReturns(const std::vector<double>& equity) {
    std::vector<double> returns;
    for (size_t i = 1; i < equity.size(); ++i) {
        returns.push_back(equity[i - 1] > 0.0 ? equity[i] / equity[i - 1] - 1.0 : 0.0);
    }
    return returns;
}

PerformanceReport PerformanceMetrics::compute(
    const std::vector<double>& equity,
    const std::vector<double>& returns,
    const std::vector<ClosedTrade>& trades,
    double periods_per_year
) {
    PerformanceReport report;
    if (!equity.empty() && equity.front() > 0.0) {
        report.total_return = equity.back() / equity.front() - 1.0;
    }

    const double n_years = static_cast<double>(equity.size()) / periods_per_year;
    if (n_years > 0.0 && report.total_return > -1.0) {
        report.annualized_return = std::pow(1.0 + report.total_return, 1.0 / n_years) - 1.0;
    } else if (n_years > 0.0) {
        report.annualized_return = -1.0;
    }

    report.sharpe_ratio = sharpe(returns, periods_per_year);
    report.sortino_ratio = sortino(returns, periods_per_year);
    const auto dd = maxDrawdown(equity);
    report.max_drawdown = dd.first;
    report.max_drawdown_duration_bars = dd.second;

    std::vector<double> pnls;
    pnls.reserve(trades.size());
    for (const auto& trade : trades) {
        pnls.push_back(trade.pnl);
    }
    report.hit_rate = hitRate(pnls);
    report.profit_factor = profitFactor(pnls);
    report.total_trades = static_cast<int>(trades.size());
    report.calmar_ratio = (report.max_drawdown > 0.0) ? report.annualized_return / report.max_drawdown : 0.0;
    return report;
}

} // namespace backtest
} // namespace regimegate
