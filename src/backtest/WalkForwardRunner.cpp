#include "backtest/WalkForwardRunner.h"

#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <set>

namespace regimegate {
namespace backtest {

namespace {
std::vector<Bar> barsBetween(const std::vector<Bar>& bars, TimestampMs first, TimestampMs last) {
    std::vector<Bar> out;
    for (const auto& bar : bars) {
        if (bar.timestamp >= first && bar.timestamp <= last) {
            out.push_back(bar);
        }
    }
    return out;
}
}

WalkForwardReport runWalkForward(
    const std::vector<Bar>& bars,
    const BacktestEngine& engine,
    const PolicyFactory& make_policy,
    const WalkForwardParams& params
) {
    if (!make_policy) {
        throw ConfigurationError("walk-forward requires a policy factory");
    }

    std::set<TimestampMs> unique_ts;
    for (const auto& bar : bars) {
        unique_ts.insert(bar.timestamp);
    }
    const std::vector<TimestampMs> timestamps(unique_ts.begin(), unique_ts.end());

    auto splits = WalkForwardSplitter::generateSplits(static_cast<int64_t>(timestamps.size()), params);
    LOG_INFO("Walk-forward: {} folds over {} timestamps", splits.size(), timestamps.size());

    WalkForwardReport report;
    std::vector<double> stitched_equity{engine.config().initial_capital};
    std::vector<ClosedTrade> all_trades;
    double sharpe_sum = 0.0;

    for (const auto& split : splits) {
        WalkForwardFold fold;
        fold.split = split;
        fold.train_begin = timestamps[static_cast<size_t>(split.train.begin)];
        fold.train_end = timestamps[static_cast<size_t>(split.train.end - 1)];
        fold.test_begin = timestamps[static_cast<size_t>(split.test.begin)];
        fold.test_end = timestamps[static_cast<size_t>(split.test.end - 1)];

        auto train = barsBetween(bars, fold.train_begin, fold.train_end);
        auto test = barsBetween(bars, fold.test_begin, fold.test_end);
        fold.train_bars = train.size();

        auto policy = make_policy();
        if (!policy) {
            throw ConfigurationError("policy factory returned null");
        }
        policy->prepare(train);
        fold.result = engine.run(test, *policy);

        for (double r : fold.result.returns) {
            report.oos_returns.push_back(r);
            stitched_equity.push_back(stitched_equity.back() * (1.0 + r));
        }
        all_trades.insert(all_trades.end(), fold.result.trades.begin(), fold.result.trades.end());
        sharpe_sum += fold.result.metrics.sharpe_ratio;
        if (fold.result.kill_switch_tripped) {
            ++report.folds_with_kill_switch;
        }

        LOG_INFO("Fold {}: train [{}, {}) test [{}, {}) return={:.2f}% sharpe={:.3f}",
                 split.fold, split.train.begin, split.train.end, split.test.begin, split.test.end,
                 fold.result.metrics.total_return * 100.0, fold.result.metrics.sharpe_ratio);
        report.folds.push_back(std::move(fold));
    }

    if (!report.folds.empty()) {
        report.mean_fold_sharpe = sharpe_sum / static_cast<double>(report.folds.size());
    }
    report.oos_metrics = PerformanceMetrics::compute(
        stitched_equity, report.oos_returns, all_trades, engine.config().periods_per_year);
    return report;
}

} // namespace backtest
} // namespace regimegate
