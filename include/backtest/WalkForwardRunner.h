#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "backtest/BacktestEngine.h"
#include "backtest/WalkForwardSplitter.h"

namespace regimegate {
namespace backtest {

struct WalkForwardFold {
    WalkForwardSplit split;
    TimestampMs train_begin = 0;
    TimestampMs train_end = 0;     // last train timestamp, inclusive
    TimestampMs test_begin = 0;
    TimestampMs test_end = 0;      // last test timestamp, inclusive
    size_t train_bars = 0;
    BacktestResult result;
};

struct WalkForwardReport {
    std::vector<WalkForwardFold> folds;
    std::vector<double> oos_returns;        // test-range returns of every fold, in order
    PerformanceReport oos_metrics;          // stitched out-of-sample curve
    double mean_fold_sharpe = 0.0;
    int folds_with_kill_switch = 0;
};

using PolicyFactory = std::function<std::unique_ptr<IDecisionPolicy>()>;

// Split indices refer to the distinct sorted timestamps of `bars`, so every
// symbol of a timestamp lands in the same range. Each fold gets a fresh policy
// that sees only its train range before the test range is backtested.
WalkForwardReport runWalkForward(const std::vector<Bar>& bars,
                                 const BacktestEngine& engine,
                                 const PolicyFactory& make_policy,
                                 const WalkForwardParams& params);

} // namespace backtest
} // namespace regimegate
