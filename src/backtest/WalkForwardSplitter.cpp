#include "backtest/WalkForwardSplitter.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <string>

namespace regimegate {
namespace backtest {

std::vector<WalkForwardSplit> WalkForwardSplitter::generateSplits(
    int64_t history_len,
    int64_t train_window,
    int64_t test_window,
    int64_t purge_gap,
    int64_t embargo_gap
) {
    if (train_window <= 0 || test_window <= 0) {
        throw InvalidWindowError("train and test windows must be positive");
    }
    if (purge_gap < 0 || embargo_gap < 0) {
        throw InvalidWindowError("purge and embargo gaps must be non-negative");
    }
    if (train_window + purge_gap + test_window > history_len) {
        throw InvalidWindowError("history of " + std::to_string(history_len) +
                                 " bars is too short for one split of " +
                                 std::to_string(train_window + purge_gap + test_window));
    }

    std::vector<WalkForwardSplit> splits;
    int64_t start = 0;
    while (true) {
        const int64_t train_end = start + train_window;
        const int64_t test_begin = train_end + purge_gap;
        const int64_t test_end = test_begin + test_window;
        if (test_end > history_len) {
            break;
        }

        WalkForwardSplit split;
        split.fold = static_cast<int>(splits.size());
        split.train = {start, train_end};
        split.test = {test_begin, test_end};
        splits.push_back(split);

        start = test_end + embargo_gap;
    }

    LOG_DEBUG("Walk-forward: {} folds over {} bars (train={}, test={}, purge={}, embargo={})",
              splits.size(), history_len, train_window, test_window, purge_gap, embargo_gap);
    return splits;
}

std::vector<WalkForwardSplit> WalkForwardSplitter::generateSplits(int64_t history_len,
                                                                  const WalkForwardParams& params) {
    return generateSplits(history_len, params.train_window, params.test_window,
                          params.purge_gap, params.embargo_gap);
}

} // namespace backtest
} // namespace regimegate
