#pragma once

#include <cstdint>
#include <vector>

namespace regimegate {
namespace backtest {

// Half-open [begin, end)
struct IndexRange {
    int64_t begin = 0;
    int64_t end = 0;

    int64_t size() const { return end - begin; }
};

struct WalkForwardSplit {
    int fold = 0;
    IndexRange train;
    IndexRange test;
};

struct WalkForwardParams {
    int64_t train_window = 500;
    int64_t test_window = 100;
    int64_t purge_gap = 3;
    int64_t embargo_gap = 2;
};

// [----train----][purge][----test----][embargo][----train----][purge]...
class WalkForwardSplitter {
public:
    // Throws InvalidWindowError for non-positive windows, negative gaps or a
    // history too short for the first split.
    static std::vector<WalkForwardSplit> generateSplits(int64_t history_len,
                                                        int64_t train_window,
                                                        int64_t test_window,
                                                        int64_t purge_gap,
                                                        int64_t embargo_gap);

    static std::vector<WalkForwardSplit> generateSplits(int64_t history_len, const WalkForwardParams& params);
};

} // namespace backtest
} // namespace regimegate
