#pragma once

#include <vector>
#include "common/Types.h"

namespace regimegate {
namespace analytics {

// One HMM observation.
struct RegimeFeatureRow {
    TimestampMs timestamp = 0;
    double log_return = 0.0;
    double realized_vol = 0.0;   // annualized
};

class RegimeFeatures {
public:
    // Builds [log_return, realized_vol] rows from a bar series of one symbol.
    // Bars with a non-positive close or a non-increasing timestamp are skipped.
    // Each log return is rescaled by sqrt(nominal_spacing / actual_spacing),
    // nominal being the median spacing, so gaps do not inflate volatility.
    // The first row is emitted once `vol_window` returns are available.
    static std::vector<RegimeFeatureRow> fromBars(const std::vector<Bar>& bars,
                                                  int vol_window,
                                                  double bars_per_year);

    // Drops rows with non-finite values.
    static std::vector<RegimeFeatureRow> finiteRows(const std::vector<RegimeFeatureRow>& rows);
};

} // namespace analytics
} // namespace regimegate
