#include "signals/TechnicalScorer.h"

#include <algorithm>
#include <cmath>

namespace regimegate {
namespace signals {

namespace {
double clipUnit(double value) {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, -1.0, 1.0);
}
}

double TechnicalScorer::score(const core::FeatureVector& features) {
    const double rsi_score = clipUnit((50.0 - features.rsi) / 50.0);
    const double bb_score = clipUnit((0.5 - features.bb_pctb) * 2.0);
    const double vwap_score = clipUnit(-features.vwap_dev * 20.0);
    return 0.4 * rsi_score + 0.3 * bb_score + 0.3 * vwap_score;
}

} // namespace signals
} // namespace regimegate
