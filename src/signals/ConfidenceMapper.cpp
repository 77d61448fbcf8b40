#include "signals/ConfidenceMapper.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>

namespace regimegate {
namespace signals {

ConfidenceMapper::ConfidenceMapper(ConfidenceMapperConfig config)
    : config_(config) {
    if (!std::isfinite(config_.min_iqr) || !std::isfinite(config_.max_iqr) ||
        config_.min_iqr < 0.0 || config_.min_iqr >= config_.max_iqr) {
        throw ConfigurationError("confidence mapping requires 0 <= min_iqr < max_iqr");
    }
}

double ConfidenceMapper::fromIqr(double iqr) const {
    if (!std::isfinite(iqr)) {
        return 0.0;
    }
    const double scaled = 1.0 - (iqr - config_.min_iqr) / (config_.max_iqr - config_.min_iqr);
    return std::clamp(scaled, 0.0, 1.0);
}

double ConfidenceMapper::fromPrediction(const core::QuantilePrediction& prediction) const {
    return fromIqr(std::abs(prediction.iqr()));
}

double ConfidenceMapper::mlScore(const core::QuantilePrediction& prediction) {
    return std::clamp(static_cast<double>(prediction.label - 1), -1.0, 1.0);
}

} // namespace signals
} // namespace regimegate
