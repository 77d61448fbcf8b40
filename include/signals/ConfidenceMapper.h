#pragma once

#include "core/model/CollaboratorTypes.h"

namespace regimegate {
namespace signals {

struct ConfidenceMapperConfig {
    double min_iqr = 0.2;   // at or below: full confidence
    double max_iqr = 1.5;   // at or above: zero confidence
};

// Maps predictor uncertainty (q75 - q25) linearly onto [0, 1].
class ConfidenceMapper {
public:
    // Throws ConfigurationError unless 0 <= min_iqr < max_iqr.
    explicit ConfidenceMapper(ConfidenceMapperConfig config = ConfidenceMapperConfig());

    double fromIqr(double iqr) const;
    double fromPrediction(const core::QuantilePrediction& prediction) const;

    // label 0/1/2 -> -1/0/+1
    static double mlScore(const core::QuantilePrediction& prediction);

private:
    ConfidenceMapperConfig config_;
};

} // namespace signals
} // namespace regimegate
