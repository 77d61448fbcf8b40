#pragma once

#include "core/model/CollaboratorTypes.h"

namespace regimegate {
namespace signals {

// Composite contrarian score in [-1, 1]:
//   0.4 * clip((50 - rsi) / 50) + 0.3 * clip((0.5 - %B) * 2) + 0.3 * clip(-vwap_dev * 20)
// A non-finite input contributes 0.
class TechnicalScorer {
public:
    static double score(const core::FeatureVector& features);
};

} // namespace signals
} // namespace regimegate
