#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/RegimeFeatures.h"
#include "core/model/CollaboratorTypes.h"

namespace regimegate {
namespace core {

class IFeatureProvider {
public:
    virtual ~IFeatureProvider() = default;

    // Features of the latest bar closed at or before `timestamp`.
    virtual std::optional<FeatureVector> getFeatures(const std::string& symbol, TimestampMs timestamp) = 0;

    // Up to `count` regime observations ending at or before `timestamp`.
    virtual std::vector<analytics::RegimeFeatureRow> regimeFeatures(
        const std::string& symbol, TimestampMs timestamp, size_t count) = 0;
};

} // namespace core
} // namespace regimegate
