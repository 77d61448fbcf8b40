#pragma once

#include <optional>
#include <string>

#include "core/model/CollaboratorTypes.h"

namespace regimegate {
namespace core {

class IModelPredictor {
public:
    virtual ~IModelPredictor() = default;

    virtual std::optional<QuantilePrediction> predict(const std::string& symbol,
                                                      const FeatureVector& features) = 0;
};

} // namespace core
} // namespace regimegate
