#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"

namespace regimegate {
namespace signals {

struct RegimeWeights {
    double technical = 0.0;
    double ml = 0.0;
    double sentiment = 0.0;

    double of(SignalSource source) const;
    double sum() const { return technical + ml + sentiment; }
};

struct SignalFusionConfig {
    std::map<Regime, RegimeWeights> weights{
        {Regime::TRENDING, {0.4, 0.5, 0.1}},
        {Regime::MEAN_REVERTING, {0.5, 0.3, 0.2}},
        {Regime::CHOPPY, {0.3, 0.3, 0.4}},
    };
    double choppy_scale = 0.3;
    double direction_threshold = 0.05;

    // Every regime needs a non-negative triple summing to 1.0 (1e-6).
    // Throws ConfigurationError.
    void validate() const;
};

// Regime-gated mixture of experts. Stateless: fuse() depends only on its arguments.
class SignalFusion {
public:
    explicit SignalFusion(SignalFusionConfig config = SignalFusionConfig());

    // Sources absent from `components` (or with a non-finite score) count as 0
    // and their weight is redistributed proportionally over the present ones.
    FusedSignal fuse(const std::string& symbol,
                     const std::vector<ComponentSignal>& components,
                     Regime regime,
                     double confidence,
                     TimestampMs timestamp) const;

    static Direction directionFor(double strength, double threshold);

    const SignalFusionConfig& config() const { return config_; }

private:
    SignalFusionConfig config_;
};

} // namespace signals
} // namespace regimegate
