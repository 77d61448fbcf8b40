#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/CollaboratorTypes.h"
#include "risk/PositionSizer.h"
#include "signals/ConfidenceMapper.h"
#include "signals/SignalFusion.h"

namespace regimegate {
namespace core {

struct DecisionPipelineConfig {
    bool allow_short = false;            // spot: SHORT only flattens longs
    double rebalance_band_pct = 0.02;    // skip trades smaller than this share of equity
    double default_confidence = 0.5;     // used when no prediction is available
    double fallback_vol = 0.3;           // used when realized vol is not finite

    // Throws ConfigurationError.
    void validate() const;
};

struct DecisionInputs {
    FeatureVector features;
    RegimeState regime;
    std::optional<QuantilePrediction> prediction;
    std::optional<double> sentiment;
    double equity = 0.0;
    double current_qty = 0.0;            // signed
};

struct Decision {
    FusedSignal signal;
    SizedOrderIntent sized;              // sizer output for the full target
    double target_qty = 0.0;             // signed
    double delta_qty = 0.0;
    std::optional<SizedOrderIntent> order;   // trade to send, if any
};

// Regime -> components -> fusion -> sizing -> delta against the current
// position. Shared by the live loop and the backtest policy.
class DecisionPipeline {
public:
    DecisionPipeline(DecisionPipelineConfig config,
                     signals::SignalFusion fusion,
                     risk::PositionSizer sizer,
                     signals::ConfidenceMapper confidence_mapper = signals::ConfidenceMapper());

    Decision decide(const DecisionInputs& inputs) const;

    std::vector<ComponentSignal> components(const DecisionInputs& inputs) const;
    double confidence(const DecisionInputs& inputs) const;

    const DecisionPipelineConfig& config() const { return config_; }
    const signals::SignalFusion& fusion() const { return fusion_; }
    const risk::PositionSizer& sizer() const { return sizer_; }

private:
    DecisionPipelineConfig config_;
    signals::SignalFusion fusion_;
    risk::PositionSizer sizer_;
    signals::ConfidenceMapper confidence_mapper_;
};

} // namespace core
} // namespace regimegate
