#include "core/orchestration/DecisionPipeline.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "signals/TechnicalScorer.h"

#include <cmath>

namespace regimegate {
namespace core {

void DecisionPipelineConfig::validate() const {
    if (rebalance_band_pct < 0.0 || rebalance_band_pct >= 1.0) {
        throw ConfigurationError("decision.rebalance_band_pct must be in [0, 1)");
    }
    if (default_confidence < 0.0 || default_confidence > 1.0) {
        throw ConfigurationError("decision.default_confidence must be in [0, 1]");
    }
    if (!(fallback_vol > 0.0)) {
        throw ConfigurationError("decision.fallback_vol must be positive");
    }
}

DecisionPipeline::DecisionPipeline(
    DecisionPipelineConfig config,
    signals::SignalFusion fusion,
    risk::PositionSizer sizer,
    signals::ConfidenceMapper confidence_mapper
)
    : config_(config)
    , fusion_(std::move(fusion))
    , sizer_(std::move(sizer))
    , confidence_mapper_(confidence_mapper) {
    config_.validate();
}

std::vector<ComponentSignal> DecisionPipeline::components(const DecisionInputs& inputs) const {
    const TimestampMs ts = inputs.features.timestamp;
    std::vector<ComponentSignal> out;
    out.push_back({SignalSource::TECHNICAL, signals::TechnicalScorer::score(inputs.features), ts});
    if (inputs.prediction) {
        out.push_back({SignalSource::ML, signals::ConfidenceMapper::mlScore(*inputs.prediction), ts});
    }
    if (inputs.sentiment) {
        out.push_back({SignalSource::SENTIMENT, *inputs.sentiment, ts});
    }
    return out;
}

double DecisionPipeline::confidence(const DecisionInputs& inputs) const {
    if (!inputs.prediction) {
        return config_.default_confidence;
    }
    return confidence_mapper_.fromPrediction(*inputs.prediction);
}

Decision DecisionPipeline::decide(const DecisionInputs& inputs) const {
    const FeatureVector& features = inputs.features;

    Decision decision;
    decision.signal = fusion_.fuse(features.symbol,
                                   components(inputs),
                                   inputs.regime.regime,
                                   confidence(inputs),
                                   features.timestamp);

    const double vol = std::isfinite(features.realized_vol) ? features.realized_vol : config_.fallback_vol;
    decision.sized = sizer_.size(decision.signal, vol, inputs.equity, features.close);

    switch (decision.signal.direction) {
        case Direction::LONG:
            decision.target_qty = decision.sized.quantity;
            break;
        case Direction::SHORT:
            decision.target_qty = config_.allow_short ? -decision.sized.quantity : 0.0;
            break;
        case Direction::FLAT:
            // hold whatever is on
            decision.target_qty = inputs.current_qty;
            break;
    }
    decision.delta_qty = decision.target_qty - inputs.current_qty;

    const double delta_notional = std::abs(decision.delta_qty) * features.close;
    if (!(features.close > 0.0) || !(inputs.equity > 0.0) ||
        delta_notional <= config_.rebalance_band_pct * inputs.equity) {
        return decision;
    }

    SizedOrderIntent order = decision.sized;
    order.side = (decision.delta_qty > 0.0) ? OrderSide::BUY : OrderSide::SELL;
    order.quantity = std::abs(decision.delta_qty);
    order.notional_pct_of_equity = delta_notional / inputs.equity;
    order.signal_strength = decision.signal.strength;
    order.signal_regime = decision.signal.regime;
    decision.order = order;

    LOG_DEBUG("{} {} strength={:.4f} target={:.8f} current={:.8f}",
              features.symbol, directionToString(decision.signal.direction),
              decision.signal.strength, decision.target_qty, inputs.current_qty);
    return decision;
}

} // namespace core
} // namespace regimegate
