#include "backtest/DecisionPolicy.h"

#include "common/Errors.h"
#include "common/Logger.h"

#include <cmath>

namespace regimegate {
namespace backtest {

PipelinePolicy::PipelinePolicy(
    PipelinePolicyConfig config,
    std::shared_ptr<core::DecisionPipeline> pipeline,
    std::shared_ptr<core::IModelPredictor> predictor,
    std::shared_ptr<core::ISentimentProvider> sentiment
)
    : config_(config)
    , pipeline_(std::move(pipeline))
    , predictor_(std::move(predictor))
    , sentiment_(std::move(sentiment))
    , features_(config.features) {
    config_.detector.validate();
    if (!pipeline_) {
        throw ConfigurationError("pipeline policy requires a decision pipeline");
    }
    if (config_.refit_interval_bars < 1) {
        throw ConfigurationError("refit_interval_bars must be >= 1");
    }
}

std::shared_ptr<analytics::RegimeDetector> PipelinePolicy::detector(const std::string& symbol) const {
    auto it = detectors_.find(symbol);
    return (it == detectors_.end()) ? nullptr : it->second;
}

bool PipelinePolicy::tryFit(const std::string& symbol, TimestampMs now) {
    auto& det = detectors_[symbol];
    if (!det) {
        det = std::make_shared<analytics::RegimeDetector>(config_.detector);
    }
    auto rows = features_.regimeFeatures(symbol, now, static_cast<size_t>(config_.detector.train_window));
    try {
        det->fit(rows);
    } catch (const InsufficientDataError& e) {
        LOG_DEBUG("{}: regime fit deferred ({})", symbol, e.what());
        return false;
    }
    bars_since_fit_[symbol] = 0;
    ++fit_count_;
    return true;
}

void PipelinePolicy::prepare(const std::vector<Bar>& history) {
    features_.append(history);
    std::map<std::string, TimestampMs> last_seen;
    for (const auto& bar : history) {
        last_seen[bar.symbol] = bar.timestamp;
    }
    for (const auto& [symbol, ts] : last_seen) {
        if (!tryFit(symbol, ts)) {
            LOG_WARN("{}: not enough training history to fit the regime detector", symbol);
        }
    }
}

void PipelinePolicy::onBar(const Bar& bar) {
    features_.append(bar);
    bars_since_fit_[bar.symbol] += 1;
}

std::optional<PolicyDecision> PipelinePolicy::decide(const Bar& bar, const PolicyContext& context) {
    auto det = detector(bar.symbol);
    const bool due = !det || !det->isFitted() || bars_since_fit_[bar.symbol] >= config_.refit_interval_bars;
    if (due) {
        tryFit(bar.symbol, bar.timestamp);
        det = detector(bar.symbol);
    }
    if (!det || !det->isFitted()) {
        return std::nullopt;
    }

    auto features = features_.getFeatures(bar.symbol, bar.timestamp);
    if (!features) {
        return std::nullopt;
    }

    RegimeState regime;
    try {
        auto window = features_.regimeFeatures(
            bar.symbol, bar.timestamp, static_cast<size_t>(config_.detector.classify_window));
        regime = det->classify(window, bar.symbol);
    } catch (const InsufficientDataError& e) {
        LOG_DEBUG("{}: classify skipped ({})", bar.symbol, e.what());
        return std::nullopt;
    }

    core::DecisionInputs inputs;
    inputs.features = *features;
    inputs.regime = regime;
    if (predictor_) {
        inputs.prediction = predictor_->predict(bar.symbol, *features);
    }
    if (sentiment_) {
        inputs.sentiment = sentiment_->getScore(bar.symbol);
    }
    inputs.equity = context.equity;
    inputs.current_qty = context.current_qty;

    auto decision = pipeline_->decide(inputs);

    PolicyDecision out;
    out.regime = regime;
    out.signal = decision.signal;
    out.order = decision.order;
    return out;
}

BuyAndHoldPolicy::BuyAndHoldPolicy(double target_fraction)
    : target_fraction_(target_fraction) {
    if (!(target_fraction_ > 0.0) || target_fraction_ > 1.0) {
        throw ConfigurationError("buy and hold target fraction must be in (0, 1]");
    }
}

std::optional<PolicyDecision> BuyAndHoldPolicy::decide(const Bar& bar, const PolicyContext& context) {
    if (std::abs(context.current_qty) > 0.0 || !(bar.close > 0.0) || !(context.equity > 0.0)) {
        return std::nullopt;
    }

    SizedOrderIntent intent;
    intent.symbol = bar.symbol;
    intent.side = OrderSide::BUY;
    intent.quantity = target_fraction_ * context.equity / bar.close;
    intent.notional_pct_of_equity = target_fraction_;
    intent.signal_strength = 1.0;
    intent.signal_regime = Regime::TRENDING;

    PolicyDecision out;
    out.order = intent;
    return out;
}

} // namespace backtest
} // namespace regimegate
