#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "backtest/BarFeatureProvider.h"
#include "core/contracts/IModelPredictor.h"
#include "core/contracts/ISentimentProvider.h"
#include "core/orchestration/DecisionPipeline.h"

namespace regimegate {
namespace backtest {

struct PolicyContext {
    double equity = 0.0;
    double current_qty = 0.0;
    TimestampMs now = 0;
};

struct PolicyDecision {
    std::optional<RegimeState> regime;
    std::optional<FusedSignal> signal;
    std::optional<SizedOrderIntent> order;
    OrderType order_type = OrderType::MARKET;
    std::optional<double> limit_price;
};

// What the backtest runs at SIGNAL. Implementations may keep state across
// bars of one run; a fresh instance is used per run.
class IDecisionPolicy {
public:
    virtual ~IDecisionPolicy() = default;

    virtual std::string name() const = 0;

    // History that precedes the run (walk-forward train range). Default: ignored.
    virtual void prepare(const std::vector<Bar>& history) { (void)history; }

    // BAR_CLOSE
    virtual void onBar(const Bar& bar) = 0;

    // SIGNAL; nullopt skips the bar.
    virtual std::optional<PolicyDecision> decide(const Bar& bar, const PolicyContext& context) = 0;
};

struct PipelinePolicyConfig {
    analytics::RegimeDetectorConfig detector;
    BarFeatureConfig features;
    int refit_interval_bars = 500;
};

// The live decision pipeline per bar: per-symbol regime detector (refit every
// refit_interval_bars on bars already seen), features, fusion, sizing.
class PipelinePolicy : public IDecisionPolicy {
public:
    PipelinePolicy(PipelinePolicyConfig config,
                   std::shared_ptr<core::DecisionPipeline> pipeline,
                   std::shared_ptr<core::IModelPredictor> predictor = nullptr,
                   std::shared_ptr<core::ISentimentProvider> sentiment = nullptr);

    std::string name() const override { return "pipeline"; }
    void prepare(const std::vector<Bar>& history) override;
    void onBar(const Bar& bar) override;
    std::optional<PolicyDecision> decide(const Bar& bar, const PolicyContext& context) override;

    std::shared_ptr<analytics::RegimeDetector> detector(const std::string& symbol) const;
    int fitCount() const { return fit_count_; }

private:
    bool tryFit(const std::string& symbol, TimestampMs now);

    PipelinePolicyConfig config_;
    std::shared_ptr<core::DecisionPipeline> pipeline_;
    std::shared_ptr<core::IModelPredictor> predictor_;
    std::shared_ptr<core::ISentimentProvider> sentiment_;
    BarFeatureProvider features_;
    std::map<std::string, std::shared_ptr<analytics::RegimeDetector>> detectors_;
    std::map<std::string, int> bars_since_fit_;
    int fit_count_ = 0;
};

// Benchmark: buys target_fraction of equity in each symbol once and holds.
class BuyAndHoldPolicy : public IDecisionPolicy {
public:
    explicit BuyAndHoldPolicy(double target_fraction = 1.0);

    std::string name() const override { return "buy_and_hold"; }
    void onBar(const Bar& bar) override { (void)bar; }
    std::optional<PolicyDecision> decide(const Bar& bar, const PolicyContext& context) override;

private:
    double target_fraction_;
};

} // namespace backtest
} // namespace regimegate
