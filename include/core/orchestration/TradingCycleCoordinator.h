#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "core/contracts/IFeatureProvider.h"
#include "core/contracts/IModelPredictor.h"
#include "core/contracts/IPersistenceStore.h"
#include "core/contracts/ISentimentProvider.h"
#include "core/orchestration/DecisionPipeline.h"
#include "execution/OrderManager.h"
#include "portfolio/PortfolioState.h"
#include "risk/RiskChecker.h"

namespace regimegate {
namespace core {

struct TradingCycleConfig {
    std::vector<std::string> symbols;
    int collaborator_timeout_ms = 2000;
    analytics::RegimeDetectorConfig detector;
};

enum class CycleOutcome {
    SKIPPED_IN_FLIGHT,
    NO_DATA,
    NO_REGIME,
    NO_TRADE,
    REJECTED,
    SUBMITTED,
    ERROR
};

const char* cycleOutcomeToString(CycleOutcome outcome);

struct SymbolCycleResult {
    std::string symbol;
    CycleOutcome outcome = CycleOutcome::NO_TRADE;
    std::string detail;
    std::optional<risk::RiskRejectReason> reject_reason;
    std::optional<std::string> order_id;
};

struct CycleReport {
    TimestampMs timestamp = 0;
    std::vector<SymbolCycleResult> symbols;
    std::vector<Fill> fills;
    std::optional<PortfolioSnapshot> snapshot;
    bool kill_switch_tripped = false;
};

// One scheduling tick of the live/paper loop:
//   poll fills -> per symbol (skip in-flight) features, regime, collaborators,
//   decision, risk check, submit -> mark, snapshot, kill switch, persist.
class TradingCycleCoordinator {
public:
    TradingCycleCoordinator(
        TradingCycleConfig config,
        std::shared_ptr<IFeatureProvider> feature_provider,
        std::shared_ptr<IModelPredictor> predictor,
        std::shared_ptr<ISentimentProvider> sentiment,
        std::shared_ptr<DecisionPipeline> pipeline,
        std::shared_ptr<risk::RiskChecker> risk_checker,
        std::shared_ptr<::regimegate::execution::OrderManager> order_manager,
        std::shared_ptr<portfolio::PortfolioState> portfolio,
        std::shared_ptr<IPersistenceStore> store
    );

    CycleReport runTick(TimestampMs now);

    // Refits the symbol's detector on the latest train_window observations.
    // Throws InsufficientDataError.
    void retrainSymbol(const std::string& symbol, TimestampMs now);

    std::shared_ptr<analytics::RegimeDetector> detector(const std::string& symbol) const;
    std::optional<RegimeState> latestRegime(const std::string& symbol) const;
    std::optional<FusedSignal> latestSignal(const std::string& symbol) const;

    const std::vector<std::string>& symbols() const { return config_.symbols; }

private:
    SymbolCycleResult runSymbol(const std::string& symbol, TimestampMs now, std::vector<Fill>& fills);
    void applyFills(const std::vector<Fill>& fills);
    std::optional<QuantilePrediction> predictWithTimeout(const std::string& symbol, const FeatureVector& features);
    std::optional<double> sentimentWithTimeout(const std::string& symbol);

    TradingCycleConfig config_;
    std::shared_ptr<IFeatureProvider> feature_provider_;
    std::shared_ptr<IModelPredictor> predictor_;
    std::shared_ptr<ISentimentProvider> sentiment_;
    std::shared_ptr<DecisionPipeline> pipeline_;
    std::shared_ptr<risk::RiskChecker> risk_checker_;
    std::shared_ptr<::regimegate::execution::OrderManager> order_manager_;
    std::shared_ptr<portfolio::PortfolioState> portfolio_;
    std::shared_ptr<IPersistenceStore> store_;

    std::map<std::string, std::shared_ptr<analytics::RegimeDetector>> detectors_;

    mutable std::mutex state_mutex_;
    std::map<std::string, RegimeState> latest_regime_;
    std::map<std::string, FusedSignal> latest_signal_;
};

} // namespace core
} // namespace regimegate
