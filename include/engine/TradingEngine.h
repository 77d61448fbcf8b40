#pragma once

#include "common/Types.h"
#include "core/contracts/IExecutionAdapter.h"
#include "core/contracts/IFeatureProvider.h"
#include "core/contracts/IKillSwitchStore.h"
#include "core/contracts/IModelPredictor.h"
#include "core/contracts/IPersistenceStore.h"
#include "core/contracts/ISentimentProvider.h"
#include "core/orchestration/TradingCycleCoordinator.h"
#include "engine/EngineConfig.h"
#include "execution/OrderManager.h"
#include "portfolio/PortfolioState.h"
#include "risk/KillSwitch.h"
#include "risk/RiskChecker.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace regimegate {
namespace engine {

enum class RetrainStatus {
    STARTED,
    ALREADY_RUNNING
};

const char* retrainStatusToString(RetrainStatus status);

struct EngineDependencies {
    std::shared_ptr<core::IFeatureProvider> feature_provider;
    std::shared_ptr<core::IModelPredictor> predictor;          // optional
    std::shared_ptr<core::ISentimentProvider> sentiment;       // optional
    std::shared_ptr<core::IPersistenceStore> store;
    std::shared_ptr<core::IKillSwitchStore> kill_switch_store;
    std::shared_ptr<core::IExecutionAdapter> execution_adapter;   // LIVE only
};

struct EngineStatus {
    TradingMode mode = TradingMode::PAPER;
    bool running = false;
    bool retraining = false;
    long long ticks = 0;
    core::KillSwitchRecord kill_switch;
    std::optional<PortfolioSnapshot> snapshot;
    std::optional<RiskMetrics> risk;
    size_t active_orders = 0;
    std::vector<Position> positions;
    std::vector<std::string> restricted_symbols;
    std::map<std::string, RegimeState> regimes;
    std::map<std::string, FusedSignal> signals;
};

using Clock = std::function<TimestampMs()>;

// Trading Engine - live/paper 스케줄링
//   decision thread: one TradingCycleCoordinator tick per tick_interval,
//                    retrain request every retrain_interval
//   health thread:   risk metrics from the last committed snapshots
//   retrain thread:  detector refits, one at a time
class TradingEngine {
public:
    // Throws ConfigurationError for BACKTEST mode, missing dependencies or
    // LIVE without an execution adapter.
    TradingEngine(const EngineConfig& config, EngineDependencies deps, Clock clock = nullptr);

    ~TradingEngine();

    // ===== 엔진 제어 =====
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // One decision cycle on the caller's thread.
    core::CycleReport runOnce();

    // One health pass on the caller's thread. Persists and caches the metrics.
    RiskMetrics updateHealth();

    // ===== 재학습 =====
    RetrainStatus requestRetrain();
    bool isRetraining() const { return retrain_running_; }
    void waitForRetrain();

    // ===== 운영자 조회 =====
    std::optional<RegimeState> currentRegime(const std::string& symbol) const;
    std::optional<FusedSignal> latestSignal(const std::string& symbol) const;
    std::optional<RiskMetrics> latestRiskMetrics() const;
    core::KillSwitchRecord killSwitchState() const;
    EngineStatus status() const;

    // Re-arms the kill switch and rebases the drawdown peak to current equity.
    // Throws PersistenceError if the reset cannot be saved.
    void resetKillSwitch(const std::string& operator_name, const std::string& note);

    std::shared_ptr<portfolio::PortfolioState> portfolio() const { return portfolio_; }
    std::shared_ptr<risk::RiskChecker> riskChecker() const { return risk_checker_; }
    std::shared_ptr<core::TradingCycleCoordinator> coordinator() const { return coordinator_; }

private:
    void runDecisionLoop();
    void runHealthLoop();
    void runRetrain(TimestampMs now);
    bool waitFor(std::chrono::milliseconds duration);   // false once stopping
    TimestampMs now() const;
    double restoreStartingCash() const;

    EngineConfig config_;
    EngineDependencies deps_;
    Clock clock_;

    std::shared_ptr<risk::KillSwitch> kill_switch_;
    std::shared_ptr<risk::RiskChecker> risk_checker_;
    std::shared_ptr<portfolio::PortfolioState> portfolio_;
    std::shared_ptr<core::DecisionPipeline> pipeline_;
    std::shared_ptr<execution::OrderManager> order_manager_;
    std::shared_ptr<core::TradingCycleCoordinator> coordinator_;

    // 스레드 제어
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> decision_thread_;
    std::unique_ptr<std::thread> health_thread_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    std::mutex retrain_mutex_;
    std::atomic<bool> retrain_running_{false};
    std::unique_ptr<std::thread> retrain_thread_;

    std::mutex tick_mutex_;                 // one decision cycle at a time
    mutable std::mutex metrics_mutex_;
    std::optional<RiskMetrics> latest_metrics_;
    std::atomic<long long> ticks_{0};
};

} // namespace engine
} // namespace regimegate
