#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "backtest/BarFeatureProvider.h"
#include "backtest/FillSimulator.h"
#include "backtest/PerformanceMetrics.h"
#include "backtest/WalkForwardSplitter.h"
#include "core/orchestration/DecisionPipeline.h"
#include "execution/OrderManager.h"
#include "risk/PositionSizer.h"
#include "risk/RiskChecker.h"
#include "signals/ConfidenceMapper.h"
#include "signals/SignalFusion.h"

namespace regimegate {
namespace engine {

// 거래 모드
enum class TradingMode {
    LIVE,           // 실전 거래 (execution adapter 필요)
    PAPER,          // 모의 거래
    BACKTEST        // 백테스트
};

inline const char* tradingModeToString(TradingMode mode) {
    switch (mode) {
        case TradingMode::LIVE: return "live";
        case TradingMode::PAPER: return "paper";
        case TradingMode::BACKTEST: return "backtest";
    }
    return "paper";
}

inline std::optional<TradingMode> tradingModeFromString(const std::string& value) {
    if (value == "live" || value == "LIVE") return TradingMode::LIVE;
    if (value == "paper" || value == "PAPER") return TradingMode::PAPER;
    if (value == "backtest" || value == "BACKTEST") return TradingMode::BACKTEST;
    return std::nullopt;
}

struct MonteCarloSettings {
    int n_sims = 1000;
    int block_size = 20;
    uint64_t seed = 42;
    double perturb_pct = 0.20;
    int perturb_sets = 100;
    double collapse_ratio = 0.5;
};

// 엔진 설정
struct EngineConfig {
    TradingMode mode = TradingMode::PAPER;
    std::vector<std::string> symbols{"BTC-USD"};
    double initial_capital = 100000.0;

    // 스케줄링
    int tick_interval_seconds = 4 * 3600;     // one decision cycle per 4h bar
    int health_interval_seconds = 60;
    int retrain_interval_hours = 7 * 24;
    int collaborator_timeout_ms = 2000;

    std::string state_dir = "state";
    std::string log_dir = "logs";
    std::string log_level = "info";

    analytics::RegimeDetectorConfig regime;
    backtest::BarFeatureConfig features;
    signals::SignalFusionConfig fusion;
    signals::ConfidenceMapperConfig confidence;
    risk::PositionSizerConfig sizing;
    core::DecisionPipelineConfig decision;
    risk::RiskCheckerConfig risk;
    execution::OrderManagerConfig execution;

    // 백테스트
    backtest::FillSimulatorConfig fills;
    int refit_interval_bars = 500;
    double periods_per_year = backtest::PerformanceMetrics::kDefaultPeriodsPerYear;
    backtest::WalkForwardParams walk_forward{1000, 100, 3, 2};
    MonteCarloSettings monte_carlo;

    // Throws ConfigurationError.
    void validate() const;
};

} // namespace engine
} // namespace regimegate
