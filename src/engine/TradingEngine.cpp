#include "engine/TradingEngine.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "core/execution/ExecutionUpdateSchema.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace regimegate {
namespace engine {

namespace {
TimestampMs systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
}

const char* retrainStatusToString(RetrainStatus status) {
    return (status == RetrainStatus::ALREADY_RUNNING) ? "ALREADY_RUNNING" : "STARTED";
}

TradingEngine::TradingEngine(const EngineConfig& config, EngineDependencies deps, Clock clock)
    : config_(config)
    , deps_(std::move(deps))
    , clock_(clock ? std::move(clock) : Clock(systemNowMs)) {
    config_.validate();
    if (config_.mode == TradingMode::BACKTEST) {
        throw ConfigurationError("TradingEngine runs live or paper; use BacktestEngine for backtests");
    }
    if (!deps_.feature_provider || !deps_.store || !deps_.kill_switch_store) {
        throw ConfigurationError("TradingEngine requires a feature provider, a persistence store and a kill switch store");
    }
    config_.execution.paper_mode = (config_.mode == TradingMode::PAPER);

    // 1. kill switch (fail-closed load) and drawdown peak since the last reset
    kill_switch_ = std::make_shared<risk::KillSwitch>(deps_.kill_switch_store, config_.risk.max_drawdown_pct);
    const auto record = kill_switch_->record();
    const double seed_peak = deps_.store->maxEquitySince(record.last_reset_at).value_or(0.0);

    // 2. portfolio, risk, pipeline, execution
    portfolio_ = std::make_shared<portfolio::PortfolioState>(restoreStartingCash(), seed_peak);
    risk_checker_ = std::make_shared<risk::RiskChecker>(config_.risk, kill_switch_);
    pipeline_ = std::make_shared<core::DecisionPipeline>(
        config_.decision,
        signals::SignalFusion(config_.fusion),
        risk::PositionSizer(config_.sizing),
        signals::ConfidenceMapper(config_.confidence));
    order_manager_ = std::make_shared<execution::OrderManager>(
        config_.execution, kill_switch_, deps_.execution_adapter);

    core::TradingCycleConfig cycle;
    cycle.symbols = config_.symbols;
    cycle.collaborator_timeout_ms = config_.collaborator_timeout_ms;
    cycle.detector = config_.regime;
    coordinator_ = std::make_shared<core::TradingCycleCoordinator>(
        cycle, deps_.feature_provider, deps_.predictor, deps_.sentiment,
        pipeline_, risk_checker_, order_manager_, portfolio_, deps_.store);

    LOG_INFO("TradingEngine ready: mode={}, symbols={}, kill_switch={}, seeded peak={:.2f}",
             tradingModeToString(config_.mode), config_.symbols.size(),
             core::killSwitchStateToString(record.state), portfolio_->peakEquity());
}

TradingEngine::~TradingEngine() {
    stop();
    waitForRetrain();
}

double TradingEngine::restoreStartingCash() const {
    auto latest = deps_.store->latestSnapshot();
    if (!latest) {
        return config_.initial_capital;
    }
    for (const auto& position : deps_.store->positions()) {
        if (std::abs(position.quantity) > 1e-12) {
            LOG_WARN("Persisted open position in {} ({}) is not restored; starting from initial capital",
                     position.symbol, position.quantity);
            return config_.initial_capital;
        }
    }
    LOG_INFO("Restored flat book: equity {:.2f} from snapshot at {}", latest->equity, latest->timestamp);
    return latest->equity;
}

TimestampMs TradingEngine::now() const {
    return clock_();
}

bool TradingEngine::start() {
    if (running_) {
        LOG_WARN("엔진이 이미 실행 중입니다");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("거래 엔진 시작 ({})", tradingModeToString(config_.mode));
    LOG_INFO("========================================");

    running_ = true;
    requestRetrain();
    decision_thread_ = std::make_unique<std::thread>(&TradingEngine::runDecisionLoop, this);
    health_thread_ = std::make_unique<std::thread>(&TradingEngine::runHealthLoop, this);
    return true;
}

void TradingEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("거래 엔진 중지");
    LOG_INFO("========================================");

    stop_cv_.notify_all();
    if (decision_thread_ && decision_thread_->joinable()) {
        decision_thread_->join();
    }
    if (health_thread_ && health_thread_->joinable()) {
        health_thread_->join();
    }

    auto snapshot = portfolio_->latestSnapshot();
    if (snapshot) {
        LOG_INFO("최종 자산: {:.2f} (실현 손익 {:.2f}, 최대 낙폭 {:.2f}%)",
                 snapshot->equity, snapshot->realized_pnl, portfolio_->maxDrawdown() * 100.0);
    }
}

bool TradingEngine::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait_for(lock, duration, [this]() { return !running_; });
    return running_;
}

// ===== 메인 루프 =====

void TradingEngine::runDecisionLoop() {
    LOG_INFO("decision loop started (tick every {}s)", config_.tick_interval_seconds);

    const auto tick_interval = std::chrono::seconds(config_.tick_interval_seconds);
    const auto retrain_interval = std::chrono::hours(config_.retrain_interval_hours);
    auto last_retrain = std::chrono::steady_clock::now();

    while (running_) {
        const auto tick_start = std::chrono::steady_clock::now();
        try {
            if (tick_start - last_retrain >= retrain_interval) {
                LOG_INFO("정기 재학습 요청: {}", retrainStatusToString(requestRetrain()));
                last_retrain = tick_start;
            }
            runOnce();
        } catch (const std::exception& e) {
            LOG_ERROR("decision loop error: {}", e.what());
        }

        const auto elapsed = std::chrono::steady_clock::now() - tick_start;
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(tick_interval - elapsed);
        if (!waitFor(std::max(remaining, std::chrono::milliseconds(0)))) {
            break;
        }
    }
    LOG_INFO("decision loop stopped");
}

void TradingEngine::runHealthLoop() {
    const auto interval = std::chrono::seconds(config_.health_interval_seconds);
    while (waitFor(interval)) {
        try {
            updateHealth();
        } catch (const std::exception& e) {
            LOG_ERROR("health check error: {}", e.what());
        }
    }
}

core::CycleReport TradingEngine::runOnce() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    const TimestampMs ts = now();
    auto report = coordinator_->runTick(ts);
    ticks_ += 1;

    for (const auto& fill : report.fills) {
        auto position = portfolio_->position(fill.symbol);
        Logger::getInstance().logFill(fill.symbol, core::execution::orderSideToString(fill.side),
                                      fill.price, fill.quantity, fill.fee,
                                      position ? position->realized_pnl : 0.0);
    }

    int submitted = 0;
    int rejected = 0;
    for (const auto& result : report.symbols) {
        if (result.outcome == core::CycleOutcome::SUBMITTED) ++submitted;
        if (result.outcome == core::CycleOutcome::REJECTED) ++rejected;
        LOG_DEBUG("  {} -> {} {}", result.symbol, core::cycleOutcomeToString(result.outcome), result.detail);
    }
    if (report.snapshot) {
        LOG_INFO("tick {}: equity={:.2f} drawdown={:.2f}% submitted={} rejected={} fills={}{}",
                 ticks_.load(), report.snapshot->equity, report.snapshot->drawdown_pct * 100.0,
                 submitted, rejected, report.fills.size(),
                 report.kill_switch_tripped ? " [KILL SWITCH TRIPPED]" : "");
    }
    return report;
}

RiskMetrics TradingEngine::updateHealth() {
    const size_t window = static_cast<size_t>(config_.risk.metrics_lookback) + 1;
    auto metrics = risk_checker_->computeMetrics(
        portfolio_->recentSnapshots(window), portfolio_->exposureView(), portfolio_->maxDrawdown());
    if (metrics.timestamp == 0) {
        metrics.timestamp = now();
    }
    if (!deps_.store->appendRiskMetrics(metrics)) {
        LOG_ERROR("Failed to persist risk metrics");
    }
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        latest_metrics_ = metrics;
    }
    LOG_DEBUG("health: drawdown={:.2f}% vol={:.4f} concentration={:.2f}% kill_switch={}",
              metrics.current_drawdown_pct * 100.0, metrics.portfolio_vol,
              metrics.concentration_pct * 100.0, metrics.kill_switch_active ? "TRIPPED" : "ARMED");
    return metrics;
}

// ===== 재학습 =====

RetrainStatus TradingEngine::requestRetrain() {
    std::lock_guard<std::mutex> lock(retrain_mutex_);
    if (retrain_running_.exchange(true)) {
        LOG_INFO("retrain requested while one is running");
        return RetrainStatus::ALREADY_RUNNING;
    }
    if (retrain_thread_ && retrain_thread_->joinable()) {
        retrain_thread_->join();
    }
    retrain_thread_ = std::make_unique<std::thread>(&TradingEngine::runRetrain, this, now());
    return RetrainStatus::STARTED;
}

void TradingEngine::runRetrain(TimestampMs ts) {
    int fitted = 0;
    for (const auto& symbol : config_.symbols) {
        try {
            coordinator_->retrainSymbol(symbol, ts);
            ++fitted;
        } catch (const InsufficientDataError& e) {
            LOG_WARN("{}: retrain skipped, prior model kept ({})", symbol, e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("{}: retrain failed: {}", symbol, e.what());
        }
    }
    LOG_INFO("retrain finished: {}/{} symbols fitted", fitted, config_.symbols.size());
    retrain_running_ = false;
}

void TradingEngine::waitForRetrain() {
    std::lock_guard<std::mutex> lock(retrain_mutex_);
    if (retrain_thread_ && retrain_thread_->joinable()) {
        retrain_thread_->join();
    }
}

// ===== 운영자 조회 =====

std::optional<RegimeState> TradingEngine::currentRegime(const std::string& symbol) const {
    return coordinator_->latestRegime(symbol);
}

std::optional<FusedSignal> TradingEngine::latestSignal(const std::string& symbol) const {
    return coordinator_->latestSignal(symbol);
}

std::optional<RiskMetrics> TradingEngine::latestRiskMetrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return latest_metrics_;
}

core::KillSwitchRecord TradingEngine::killSwitchState() const {
    return kill_switch_->record();
}

EngineStatus TradingEngine::status() const {
    EngineStatus out;
    out.mode = config_.mode;
    out.running = running_;
    out.retraining = retrain_running_;
    out.ticks = ticks_;
    out.kill_switch = kill_switch_->record();
    out.snapshot = portfolio_->latestSnapshot();
    out.risk = latestRiskMetrics();
    out.active_orders = order_manager_->activeOrderCount();
    out.positions = portfolio_->positions();
    out.restricted_symbols = risk_checker_->restrictedSymbols();
    for (const auto& symbol : config_.symbols) {
        if (auto regime = currentRegime(symbol)) {
            out.regimes[symbol] = *regime;
        }
        if (auto signal = latestSignal(symbol)) {
            out.signals[symbol] = *signal;
        }
    }
    return out;
}

void TradingEngine::resetKillSwitch(const std::string& operator_name, const std::string& note) {
    kill_switch_->reset(operator_name, note, now());
    portfolio_->rebasePeak();
    LOG_WARN("Kill switch reset by {}; drawdown peak rebased to {:.2f}", operator_name, portfolio_->peakEquity());
}

} // namespace engine
} // namespace regimegate
