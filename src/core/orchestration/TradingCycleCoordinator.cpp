#include "core/orchestration/TradingCycleCoordinator.h"

#include "common/Errors.h"
#include "common/Logger.h"

#include <chrono>
#include <exception>
#include <future>
#include <thread>

namespace regimegate {
namespace core {

namespace {
// Runs fn on a detached thread. A late or failed answer counts as missing;
// the worker keeps its own copies of what it needs.
template <typename T, typename Fn>
std::optional<T> callWithTimeout(Fn fn, int timeout_ms, const char* what, const std::string& symbol) {
    auto promise = std::make_shared<std::promise<std::optional<T>>>();
    auto future = promise->get_future();
    std::thread([promise, fn]() {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        LOG_WARN("{} for {} timed out after {} ms, treated as missing", what, symbol, timeout_ms);
        return std::nullopt;
    }
    try {
        return future.get();
    } catch (const std::exception& e) {
        LOG_WARN("{} for {} failed, treated as missing: {}", what, symbol, e.what());
        return std::nullopt;
    }
}
}

const char* cycleOutcomeToString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::SKIPPED_IN_FLIGHT: return "skipped_in_flight";
        case CycleOutcome::NO_DATA: return "no_data";
        case CycleOutcome::NO_REGIME: return "no_regime";
        case CycleOutcome::NO_TRADE: return "no_trade";
        case CycleOutcome::REJECTED: return "rejected";
        case CycleOutcome::SUBMITTED: return "submitted";
        case CycleOutcome::ERROR: return "error";
    }
    return "error";
}

TradingCycleCoordinator::TradingCycleCoordinator(
    TradingCycleConfig config,
    std::shared_ptr<IFeatureProvider> feature_provider,
    std::shared_ptr<IModelPredictor> predictor,
    std::shared_ptr<ISentimentProvider> sentiment,
    std::shared_ptr<DecisionPipeline> pipeline,
    std::shared_ptr<risk::RiskChecker> risk_checker,
    std::shared_ptr<execution::OrderManager> order_manager,
    std::shared_ptr<portfolio::PortfolioState> portfolio,
    std::shared_ptr<IPersistenceStore> store
)
    : config_(std::move(config))
    , feature_provider_(std::move(feature_provider))
    , predictor_(std::move(predictor))
    , sentiment_(std::move(sentiment))
    , pipeline_(std::move(pipeline))
    , risk_checker_(std::move(risk_checker))
    , order_manager_(std::move(order_manager))
    , portfolio_(std::move(portfolio))
    , store_(std::move(store)) {
    if (!feature_provider_ || !pipeline_ || !risk_checker_ || !order_manager_ || !portfolio_ || !store_) {
        throw ConfigurationError("trading cycle is missing a required component");
    }
    config_.detector.validate();
    for (const auto& symbol : config_.symbols) {
        detectors_[symbol] = std::make_shared<analytics::RegimeDetector>(config_.detector);
    }
}

std::shared_ptr<analytics::RegimeDetector> TradingCycleCoordinator::detector(const std::string& symbol) const {
    auto it = detectors_.find(symbol);
    return (it == detectors_.end()) ? nullptr : it->second;
}

std::optional<RegimeState> TradingCycleCoordinator::latestRegime(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = latest_regime_.find(symbol);
    if (it == latest_regime_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<FusedSignal> TradingCycleCoordinator::latestSignal(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = latest_signal_.find(symbol);
    if (it == latest_signal_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TradingCycleCoordinator::retrainSymbol(const std::string& symbol, TimestampMs now) {
    auto det = detector(symbol);
    if (!det) {
        throw ConfigurationError("no regime detector for " + symbol);
    }
    auto rows = feature_provider_->regimeFeatures(symbol, now, static_cast<size_t>(config_.detector.train_window));
    det->fit(rows);
}

std::optional<QuantilePrediction> TradingCycleCoordinator::predictWithTimeout(
    const std::string& symbol, const FeatureVector& features) {
    if (!predictor_) {
        return std::nullopt;
    }
    auto predictor = predictor_;
    return callWithTimeout<QuantilePrediction>(
        [predictor, symbol, features]() { return predictor->predict(symbol, features); },
        config_.collaborator_timeout_ms, "Model prediction", symbol);
}

std::optional<double> TradingCycleCoordinator::sentimentWithTimeout(const std::string& symbol) {
    if (!sentiment_) {
        return std::nullopt;
    }
    auto sentiment = sentiment_;
    return callWithTimeout<double>(
        [sentiment, symbol]() { return sentiment->getScore(symbol); },
        config_.collaborator_timeout_ms, "Sentiment score", symbol);
}

void TradingCycleCoordinator::applyFills(const std::vector<Fill>& fills) {
    for (const auto& fill : fills) {
        auto order = order_manager_->order(fill.order_id);
        const double order_qty = order ? order->quantity : 0.0;

        auto result = portfolio_->applyFill(fill, order_qty);
        if (result.duplicate) {
            continue;
        }
        if (!store_->appendFill(fill)) {
            LOG_ERROR("Failed to persist fill {}", fill.dedupeKey());
        }
        if (order && !store_->appendOrder(*order)) {
            LOG_ERROR("Failed to persist order {}", order->order_id);
        }
        if (auto position = portfolio_->position(fill.symbol)) {
            if (!store_->upsertPosition(*position)) {
                LOG_ERROR("Failed to persist position {}", fill.symbol);
            }
        }
        risk_checker_->checkPostTrade(fill.symbol, portfolio_->exposureView());
    }
}

SymbolCycleResult TradingCycleCoordinator::runSymbol(
    const std::string& symbol, TimestampMs now, std::vector<Fill>& fills) {
    SymbolCycleResult result;
    result.symbol = symbol;

    auto features = feature_provider_->getFeatures(symbol, now);
    if (!features || !(features->close > 0.0)) {
        result.outcome = CycleOutcome::NO_DATA;
        result.detail = "no features";
        return result;
    }
    portfolio_->markToMarket(symbol, features->close);

    if (order_manager_->hasActiveOrder(symbol)) {
        result.outcome = CycleOutcome::SKIPPED_IN_FLIGHT;
        result.detail = "order in flight";
        return result;
    }

    RegimeState regime;
    try {
        auto det = detector(symbol);
        if (!det) {
            throw InsufficientDataError("no detector");
        }
        auto window = feature_provider_->regimeFeatures(
            symbol, now, static_cast<size_t>(config_.detector.classify_window));
        regime = det->classify(window, symbol);
    } catch (const InsufficientDataError& e) {
        LOG_INFO("{}: regime unavailable, cycle skipped ({})", symbol, e.what());
        result.outcome = CycleOutcome::NO_REGIME;
        result.detail = e.what();
        return result;
    }

    DecisionInputs inputs;
    inputs.features = *features;
    inputs.regime = regime;
    inputs.prediction = predictWithTimeout(symbol, *features);
    inputs.sentiment = sentimentWithTimeout(symbol);
    inputs.equity = portfolio_->equity();
    inputs.current_qty = portfolio_->positionQuantity(symbol);

    Decision decision = pipeline_->decide(inputs);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        latest_regime_[symbol] = regime;
        latest_signal_[symbol] = decision.signal;
    }
    LOG_INFO("signal_generated: {} {} strength={:.4f} confidence={:.4f} regime={}",
             symbol, directionToString(decision.signal.direction), decision.signal.strength,
             decision.signal.confidence, regimeToString(regime.regime));

    if (!decision.order) {
        result.outcome = CycleOutcome::NO_TRADE;
        return result;
    }

    risk::ProposedOrder proposed;
    proposed.symbol = symbol;
    proposed.side = decision.order->side;
    proposed.quantity = decision.order->quantity;
    proposed.price = features->close;
    proposed.data_timestamp = features->timestamp;
    proposed.now = now;

    auto verdict = risk_checker_->checkPreTrade(proposed, portfolio_->exposureView());
    if (!verdict.approved) {
        LOG_INFO("trade_rejected: {} reason={} ({})",
                 symbol, risk::riskRejectReasonToString(verdict.reason), verdict.message);
        result.outcome = CycleOutcome::REJECTED;
        result.reject_reason = verdict.reason;
        result.detail = verdict.message;
        return result;
    }

    try {
        auto submission = order_manager_->submit(*decision.order, OrderType::MARKET, features->close,
                                                 std::nullopt, now);
        if (!store_->appendOrder(submission.order)) {
            LOG_ERROR("Failed to persist order {}", submission.order.order_id);
        }
        result.order_id = submission.order.order_id;
        if (submission.order.status == OrderStatus::REJECTED) {
            result.outcome = CycleOutcome::REJECTED;
            result.detail = submission.order.reject_reason;
            return result;
        }
        applyFills(submission.fills);
        fills.insert(fills.end(), submission.fills.begin(), submission.fills.end());
        result.outcome = CycleOutcome::SUBMITTED;
    } catch (const KillSwitchTripped& e) {
        result.outcome = CycleOutcome::REJECTED;
        result.reject_reason = risk::RiskRejectReason::KILL_SWITCH;
        result.detail = e.what();
    }
    return result;
}

CycleReport TradingCycleCoordinator::runTick(TimestampMs now) {
    CycleReport report;
    report.timestamp = now;

    auto polled = order_manager_->pollFills(now);
    applyFills(polled);
    report.fills = polled;

    for (const auto& symbol : config_.symbols) {
        try {
            report.symbols.push_back(runSymbol(symbol, now, report.fills));
        } catch (const std::exception& e) {
            LOG_ERROR("Cycle error for {}: {}", symbol, e.what());
            SymbolCycleResult failed;
            failed.symbol = symbol;
            failed.outcome = CycleOutcome::ERROR;
            failed.detail = e.what();
            report.symbols.push_back(failed);
        }
    }

    auto snapshot = portfolio_->recordSnapshot(now);
    if (!store_->appendSnapshot(snapshot)) {
        LOG_ERROR("Failed to persist snapshot at {}", now);
    }
    report.snapshot = snapshot;
    report.kill_switch_tripped = risk_checker_->onSnapshot(snapshot);
    return report;
}

} // namespace core
} // namespace regimegate
