#include "engine/EngineConfig.h"
#include "common/Errors.h"

namespace regimegate {
namespace engine {

void EngineConfig::validate() const {
    if (symbols.empty()) {
        throw ConfigurationError("engine.symbols must not be empty");
    }
    for (const auto& symbol : symbols) {
        if (symbol.empty()) {
            throw ConfigurationError("engine.symbols contains an empty symbol");
        }
    }
    if (!(initial_capital > 0.0)) {
        throw ConfigurationError("engine.initial_capital must be positive");
    }
    if (tick_interval_seconds <= 0 || health_interval_seconds <= 0 || retrain_interval_hours <= 0) {
        throw ConfigurationError("engine intervals must be positive");
    }
    if (collaborator_timeout_ms <= 0) {
        throw ConfigurationError("engine.collaborator_timeout_ms must be positive");
    }
    if (state_dir.empty()) {
        throw ConfigurationError("engine.state_dir must not be empty");
    }
    if (refit_interval_bars < 1) {
        throw ConfigurationError("backtest.refit_interval_bars must be >= 1");
    }
    if (!(periods_per_year > 0.0)) {
        throw ConfigurationError("backtest.periods_per_year must be positive");
    }
    if (walk_forward.train_window <= 0 || walk_forward.test_window <= 0 ||
        walk_forward.purge_gap < 0 || walk_forward.embargo_gap < 0) {
        throw ConfigurationError("walk_forward windows must be positive and gaps non-negative");
    }
    if (monte_carlo.n_sims <= 0 || monte_carlo.block_size <= 0 || monte_carlo.perturb_sets < 0 ||
        monte_carlo.perturb_pct < 0.0 || !(monte_carlo.collapse_ratio > 0.0)) {
        throw ConfigurationError("monte_carlo settings out of range");
    }
    if (execution.order_timeout_seconds <= 0 || execution.paper_fee_rate < 0.0 ||
        execution.paper_slippage_bps < 0.0) {
        throw ConfigurationError("execution settings out of range");
    }
    if (!(confidence.min_iqr >= 0.0) || !(confidence.max_iqr > confidence.min_iqr)) {
        throw ConfigurationError("signals.confidence requires 0 <= min_iqr < max_iqr");
    }

    regime.validate();
    fusion.validate();
    sizing.validate();
    decision.validate();
    risk.validate();
    fills.validate();
}

} // namespace engine
} // namespace regimegate
