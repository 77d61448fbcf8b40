#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace regimegate {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
#ifdef _WIN32
    char* value = nullptr;
    size_t len = 0;
    if (_dupenv_s(&value, &len, name) != 0 || value == nullptr || len == 0) {
        if (value != nullptr) {
            free(value);
        }
        return "";
    }
    std::string out = trimCopy(value);
    free(value);
    return out;
#else
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
#endif
}

engine::TradingMode parseMode(const std::string& raw) {
    auto mode = engine::tradingModeFromString(lowerCopy(trimCopy(raw)));
    if (!mode) {
        throw ConfigurationError("unknown trading mode '" + raw + "' (live, paper, backtest)");
    }
    return *mode;
}

void loadRegimeWeights(const nlohmann::json& j, signals::SignalFusionConfig& fusion) {
    static const std::pair<const char*, Regime> kRegimes[] = {
        {"trending", Regime::TRENDING},
        {"mean_reverting", Regime::MEAN_REVERTING},
        {"choppy", Regime::CHOPPY},
    };
    for (const auto& [key, regime] : kRegimes) {
        if (!j.contains(key)) {
            continue;
        }
        const auto& w = j[key];
        auto& target = fusion.weights[regime];
        target.technical = w.value("technical", target.technical);
        target.ml = w.value("ml", target.ml);
        target.sentiment = w.value("sentiment", target.sentiment);
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    LOG_INFO("설정 파일 경로: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("설정 파일을 찾을 수 없습니다: {} (기본값 사용)", config_path.string());
        loadFromJson(nlohmann::json::object());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("config parse error in " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_path_ = config_path.string();
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::EngineConfig cfg;

    try {
        if (j.contains("engine")) {
            const auto& e = j["engine"];
            if (e.contains("mode")) {
                cfg.mode = parseMode(e["mode"].get<std::string>());
            }
            if (e.contains("symbols")) {
                cfg.symbols = e["symbols"].get<std::vector<std::string>>();
                for (auto& symbol : cfg.symbols) {
                    symbol = trimCopy(symbol);
                }
            }
            cfg.initial_capital = e.value("initial_capital", cfg.initial_capital);
            cfg.tick_interval_seconds = e.value("tick_interval_seconds", cfg.tick_interval_seconds);
            cfg.health_interval_seconds = e.value("health_interval_seconds", cfg.health_interval_seconds);
            cfg.retrain_interval_hours = e.value("retrain_interval_hours", cfg.retrain_interval_hours);
            cfg.collaborator_timeout_ms = e.value("collaborator_timeout_ms", cfg.collaborator_timeout_ms);
            cfg.state_dir = e.value("state_dir", cfg.state_dir);
            cfg.log_dir = e.value("log_dir", cfg.log_dir);
            cfg.log_level = e.value("log_level", cfg.log_level);
        }

        if (j.contains("regime")) {
            const auto& r = j["regime"];
            cfg.regime.n_states = r.value("n_states", cfg.regime.n_states);
            cfg.regime.min_train_bars = r.value("min_train_bars", cfg.regime.min_train_bars);
            cfg.regime.n_iter = r.value("n_iter", cfg.regime.n_iter);
            cfg.regime.tolerance = r.value("tolerance", cfg.regime.tolerance);
            cfg.regime.covariance_floor = r.value("covariance_floor", cfg.regime.covariance_floor);
            cfg.regime.vol_window = r.value("vol_window", cfg.regime.vol_window);
            cfg.regime.bars_per_year = r.value("bars_per_year", cfg.regime.bars_per_year);
            cfg.regime.classify_window = r.value("classify_window", cfg.regime.classify_window);
            cfg.regime.train_window = r.value("train_window", cfg.regime.train_window);
        }

        if (j.contains("features")) {
            const auto& f = j["features"];
            cfg.features.rsi_period = f.value("rsi_period", cfg.features.rsi_period);
            cfg.features.bb_period = f.value("bb_period", cfg.features.bb_period);
            cfg.features.bb_std_mult = f.value("bb_std", cfg.features.bb_std_mult);
            cfg.features.atr_period = f.value("atr_period", cfg.features.atr_period);
            cfg.features.vwap_period = f.value("vwap_period", cfg.features.vwap_period);
            cfg.features.vol_window = f.value("vol_window", cfg.features.vol_window);
            cfg.features.bars_per_year = f.value("bars_per_year", cfg.features.bars_per_year);
            cfg.features.lookback_bars = f.value("lookback_bars", cfg.features.lookback_bars);
        }

        if (j.contains("signals")) {
            const auto& s = j["signals"];
            if (s.contains("regime_weights")) {
                loadRegimeWeights(s["regime_weights"], cfg.fusion);
            }
            cfg.fusion.choppy_scale = s.value("choppy_scale", cfg.fusion.choppy_scale);
            cfg.fusion.direction_threshold = s.value("direction_threshold", cfg.fusion.direction_threshold);
            if (s.contains("confidence")) {
                cfg.confidence.min_iqr = s["confidence"].value("min_iqr", cfg.confidence.min_iqr);
                cfg.confidence.max_iqr = s["confidence"].value("max_iqr", cfg.confidence.max_iqr);
            }
        }

        if (j.contains("decision")) {
            const auto& d = j["decision"];
            cfg.decision.allow_short = d.value("allow_short", cfg.decision.allow_short);
            cfg.decision.rebalance_band_pct = d.value("rebalance_band_pct", cfg.decision.rebalance_band_pct);
            cfg.decision.default_confidence = d.value("default_confidence", cfg.decision.default_confidence);
            cfg.decision.fallback_vol = d.value("fallback_vol", cfg.decision.fallback_vol);
        }

        // risk.max_position_pct caps both the sizer and the pre-trade check
        if (j.contains("risk")) {
            const auto& r = j["risk"];
            cfg.sizing.vol_target = r.value("vol_target", cfg.sizing.vol_target);
            cfg.sizing.vol_floor = r.value("vol_floor", cfg.sizing.vol_floor);
            cfg.risk.max_position_pct = r.value("max_position_pct", cfg.risk.max_position_pct);
            cfg.sizing.max_position_pct = cfg.risk.max_position_pct;
            cfg.risk.max_concentration_pct = r.value("max_concentration_pct", cfg.risk.max_concentration_pct);
            cfg.risk.max_portfolio_leverage = r.value("max_portfolio_leverage", cfg.risk.max_portfolio_leverage);
            cfg.risk.min_trade_usd = r.value("min_trade_usd", cfg.risk.min_trade_usd);
            cfg.risk.staleness_threshold_minutes =
                r.value("staleness_threshold_minutes", cfg.risk.staleness_threshold_minutes);
            cfg.risk.max_drawdown_pct = r.value("max_drawdown_pct", cfg.risk.max_drawdown_pct);
            cfg.risk.metrics_lookback = r.value("metrics_lookback", cfg.risk.metrics_lookback);
            cfg.risk.metrics_periods_per_year = r.value("metrics_periods_per_year", cfg.risk.metrics_periods_per_year);
        }

        if (j.contains("execution")) {
            const auto& x = j["execution"];
            cfg.execution.id_prefix = x.value("id_prefix", cfg.execution.id_prefix);
            cfg.execution.exchange = x.value("exchange", cfg.execution.exchange);
            cfg.execution.order_timeout_seconds = x.value("order_timeout_seconds", cfg.execution.order_timeout_seconds);
            cfg.execution.paper_slippage_bps = x.value("paper_slippage_bps", cfg.execution.paper_slippage_bps);
            cfg.execution.paper_fee_rate = x.value("paper_fee_rate", cfg.execution.paper_fee_rate);
        }

        if (j.contains("backtest")) {
            const auto& b = j["backtest"];
            cfg.refit_interval_bars = b.value("refit_interval_bars", cfg.refit_interval_bars);
            cfg.periods_per_year = b.value("periods_per_year", cfg.periods_per_year);
            cfg.fills.fill_latency_bars = b.value("fill_latency_bars", cfg.fills.fill_latency_bars);
            cfg.fills.partial_fill_fraction = b.value("partial_fill_fraction", cfg.fills.partial_fill_fraction);
            cfg.fills.max_participation = b.value("max_participation", cfg.fills.max_participation);
            cfg.fills.cancel_after_bars = b.value("cancel_after_bars", cfg.fills.cancel_after_bars);
            cfg.fills.spread_bps = b.value("spread_bps", cfg.fills.spread_bps);
            cfg.fills.impact_bps = b.value("impact_bps", cfg.fills.impact_bps);
            cfg.fills.maker_fee_bps = b.value("maker_fee_bps", cfg.fills.maker_fee_bps);
            cfg.fills.taker_fee_bps = b.value("taker_fee_bps", cfg.fills.taker_fee_bps);

            if (b.contains("walk_forward")) {
                const auto& w = b["walk_forward"];
                cfg.walk_forward.train_window = w.value("train_bars", cfg.walk_forward.train_window);
                cfg.walk_forward.test_window = w.value("test_bars", cfg.walk_forward.test_window);
                cfg.walk_forward.purge_gap = w.value("purge_bars", cfg.walk_forward.purge_gap);
                cfg.walk_forward.embargo_gap = w.value("embargo_bars", cfg.walk_forward.embargo_gap);
            }
            if (b.contains("monte_carlo")) {
                const auto& m = b["monte_carlo"];
                cfg.monte_carlo.n_sims = m.value("n_sims", cfg.monte_carlo.n_sims);
                cfg.monte_carlo.block_size = m.value("block_size", cfg.monte_carlo.block_size);
                cfg.monte_carlo.seed = m.value("seed", cfg.monte_carlo.seed);
                cfg.monte_carlo.perturb_pct = m.value("perturb_pct", cfg.monte_carlo.perturb_pct);
                cfg.monte_carlo.perturb_sets = m.value("perturb_sets", cfg.monte_carlo.perturb_sets);
                cfg.monte_carlo.collapse_ratio = m.value("collapse_ratio", cfg.monte_carlo.collapse_ratio);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("config value error: ") + e.what());
    }

    applyEnvOverrides(cfg);
    cfg.validate();

    cfg.execution.paper_mode = (cfg.mode != engine::TradingMode::LIVE);

    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_ = cfg;
    LOG_INFO("설정 로드 완료: mode={}, symbols={}, capital={:.2f}, state_dir={}",
             engine::tradingModeToString(cfg.mode), cfg.symbols.size(), cfg.initial_capital, cfg.state_dir);
}

void Config::applyEnvOverrides(engine::EngineConfig& cfg) const {
    const std::string mode = readEnvVar("REGIMEGATE_MODE");
    if (!mode.empty()) {
        cfg.mode = parseMode(mode);
        LOG_INFO("REGIMEGATE_MODE override: {}", engine::tradingModeToString(cfg.mode));
    }
    const std::string state_dir = readEnvVar("REGIMEGATE_STATE_DIR");
    if (!state_dir.empty()) {
        cfg.state_dir = state_dir;
        LOG_INFO("REGIMEGATE_STATE_DIR override: {}", state_dir);
    }
}

void Config::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_ = engine::EngineConfig();
    loaded_path_.clear();
}

engine::EngineConfig Config::getEngineConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_;
}

engine::TradingMode Config::getMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_.mode;
}

std::vector<std::string> Config::getSymbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_.symbols;
}

double Config::getInitialCapital() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_.initial_capital;
}

std::string Config::getStateDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_.state_dir;
}

std::string Config::getLogDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_.log_dir;
}

std::string Config::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_.log_level;
}

std::string Config::getLoadedPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_path_;
}

void Config::setMode(engine::TradingMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_.mode = mode;
    engine_config_.execution.paper_mode = (mode != engine::TradingMode::LIVE);
}

void Config::setInitialCapital(double v) {
    if (!(v > 0.0)) {
        throw ConfigurationError("initial capital must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_.initial_capital = v;
}

void Config::setSymbols(const std::vector<std::string>& v) {
    if (v.empty()) {
        throw ConfigurationError("symbols must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_.symbols = v;
}

} // namespace regimegate
