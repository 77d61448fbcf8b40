#include "common/Config.h"
#include "common/Errors.h"
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

// Simple manual test runner
int main() {
    using namespace regimegate;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    unsetenv("REGIMEGATE_MODE");
    unsetenv("REGIMEGATE_STATE_DIR");

    // 1. Defaults
    config.reset();
    auto defaults = config.getEngineConfig();
    defaults.validate();
    assert(defaults.mode == engine::TradingMode::PAPER);
    assert(!defaults.symbols.empty());
    assert(std::abs(defaults.fusion.weights.at(Regime::TRENDING).ml - 0.5) < 1e-12);
    assert(std::abs(defaults.risk.max_drawdown_pct - 0.15) < 1e-12);
    assert(defaults.risk.staleness_threshold_minutes == 30);
    assert(defaults.walk_forward.train_window == 1000);

    // 2. Sections override defaults
    nlohmann::json j = {
        {"engine", {{"mode", "paper"}, {"symbols", {"BTC-USD", " ETH-USD "}}, {"initial_capital", 50000.0}}},
        {"risk", {{"max_position_pct", 0.2}, {"vol_target", 0.1}, {"staleness_threshold_minutes", 15}}},
        {"signals", {{"choppy_scale", 0.25},
                     {"regime_weights", {{"choppy", {{"technical", 0.2}, {"ml", 0.2}, {"sentiment", 0.6}}}}}}},
        {"backtest", {{"fill_latency_bars", 2}, {"walk_forward", {{"train_bars", 400}}}}},
    };
    config.loadFromJson(j);
    auto cfg = config.getEngineConfig();
    assert(cfg.symbols.size() == 2);
    assert(cfg.symbols[1] == "ETH-USD");
    assert(std::abs(cfg.initial_capital - 50000.0) < 1e-9);
    // the position cap feeds both the sizer and the pre-trade check
    assert(std::abs(cfg.risk.max_position_pct - 0.2) < 1e-12);
    assert(std::abs(cfg.sizing.max_position_pct - 0.2) < 1e-12);
    assert(std::abs(cfg.sizing.vol_target - 0.1) < 1e-12);
    assert(cfg.risk.staleness_threshold_minutes == 15);
    assert(std::abs(cfg.fusion.choppy_scale - 0.25) < 1e-12);
    assert(std::abs(cfg.fusion.weights.at(Regime::CHOPPY).sentiment - 0.6) < 1e-12);
    assert(std::abs(cfg.fusion.weights.at(Regime::TRENDING).technical - 0.4) < 1e-12);
    assert(cfg.fills.fill_latency_bars == 2);
    assert(cfg.walk_forward.train_window == 400);
    assert(cfg.walk_forward.test_window == 100);
    assert(cfg.execution.paper_mode);

    // 3. Weights that do not sum to 1 fail at load
    bool threw = false;
    try {
        config.loadFromJson({{"signals", {{"regime_weights", {{"trending", {{"technical", 0.5}, {"ml", 0.5}, {"sentiment", 0.5}}}}}}}});
    } catch (const ConfigurationError& e) {
        threw = true;
        std::cout << "  rejected: " << e.what() << std::endl;
    }
    assert(threw);
    // the previous configuration survives a failed load
    assert(std::abs(config.getEngineConfig().fusion.choppy_scale - 0.25) < 1e-12);

    threw = false;
    try {
        config.loadFromJson({{"regime", {{"n_states", 4}}}});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        config.loadFromJson({{"engine", {{"mode", "margin"}}}});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        config.loadFromJson({{"risk", {{"max_drawdown_pct", "high"}}}});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    // 4. Environment overrides
    setenv("REGIMEGATE_MODE", "live", 1);
    setenv("REGIMEGATE_STATE_DIR", "state_override", 1);
    config.loadFromJson(nlohmann::json::object());
    assert(config.getMode() == engine::TradingMode::LIVE);
    assert(config.getStateDir() == "state_override");
    assert(!config.getEngineConfig().execution.paper_mode);

    setenv("REGIMEGATE_MODE", "sideways", 1);
    threw = false;
    try {
        config.loadFromJson(nlohmann::json::object());
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    unsetenv("REGIMEGATE_MODE");
    unsetenv("REGIMEGATE_STATE_DIR");

    // Programmatic setters
    config.setMode(engine::TradingMode::LIVE);
    assert(!config.getEngineConfig().execution.paper_mode);
    config.setMode(engine::TradingMode::PAPER);
    assert(config.getEngineConfig().execution.paper_mode);
    config.setInitialCapital(25000.0);
    assert(config.getInitialCapital() == 25000.0);
    config.setSymbols({"ETH-USD", "SOL-USD"});
    assert(config.getSymbols().size() == 2);
    threw = false;
    try {
        config.setSymbols({});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    // 5. Files
    const auto dir = std::filesystem::temp_directory_path() / "regimegate_test_config";
    std::filesystem::create_directories(dir);

    config.load((dir / "missing.json").string());
    assert(config.getMode() == engine::TradingMode::PAPER);

    const auto broken = dir / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ \"engine\": { \"mode\": ";
    }
    threw = false;
    try {
        config.load(broken.string());
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    const auto good = dir / "good.json";
    {
        std::ofstream out(good);
        out << R"({"engine": {"symbols": ["SOL-USD"], "state_dir": "state_sol"}})";
    }
    config.load(good.string());
    assert(config.getSymbols().size() == 1 && config.getSymbols()[0] == "SOL-USD");
    assert(config.getStateDir() == "state_sol");
    assert(config.getLoadedPath() == good.string());

    // Shipped config, when run next to it
    if (std::filesystem::exists("config/config.json")) {
        std::cout << "[TEST] Found config.json, loading..." << std::endl;
        config.load("config/config.json");
        config.getEngineConfig().validate();
    }

    std::filesystem::remove_all(dir);
    config.reset();

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
