#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestEngine.h"
#include "backtest/BarFeatureProvider.h"
#include "backtest/DataHistory.h"
#include "backtest/DecisionPolicy.h"
#include "backtest/MonteCarloRobustness.h"
#include "backtest/WalkForwardRunner.h"
#include "core/execution/ExecutionUpdateSchema.h"
#include "core/state/JsonlPersistenceStore.h"
#include "core/state/KillSwitchStoreJson.h"
#include "engine/TradingEngine.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace regimegate;

namespace {

std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  regimegate --backtest <data> [--json] [--benchmark] [--initial-capital X]\n"
        << "  regimegate --walkforward <data> [--json]\n"
        << "  regimegate --montecarlo <data> [--json]\n"
        << "  regimegate --paper <data> [--replay]\n"
        << "  regimegate --status\n"
        << "  regimegate --reset-kill-switch <operator> [note]\n"
        << "  common: --config <path>\n"
        << "<data>: comma separated list of [SYMBOL=]file.csv|file.json\n";
}

// "BTC-USD=btc.csv,eth.csv": symbol defaults to the file stem.
std::vector<Bar> loadBars(const std::string& paths) {
    std::map<std::string, std::vector<Bar>> by_symbol;
    size_t start = 0;
    while (start <= paths.size()) {
        const size_t comma = paths.find(',', start);
        std::string token = (comma == std::string::npos) ? paths.substr(start) : paths.substr(start, comma - start);
        if (!token.empty()) {
            std::string symbol;
            std::string path = token;
            const size_t eq = token.find('=');
            if (eq != std::string::npos) {
                symbol = token.substr(0, eq);
                path = token.substr(eq + 1);
            }
            const std::filesystem::path file(path);
            if (!std::filesystem::exists(file)) {
                throw ConfigurationError("data file not found: " + path);
            }
            if (symbol.empty()) {
                symbol = file.stem().string();
            }
            std::string ext = file.extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            auto bars = (ext == ".json") ? backtest::DataHistory::loadJSON(path, symbol)
                                         : backtest::DataHistory::loadCSV(path, symbol);
            for (auto& bar : bars) {
                by_symbol[bar.symbol].push_back(std::move(bar));
            }
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    auto merged = backtest::DataHistory::merge(by_symbol);
    if (merged.empty()) {
        throw ConfigurationError("no bars loaded from " + paths);
    }
    return merged;
}

backtest::BacktestConfig makeBacktestConfig(const engine::EngineConfig& cfg) {
    backtest::BacktestConfig bt;
    bt.initial_capital = cfg.initial_capital;
    bt.fills = cfg.fills;
    bt.risk = cfg.risk;
    bt.periods_per_year = cfg.periods_per_year;
    return bt;
}

std::unique_ptr<backtest::IDecisionPolicy> makePipelinePolicy(const engine::EngineConfig& cfg) {
    backtest::PipelinePolicyConfig policy;
    policy.detector = cfg.regime;
    policy.features = cfg.features;
    policy.refit_interval_bars = cfg.refit_interval_bars;
    auto pipeline = std::make_shared<core::DecisionPipeline>(
        cfg.decision,
        signals::SignalFusion(cfg.fusion),
        risk::PositionSizer(cfg.sizing),
        signals::ConfidenceMapper(cfg.confidence));
    return std::make_unique<backtest::PipelinePolicy>(policy, pipeline);
}

nlohmann::json metricsToJson(const backtest::PerformanceReport& m) {
    nlohmann::json j;
    j["total_return"] = m.total_return;
    j["annualized_return"] = m.annualized_return;
    j["sharpe_ratio"] = m.sharpe_ratio;
    j["sortino_ratio"] = m.sortino_ratio;
    j["max_drawdown"] = m.max_drawdown;
    j["max_drawdown_duration_bars"] = m.max_drawdown_duration_bars;
    j["hit_rate"] = m.hit_rate;
    // JSON has no infinity
    j["profit_factor"] = std::isfinite(m.profit_factor) ? nlohmann::json(m.profit_factor) : nlohmann::json(nullptr);
    j["total_trades"] = m.total_trades;
    j["calmar_ratio"] = m.calmar_ratio;
    return j;
}

nlohmann::json resultToJson(const backtest::BacktestResult& r) {
    nlohmann::json j;
    j["policy"] = r.policy_name;
    j["metrics"] = metricsToJson(r.metrics);
    j["bars_processed"] = r.bars_processed;
    j["signals_generated"] = r.signals_generated;
    j["orders"] = r.orders.size();
    j["fills"] = r.fills.size();
    j["rejections"] = r.rejection_counts;
    j["kill_switch_tripped"] = r.kill_switch_tripped;
    j["final_equity"] = r.equity_curve.empty() ? 0.0 : r.equity_curve.back().equity;
    return j;
}

void printResult(const backtest::BacktestResult& r) {
    const auto& m = r.metrics;
    std::cout << "\n백테스트 결과 (" << r.policy_name << ")\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    if (!r.equity_curve.empty()) {
        std::cout << "최종 자산:     " << r.equity_curve.back().equity << "\n";
    }
    std::cout << "총 수익률:     " << m.total_return * 100.0 << "%\n";
    std::cout << "연환산 수익률: " << m.annualized_return * 100.0 << "%\n";
    std::cout << std::setprecision(3);
    std::cout << "Sharpe:        " << m.sharpe_ratio << "\n";
    std::cout << "Sortino:       " << m.sortino_ratio << "\n";
    std::cout << "Calmar:        " << m.calmar_ratio << "\n";
    std::cout << std::setprecision(2);
    std::cout << "MDD:           " << m.max_drawdown * 100.0 << "% (" << m.max_drawdown_duration_bars << " bars)\n";
    std::cout << "거래 수:       " << m.total_trades << "\n";
    std::cout << "승률:          " << m.hit_rate * 100.0 << "%\n";
    std::cout << "Profit Factor: " << std::setprecision(3) << m.profit_factor << "\n";
    std::cout << "Kill switch:   " << (r.kill_switch_tripped ? "TRIPPED" : "ARMED") << "\n";
    if (!r.rejection_counts.empty()) {
        std::cout << "리스크 거절:\n";
        for (const auto& [reason, count] : r.rejection_counts) {
            std::cout << "  - " << reason << ": " << count << "\n";
        }
    }
    std::cout << "---------------------------------------------\n";
}

int runBacktest(const std::string& data, bool json_mode, bool with_benchmark) {
    const auto cfg = Config::getInstance().getEngineConfig();
    const auto bars = loadBars(data);
    LOG_INFO("Starting Backtest Mode: {} bars", bars.size());

    backtest::BacktestEngine engine(makeBacktestConfig(cfg));
    auto policy = makePipelinePolicy(cfg);
    auto result = engine.run(bars, *policy);

    std::optional<backtest::BacktestResult> benchmark;
    if (with_benchmark) {
        // 벤치마크는 포지션 한도 내 균등 배분
        std::set<std::string> symbols;
        for (const auto& bar : bars) symbols.insert(bar.symbol);
        const double fraction = std::min(cfg.risk.max_position_pct, 1.0 / static_cast<double>(symbols.size()));
        backtest::BuyAndHoldPolicy buy_and_hold(fraction);
        benchmark = engine.run(bars, buy_and_hold);
    }

    if (json_mode) {
        nlohmann::json j = resultToJson(result);
        if (benchmark) {
            j["benchmark"] = resultToJson(*benchmark);
        }
        std::cout << j.dump() << "\n";
        return 0;
    }
    printResult(result);
    if (benchmark) {
        printResult(*benchmark);
    }
    return 0;
}

int runWalkForwardMode(const std::string& data, bool json_mode) {
    const auto cfg = Config::getInstance().getEngineConfig();
    const auto bars = loadBars(data);

    backtest::BacktestEngine engine(makeBacktestConfig(cfg));
    auto report = backtest::runWalkForward(
        bars, engine, [&cfg]() { return makePipelinePolicy(cfg); }, cfg.walk_forward);

    if (json_mode) {
        nlohmann::json j;
        j["folds"] = nlohmann::json::array();
        for (const auto& fold : report.folds) {
            nlohmann::json f = resultToJson(fold.result);
            f["fold"] = fold.split.fold;
            f["train"] = {fold.split.train.begin, fold.split.train.end};
            f["test"] = {fold.split.test.begin, fold.split.test.end};
            j["folds"].push_back(f);
        }
        j["oos_metrics"] = metricsToJson(report.oos_metrics);
        j["mean_fold_sharpe"] = report.mean_fold_sharpe;
        j["folds_with_kill_switch"] = report.folds_with_kill_switch;
        std::cout << j.dump() << "\n";
        return 0;
    }

    std::cout << "\nWalk-forward (" << report.folds.size() << " folds)\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed;
    for (const auto& fold : report.folds) {
        std::cout << "fold " << fold.split.fold
                  << " | train [" << fold.split.train.begin << ", " << fold.split.train.end << ")"
                  << " | test [" << fold.split.test.begin << ", " << fold.split.test.end << ")"
                  << " | ret=" << std::setprecision(2) << fold.result.metrics.total_return * 100.0 << "%"
                  << " | sharpe=" << std::setprecision(3) << fold.result.metrics.sharpe_ratio << "\n";
    }
    std::cout << "OOS return:  " << std::setprecision(2) << report.oos_metrics.total_return * 100.0 << "%\n";
    std::cout << "OOS Sharpe:  " << std::setprecision(3) << report.oos_metrics.sharpe_ratio << "\n";
    std::cout << "OOS MDD:     " << std::setprecision(2) << report.oos_metrics.max_drawdown * 100.0 << "%\n";
    std::cout << "---------------------------------------------\n";
    return 0;
}

int runMonteCarloMode(const std::string& data, bool json_mode) {
    const auto cfg = Config::getInstance().getEngineConfig();
    const auto bars = loadBars(data);
    const auto& mc = cfg.monte_carlo;

    backtest::BacktestEngine engine(makeBacktestConfig(cfg));
    auto base_policy = makePipelinePolicy(cfg);
    auto base = engine.run(bars, *base_policy);
    if (base.returns.empty()) {
        std::cerr << "백테스트 수익률이 비어 있어 Monte Carlo를 실행할 수 없습니다\n";
        return 1;
    }

    auto boot = backtest::MonteCarloRobustness::bootstrap(
        base.returns, mc.n_sims, mc.block_size, mc.seed, cfg.periods_per_year);

    const backtest::ParameterSet params{
        {"vol_target", cfg.sizing.vol_target},
        {"choppy_scale", cfg.fusion.choppy_scale},
        {"direction_threshold", cfg.fusion.direction_threshold},
        {"rebalance_band_pct", cfg.decision.rebalance_band_pct},
    };
    auto runner = [&](const backtest::ParameterSet& p) {
        auto perturbed = cfg;
        perturbed.sizing.vol_target = p.at("vol_target");
        perturbed.fusion.choppy_scale = std::min(p.at("choppy_scale"), 1.0);
        perturbed.fusion.direction_threshold = p.at("direction_threshold");
        perturbed.decision.rebalance_band_pct = p.at("rebalance_band_pct");
        auto policy = makePipelinePolicy(perturbed);
        return engine.run(bars, *policy).metrics.sharpe_ratio;
    };
    auto sensitivity = backtest::MonteCarloRobustness::runSensitivity(
        params, runner, mc.perturb_pct, mc.perturb_sets, mc.seed, mc.collapse_ratio);

    auto summary = [](const backtest::DistributionSummary& d) {
        return nlohmann::json{{"mean", d.mean}, {"p5", d.p5}, {"p95", d.p95}};
    };
    if (json_mode) {
        nlohmann::json j;
        j["base"] = resultToJson(base);
        j["bootstrap"] = {
            {"n_simulations", boot.n_simulations},
            {"sharpe", summary(boot.sharpe)},
            {"total_return", summary(boot.total_return)},
            {"max_drawdown", summary(boot.max_drawdown)},
        };
        j["sensitivity"] = {
            {"base_sharpe", sensitivity.base_sharpe},
            {"median_sharpe", sensitivity.median_sharpe},
            {"sets", sensitivity.sharpes.size()},
            {"collapse_warning", sensitivity.collapse_warning},
        };
        std::cout << j.dump() << "\n";
        return 0;
    }

    printResult(base);
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Bootstrap (" << boot.n_simulations << " sims)\n";
    std::cout << "  Sharpe     mean=" << boot.sharpe.mean << " p5=" << boot.sharpe.p5 << " p95=" << boot.sharpe.p95 << "\n";
    std::cout << "  Return     mean=" << boot.total_return.mean << " p5=" << boot.total_return.p5
              << " p95=" << boot.total_return.p95 << "\n";
    std::cout << "  MaxDD      mean=" << boot.max_drawdown.mean << " p5=" << boot.max_drawdown.p5
              << " p95=" << boot.max_drawdown.p95 << "\n";
    std::cout << "Sensitivity: base Sharpe=" << sensitivity.base_sharpe
              << " median=" << sensitivity.median_sharpe
              << (sensitivity.collapse_warning ? "  [WARNING: collapse]" : "") << "\n";
    return 0;
}

int runPaper(const std::string& data, bool replay) {
    auto cfg = Config::getInstance().getEngineConfig();
    cfg.mode = engine::TradingMode::PAPER;
    const auto bars = loadBars(data);

    auto features = std::make_shared<backtest::BarFeatureProvider>(cfg.features);
    features->append(bars);

    std::filesystem::create_directories(cfg.state_dir);
    engine::EngineDependencies deps;
    deps.feature_provider = features;
    deps.store = std::make_shared<core::JsonlPersistenceStore>(cfg.state_dir);
    deps.kill_switch_store = std::make_shared<core::KillSwitchStoreJson>(
        std::filesystem::path(cfg.state_dir) / "kill_switch.json");

    if (!replay) {
        engine::TradingEngine trading(cfg, deps);
        trading.start();
        while (!g_stop_requested && trading.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LOG_INFO("종료 신호 수신");
        trading.stop();
        return 0;
    }

    // 과거 바를 시계로 사용해 틱 단위로 재생
    std::vector<TimestampMs> timestamps;
    for (const auto& bar : bars) {
        if (timestamps.empty() || timestamps.back() != bar.timestamp) {
            timestamps.push_back(bar.timestamp);
        }
    }
    auto clock_index = std::make_shared<size_t>(0);
    engine::TradingEngine trading(cfg, deps, [clock_index, &timestamps]() {
        return timestamps[std::min(*clock_index, timestamps.size() - 1)];
    });

    int since_retrain = cfg.refit_interval_bars;
    for (size_t i = 0; i < timestamps.size() && !g_stop_requested; ++i) {
        *clock_index = i;
        if (since_retrain >= cfg.refit_interval_bars) {
            trading.requestRetrain();
            trading.waitForRetrain();
            since_retrain = 0;
        }
        trading.runOnce();
        trading.updateHealth();
        ++since_retrain;
    }

    auto status = trading.status();
    if (status.snapshot) {
        std::cout << std::fixed << std::setprecision(2)
                  << "replay finished: equity=" << status.snapshot->equity
                  << " drawdown=" << status.snapshot->drawdown_pct * 100.0 << "%"
                  << " kill_switch=" << core::killSwitchStateToString(status.kill_switch.state) << "\n";
    }
    return 0;
}

int runStatus() {
    const auto cfg = Config::getInstance().getEngineConfig();
    core::JsonlPersistenceStore store(cfg.state_dir);
    core::KillSwitchStoreJson kill_store(std::filesystem::path(cfg.state_dir) / "kill_switch.json");

    nlohmann::json j;
    j["state_dir"] = cfg.state_dir;
    try {
        auto record = kill_store.load();
        j["kill_switch"] = record ? core::killSwitchStateToString(record->state) : "ARMED";
        if (record) {
            j["kill_switch_reason"] = record->reason;
            j["kill_switch_changed_at"] = record->changed_at;
        }
    } catch (const PersistenceError& e) {
        j["kill_switch"] = "TRIPPED";
        j["kill_switch_reason"] = std::string("unreadable record: ") + e.what();
    }
    if (auto snapshot = store.latestSnapshot()) {
        j["equity"] = snapshot->equity;
        j["cash"] = snapshot->cash;
        j["drawdown_pct"] = snapshot->drawdown_pct;
        j["snapshot_ts"] = snapshot->timestamp;
    }
    j["positions"] = nlohmann::json::array();
    for (const auto& position : store.positions()) {
        j["positions"].push_back({
            {"symbol", position.symbol},
            {"quantity", position.quantity},
            {"avg_entry_price", position.avg_entry_price},
            {"realized_pnl", position.realized_pnl},
        });
    }
    std::cout << j.dump(2) << "\n";
    return 0;
}

int runResetKillSwitch(const std::string& operator_name, const std::string& note) {
    const auto cfg = Config::getInstance().getEngineConfig();
    auto kill_store = std::make_shared<core::KillSwitchStoreJson>(
        std::filesystem::path(cfg.state_dir) / "kill_switch.json");
    risk::KillSwitch kill_switch(kill_store, cfg.risk.max_drawdown_pct);
    if (!kill_switch.isTripped()) {
        std::cout << "kill switch already ARMED\n";
        return 0;
    }
    kill_switch.reset(operator_name, note, nowMs());
    std::cout << "kill switch reset to ARMED by " << operator_name << "\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string config_path = "config/config.json";
    std::string command;
    std::string command_arg;
    std::string note;
    bool json_mode = false;
    bool with_benchmark = false;
    bool replay = false;
    double cli_initial_capital = -1.0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--json") {
            json_mode = true;
        } else if (arg == "--benchmark") {
            with_benchmark = true;
        } else if (arg == "--replay") {
            replay = true;
        } else if (arg == "--initial-capital" && i + 1 < argc) {
            try {
                cli_initial_capital = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --initial-capital value. Ignored.\n";
            }
        } else if ((arg == "--backtest" || arg == "--walkforward" || arg == "--montecarlo" || arg == "--paper")
                   && i + 1 < argc) {
            command = arg;
            command_arg = argv[++i];
        } else if (arg == "--status") {
            command = arg;
        } else if (arg == "--reset-kill-switch" && i + 1 < argc) {
            command = arg;
            command_arg = argv[++i];
            if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                note = argv[++i];
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    try {
        // 로그는 설정 로드 후 초기화
        Config::getInstance().load(config_path);
        auto& config = Config::getInstance();
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
        if (cli_initial_capital > 0.0) {
            config.setInitialCapital(cli_initial_capital);
        }

        if (command == "--backtest") return runBacktest(command_arg, json_mode, with_benchmark);
        if (command == "--walkforward") return runWalkForwardMode(command_arg, json_mode);
        if (command == "--montecarlo") return runMonteCarloMode(command_arg, json_mode);
        if (command == "--paper") return runPaper(command_arg, replay);
        if (command == "--status") return runStatus();
        if (command == "--reset-kill-switch") return runResetKillSwitch(command_arg, note);

        printUsage();
        return 1;
    } catch (const ConfigurationError& e) {
        std::cerr << "설정 오류: " << e.what() << "\n";
        LOG_CRITICAL("Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "치명적 오류: " << e.what() << "\n";
        LOG_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
