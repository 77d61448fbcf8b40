#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "backtest/PerformanceMetrics.h"

namespace regimegate {
namespace backtest {

struct DistributionSummary {
    double mean = 0.0;
    double p5 = 0.0;
    double p95 = 0.0;
};

struct MonteCarloResult {
    int n_simulations = 0;
    std::vector<double> sharpe_ratios;
    std::vector<double> total_returns;
    std::vector<double> max_drawdowns;
    DistributionSummary sharpe;
    DistributionSummary total_return;
    DistributionSummary max_drawdown;
};

using ParameterSet = std::map<std::string, double>;

struct SensitivityResult {
    double base_sharpe = 0.0;
    double median_sharpe = 0.0;
    std::vector<ParameterSet> parameter_sets;
    std::vector<double> sharpes;
    bool collapse_warning = false;   // advisory only
};

// Robustness checks on a finished backtest. Deterministic for a fixed seed.
class MonteCarloRobustness {
public:
    // Circular block bootstrap: blocks of block_size consecutive returns,
    // wrapping at the end, are drawn with replacement until the original
    // length is reached. Throws std::invalid_argument for empty returns,
    // n_sims <= 0 or block_size <= 0.
    static MonteCarloResult bootstrap(const std::vector<double>& returns,
                                      int n_sims = 1000,
                                      int block_size = 20,
                                      uint64_t seed = 42,
                                      double periods_per_year = PerformanceMetrics::kDefaultPeriodsPerYear);

    // Each parameter scaled by 1 + U(-pct, pct).
    static std::vector<ParameterSet> perturbParameters(const ParameterSet& params,
                                                       double pct = 0.20,
                                                       int n_sets = 100,
                                                       uint64_t seed = 42);

    // Runs `runner` (returns a Sharpe ratio) on the base set and every
    // perturbed set. Warns when the median Sharpe drops below
    // collapse_ratio * base Sharpe.
    static SensitivityResult runSensitivity(const ParameterSet& base,
                                            const std::function<double(const ParameterSet&)>& runner,
                                            double pct = 0.20,
                                            int n_sets = 100,
                                            uint64_t seed = 42,
                                            double collapse_ratio = 0.5);

    // Linear interpolation between closest ranks; q in [0, 100].
    static double percentile(std::vector<double> values, double q);

    static DistributionSummary summarize(const std::vector<double>& values);
};

} // namespace backtest
} // namespace regimegate
