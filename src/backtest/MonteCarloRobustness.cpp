#include "backtest/MonteCarloRobustness.h"

#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace regimegate {
namespace backtest {

double MonteCarloRobustness::percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    q = std::clamp(q, 0.0, 100.0);
    const double rank = q / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = rank - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

DistributionSummary MonteCarloRobustness::summarize(const std::vector<double>& values) {
    DistributionSummary summary;
    summary.mean = analytics::TechnicalIndicators::calculateMean(values);
    summary.p5 = percentile(values, 5.0);
    summary.p95 = percentile(values, 95.0);
    return summary;
}

MonteCarloResult MonteCarloRobustness::bootstrap(
    const std::vector<double>& returns,
    int n_sims,
    int block_size,
    uint64_t seed,
    double periods_per_year
) {
    if (returns.empty()) {
        throw std::invalid_argument("bootstrap requires at least one return");
    }
    if (n_sims <= 0 || block_size <= 0) {
        throw std::invalid_argument("n_sims and block_size must be positive");
    }

    const size_t n = returns.size();
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> pick_start(0, n - 1);

    MonteCarloResult result;
    result.n_simulations = n_sims;
    result.sharpe_ratios.reserve(static_cast<size_t>(n_sims));
    result.total_returns.reserve(static_cast<size_t>(n_sims));
    result.max_drawdowns.reserve(static_cast<size_t>(n_sims));

    std::vector<double> sample;
    std::vector<double> equity;
    sample.reserve(n);
    equity.reserve(n + 1);

    for (int sim = 0; sim < n_sims; ++sim) {
        sample.clear();
        while (sample.size() < n) {
            const size_t start = pick_start(rng);
            for (int k = 0; k < block_size && sample.size() < n; ++k) {
                sample.push_back(returns[(start + static_cast<size_t>(k)) % n]);
            }
        }

        equity.assign(1, 1.0);
        for (double r : sample) {
            equity.push_back(equity.back() * (1.0 + r));
        }

        result.sharpe_ratios.push_back(PerformanceMetrics::sharpe(sample, periods_per_year));
        result.total_returns.push_back(equity.back() - 1.0);
        result.max_drawdowns.push_back(PerformanceMetrics::maxDrawdown(equity).first);
    }

    result.sharpe = summarize(result.sharpe_ratios);
    result.total_return = summarize(result.total_returns);
    result.max_drawdown = summarize(result.max_drawdowns);

    LOG_INFO("Monte Carlo ({} sims, block {}): sharpe mean={:.3f} [p5 {:.3f}, p95 {:.3f}], "
             "return p5={:.2f}%, max_dd p95={:.2f}%",
             n_sims, block_size, result.sharpe.mean, result.sharpe.p5, result.sharpe.p95,
             result.total_return.p5 * 100.0, result.max_drawdown.p95 * 100.0);
    return result;
}

std::vector<ParameterSet> MonteCarloRobustness::perturbParameters(
    const ParameterSet& params,
    double pct,
    int n_sets,
    uint64_t seed
) {
    if (pct < 0.0 || n_sets < 0) {
        throw std::invalid_argument("perturbation pct and n_sets must be non-negative");
    }

    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> jitter(-pct, pct);

    std::vector<ParameterSet> sets;
    sets.reserve(static_cast<size_t>(n_sets));
    for (int i = 0; i < n_sets; ++i) {
        ParameterSet perturbed;
        for (const auto& [name, value] : params) {
            perturbed[name] = value * (1.0 + jitter(rng));
        }
        sets.push_back(std::move(perturbed));
    }
    return sets;
}

SensitivityResult MonteCarloRobustness::runSensitivity(
    const ParameterSet& base,
    const std::function<double(const ParameterSet&)>& runner,
    double pct,
    int n_sets,
    uint64_t seed,
    double collapse_ratio
) {
    if (!runner) {
        throw std::invalid_argument("sensitivity runner is empty");
    }

    SensitivityResult result;
    result.base_sharpe = runner(base);
    result.parameter_sets = perturbParameters(base, pct, n_sets, seed);
    result.sharpes.reserve(result.parameter_sets.size());
    for (const auto& params : result.parameter_sets) {
        result.sharpes.push_back(runner(params));
    }
    result.median_sharpe = result.sharpes.empty() ? result.base_sharpe : percentile(result.sharpes, 50.0);

    if (result.base_sharpe > 0.0 && result.median_sharpe < collapse_ratio * result.base_sharpe) {
        result.collapse_warning = true;
        LOG_WARN("Sensitivity: median Sharpe {:.3f} collapsed below {:.0f}% of base {:.3f} under +/-{:.0f}% jitter",
                 result.median_sharpe, collapse_ratio * 100.0, result.base_sharpe, pct * 100.0);
    } else {
        LOG_INFO("Sensitivity: base Sharpe {:.3f}, median {:.3f} over {} sets",
                 result.base_sharpe, result.median_sharpe, result.sharpes.size());
    }
    return result;
}

} // namespace backtest
} // namespace regimegate
