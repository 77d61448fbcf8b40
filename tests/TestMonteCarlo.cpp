#include "backtest/MonteCarloRobustness.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace regimegate::backtest;

namespace {
bool near(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol;
}

template <typename Fn>
bool throwsInvalidArgument(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

std::vector<double> sampleReturns() {
    std::vector<double> returns;
    for (int i = 0; i < 120; ++i) {
        returns.push_back(0.002 + 0.01 * std::sin(i * 0.7) + ((i % 7 == 0) ? -0.02 : 0.0));
    }
    return returns;
}
}

int main() {
    std::cout << "[TEST] Starting MonteCarlo Test..." << std::endl;

    // 1. Percentile is linear between closest ranks
    {
        assert(near(MonteCarloRobustness::percentile({1.0, 2.0, 3.0, 4.0}, 50.0), 2.5));
        assert(near(MonteCarloRobustness::percentile({4.0, 1.0, 3.0, 2.0}, 0.0), 1.0));
        assert(near(MonteCarloRobustness::percentile({4.0, 1.0, 3.0, 2.0}, 100.0), 4.0));
        assert(near(MonteCarloRobustness::percentile({10.0, 20.0}, 25.0), 12.5));
        assert(near(MonteCarloRobustness::percentile({7.0}, 95.0), 7.0));
        assert(near(MonteCarloRobustness::percentile({}, 50.0), 0.0));

        auto summary = MonteCarloRobustness::summarize({1.0, 2.0, 3.0, 4.0, 5.0});
        assert(near(summary.mean, 3.0));
        assert(near(summary.p5, 1.2));
        assert(near(summary.p95, 4.8));
    }

    // 2. Bootstrap shape and determinism
    {
        auto returns = sampleReturns();
        auto a = MonteCarloRobustness::bootstrap(returns, 200, 10, 42);
        auto b = MonteCarloRobustness::bootstrap(returns, 200, 10, 42);
        auto c = MonteCarloRobustness::bootstrap(returns, 200, 10, 43);

        assert(a.n_simulations == 200);
        assert(a.sharpe_ratios.size() == 200);
        assert(a.total_returns.size() == 200);
        assert(a.max_drawdowns.size() == 200);
        assert(a.sharpe_ratios == b.sharpe_ratios);
        assert(a.total_returns == b.total_returns);
        assert(a.max_drawdowns == b.max_drawdowns);
        assert(a.total_returns != c.total_returns);

        assert(a.sharpe.p5 <= a.sharpe.p95);
        assert(a.total_return.p5 <= a.total_return.p95);
        for (double dd : a.max_drawdowns) {
            assert(dd >= 0.0 && dd < 1.0);
        }
    }

    // 3. A constant series resamples to itself
    {
        std::vector<double> flat(50, 0.001);
        auto result = MonteCarloRobustness::bootstrap(flat, 20, 7, 1);
        const double expected = std::pow(1.001, 50) - 1.0;
        for (double tr : result.total_returns) {
            assert(near(tr, expected, 1e-12));
        }
        for (double dd : result.max_drawdowns) {
            assert(near(dd, 0.0));
        }
    }

    // 4. Blocks longer than the series wrap around
    {
        std::vector<double> returns = {0.01, -0.02, 0.03};
        auto result = MonteCarloRobustness::bootstrap(returns, 10, 5, 9);
        const double expected = 1.01 * 0.98 * 1.03 - 1.0;
        // A single wrapped block covers every return exactly once.
        for (double tr : result.total_returns) {
            assert(near(tr, expected, 1e-12));
        }
    }

    // 5. Bad inputs
    {
        assert(throwsInvalidArgument([] { MonteCarloRobustness::bootstrap({}, 10, 5, 1); }));
        assert(throwsInvalidArgument([] { MonteCarloRobustness::bootstrap({0.01}, 0, 5, 1); }));
        assert(throwsInvalidArgument([] { MonteCarloRobustness::bootstrap({0.01}, 10, 0, 1); }));
        assert(throwsInvalidArgument([] { MonteCarloRobustness::perturbParameters({{"a", 1.0}}, -0.1, 5, 1); }));
        assert(throwsInvalidArgument([] {
            MonteCarloRobustness::runSensitivity({{"a", 1.0}}, nullptr);
        }));
    }

    // 6. Parameter perturbation
    {
        ParameterSet base = {{"vol_target", 0.15}, {"max_position", 0.25}, {"threshold", 0.05}};
        auto sets = MonteCarloRobustness::perturbParameters(base, 0.2, 100, 42);
        auto again = MonteCarloRobustness::perturbParameters(base, 0.2, 100, 42);
        assert(sets.size() == 100);
        assert(sets == again);
        for (const auto& set : sets) {
            assert(set.size() == base.size());
            for (const auto& [name, value] : set) {
                const double ratio = value / base.at(name);
                assert(ratio >= 0.8 - 1e-12 && ratio <= 1.2 + 1e-12);
            }
        }
        assert(sets[0] != sets[1]);

        auto untouched = MonteCarloRobustness::perturbParameters(base, 0.0, 3, 42);
        for (const auto& set : untouched) {
            assert(set == base);
        }
    }

    // 7. Sensitivity: a runner that only works at the exact base value collapses
    {
        ParameterSet base = {{"threshold", 0.05}};
        auto fragile = [&](const ParameterSet& params) {
            return std::abs(params.at("threshold") - 0.05) < 1e-6 ? 2.0 : 0.1;
        };
        auto result = MonteCarloRobustness::runSensitivity(base, fragile, 0.2, 50, 42);
        assert(near(result.base_sharpe, 2.0));
        assert(result.sharpes.size() == 50);
        assert(result.parameter_sets.size() == 50);
        assert(near(result.median_sharpe, 0.1));
        assert(result.collapse_warning);
    }

    // 8. Sensitivity: a smooth runner stays above half the base
    {
        ParameterSet base = {{"threshold", 0.05}};
        auto smooth = [](const ParameterSet& params) {
            return 1.0 + params.at("threshold");
        };
        auto result = MonteCarloRobustness::runSensitivity(base, smooth, 0.2, 50, 42);
        assert(!result.collapse_warning);
        assert(result.median_sharpe > 1.0);

        // A non-positive base never warns.
        auto losing = MonteCarloRobustness::runSensitivity(base, [](const ParameterSet&) { return -1.0; },
                                                           0.2, 10, 42);
        assert(!losing.collapse_warning);
    }

    std::cout << "[TEST] MonteCarlo Test PASSED!" << std::endl;
    return 0;
}
