#pragma once

#include "common/Types.h"
#include "analytics/RegimeFeatures.h"
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace regimegate {
namespace analytics {

struct RegimeDetectorConfig {
    int n_states = 3;
    int min_train_bars = 200;
    int n_iter = 100;
    double tolerance = 1e-4;
    double covariance_floor = 1e-6;
    int vol_window = 20;
    double bars_per_year = 6.0 * 365.0;   // 4h bars
    int classify_window = 50;
    int train_window = 1000;

    // Throws ConfigurationError.
    void validate() const;
};

struct Covariance2 {
    double xx = 0.0;
    double xy = 0.0;
    double yy = 0.0;
};

// Gaussian HMM over [log_return, realized_vol], three hidden states.
struct HmmParameters {
    std::array<double, 3> start{};
    std::array<std::array<double, 3>, 3> transition{};
    std::array<std::array<double, 2>, 3> means{};
    std::array<Covariance2, 3> covariances{};
};

struct FittedRegimeModel {
    HmmParameters params;
    // raw state index -> regime, rebuilt on every fit
    std::array<Regime, 3> state_regime{Regime::TRENDING, Regime::MEAN_REVERTING, Regime::CHOPPY};
    double log_likelihood = 0.0;
    int iterations = 0;
    bool converged = false;
    size_t n_samples = 0;
    TimestampMs trained_through = 0;
};

class RegimeDetector {
public:
    explicit RegimeDetector(RegimeDetectorConfig config = RegimeDetectorConfig());

    // Baum-Welch on the training window. Throws InsufficientDataError when
    // fewer than min_train_bars finite rows remain.
    void fit(const std::vector<RegimeFeatureRow>& history);

    // Forward algorithm over the window; confidence is the posterior of the
    // most probable current state. Throws InsufficientDataError when unfitted
    // or when the window holds no finite rows.
    RegimeState classify(const std::vector<RegimeFeatureRow>& recent_window,
                         const std::string& symbol = "") const;

    bool isFitted() const;
    std::shared_ptr<const FittedRegimeModel> model() const;
    const RegimeDetectorConfig& config() const { return config_; }

    // Sorts states by mean volatility: lowest TRENDING, middle MEAN_REVERTING,
    // highest CHOPPY.
    static std::array<Regime, 3> mapStatesByVolatility(const HmmParameters& params);

private:
    HmmParameters initialParameters(const std::vector<RegimeFeatureRow>& rows) const;
    double reestimate(const std::vector<RegimeFeatureRow>& rows, HmmParameters& params) const;
    void regularize(Covariance2& cov) const;

    RegimeDetectorConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<const FittedRegimeModel> model_;
};

} // namespace analytics
} // namespace regimegate
