#include "analytics/RegimeDetector.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <numeric>
#include <algorithm>
#include <cmath>
#include <limits>

namespace regimegate {
namespace analytics {

namespace {
constexpr int kStates = 3;
constexpr double kLog2Pi = 1.8378770664093453;
constexpr double kMinProb = 1e-300;

using StateRow = std::array<double, kStates>;

double logSumExp(const StateRow& values) {
    const double max_value = *std::max_element(values.begin(), values.end());
    if (!std::isfinite(max_value)) {
        return max_value;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += std::exp(v - max_value);
    }
    return max_value + std::log(sum);
}

double logGaussian(const RegimeFeatureRow& x, const std::array<double, 2>& mu, const Covariance2& c) {
    const double det = c.xx * c.yy - c.xy * c.xy;
    if (!(det > 0.0)) {
        return -std::numeric_limits<double>::infinity();
    }
    const double dx = x.log_return - mu[0];
    const double dy = x.realized_vol - mu[1];
    const double quad = (c.yy * dx * dx - 2.0 * c.xy * dx * dy + c.xx * dy * dy) / det;
    return -kLog2Pi - 0.5 * std::log(det) - 0.5 * quad;
}

std::array<StateRow, kStates> logTransition(const HmmParameters& params) {
    std::array<StateRow, kStates> out{};
    for (int i = 0; i < kStates; ++i) {
        for (int j = 0; j < kStates; ++j) {
            out[i][j] = std::log(std::max(params.transition[i][j], kMinProb));
        }
    }
    return out;
}

StateRow emissionRow(const RegimeFeatureRow& x, const HmmParameters& params) {
    StateRow row{};
    for (int k = 0; k < kStates; ++k) {
        row[k] = logGaussian(x, params.means[k], params.covariances[k]);
    }
    return row;
}
} // namespace

void RegimeDetectorConfig::validate() const {
    if (n_states != kStates) {
        throw ConfigurationError("regime detector requires exactly 3 states, got " +
                                 std::to_string(n_states));
    }
    if (min_train_bars < kStates * 2) {
        throw ConfigurationError("regime.min_train_bars too small");
    }
    if (n_iter < 1 || !(tolerance > 0.0) || !(covariance_floor > 0.0)) {
        throw ConfigurationError("regime EM settings must be positive");
    }
    if (vol_window < 2 || classify_window < 1 || !(bars_per_year > 0.0)) {
        throw ConfigurationError("regime feature windows must be positive");
    }
    if (train_window < min_train_bars) {
        throw ConfigurationError("regime.train_window must be >= min_train_bars");
    }
}

RegimeDetector::RegimeDetector(RegimeDetectorConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

void RegimeDetector::regularize(Covariance2& cov) const {
    cov.xx = std::max(cov.xx, 0.0) + config_.covariance_floor;
    cov.yy = std::max(cov.yy, 0.0) + config_.covariance_floor;
    const double bound = 0.999 * std::sqrt(cov.xx * cov.yy);
    cov.xy = std::clamp(cov.xy, -bound, bound);
}

HmmParameters RegimeDetector::initialParameters(const std::vector<RegimeFeatureRow>& rows) const {
    HmmParameters params;

    // Volatility terciles give a deterministic, well-separated start.
    std::vector<size_t> order(rows.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&rows](size_t a, size_t b) {
        return rows[a].realized_vol < rows[b].realized_vol;
    });

    const size_t n = rows.size();
    for (int k = 0; k < kStates; ++k) {
        const size_t begin = n * k / kStates;
        const size_t end = n * (k + 1) / kStates;
        const double count = static_cast<double>(end - begin);

        double mr = 0.0, mv = 0.0;
        for (size_t i = begin; i < end; ++i) {
            mr += rows[order[i]].log_return;
            mv += rows[order[i]].realized_vol;
        }
        mr /= count;
        mv /= count;

        Covariance2 cov;
        for (size_t i = begin; i < end; ++i) {
            const double dr = rows[order[i]].log_return - mr;
            const double dv = rows[order[i]].realized_vol - mv;
            cov.xx += dr * dr;
            cov.xy += dr * dv;
            cov.yy += dv * dv;
        }
        cov.xx /= count;
        cov.xy /= count;
        cov.yy /= count;
        regularize(cov);

        params.means[k] = {mr, mv};
        params.covariances[k] = cov;
        params.start[k] = 1.0 / kStates;
        for (int j = 0; j < kStates; ++j) {
            params.transition[k][j] = (k == j) ? 0.9 : 0.05;
        }
    }
    return params;
}

// One Baum-Welch iteration. Returns the log-likelihood under the parameters
// passed in, then overwrites them with the re-estimate.
double RegimeDetector::reestimate(const std::vector<RegimeFeatureRow>& rows, HmmParameters& params) const {
    const size_t T = rows.size();
    const auto log_a = logTransition(params);

    std::vector<StateRow> log_b(T);
    std::vector<StateRow> log_alpha(T);
    std::vector<StateRow> log_beta(T);

    for (size_t t = 0; t < T; ++t) {
        log_b[t] = emissionRow(rows[t], params);
    }

    // forward
    for (int k = 0; k < kStates; ++k) {
        log_alpha[0][k] = std::log(std::max(params.start[k], kMinProb)) + log_b[0][k];
    }
    for (size_t t = 1; t < T; ++t) {
        for (int j = 0; j < kStates; ++j) {
            StateRow terms{};
            for (int i = 0; i < kStates; ++i) {
                terms[i] = log_alpha[t - 1][i] + log_a[i][j];
            }
            log_alpha[t][j] = logSumExp(terms) + log_b[t][j];
        }
    }

    // backward
    log_beta[T - 1].fill(0.0);
    for (size_t t = T - 1; t-- > 0;) {
        for (int i = 0; i < kStates; ++i) {
            StateRow terms{};
            for (int j = 0; j < kStates; ++j) {
                terms[j] = log_a[i][j] + log_b[t + 1][j] + log_beta[t + 1][j];
            }
            log_beta[t][i] = logSumExp(terms);
        }
    }

    const double log_likelihood = logSumExp(log_alpha[T - 1]);
    if (!std::isfinite(log_likelihood)) {
        return log_likelihood;
    }

    StateRow gamma_sum{};
    StateRow gamma_head_sum{};   // excludes the last observation
    std::array<StateRow, kStates> xi_sum{};
    std::array<std::array<double, 2>, kStates> weighted{};
    std::array<Covariance2, kStates> second{};
    StateRow start{};

    for (size_t t = 0; t < T; ++t) {
        for (int k = 0; k < kStates; ++k) {
            const double g = std::exp(log_alpha[t][k] + log_beta[t][k] - log_likelihood);
            gamma_sum[k] += g;
            if (t + 1 < T) gamma_head_sum[k] += g;
            if (t == 0) start[k] = g;
            const double r = rows[t].log_return;
            const double v = rows[t].realized_vol;
            weighted[k][0] += g * r;
            weighted[k][1] += g * v;
            second[k].xx += g * r * r;
            second[k].xy += g * r * v;
            second[k].yy += g * v * v;
        }
        if (t + 1 < T) {
            for (int i = 0; i < kStates; ++i) {
                for (int j = 0; j < kStates; ++j) {
                    xi_sum[i][j] += std::exp(log_alpha[t][i] + log_a[i][j] + log_b[t + 1][j] +
                                             log_beta[t + 1][j] - log_likelihood);
                }
            }
        }
    }

    double start_total = 0.0;
    for (int k = 0; k < kStates; ++k) {
        start[k] = std::max(start[k], 1e-10);
        start_total += start[k];
    }
    for (int k = 0; k < kStates; ++k) {
        params.start[k] = start[k] / start_total;
    }

    for (int i = 0; i < kStates; ++i) {
        if (gamma_head_sum[i] > 1e-10) {
            double row_total = 0.0;
            for (int j = 0; j < kStates; ++j) {
                params.transition[i][j] = std::max(xi_sum[i][j] / gamma_head_sum[i], 1e-10);
                row_total += params.transition[i][j];
            }
            for (int j = 0; j < kStates; ++j) {
                params.transition[i][j] /= row_total;
            }
        }

        // A state that lost all responsibility keeps its previous emission.
        if (gamma_sum[i] > 1e-10) {
            const double mr = weighted[i][0] / gamma_sum[i];
            const double mv = weighted[i][1] / gamma_sum[i];
            Covariance2 cov;
            cov.xx = second[i].xx / gamma_sum[i] - mr * mr;
            cov.xy = second[i].xy / gamma_sum[i] - mr * mv;
            cov.yy = second[i].yy / gamma_sum[i] - mv * mv;
            regularize(cov);
            params.means[i] = {mr, mv};
            params.covariances[i] = cov;
        }
    }

    return log_likelihood;
}

std::array<Regime, 3> RegimeDetector::mapStatesByVolatility(const HmmParameters& params) {
    std::array<int, kStates> order{0, 1, 2};
    std::stable_sort(order.begin(), order.end(), [&params](int a, int b) {
        return params.means[a][1] < params.means[b][1];
    });

    std::array<Regime, 3> mapping{};
    mapping[order[0]] = Regime::TRENDING;
    mapping[order[1]] = Regime::MEAN_REVERTING;
    mapping[order[2]] = Regime::CHOPPY;
    return mapping;
}

void RegimeDetector::fit(const std::vector<RegimeFeatureRow>& history) {
    const auto rows = RegimeFeatures::finiteRows(history);
    if (rows.size() < static_cast<size_t>(config_.min_train_bars)) {
        throw InsufficientDataError("regime fit needs " + std::to_string(config_.min_train_bars) +
                                    " rows, got " + std::to_string(rows.size()));
    }

    auto fitted = std::make_shared<FittedRegimeModel>();
    HmmParameters params = initialParameters(rows);

    double prev_ll = -std::numeric_limits<double>::infinity();
    int iter = 0;
    for (iter = 1; iter <= config_.n_iter; ++iter) {
        const double ll = reestimate(rows, params);
        if (!std::isfinite(ll)) {
            throw InsufficientDataError("regime fit degenerated (non-finite likelihood)");
        }
        if (iter > 1 && std::abs(ll - prev_ll) < config_.tolerance) {
            prev_ll = ll;
            fitted->converged = true;
            break;
        }
        prev_ll = ll;
    }

    fitted->params = params;
    fitted->state_regime = mapStatesByVolatility(params);
    fitted->log_likelihood = prev_ll;
    fitted->iterations = std::min(iter, config_.n_iter);
    fitted->n_samples = rows.size();
    fitted->trained_through = rows.back().timestamp;

    if (!fitted->converged) {
        LOG_WARN("Regime HMM did not converge in {} iterations (ll={:.4f})", config_.n_iter, prev_ll);
    }
    LOG_INFO("Regime HMM fitted: samples={}, iterations={}, ll={:.4f}, vol means=[{:.4f}, {:.4f}, {:.4f}]",
             fitted->n_samples, fitted->iterations, fitted->log_likelihood,
             params.means[0][1], params.means[1][1], params.means[2][1]);

    std::lock_guard<std::mutex> lock(mutex_);
    model_ = std::move(fitted);
}

RegimeState RegimeDetector::classify(const std::vector<RegimeFeatureRow>& recent_window,
                                     const std::string& symbol) const {
    const auto fitted = model();
    if (!fitted) {
        throw InsufficientDataError("regime detector has not been fitted");
    }
    const auto rows = RegimeFeatures::finiteRows(recent_window);
    if (rows.empty()) {
        throw InsufficientDataError("regime classification window is empty");
    }

    const auto& params = fitted->params;
    const auto log_a = logTransition(params);

    StateRow log_alpha{};
    for (int k = 0; k < kStates; ++k) {
        log_alpha[k] = std::log(std::max(params.start[k], kMinProb)) +
                       logGaussian(rows[0], params.means[k], params.covariances[k]);
    }
    for (size_t t = 1; t < rows.size(); ++t) {
        const StateRow log_b = emissionRow(rows[t], params);
        StateRow next{};
        for (int j = 0; j < kStates; ++j) {
            StateRow terms{};
            for (int i = 0; i < kStates; ++i) {
                terms[i] = log_alpha[i] + log_a[i][j];
            }
            next[j] = logSumExp(terms) + log_b[j];
        }
        // normalize to keep the recursion bounded
        const double norm = logSumExp(next);
        for (int j = 0; j < kStates; ++j) {
            log_alpha[j] = next[j] - norm;
        }
    }

    const double total = logSumExp(log_alpha);
    if (!std::isfinite(total)) {
        throw InsufficientDataError("regime classification produced no finite posterior");
    }

    int best = 0;
    double best_posterior = -1.0;
    for (int k = 0; k < kStates; ++k) {
        const double posterior = std::exp(log_alpha[k] - total);
        if (posterior > best_posterior) {
            best_posterior = posterior;
            best = k;
        }
    }

    RegimeState state;
    state.regime = fitted->state_regime[best];
    state.confidence = std::clamp(best_posterior, 0.0, 1.0);
    state.timestamp = rows.back().timestamp;
    state.symbol = symbol;
    return state;
}

bool RegimeDetector::isFitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_ != nullptr;
}

std::shared_ptr<const FittedRegimeModel> RegimeDetector::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

} // namespace analytics
} // namespace regimegate
