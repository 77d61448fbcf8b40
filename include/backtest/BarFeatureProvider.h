#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IFeatureProvider.h"

namespace regimegate {
namespace backtest {

struct BarFeatureConfig {
    int rsi_period = 14;
    int bb_period = 20;
    double bb_std_mult = 2.0;
    int atr_period = 14;
    int vwap_period = 20;
    int vol_window = 20;
    double bars_per_year = 6.0 * 365.0;
    size_t lookback_bars = 120;          // bars used per feature vector
};

// Features computed from bars already appended. Queries only ever see bars
// with timestamp <= the requested time, so a backtest cannot look ahead.
// Safe to query from the decision and retrain threads.
class BarFeatureProvider : public core::IFeatureProvider {
public:
    explicit BarFeatureProvider(BarFeatureConfig config = BarFeatureConfig());

    // Bars must arrive in time order per symbol; out-of-order bars are dropped.
    void append(const Bar& bar);
    void append(const std::vector<Bar>& bars);

    std::optional<core::FeatureVector> getFeatures(const std::string& symbol, TimestampMs timestamp) override;
    std::vector<analytics::RegimeFeatureRow> regimeFeatures(
        const std::string& symbol, TimestampMs timestamp, size_t count) override;

    size_t barCount(const std::string& symbol) const;
    const BarFeatureConfig& config() const { return config_; }

private:
    // Last `count` bars of the symbol at or before `timestamp`
    std::vector<Bar> window(const std::string& symbol, TimestampMs timestamp, size_t count) const;

    BarFeatureConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Bar>> bars_;
};

} // namespace backtest
} // namespace regimegate
