#include "backtest/BarFeatureProvider.h"

#include "analytics/RegimeFeatures.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace regimegate {
namespace backtest {

using analytics::TechnicalIndicators;

BarFeatureProvider::BarFeatureProvider(BarFeatureConfig config)
    : config_(config) {}

void BarFeatureProvider::append(const Bar& bar) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = bars_[bar.symbol];
    if (!series.empty() && bar.timestamp <= series.back().timestamp) {
        LOG_WARN("BarFeatureProvider: out-of-order bar for {} dropped ({} <= {})",
                 bar.symbol, bar.timestamp, series.back().timestamp);
        return;
    }
    series.push_back(bar);
}

void BarFeatureProvider::append(const std::vector<Bar>& bars) {
    for (const auto& bar : bars) {
        append(bar);
    }
}

size_t BarFeatureProvider::barCount(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bars_.find(symbol);
    return (it == bars_.end()) ? 0 : it->second.size();
}

std::vector<Bar> BarFeatureProvider::window(const std::string& symbol, TimestampMs timestamp, size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bars_.find(symbol);
    if (it == bars_.end() || it->second.empty()) {
        return {};
    }
    const auto& series = it->second;
    auto end = std::upper_bound(series.begin(), series.end(), timestamp,
                                [](TimestampMs ts, const Bar& bar) { return ts < bar.timestamp; });
    const size_t available = static_cast<size_t>(end - series.begin());
    const size_t take = std::min(available, count);
    return std::vector<Bar>(end - take, end);
}

std::optional<core::FeatureVector> BarFeatureProvider::getFeatures(const std::string& symbol, TimestampMs timestamp) {
    auto bars = window(symbol, timestamp, config_.lookback_bars);
    if (bars.size() < 2) {
        return std::nullopt;
    }

    const Bar& last = bars.back();
    const auto closes = TechnicalIndicators::extractClosePrices(bars);

    core::FeatureVector features;
    features.symbol = symbol;
    features.timestamp = last.timestamp;
    features.close = last.close;

    const Bar& prev = bars[bars.size() - 2];
    features.log_return = (prev.close > 0.0 && last.close > 0.0) ? std::log(last.close / prev.close) : 0.0;

    auto rows = analytics::RegimeFeatures::fromBars(bars, config_.vol_window, config_.bars_per_year);
    features.realized_vol = rows.empty() ? std::nan("") : rows.back().realized_vol;

    features.rsi = TechnicalIndicators::calculateRSI(closes, config_.rsi_period);
    const auto bands = TechnicalIndicators::calculateBollingerBands(
        closes, last.close, config_.bb_period, config_.bb_std_mult);
    features.bb_pctb = bands.percent_b;
    features.atr = TechnicalIndicators::calculateATR(bars, config_.atr_period);

    const double vwap = TechnicalIndicators::calculateVWAP(bars, config_.vwap_period);
    features.vwap_dev = (vwap > 0.0) ? (last.close - vwap) / vwap : 0.0;
    return features;
}

std::vector<analytics::RegimeFeatureRow> BarFeatureProvider::regimeFeatures(
    const std::string& symbol, TimestampMs timestamp, size_t count) {
    // vol_window + 1 extra bars so `count` rows come out
    auto bars = window(symbol, timestamp, count + static_cast<size_t>(config_.vol_window) + 1);
    auto rows = analytics::RegimeFeatures::fromBars(bars, config_.vol_window, config_.bars_per_year);
    if (rows.size() > count) {
        rows.erase(rows.begin(), rows.end() - static_cast<long>(count));
    }
    return rows;
}

} // namespace backtest
} // namespace regimegate
