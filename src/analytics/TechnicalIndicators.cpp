#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace regimegate {
namespace analytics {

// RSI 계산 (Wilder's Smoothing 방식)
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // 1. 초기 평균 (첫 period 기간)
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    // 2. Wilder's Smoothing 적용 (끝까지 순회)
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss < 0.0000001) {
        return (avg_gain < 0.0000001) ? 50.0 : 100.0;
    }

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    BollingerBands result;

    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    std::vector<double> recent_prices(prices.end() - period, prices.end());

    result.middle = calculateSMA(recent_prices, period);
    double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);
    result.width = result.upper - result.lower;

    if (result.width > 1e-12) {
        result.percent_b = (current_price - result.lower) / result.width;
    } else {
        result.percent_b = 0.5;
    }

    return result;
}

// ATR 계산 (Average True Range)
double TechnicalIndicators::calculateATR(const std::vector<Bar>& bars, int period) {
    if (period <= 0 || bars.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> true_ranges;
    true_ranges.reserve(bars.size() - 1);
    for (size_t i = 1; i < bars.size(); ++i) {
        const double high_low = bars[i].high - bars[i].low;
        const double high_close = std::abs(bars[i].high - bars[i - 1].close);
        const double low_close = std::abs(bars[i].low - bars[i - 1].close);
        true_ranges.push_back(std::max({high_low, high_close, low_close}));
    }

    double atr = std::accumulate(true_ranges.begin(), true_ranges.begin() + period, 0.0) / period;
    for (size_t i = period; i < true_ranges.size(); ++i) {
        atr = ((atr * (period - 1)) + true_ranges[i]) / period;
    }
    return atr;
}

// VWAP 계산 (Volume Weighted Average Price)
double TechnicalIndicators::calculateVWAP(const std::vector<Bar>& bars, int period) {
    if (bars.empty()) return 0.0;

    size_t start = 0;
    if (period > 0 && bars.size() > static_cast<size_t>(period)) {
        start = bars.size() - period;
    }

    double cumulative_tpv = 0.0;
    double cumulative_volume = 0.0;

    for (size_t i = start; i < bars.size(); ++i) {
        const auto& bar = bars[i];
        double typical_price = (bar.high + bar.low + bar.close) / 3.0;
        cumulative_tpv += typical_price * bar.volume;
        cumulative_volume += bar.volume;
    }

    if (cumulative_volume < 1e-12) return 0.0;
    return cumulative_tpv / cumulative_volume;
}

// SMA 계산 (Simple Moving Average)
double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());

    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }

    return prices;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean,
    bool sample
) {
    const size_t denom = sample ? values.size() - 1 : values.size();
    if (values.empty() || denom == 0) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / denom);
}

} // namespace analytics
} // namespace regimegate
