#pragma once

#include <vector>
#include "common/Types.h"

namespace regimegate {
namespace analytics {

// Technical Indicators - 검증된 공식으로 구현
// Inputs are ordered oldest to newest.
class TechnicalIndicators {
public:
    // RSI (Relative Strength Index), Wilder smoothing
    // 70 이상: 과매수, 30 이하: 과매도
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    struct BollingerBands {
        double upper;
        double middle;      // SMA
        double lower;
        double width;
        double percent_b;   // %B (현재가가 밴드 내 어디에 위치하는지: 0~1)

        BollingerBands() : upper(0), middle(0), lower(0), width(0), percent_b(0.5) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  double current_price,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // ATR (Average True Range), Wilder smoothing
    static double calculateATR(const std::vector<Bar>& bars, int period = 14);

    // Volume Weighted Average Price over the last `period` bars (0 = all)
    static double calculateVWAP(const std::vector<Bar>& bars, int period = 0);

    static double calculateSMA(const std::vector<double>& prices, int period);

    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);

    static double calculateMean(const std::vector<double>& values);
    // Population (ddof = 0) when sample == false
    static double calculateStandardDeviation(const std::vector<double>& values, double mean,
                                             bool sample = false);
};

} // namespace analytics
} // namespace regimegate
