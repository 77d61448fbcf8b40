#include "analytics/RegimeFeatures.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace regimegate {
namespace analytics {

namespace {
long long medianSpacing(std::vector<long long> spacings) {
    if (spacings.empty()) {
        return 0;
    }
    const size_t mid = spacings.size() / 2;
    std::nth_element(spacings.begin(), spacings.begin() + mid, spacings.end());
    return spacings[mid];
}
}

std::vector<RegimeFeatureRow> RegimeFeatures::fromBars(
    const std::vector<Bar>& bars,
    int vol_window,
    double bars_per_year
) {
    std::vector<RegimeFeatureRow> rows;
    if (vol_window < 2 || bars.size() < 2) {
        return rows;
    }

    // 1. usable bars
    std::vector<const Bar*> usable;
    usable.reserve(bars.size());
    int skipped = 0;
    for (const auto& bar : bars) {
        if (!(bar.close > 0.0) || !std::isfinite(bar.close)) {
            ++skipped;
            continue;
        }
        if (!usable.empty() && bar.timestamp <= usable.back()->timestamp) {
            ++skipped;
            continue;
        }
        usable.push_back(&bar);
    }
    if (skipped > 0) {
        LOG_WARN("RegimeFeatures: skipped {} unusable bars", skipped);
    }
    if (usable.size() < 2) {
        return rows;
    }

    std::vector<long long> spacings;
    spacings.reserve(usable.size() - 1);
    for (size_t i = 1; i < usable.size(); ++i) {
        spacings.push_back(usable[i]->timestamp - usable[i - 1]->timestamp);
    }
    const double nominal = static_cast<double>(medianSpacing(spacings));

    // 2. spacing-normalized log returns
    std::vector<double> returns;
    returns.reserve(usable.size() - 1);
    for (size_t i = 1; i < usable.size(); ++i) {
        double r = std::log(usable[i]->close / usable[i - 1]->close);
        const double dt = static_cast<double>(spacings[i - 1]);
        if (nominal > 0.0 && dt > 0.0) {
            r *= std::sqrt(nominal / dt);
        }
        returns.push_back(r);
    }

    // 3. rolling realized vol (sample stddev, annualized)
    const double annualize = std::sqrt(bars_per_year);
    std::vector<double> window;
    window.reserve(vol_window);
    for (size_t i = static_cast<size_t>(vol_window) - 1; i < returns.size(); ++i) {
        window.assign(returns.begin() + (i + 1 - vol_window), returns.begin() + i + 1);
        const double mean = TechnicalIndicators::calculateMean(window);
        const double std_dev = TechnicalIndicators::calculateStandardDeviation(window, mean, true);

        RegimeFeatureRow row;
        row.timestamp = usable[i + 1]->timestamp;
        row.log_return = returns[i];
        row.realized_vol = std_dev * annualize;
        rows.push_back(row);
    }

    return rows;
}

std::vector<RegimeFeatureRow> RegimeFeatures::finiteRows(const std::vector<RegimeFeatureRow>& rows) {
    std::vector<RegimeFeatureRow> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        if (std::isfinite(row.log_return) && std::isfinite(row.realized_vol)) {
            out.push_back(row);
        }
    }
    return out;
}

} // namespace analytics
} // namespace regimegate
