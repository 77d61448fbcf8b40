#include "portfolio/DrawdownMonitor.h"

#include <algorithm>
#include <cmath>

namespace regimegate {
namespace portfolio {

DrawdownMonitor::DrawdownMonitor(double seed_peak_equity)
    : peak_equity_(std::isfinite(seed_peak_equity) ? std::max(seed_peak_equity, 0.0) : 0.0) {}

double DrawdownMonitor::update(double equity) {
    if (equity > peak_equity_) {
        peak_equity_ = equity;
    }

    if (peak_equity_ > 0.0) {
        current_drawdown_ = std::max(0.0, (peak_equity_ - equity) / peak_equity_);
    } else {
        current_drawdown_ = 0.0;
    }
    max_drawdown_ = std::max(max_drawdown_, current_drawdown_);
    return current_drawdown_;
}

void DrawdownMonitor::rebase(double equity) {
    peak_equity_ = std::max(equity, 0.0);
    current_drawdown_ = 0.0;
}

} // namespace portfolio
} // namespace regimegate
