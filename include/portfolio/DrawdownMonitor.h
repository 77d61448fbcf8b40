#pragma once

namespace regimegate {
namespace portfolio {

// Running peak-to-trough drawdown. The peak is seeded from the historical
// maximum equity, never from the current value after a restart.
class DrawdownMonitor {
public:
    explicit DrawdownMonitor(double seed_peak_equity = 0.0);

    // Returns the current drawdown as a positive fraction (0.10 = 10%).
    double update(double equity);

    // Operator-driven peak reset (kill switch reset).
    void rebase(double equity);

    double peakEquity() const { return peak_equity_; }
    double maxDrawdown() const { return max_drawdown_; }

private:
    double peak_equity_ = 0.0;
    double current_drawdown_ = 0.0;
    double max_drawdown_ = 0.0;
};

} // namespace portfolio
} // namespace regimegate
