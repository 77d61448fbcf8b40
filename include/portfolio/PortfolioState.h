#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "portfolio/DrawdownMonitor.h"

namespace regimegate {
namespace portfolio {

// Consistent point-in-time read for risk checks.
struct ExposureView {
    double equity = 0.0;
    double cash = 0.0;
    std::map<std::string, double> quantities;   // signed
    std::map<std::string, double> prices;       // last known

    double quantity(const std::string& symbol) const;
    double price(const std::string& symbol) const;
    double exposure(const std::string& symbol) const;   // |qty| * price
    double grossExposure() const;
    double largestExposure() const;
};

struct FillResult {
    bool applied = false;
    bool duplicate = false;
    double realized_pnl = 0.0;
    std::optional<ClosedTrade> closed_trade;
};

// Cash, positions and the equity curve. Positions change only through
// applyFill(); every public method is safe to call from other threads and
// readers only ever observe fully applied fills.
//
// Realized PnL uses the average-cost method: increasing fills re-average the
// entry price, reducing fills realize (fill - avg) * closed_qty less the
// pro-rata share of accrued entry fees and the exit fee.
class PortfolioState {
public:
    explicit PortfolioState(double initial_cash, double seed_peak_equity = 0.0);

    // Idempotent by Fill::dedupeKey(). An identical replay returns
    // duplicate=true and changes nothing; a replay with different content or
    // a fill that takes the order past `order_quantity` throws
    // IdempotencyViolation. order_quantity <= 0 skips the overfill guard.
    FillResult applyFill(const Fill& fill, double order_quantity);

    void markToMarket(const std::string& symbol, double price);

    // Appends a snapshot and updates the drawdown monitor.
    PortfolioSnapshot recordSnapshot(TimestampMs timestamp);

    std::optional<PortfolioSnapshot> latestSnapshot() const;
    std::vector<PortfolioSnapshot> snapshots() const;
    std::vector<PortfolioSnapshot> recentSnapshots(size_t count) const;

    std::optional<Position> position(const std::string& symbol) const;
    std::vector<Position> positions() const;
    std::vector<ClosedTrade> closedTrades() const;

    double cash() const;
    double equity() const;
    double realizedPnl() const;
    double positionQuantity(const std::string& symbol) const;
    std::optional<double> lastPrice(const std::string& symbol) const;
    ExposureView exposureView() const;

    double peakEquity() const;
    double maxDrawdown() const;

    // Resets the drawdown peak to the current equity.
    void rebasePeak();

private:
    struct PositionBook {
        double quantity = 0.0;
        double avg_entry_price = 0.0;
        double entry_fees = 0.0;   // fees of the open quantity not yet realized
        double realized_pnl = 0.0;
        double last_price = 0.0;
        bool has_price = false;
        TimestampMs entry_time = 0;
        TimestampMs updated_at = 0;
    };

    static bool sameFill(const Fill& a, const Fill& b);
    Position toPosition(const std::string& symbol, const PositionBook& book) const;
    double positionsValueLocked() const;
    double unrealizedLocked() const;
    void verifyInvariantLocked(const char* where) const;

    mutable std::mutex mutex_;
    double cash_;
    double equity_;          // tracked incrementally, checked against cash + positions value
    double realized_pnl_ = 0.0;
    std::map<std::string, PositionBook> books_;
    std::map<std::string, Fill> applied_fills_;
    std::map<std::string, double> order_filled_qty_;
    std::vector<PortfolioSnapshot> snapshots_;
    std::vector<ClosedTrade> closed_trades_;
    DrawdownMonitor drawdown_;
};

} // namespace portfolio
} // namespace regimegate
