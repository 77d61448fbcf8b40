#include "portfolio/PortfolioState.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace regimegate {
namespace portfolio {

namespace {
constexpr double kQtyEpsilon = 1e-12;

double sign(double value) {
    return (value > 0.0) ? 1.0 : ((value < 0.0) ? -1.0 : 0.0);
}

PositionSide sideOf(double quantity) {
    if (quantity > kQtyEpsilon) return PositionSide::LONG;
    if (quantity < -kQtyEpsilon) return PositionSide::SHORT;
    return PositionSide::FLAT;
}
}

double ExposureView::quantity(const std::string& symbol) const {
    auto it = quantities.find(symbol);
    return (it != quantities.end()) ? it->second : 0.0;
}

double ExposureView::price(const std::string& symbol) const {
    auto it = prices.find(symbol);
    return (it != prices.end()) ? it->second : 0.0;
}

double ExposureView::exposure(const std::string& symbol) const {
    return std::abs(quantity(symbol)) * price(symbol);
}

double ExposureView::grossExposure() const {
    double total = 0.0;
    for (const auto& [symbol, qty] : quantities) {
        total += std::abs(qty) * price(symbol);
    }
    return total;
}

double ExposureView::largestExposure() const {
    double largest = 0.0;
    for (const auto& [symbol, qty] : quantities) {
        largest = std::max(largest, std::abs(qty) * price(symbol));
    }
    return largest;
}

PortfolioState::PortfolioState(double initial_cash, double seed_peak_equity)
    : cash_(initial_cash)
    , equity_(initial_cash)
    , drawdown_(std::max(seed_peak_equity, initial_cash)) {
    if (!std::isfinite(initial_cash) || initial_cash < 0.0) {
        throw std::invalid_argument("initial cash must be finite and non-negative");
    }
}

bool PortfolioState::sameFill(const Fill& a, const Fill& b) {
    return a.order_id == b.order_id && a.fill_seq == b.fill_seq && a.symbol == b.symbol &&
           a.side == b.side && a.quantity == b.quantity && a.price == b.price && a.fee == b.fee;
}

FillResult PortfolioState::applyFill(const Fill& fill, double order_quantity) {
    if (!(fill.quantity > 0.0) || !std::isfinite(fill.quantity) ||
        !(fill.price > 0.0) || !std::isfinite(fill.price) ||
        !(fill.fee >= 0.0) || !std::isfinite(fill.fee)) {
        throw std::invalid_argument("invalid fill " + fill.dedupeKey());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    FillResult result;

    const std::string key = fill.dedupeKey();
    auto seen = applied_fills_.find(key);
    if (seen != applied_fills_.end()) {
        if (!sameFill(seen->second, fill)) {
            LOG_CRITICAL("Fill {} replayed with different content", key);
            throw IdempotencyViolation("fill " + key + " replayed with different content");
        }
        LOG_DEBUG("Duplicate fill {} ignored", key);
        result.duplicate = true;
        return result;
    }

    const double already_filled = order_filled_qty_[fill.order_id];
    if (order_quantity > 0.0 &&
        already_filled + fill.quantity > order_quantity * (1.0 + 1e-9) + kQtyEpsilon) {
        LOG_CRITICAL("Fill {} overfills order: {} + {} > {}", key, already_filled, fill.quantity, order_quantity);
        throw IdempotencyViolation("fill " + key + " exceeds order quantity");
    }

    auto& book = books_[fill.symbol];
    if (!book.has_price) {
        book.last_price = fill.price;
        book.has_price = true;
    }

    const double delta = (fill.side == OrderSide::BUY) ? fill.quantity : -fill.quantity;
    const double notional = fill.price * fill.quantity;

    // 1. cash
    if (fill.side == OrderSide::BUY) {
        cash_ -= notional + fill.fee;
    } else {
        cash_ += notional - fill.fee;
    }
    equity_ += -delta * fill.price - fill.fee + delta * book.last_price;

    // 2. position (average cost)
    if (std::abs(book.quantity) <= kQtyEpsilon || sign(delta) == sign(book.quantity)) {
        const double held = std::abs(book.quantity);
        if (held <= kQtyEpsilon) {
            book.entry_time = fill.timestamp;
            book.avg_entry_price = fill.price;
            book.entry_fees = fill.fee;
        } else {
            book.avg_entry_price = (held * book.avg_entry_price + fill.quantity * fill.price) /
                                   (held + fill.quantity);
            book.entry_fees += fill.fee;
        }
        book.quantity += delta;
    } else {
        const double held = std::abs(book.quantity);
        const double closed_qty = std::min(fill.quantity, held);
        const double direction = sign(book.quantity);
        const double entry_fee_share = book.entry_fees * (closed_qty / held);
        const double exit_fee_share = fill.fee * (closed_qty / fill.quantity);
        const double gross = closed_qty * (fill.price - book.avg_entry_price) * direction;
        const double realized = gross - entry_fee_share - exit_fee_share;

        ClosedTrade trade;
        trade.symbol = fill.symbol;
        trade.order_id = fill.order_id;
        trade.side = (direction > 0.0) ? PositionSide::LONG : PositionSide::SHORT;
        trade.quantity = closed_qty;
        trade.entry_price = book.avg_entry_price;
        trade.exit_price = fill.price;
        trade.pnl = realized;
        const double cost_basis = closed_qty * book.avg_entry_price;
        trade.return_pct = (cost_basis > 0.0) ? realized / cost_basis : 0.0;
        trade.entry_time = book.entry_time;
        trade.exit_time = fill.timestamp;

        book.entry_fees -= entry_fee_share;
        book.realized_pnl += realized;
        book.quantity += direction * -closed_qty;
        realized_pnl_ += realized;
        result.realized_pnl = realized;
        result.closed_trade = trade;
        closed_trades_.push_back(trade);

        const double remainder = fill.quantity - closed_qty;
        if (remainder > kQtyEpsilon) {
            // flip: the rest opens a new position at the fill price
            book.quantity = sign(delta) * remainder;
            book.avg_entry_price = fill.price;
            book.entry_fees = fill.fee - exit_fee_share;
            book.entry_time = fill.timestamp;
        } else if (std::abs(book.quantity) <= kQtyEpsilon) {
            book.quantity = 0.0;
            book.avg_entry_price = 0.0;
            book.entry_fees = 0.0;
        }
    }
    book.updated_at = fill.timestamp;

    applied_fills_.emplace(key, fill);
    order_filled_qty_[fill.order_id] = already_filled + fill.quantity;
    result.applied = true;

    verifyInvariantLocked("applyFill");
    return result;
}

void PortfolioState::markToMarket(const std::string& symbol, double price) {
    if (!(price > 0.0) || !std::isfinite(price)) {
        LOG_WARN("markToMarket ignored for {}: invalid price {}", symbol, price);
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& book = books_[symbol];
    if (book.has_price) {
        equity_ += book.quantity * (price - book.last_price);
    } else {
        equity_ += book.quantity * price;
    }
    book.last_price = price;
    book.has_price = true;
    verifyInvariantLocked("markToMarket");
}

PortfolioSnapshot PortfolioState::recordSnapshot(TimestampMs timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    PortfolioSnapshot snapshot;
    snapshot.timestamp = timestamp;
    snapshot.cash = cash_;
    snapshot.positions_value = positionsValueLocked();
    snapshot.equity = snapshot.cash + snapshot.positions_value;
    snapshot.unrealized_pnl = unrealizedLocked();
    snapshot.realized_pnl = realized_pnl_;
    snapshot.drawdown_pct = drawdown_.update(snapshot.equity);
    snapshots_.push_back(snapshot);
    return snapshot;
}

std::optional<PortfolioSnapshot> PortfolioState::latestSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshots_.empty()) {
        return std::nullopt;
    }
    return snapshots_.back();
}

std::vector<PortfolioSnapshot> PortfolioState::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_;
}

std::vector<PortfolioSnapshot> PortfolioState::recentSnapshots(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t start = (snapshots_.size() > count) ? snapshots_.size() - count : 0;
    return std::vector<PortfolioSnapshot>(snapshots_.begin() + start, snapshots_.end());
}

std::optional<Position> PortfolioState::position(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return std::nullopt;
    }
    return toPosition(symbol, it->second);
}

std::vector<Position> PortfolioState::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    out.reserve(books_.size());
    for (const auto& [symbol, book] : books_) {
        out.push_back(toPosition(symbol, book));
    }
    return out;
}

std::vector<ClosedTrade> PortfolioState::closedTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_trades_;
}

double PortfolioState::cash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cash_;
}

double PortfolioState::equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cash_ + positionsValueLocked();
}

double PortfolioState::realizedPnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return realized_pnl_;
}

double PortfolioState::positionQuantity(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(symbol);
    return (it != books_.end()) ? it->second.quantity : 0.0;
}

std::optional<double> PortfolioState::lastPrice(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(symbol);
    if (it == books_.end() || !it->second.has_price) {
        return std::nullopt;
    }
    return it->second.last_price;
}

ExposureView PortfolioState::exposureView() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ExposureView view;
    view.cash = cash_;
    view.equity = cash_ + positionsValueLocked();
    for (const auto& [symbol, book] : books_) {
        view.quantities[symbol] = book.quantity;
        if (book.has_price) {
            view.prices[symbol] = book.last_price;
        }
    }
    return view;
}

double PortfolioState::peakEquity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drawdown_.peakEquity();
}

double PortfolioState::maxDrawdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drawdown_.maxDrawdown();
}

void PortfolioState::rebasePeak() {
    std::lock_guard<std::mutex> lock(mutex_);
    const double current = cash_ + positionsValueLocked();
    LOG_WARN("Drawdown peak rebased: {:.2f} -> {:.2f}", drawdown_.peakEquity(), current);
    drawdown_.rebase(current);
}

Position PortfolioState::toPosition(const std::string& symbol, const PositionBook& book) const {
    Position position;
    position.symbol = symbol;
    position.quantity = book.quantity;
    position.side = sideOf(book.quantity);
    position.avg_entry_price = book.avg_entry_price;
    position.realized_pnl = book.realized_pnl;
    position.last_price = book.last_price;
    position.unrealized_pnl = book.has_price
        ? book.quantity * (book.last_price - book.avg_entry_price) - book.entry_fees
        : 0.0;
    position.updated_at = book.updated_at;
    return position;
}

double PortfolioState::positionsValueLocked() const {
    double total = 0.0;
    for (const auto& [symbol, book] : books_) {
        total += book.quantity * book.last_price;
    }
    return total;
}

double PortfolioState::unrealizedLocked() const {
    double total = 0.0;
    for (const auto& [symbol, book] : books_) {
        if (std::abs(book.quantity) > kQtyEpsilon) {
            total += book.quantity * (book.last_price - book.avg_entry_price) - book.entry_fees;
        }
    }
    return total;
}

void PortfolioState::verifyInvariantLocked(const char* where) const {
    const double expected = cash_ + positionsValueLocked();
    const double tolerance = 1e-6 * std::max(1.0, std::abs(expected));
    if (!std::isfinite(equity_) || std::abs(equity_ - expected) > tolerance) {
        LOG_CRITICAL("Equity invariant broken in {}: tracked={} cash+positions={}", where, equity_, expected);
        throw AccountingInvariantError(std::string("equity != cash + positions_value after ") + where);
    }
}

} // namespace portfolio
} // namespace regimegate
