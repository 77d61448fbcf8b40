#include "core/state/InMemoryPersistenceStore.h"

namespace regimegate {
namespace core {

bool InMemoryPersistenceStore::appendSnapshot(const PortfolioSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.push_back(snapshot);
    return true;
}

bool InMemoryPersistenceStore::upsertPosition(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[position.symbol] = position;
    return true;
}

bool InMemoryPersistenceStore::appendOrder(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    orders_.push_back(order);
    return true;
}

bool InMemoryPersistenceStore::appendFill(const Fill& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    fills_.push_back(fill);
    return true;
}

bool InMemoryPersistenceStore::appendRiskMetrics(const RiskMetrics& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    risk_metrics_.push_back(metrics);
    return true;
}

std::optional<double> InMemoryPersistenceStore::maxEquitySince(TimestampMs since) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<double> best;
    for (const auto& snapshot : snapshots_) {
        if (snapshot.timestamp < since) {
            continue;
        }
        if (!best || snapshot.equity > *best) {
            best = snapshot.equity;
        }
    }
    return best;
}

std::optional<PortfolioSnapshot> InMemoryPersistenceStore::latestSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshots_.empty()) {
        return std::nullopt;
    }
    return snapshots_.back();
}

std::vector<Position> InMemoryPersistenceStore::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    for (const auto& [symbol, position] : positions_) {
        out.push_back(position);
    }
    return out;
}

std::vector<PortfolioSnapshot> InMemoryPersistenceStore::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_;
}

std::vector<Order> InMemoryPersistenceStore::orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orders_;
}

std::vector<Fill> InMemoryPersistenceStore::fills() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fills_;
}

std::vector<RiskMetrics> InMemoryPersistenceStore::riskMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return risk_metrics_;
}

} // namespace core
} // namespace regimegate
