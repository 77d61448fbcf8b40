#pragma once

#include <map>
#include <mutex>

#include "core/contracts/IPersistenceStore.h"

namespace regimegate {
namespace core {

class InMemoryPersistenceStore : public IPersistenceStore {
public:
    bool appendSnapshot(const PortfolioSnapshot& snapshot) override;
    bool upsertPosition(const Position& position) override;
    bool appendOrder(const Order& order) override;
    bool appendFill(const Fill& fill) override;
    bool appendRiskMetrics(const RiskMetrics& metrics) override;

    std::optional<double> maxEquitySince(TimestampMs since) const override;
    std::optional<PortfolioSnapshot> latestSnapshot() const override;
    std::vector<Position> positions() const override;

    std::vector<PortfolioSnapshot> snapshots() const;
    std::vector<Order> orders() const;
    std::vector<Fill> fills() const;
    std::vector<RiskMetrics> riskMetrics() const;

private:
    mutable std::mutex mutex_;
    std::vector<PortfolioSnapshot> snapshots_;
    std::map<std::string, Position> positions_;
    std::vector<Order> orders_;
    std::vector<Fill> fills_;
    std::vector<RiskMetrics> risk_metrics_;
};

} // namespace core
} // namespace regimegate
