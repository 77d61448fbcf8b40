#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"

namespace regimegate {
namespace core {

class IPersistenceStore {
public:
    virtual ~IPersistenceStore() = default;

    virtual bool appendSnapshot(const PortfolioSnapshot& snapshot) = 0;
    virtual bool upsertPosition(const Position& position) = 0;
    virtual bool appendOrder(const Order& order) = 0;
    virtual bool appendFill(const Fill& fill) = 0;
    virtual bool appendRiskMetrics(const RiskMetrics& metrics) = 0;

    // Highest equity among snapshots at or after `since`.
    virtual std::optional<double> maxEquitySince(TimestampMs since) const = 0;
    virtual std::optional<PortfolioSnapshot> latestSnapshot() const = 0;
    virtual std::vector<Position> positions() const = 0;
};

} // namespace core
} // namespace regimegate
