#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>

#include <nlohmann/json.hpp>

#include "core/contracts/IPersistenceStore.h"

namespace regimegate {
namespace core {

// Append-only JSONL files under one state directory:
//   snapshots.jsonl, orders.jsonl, fills.jsonl, risk_metrics.jsonl
// plus positions.json (latest row per symbol, rewritten atomically).
// Each JSONL row carries a per-file "seq".
class JsonlPersistenceStore : public IPersistenceStore {
public:
    explicit JsonlPersistenceStore(std::filesystem::path state_dir);

    bool appendSnapshot(const PortfolioSnapshot& snapshot) override;
    bool upsertPosition(const Position& position) override;
    bool appendOrder(const Order& order) override;
    bool appendFill(const Fill& fill) override;
    bool appendRiskMetrics(const RiskMetrics& metrics) override;

    std::optional<double> maxEquitySince(TimestampMs since) const override;
    std::optional<PortfolioSnapshot> latestSnapshot() const override;
    std::vector<Position> positions() const override;

    std::vector<PortfolioSnapshot> readSnapshots() const;
    std::uint64_t lastSeq(const std::string& stream) const;


private:
    bool appendLine(const std::string& stream, nlohmann::json line);
    bool writePositionsLocked() const;
    std::filesystem::path streamPath(const std::string& stream) const;

    std::filesystem::path state_dir_;
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> last_seq_;
    std::map<std::string, Position> positions_;
    std::optional<PortfolioSnapshot> latest_snapshot_;
};

} // namespace core
} // namespace regimegate
