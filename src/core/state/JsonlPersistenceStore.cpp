#include "core/state/JsonlPersistenceStore.h"
#include "core/execution/ExecutionUpdateSchema.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace regimegate {
namespace core {

namespace {
const char* kSnapshots = "snapshots";
const char* kOrders = "orders";
const char* kFills = "fills";
const char* kRiskMetrics = "risk_metrics";

std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

nlohmann::json snapshotToJson(const PortfolioSnapshot& snapshot) {
    nlohmann::json line;
    line["ts_ms"] = snapshot.timestamp;
    line["equity"] = snapshot.equity;
    line["cash"] = snapshot.cash;
    line["positions_value"] = snapshot.positions_value;
    line["unrealized_pnl"] = snapshot.unrealized_pnl;
    line["realized_pnl"] = snapshot.realized_pnl;
    line["drawdown_pct"] = snapshot.drawdown_pct;
    return line;
}

PortfolioSnapshot snapshotFromJson(const nlohmann::json& line) {
    PortfolioSnapshot snapshot;
    snapshot.timestamp = line.value("ts_ms", 0LL);
    snapshot.equity = line.value("equity", 0.0);
    snapshot.cash = line.value("cash", 0.0);
    snapshot.positions_value = line.value("positions_value", 0.0);
    snapshot.unrealized_pnl = line.value("unrealized_pnl", 0.0);
    snapshot.realized_pnl = line.value("realized_pnl", 0.0);
    snapshot.drawdown_pct = line.value("drawdown_pct", 0.0);
    return snapshot;
}

nlohmann::json positionToJson(const Position& position) {
    nlohmann::json row;
    row["symbol"] = position.symbol;
    row["side"] = positionSideToString(position.side);
    row["quantity"] = position.quantity;
    row["avg_entry_price"] = position.avg_entry_price;
    row["unrealized_pnl"] = position.unrealized_pnl;
    row["realized_pnl"] = position.realized_pnl;
    row["last_price"] = position.last_price;
    row["updated_at"] = position.updated_at;
    return row;
}

Position positionFromJson(const nlohmann::json& row) {
    Position position;
    position.symbol = row.value("symbol", std::string());
    const std::string side = row.value("side", std::string("flat"));
    if (side == "long") {
        position.side = PositionSide::LONG;
    } else if (side == "short") {
        position.side = PositionSide::SHORT;
    } else {
        position.side = PositionSide::FLAT;
    }
    position.quantity = row.value("quantity", 0.0);
    position.avg_entry_price = row.value("avg_entry_price", 0.0);
    position.unrealized_pnl = row.value("unrealized_pnl", 0.0);
    position.realized_pnl = row.value("realized_pnl", 0.0);
    position.last_price = row.value("last_price", 0.0);
    position.updated_at = row.value("updated_at", 0LL);
    return position;
}

template <typename Fn>
void forEachLine(const std::filesystem::path& path, Fn&& fn) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return;
    }
    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            LOG_WARN("Skipping malformed row in {}", path.string());
            continue;
        }
        fn(line);
    }
}
} // namespace

JsonlPersistenceStore::JsonlPersistenceStore(std::filesystem::path state_dir)
    : state_dir_(std::move(state_dir)) {
    for (const char* stream : {kSnapshots, kOrders, kFills, kRiskMetrics}) {
        std::uint64_t last = 0;
        const bool is_snapshots = (std::string(stream) == kSnapshots);
        forEachLine(streamPath(stream), [&](const nlohmann::json& line) {
            last = (std::max)(last, parseSeq(line));
            if (is_snapshots) {
                latest_snapshot_ = snapshotFromJson(line);
            }
        });
        last_seq_[stream] = last;
    }

    std::ifstream in(state_dir_ / "positions.json", std::ios::binary);
    if (in.is_open()) {
        try {
            nlohmann::json raw;
            in >> raw;
            for (const auto& row : raw.value("positions", nlohmann::json::array())) {
                Position position = positionFromJson(row);
                positions_[position.symbol] = position;
            }
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("positions.json unreadable, starting without stored positions: {}", e.what());
            positions_.clear();
        }
    }
}

std::filesystem::path JsonlPersistenceStore::streamPath(const std::string& stream) const {
    return state_dir_ / (stream + ".jsonl");
}

bool JsonlPersistenceStore::appendLine(const std::string& stream, nlohmann::json line) {
    std::error_code ec;
    std::filesystem::create_directories(state_dir_, ec);
    std::ofstream out(streamPath(stream), std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Cannot open {} for append", streamPath(stream).string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_[stream] + 1;
    line["seq"] = next_seq;
    out << line.dump() << "\n";
    out.flush();
    if (!out.good()) {
        return false;
    }
    last_seq_[stream] = next_seq;
    return true;
}

bool JsonlPersistenceStore::appendSnapshot(const PortfolioSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!appendLine(kSnapshots, snapshotToJson(snapshot))) {
        return false;
    }
    latest_snapshot_ = snapshot;
    return true;
}

bool JsonlPersistenceStore::upsertPosition(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[position.symbol] = position;
    return writePositionsLocked();
}

bool JsonlPersistenceStore::appendOrder(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendLine(kOrders, execution::toJson(order));
}

bool JsonlPersistenceStore::appendFill(const Fill& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendLine(kFills, execution::toJson(fill));
}

bool JsonlPersistenceStore::appendRiskMetrics(const RiskMetrics& metrics) {
    nlohmann::json line;
    line["ts_ms"] = metrics.timestamp;
    line["current_drawdown_pct"] = metrics.current_drawdown_pct;
    line["max_drawdown_pct"] = metrics.max_drawdown_pct;
    line["portfolio_vol"] = metrics.portfolio_vol;
    if (metrics.sharpe_ratio) {
        line["sharpe_ratio"] = *metrics.sharpe_ratio;
    } else {
        line["sharpe_ratio"] = nullptr;
    }
    line["concentration_pct"] = metrics.concentration_pct;
    line["kill_switch_active"] = metrics.kill_switch_active;

    std::lock_guard<std::mutex> lock(mutex_);
    return appendLine(kRiskMetrics, std::move(line));
}

std::optional<double> JsonlPersistenceStore::maxEquitySince(TimestampMs since) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<double> best;
    forEachLine(streamPath(kSnapshots), [&](const nlohmann::json& line) {
        if (line.value("ts_ms", 0LL) < since) {
            return;
        }
        const double equity = line.value("equity", 0.0);
        if (!best || equity > *best) {
            best = equity;
        }
    });
    return best;
}

std::optional<PortfolioSnapshot> JsonlPersistenceStore::latestSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_snapshot_;
}

std::vector<Position> JsonlPersistenceStore::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, position] : positions_) {
        out.push_back(position);
    }
    return out;
}

std::vector<PortfolioSnapshot> JsonlPersistenceStore::readSnapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PortfolioSnapshot> out;
    forEachLine(streamPath(kSnapshots), [&](const nlohmann::json& line) {
        out.push_back(snapshotFromJson(line));
    });
    return out;
}

std::uint64_t JsonlPersistenceStore::lastSeq(const std::string& stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_seq_.find(stream);
    return (it == last_seq_.end()) ? 0 : it->second;
}

bool JsonlPersistenceStore::writePositionsLocked() const {
    nlohmann::json raw;
    raw["positions"] = nlohmann::json::array();
    for (const auto& [symbol, position] : positions_) {
        raw["positions"].push_back(positionToJson(position));
    }

    std::error_code ec;
    std::filesystem::create_directories(state_dir_, ec);

    const auto file_path = state_dir_ / "positions.json";
    auto tmp_path = file_path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        LOG_ERROR("positions.json rename failed: {}", ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

} // namespace core
} // namespace regimegate
