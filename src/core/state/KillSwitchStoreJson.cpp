#include "core/state/KillSwitchStoreJson.h"
#include "common/Errors.h"

#include <openssl/sha.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace regimegate {
namespace core {

namespace {
nlohmann::json recordToJson(const KillSwitchRecord& record) {
    nlohmann::json raw;
    raw["schema_version"] = record.schema_version;
    raw["state"] = killSwitchStateToString(record.state);
    raw["changed_at"] = record.changed_at;
    raw["reason"] = record.reason;
    raw["actor"] = record.actor;
    raw["note"] = record.note;
    raw["trip_drawdown_pct"] = record.trip_drawdown_pct;
    raw["last_reset_at"] = record.last_reset_at;
    return raw;
}
}

KillSwitchStoreJson::KillSwitchStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::string KillSwitchStoreJson::digest(const std::string& payload) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(payload.c_str()), payload.length(), hash);

    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(hash[i]);
    }
    return hex_stream.str();
}

std::optional<KillSwitchRecord> KillSwitchStoreJson::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        if (ec) {
            throw PersistenceError("kill switch file not accessible: " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        throw PersistenceError("kill switch file cannot be opened: " + file_path_.string());
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(std::string("kill switch file is not valid JSON: ") + e.what());
    }

    if (!raw.is_object() || !raw.contains("record") || !raw.contains("sha256") ||
        !raw["record"].is_object() || !raw["sha256"].is_string()) {
        throw PersistenceError("kill switch file is missing record or digest");
    }

    const nlohmann::json& body = raw["record"];
    if (digest(body.dump()) != raw["sha256"].get<std::string>()) {
        throw PersistenceError("kill switch digest mismatch");
    }

    KillSwitchRecord record;
    try {
        record.schema_version = body.value("schema_version", 1);
        const std::string state = body.at("state").get<std::string>();
        if (state == "TRIPPED") {
            record.state = KillSwitchState::TRIPPED;
        } else if (state == "ARMED") {
            record.state = KillSwitchState::ARMED;
        } else {
            throw PersistenceError("unknown kill switch state: " + state);
        }
        record.changed_at = body.value("changed_at", 0LL);
        record.reason = body.value("reason", std::string());
        record.actor = body.value("actor", std::string());
        record.note = body.value("note", std::string());
        record.trip_drawdown_pct = body.value("trip_drawdown_pct", 0.0);
        record.last_reset_at = body.value("last_reset_at", 0LL);
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(std::string("kill switch record malformed: ") + e.what());
    }
    return record;
}

bool KillSwitchStoreJson::save(const KillSwitchRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json body = recordToJson(record);
    nlohmann::json raw;
    raw["record"] = body;
    raw["sha256"] = digest(body.dump());

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        out.flush();
        if (!out.good()) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

} // namespace core
} // namespace regimegate
