#pragma once

#include <filesystem>
#include <mutex>

#include "core/contracts/IKillSwitchStore.h"

namespace regimegate {
namespace core {

// {"record": {...}, "sha256": "<hex of record.dump()>"}
// Written to <file>.tmp then renamed over the target.
class KillSwitchStoreJson : public IKillSwitchStore {
public:
    explicit KillSwitchStoreJson(std::filesystem::path file_path);

    std::optional<KillSwitchRecord> load() override;
    bool save(const KillSwitchRecord& record) override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    static std::string digest(const std::string& payload);

    std::filesystem::path file_path_;
    std::mutex mutex_;
};

} // namespace core
} // namespace regimegate
