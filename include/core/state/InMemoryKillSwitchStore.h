#pragma once

#include <mutex>

#include "core/contracts/IKillSwitchStore.h"

namespace regimegate {
namespace core {

// Backtests and tests. setFailSaves() simulates an unwritable store.
class InMemoryKillSwitchStore : public IKillSwitchStore {
public:
    std::optional<KillSwitchRecord> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return record_;
    }

    bool save(const KillSwitchRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_saves_) {
            return false;
        }
        record_ = record;
        ++save_count_;
        return true;
    }

    void setFailSaves(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_saves_ = fail;
    }

    int saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return save_count_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<KillSwitchRecord> record_;
    bool fail_saves_ = false;
    int save_count_ = 0;
};

} // namespace core
} // namespace regimegate
