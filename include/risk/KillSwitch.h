#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "core/contracts/IKillSwitchStore.h"

namespace regimegate {
namespace risk {

// ARMED -> TRIPPED when drawdown reaches the limit; TRIPPED -> ARMED only
// through reset(). Every transition is saved before the call returns.
// A stored record that cannot be read loads as TRIPPED.
class KillSwitch {
public:
    KillSwitch(std::shared_ptr<core::IKillSwitchStore> store, double max_drawdown_pct);

    bool isTripped() const;
    core::KillSwitchState state() const;
    core::KillSwitchRecord record() const;

    // Trips when current_drawdown_pct >= max_drawdown_pct. Never arms.
    // Returns the tripped flag after evaluation.
    bool evaluate(double current_drawdown_pct, TimestampMs timestamp);

    void trip(const std::string& reason, double drawdown_pct, TimestampMs timestamp);

    // Manual operator action. Throws PersistenceError if the ARMED record
    // cannot be saved, in which case the switch stays TRIPPED.
    void reset(const std::string& operator_name, const std::string& note, TimestampMs timestamp);

private:
    void persistLocked(const core::KillSwitchRecord& next);

    std::shared_ptr<core::IKillSwitchStore> store_;
    const double max_drawdown_pct_;
    mutable std::mutex mutex_;
    core::KillSwitchRecord record_;
};

} // namespace risk
} // namespace regimegate
